#pragma once

#include <utility>
#include <cstddef>
#include <new>

#include "IAllocator.hpp"

class IObjectBuilder
{
protected:
    IAllocator *_allocator;

public:
    IObjectBuilder(IAllocator *alloc) : _allocator(alloc) {}
    virtual ~IObjectBuilder() = default;

    /**
     * 核心能力：在 Allocator 提供的空间上构建对象
     */
    template <typename T, typename... Args>
    T *construct(Args &&...args)
    {
        void *ptr = _allocator->allocate(sizeof(T), alignof(T));
        if (!ptr)
            return nullptr;

        return new (ptr) T(std::forward<Args>(args)...);
    }

    /**
     * 销毁对象并归还内存
     */
    template <typename T>
    void destroy(T *ptr)
    {
        if (!ptr)
            return;

        ptr->~T();
        _allocator->deallocate(ptr, sizeof(T));
    }
};

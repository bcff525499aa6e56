#pragma once

#include "IObjectBuilder.hpp"

/**
 * KernelObjectBuilder: 负责在内核空间构建对象，并记录存活对象数量
 */
class KernelObjectBuilder : public IObjectBuilder
{
private:
    size_t _active_objects = 0;

public:
    using IObjectBuilder::IObjectBuilder;

    template <typename T, typename... Args>
    T *construct(Args &&...args)
    {
        T *ptr = IObjectBuilder::construct<T>(std::forward<Args>(args)...);
        if (ptr)
            _active_objects++;
        return ptr;
    }

    template <typename T>
    void destroy(T *ptr)
    {
        if (ptr)
        {
            IObjectBuilder::destroy(ptr);
            _active_objects--;
        }
    }

    size_t get_active_objects() const { return _active_objects; }
};

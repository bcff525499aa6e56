#pragma once

#include <cstdint>
#include <new>

#include "IAllocator.hpp"
#include "KernelUtils.hpp"
#include "Memory.hpp"

/**
 * StaticLayoutAllocator: 管理一块预先确定的内存布局（线性分配，不回收）
 */
class StaticLayoutAllocator : public IAllocator
{
private:
    void *_base;
    size_t _size;
    size_t _used;

public:
    /**
     * 在布局头部原地构造分配器本身，剩余空间交给它管理
     */
    static StaticLayoutAllocator *create(PhysicalMemoryLayout &layout)
    {
        if (layout.base == nullptr || layout.size <= sizeof(StaticLayoutAllocator))
            return nullptr;

        return new (layout.base) StaticLayoutAllocator(
            (uint8_t *)layout.base + sizeof(StaticLayoutAllocator),
            layout.size - sizeof(StaticLayoutAllocator));
    }

    StaticLayoutAllocator(void *base, size_t size)
        : _base(base), _size(size), _used(0) {}

    /** @brief 管理的总容量（不含分配器对象本身） */
    size_t get_capacity() const { return _size; }

    /** @brief 已使用的字节数（包含对齐填充） */
    size_t get_used_bytes() const { return _used; }

    size_t get_free_size() const { return _size - _used; }

    void *allocate(size_t size, size_t alignment = 8) override
    {
        if (!KernelUtils::Bit::is_power_of_two(alignment))
            return nullptr;

        uintptr_t current_pos = (uintptr_t)_base + _used;
        uintptr_t aligned_pos = KernelUtils::Align::up(current_pos, alignment);
        size_t padding = aligned_pos - current_pos;

        if (padding > _size - _used || size > _size - _used - padding)
        {
            return nullptr; // 内存溢出
        }

        _used += padding + size;
        return (void *)aligned_pos;
    }

    void deallocate(void *ptr, size_t size) override
    {
        // 线性分配器不支持随机释放；内存随整个布局一起回收
        (void)ptr;
        (void)size;
    }
};

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * 分配器接口：目录、加载器以及应用槽位都从这里划拨内存
 */
class IAllocator
{
public:
    virtual ~IAllocator() = default;

    // 申请原始内存块，失败返回 nullptr
    virtual void *allocate(size_t size, size_t alignment = 8) = 0;

    virtual void deallocate(void *ptr, size_t size) = 0;
};

#pragma once

#include <cstddef>

/**
 * 物理内存布局：由引导层（或模拟器）交给内核的一整块线性内存
 * 内核在上面“施工”，放置静态分配器、目录与应用槽位
 */
struct PhysicalMemoryLayout
{
    void *base;
    size_t size;
};

/**
 * kmain: 内核入口点
 * @param layout 物理内存布局
 * @param info   引导层填写的启动信息（会被拷贝进内核自己的内存）
 * @param hooks  平台钩子
 */
#include "Memory.hpp"
#include "Kernel.hpp"

extern "C" Kernel *kmain(PhysicalMemoryLayout layout, const BootInfo &info, PlatformHooks *hooks)
{
    // 1. 在内存头部“原地”构建静态分配器
    StaticLayoutAllocator *allocator = StaticLayoutAllocator::create(layout);
    if (!allocator)
    {
        K_PANIC("Physical layout too small for the kernel");
    }

    // 2. BootInfo 由引导层持有，内核保存一份自己的副本
    void *info_mem = allocator->allocate(sizeof(BootInfo), alignof(BootInfo));
    void *kernel_mem = allocator->allocate(sizeof(Kernel), alignof(Kernel));
    if (!info_mem || !kernel_mem)
    {
        K_PANIC("Physical layout too small for the kernel");
    }

    BootInfo *boot_info = new (info_mem) BootInfo(info);
    Kernel *kernel = new (kernel_mem) Kernel(allocator, *boot_info, hooks);

    // 3. 冷启动
    kernel->bootstrap();
    return kernel;
}

#include <cstdlib>
#include <iostream>

#include <kernel/Kernel.hpp>
#include <kernel/Memory.hpp>
#include <common/BootInfo.hpp>

#include "loader.hpp"
#include "LoggerPosix.hpp"

extern "C" Kernel *kmain(PhysicalMemoryLayout layout, const BootInfo &info, PlatformHooks *hooks);

// 模拟物理内存：前半给内核，后半放应用镜像
static const size_t SIM_RAM_SIZE = 64 * 1024 * 1024;
static const size_t SIM_KERNEL_REGION = 32 * 1024 * 1024;

int main(int argc, char **argv)
{
    const char *image_path = (argc > 1) ? argv[1] : "apps.img";

    // --- 1. 硬件模拟环境初始化 ---
    void *ram = std::aligned_alloc(4096, SIM_RAM_SIZE);
    if (!ram)
    {
        std::cerr << "[Simulator] Cannot allocate simulated RAM" << std::endl;
        return -1;
    }

    PhysicalMemoryLayout kernel_region{ram, SIM_KERNEL_REGION};
    PhysicalMemoryLayout image_region{static_cast<uint8_t *>(ram) + SIM_KERNEL_REGION, SIM_RAM_SIZE - SIM_KERNEL_REGION};

    BootInfo info{};
    info.magic = BOOTINFO_MAGIC;
    info.version = BOOTINFO_VERSION;
    info.memory_size = SIM_RAM_SIZE;

    // --- 2. Bootloader：把 apps.img 读入模拟内存 ---
    if (!load_app_image(image_path, image_region, &info))
    {
        std::free(ram);
        return -1;
    }

    // --- 3. 内核冷启动 ---
    PlatformHooks hooks{"posix-simulator", nullptr};
    Kernel *kernel = kmain(kernel_region, info, &hooks);

    // --- 4. 装载全部应用，并按批处理顺序报告 ---
    size_t loaded = kernel->load_apps();
    std::cout << "[Simulator] " << loaded << "/" << kernel->get_app_directory().count() << " apps loaded." << std::endl;

    AppLoader *loader = kernel->get_app_loader();
    while (loader->has_next() && loader->current_app() < loaded)
    {
        AppRange slot{};
        if (loader->slot_of((int64_t)loader->current_app(), slot) == AppDirStatus::OK)
        {
            std::cout << "[Simulator] next app_" << loader->current_app()
                      << " -> slot 0x" << std::hex << slot.start << std::dec << std::endl;
        }
        loader->move_to_next_app();
    }

    std::free(ram);
    return 0;
}

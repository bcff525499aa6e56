#pragma once

#include <new>

#include "common/BootInfo.hpp"
#include "common/diagnostics.hpp"

#include "PlatformHooks.hpp"
#include "StaticLayoutAllocator.hpp"
#include "KernelObjectBuilder.hpp"
#include "AppDirectory.hpp"
#include "AppLoader.hpp"

class Kernel
{
private:
    friend class KernelInspector;

    // 基础依赖
    StaticLayoutAllocator *_static_allocator; // 初始静态分配器
    KernelObjectBuilder *_builder;            // 在静态分配器上构建内核对象

    BootInfo &_boot_info;
    PlatformHooks *_platform_hooks;

    // 领域组件
    AppDirectory *_app_directory;
    AppLoader *_app_loader;

    bool _initialized;

public:
    Kernel(
        StaticLayoutAllocator *static_allocator,
        BootInfo &info,
        PlatformHooks *hooks)
        : _static_allocator(static_allocator),
          _builder(nullptr),
          _boot_info(info),
          _platform_hooks(hooks),
          _app_directory(nullptr),
          _app_loader(nullptr),
          _initialized(false)
    {
    }

    /**
     * @brief 冷启动：校验 BootInfo -> 建立应用目录 -> 建立加载器
     * 任何一步失败都是致命的，直接 K_PANIC
     */
    void bootstrap();

    void setup_infrastructure();
    void setup_app_registry();
    void setup_app_loader();

    /**
     * @brief 装载全部应用并刷新指令缓存，返回成功装载的数量
     */
    size_t load_apps();

    // 目录以只读引用的形式交给其它子系统
    const AppDirectory &get_app_directory() const { return *_app_directory; }
    AppLoader *get_app_loader() { return _app_loader; }

    bool is_initialized() const { return _initialized; }
};

#include "Kernel.hpp"
#include "KernelConfig.hpp"

void Kernel::bootstrap()
{
    if (_boot_info.magic != BOOTINFO_MAGIC)
    {
        K_PANIC("BootInfo magic mismatch: %#x", _boot_info.magic);
    }

    setup_infrastructure();
    setup_app_registry();
    setup_app_loader();

    // 目录与加载器全部就绪后才对外宣告初始化完成
    _initialized = true;
    K_INFO("Kernel initialized on %s",
           (_platform_hooks && _platform_hooks->platform_name) ? _platform_hooks->platform_name : "unknown platform");
}

void Kernel::setup_infrastructure()
{
    void *builder_mem = _static_allocator->allocate(sizeof(KernelObjectBuilder), alignof(KernelObjectBuilder));
    if (!builder_mem)
    {
        K_PANIC("Out of memory while creating the object builder");
    }

    _builder = new (builder_mem) KernelObjectBuilder(_static_allocator);
}

void Kernel::setup_app_registry()
{
    _app_directory = _builder->construct<AppDirectory>();
    if (!_app_directory)
    {
        K_PANIC("Out of memory while creating the app directory");
    }

    AppDirStatus status = _app_directory->build_from_table(_boot_info.app_table);
    if (status != AppDirStatus::OK)
    {
        K_PANIC("App directory rejected: %s", app_dir_status_str(status));
    }

    _app_directory->print_app_info();
}

void Kernel::setup_app_loader()
{
    // 槽位区域：每个应用一个 APP_SIZE_LIMIT 大小的页对齐区块
    size_t slot_count = _app_directory->count() < MAX_APP_NUM ? _app_directory->count() : MAX_APP_NUM;
    AppSlotLayout slots{0, APP_SIZE_LIMIT, slot_count};

    if (slot_count > 0)
    {
        void *slot_mem = _static_allocator->allocate(slot_count * APP_SIZE_LIMIT, APP_SLOT_ALIGN);
        if (!slot_mem)
        {
            K_PANIC("Out of memory while reserving %zu app slots", slot_count);
        }
        slots.base = reinterpret_cast<uintptr_t>(slot_mem);
    }

    if (_app_directory->count() > MAX_APP_NUM)
    {
        K_WARN("%zu apps embedded, only the first %zu have a slot", _app_directory->count(), MAX_APP_NUM);
    }

    _app_loader = _builder->construct<AppLoader>(*_app_directory, slots);
    if (!_app_loader)
    {
        K_PANIC("Out of memory while creating the app loader");
    }
}

size_t Kernel::load_apps()
{
    size_t loaded = 0;
    AppDirStatus status = _app_loader->load_all(loaded);
    if (status != AppDirStatus::OK)
    {
        K_ERROR("Loading stopped after %zu apps: %s", loaded, app_dir_status_str(status));
    }

    if (_platform_hooks && _platform_hooks->flush_icache)
        _platform_hooks->flush_icache();

    return loaded;
}

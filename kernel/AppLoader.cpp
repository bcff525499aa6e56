#include "AppLoader.hpp"
#include "KernelUtils.hpp"

#include <common/diagnostics.hpp>

AppLoader::AppLoader(const AppDirectory &directory, AppSlotLayout slots)
    : _directory(directory), _slots(slots)
{
}

AppDirStatus AppLoader::slot_of(int64_t index, AppRange &slot) const
{
    if (index < 0 || (uint64_t)index >= (uint64_t)_slots.max_apps)
        return AppDirStatus::LOAD_OVERFLOW;

    slot.start = (uint64_t)_slots.base + (uint64_t)index * _slots.slot_size;
    slot.end = slot.start + _slots.slot_size;
    return AppDirStatus::OK;
}

AppDirStatus AppLoader::load_app(int64_t index, AppRange &loaded)
{
    // 1. 查目录：不存在的应用直接拒绝，不触碰任何内存
    AppRange src{};
    AppDirStatus status = _directory.range_of(index, src);
    if (status != AppDirStatus::OK)
    {
        K_ERROR("[loader] unknown program requested: app_%lld", (long long)index);
        return status;
    }

    // 2. 找槽位并检查容量
    AppRange slot{};
    if (slot_of(index, slot) != AppDirStatus::OK)
    {
        K_ERROR("[loader] app_%lld has no slot (max %zu apps)", (long long)index, _slots.max_apps);
        return AppDirStatus::LOAD_OVERFLOW;
    }

    if (src.size() > slot.size())
    {
        K_ERROR("[loader] app_%lld is %zu bytes, slot limit is %zu",
                (long long)index, src.size(), slot.size());
        return AppDirStatus::LOAD_OVERFLOW;
    }

    // 3. 清空整个槽位，再拷贝应用字节
    void *dst = reinterpret_cast<void *>(static_cast<uintptr_t>(slot.start));
    KernelUtils::Memory::zero(dst, slot.size());
    KernelUtils::Memory::copy(dst, src.data(), src.size());

    loaded.start = slot.start;
    loaded.end = slot.start + src.size();

    K_DEBUG("[loader] app_%lld loaded at %#llx (%zu bytes)",
            (long long)index, (unsigned long long)loaded.start, loaded.size());
    return AppDirStatus::OK;
}

AppDirStatus AppLoader::load_all(size_t &loaded_count)
{
    loaded_count = 0;
    size_t total = _directory.count();

    for (size_t i = 0; i < total; ++i)
    {
        AppRange loaded{};
        AppDirStatus status = load_app((int64_t)i, loaded);
        if (status != AppDirStatus::OK)
            return status;
        loaded_count++;
    }

    return AppDirStatus::OK;
}

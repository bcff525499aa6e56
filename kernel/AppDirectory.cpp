#include "AppDirectory.hpp"
#include "KernelConfig.hpp"

#include <common/diagnostics.hpp>

AppDirectory::AppDirectory()
    : _state(UNINITIALIZED), _count(0), _boundaries(nullptr)
{
}

AppDirStatus AppDirectory::build(size_t count, const uint64_t *boundaries, size_t boundary_count)
{
    if (_state.load(std::memory_order_acquire) != UNINITIALIZED)
    {
        K_ERROR("AppDirectory: build called twice, keeping the existing table");
        return AppDirStatus::REINITIALIZED;
    }

    // 1. 布局校验：N+1 个边界，且单调不减。校验只读入参，不触碰状态
    if (count > APP_DIR_MAX_COUNT)
    {
        K_ERROR("AppDirectory: %zu apps exceeds the limit of %zu", count, (size_t)APP_DIR_MAX_COUNT);
        return AppDirStatus::LAYOUT_ERROR;
    }

    if (boundaries == nullptr || boundary_count == 0 || boundary_count - 1 != count)
    {
        K_ERROR("AppDirectory: expected %zu boundaries, got %zu", count + 1, boundary_count);
        return AppDirStatus::LAYOUT_ERROR;
    }

    for (size_t i = 0; i < count; ++i)
    {
        if (boundaries[i] > boundaries[i + 1])
        {
            K_ERROR("AppDirectory: boundary %zu (%#llx) > boundary %zu (%#llx)",
                    i, (unsigned long long)boundaries[i],
                    i + 1, (unsigned long long)boundaries[i + 1]);
            return AppDirStatus::LAYOUT_ERROR;
        }
    }

    // 2. 抢占构建权：只有一个合法的 build 能从 UNINITIALIZED 进入 BUILDING，
    //    进入 BUILDING 之后一定会到达 BUILT
    uint32_t expected = UNINITIALIZED;
    if (!_state.compare_exchange_strong(expected, BUILDING, std::memory_order_acq_rel))
    {
        K_ERROR("AppDirectory: build called twice, keeping the existing table");
        return AppDirStatus::REINITIALIZED;
    }

    _count = count;
    _boundaries = boundaries;

    // 3. 发布：此后的读者通过 acquire 看到完整的表
    _state.store(BUILT, std::memory_order_release);
    return AppDirStatus::OK;
}

AppDirStatus AppDirectory::build_from_table(const uint64_t *table)
{
    // 已建立的目录不再读取新表：交给 build 统一报告重复初始化
    if (is_built())
        return build(0, table, 0);

    if (table == nullptr)
    {
        K_ERROR("AppDirectory: app table is missing");
        return AppDirStatus::LAYOUT_ERROR;
    }

    uint64_t count = table[0];
    if (count > APP_DIR_MAX_COUNT)
    {
        K_ERROR("AppDirectory: app table claims %llu apps", (unsigned long long)count);
        return AppDirStatus::LAYOUT_ERROR;
    }

    return build((size_t)count, table + 1, (size_t)count + 1);
}

size_t AppDirectory::count() const
{
    if (_state.load(std::memory_order_acquire) != BUILT)
        return 0;
    return _count;
}

AppDirStatus AppDirectory::range_of(int64_t index, AppRange &out) const
{
    if (_state.load(std::memory_order_acquire) != BUILT)
        return AppDirStatus::INDEX_OUT_OF_RANGE;

    if (index < 0 || (uint64_t)index >= (uint64_t)_count)
        return AppDirStatus::INDEX_OUT_OF_RANGE;

    out.start = _boundaries[index];
    out.end = _boundaries[index + 1];
    return AppDirStatus::OK;
}

AppRangeView AppDirectory::all_ranges() const
{
    if (_state.load(std::memory_order_acquire) != BUILT)
        return AppRangeView(nullptr, 0);
    return AppRangeView(_boundaries, _count);
}

uint64_t AppDirectory::total_size() const
{
    if (_state.load(std::memory_order_acquire) != BUILT)
        return 0;
    return _boundaries[_count] - _boundaries[0];
}

void AppDirectory::print_app_info() const
{
    K_INFO("[kernel] num_app = %zu", count());

    size_t i = 0;
    for (AppRange range : all_ranges())
    {
        K_INFO("[kernel] app_%zu [%#llx, %#llx)",
               i, (unsigned long long)range.start, (unsigned long long)range.end);
        ++i;
    }
}

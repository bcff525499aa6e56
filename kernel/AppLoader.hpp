#pragma once

#include <cstdint>
#include <cstddef>

#include "AppDirectory.hpp"

/**
 * 应用槽位布局：app_i 被装载到 base + i * slot_size
 */
struct AppSlotLayout
{
    uintptr_t base;
    size_t slot_size;
    size_t max_apps;
};

/**
 * @brief AppLoader: 按目录把应用字节拷贝到各自的槽位
 *
 * 目录通过只读引用注入，加载器自身不持有任何全局状态。
 * 同时维护一个批处理游标（当前应执行的应用），供调度层按顺序取用。
 */
class AppLoader
{
private:
    const AppDirectory &_directory;
    AppSlotLayout _slots;
    size_t _current_app = 0;

public:
    AppLoader(const AppDirectory &directory, AppSlotLayout slots);

    /**
     * @brief 计算第 index 个槽位的地址区间（不拷贝）
     */
    AppDirStatus slot_of(int64_t index, AppRange &slot) const;

    /**
     * @brief 清空槽位并装载第 index 个应用
     * @param loaded 成功时返回槽位中应用字节所在的区间
     */
    AppDirStatus load_app(int64_t index, AppRange &loaded);

    /**
     * @brief 依次装载全部应用，遇到第一个失败即停止
     */
    AppDirStatus load_all(size_t &loaded_count);

    size_t current_app() const { return _current_app; }
    bool has_next() const { return _current_app < _directory.count(); }
    void move_to_next_app() { _current_app++; }
};

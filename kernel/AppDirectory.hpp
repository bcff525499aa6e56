#pragma once

#include <atomic>
#include <cstdint>
#include <cstddef>
#include <iterator>

#include "AppTypes.hpp"

/**
 * @brief AppRangeView: 对目录边界表的惰性视图
 * 每次解引用时才由相邻两个边界拼出 AppRange，可反复从 begin() 重新遍历
 */
class AppRangeView
{
private:
    const uint64_t *_boundaries;
    size_t _count;

public:
    struct Iterator
    {
        using iterator_category = std::forward_iterator_tag;
        using value_type = AppRange;
        using difference_type = std::ptrdiff_t;
        using pointer = const AppRange *;
        using reference = AppRange;

        const uint64_t *boundaries;
        size_t index;

        AppRange operator*() const { return AppRange{boundaries[index], boundaries[index + 1]}; }

        Iterator &operator++()
        {
            ++index;
            return *this;
        }

        bool operator==(const Iterator &other) const { return index == other.index; }
        bool operator!=(const Iterator &other) const { return index != other.index; }
    };

    AppRangeView(const uint64_t *boundaries, size_t count)
        : _boundaries(boundaries), _count(count) {}

    Iterator begin() const { return Iterator{_boundaries, 0}; }
    Iterator end() const { return Iterator{_boundaries, _count}; }
    size_t size() const { return _count; }
    bool empty() const { return _count == 0; }
};

/**
 * @brief AppDirectory: 已嵌入应用的只读目录
 *
 * 状态机：UNINITIALIZED -> BUILDING -> BUILT，只能前进一次。
 * build() 先校验布局再抢占状态，校验失败不改变状态；
 * 一旦进入 BUILDING 就必然发布，并发的第二个 build() 得到 REINITIALIZED。
 * build() 在调度器接纳任何任务之前执行；发布时使用 release 语义，
 * 查询侧使用 acquire 语义，因此 BUILT 之后的所有读操作无需加锁。
 *
 * 目录不拷贝边界表，只持有指向它的只读视图：
 * 表本身位于内核静态数据段（或加载器重建的物理内存），生命周期与内核相同。
 */
class AppDirectory
{
private:
    enum State : uint32_t
    {
        UNINITIALIZED = 0,
        BUILDING,
        BUILT
    };

    std::atomic<uint32_t> _state;
    size_t _count;
    const uint64_t *_boundaries;

public:
    AppDirectory();

    AppDirectory(const AppDirectory &) = delete;
    AppDirectory &operator=(const AppDirectory &) = delete;

    /**
     * @brief 建立目录
     * @param count 应用数量 N
     * @param boundaries N+1 个边界地址
     * @param boundary_count boundaries 的实际长度，必须等于 count + 1
     */
    AppDirStatus build(size_t count, const uint64_t *boundaries, size_t boundary_count);

    /**
     * @brief 从链接期生成的表建立目录：table[0] = N，后跟 N+1 个边界
     */
    AppDirStatus build_from_table(const uint64_t *table);

    bool is_built() const { return _state.load(std::memory_order_acquire) == BUILT; }

    size_t count() const;

    /**
     * @brief 查询第 index 个应用的区间
     * index 为有符号数：越界（包括负数）返回 INDEX_OUT_OF_RANGE，out 不被修改
     */
    AppDirStatus range_of(int64_t index, AppRange &out) const;

    AppRangeView all_ranges() const;

    // 全部应用占用的字节数（含应用之间的对齐填充）
    uint64_t total_size() const;

    void print_app_info() const;
};

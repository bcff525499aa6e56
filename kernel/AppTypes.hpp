#pragma once

#include <cstdint>
#include <cstddef>

static_assert(sizeof(void *) <= sizeof(uint64_t), "app boundaries are stored as 64-bit addresses");

/**
 * AppRange: 一个已嵌入应用在内核静态数据中的半开区间 [start, end)
 */
struct AppRange
{
    uint64_t start;
    uint64_t end;

    size_t size() const { return (size_t)(end - start); }
    bool empty() const { return end == start; }

    const uint8_t *data() const
    {
        return reinterpret_cast<const uint8_t *>(static_cast<uintptr_t>(start));
    }

    bool operator==(const AppRange &other) const { return start == other.start && end == other.end; }
    bool operator!=(const AppRange &other) const { return !(*this == other); }
};

/**
 * 应用目录 / 加载器的返回状态
 * 内核侧不抛异常：调用方拿到状态后决定是记录日志还是 K_PANIC
 */
enum class AppDirStatus : uint32_t
{
    OK = 0,
    LAYOUT_ERROR,       // 边界数量与 count 不符，或边界非单调
    REINITIALIZED,      // 目录已建立，再次 build 属于调用方 bug
    INDEX_OUT_OF_RANGE, // 请求了一个从未嵌入的应用
    LOAD_OVERFLOW       // 应用超出槽位容量，或槽位数不足
};

inline const char *app_dir_status_str(AppDirStatus status)
{
    switch (status)
    {
    case AppDirStatus::OK:
        return "OK";
    case AppDirStatus::LAYOUT_ERROR:
        return "LayoutError";
    case AppDirStatus::REINITIALIZED:
        return "ReinitializationError";
    case AppDirStatus::INDEX_OUT_OF_RANGE:
        return "IndexError";
    case AppDirStatus::LOAD_OVERFLOW:
        return "LoadOverflow";
    }
    return "Unknown";
}

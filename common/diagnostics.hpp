#pragma once

#include <cstdint>
#include <cstdarg>

enum class LogLevel
{
    Debug = 0,
    Info,
    Warn,
    Error,
    Fatal
};

// 内核日志入口：由平台层（模拟器 / 测试桩 / 真机串口）提供实现
extern "C"
{
    void klog(LogLevel level, const char *fmt, ...);
}

// 基础打印宏：只负责调用 handler，不负责挂起
#ifndef K_PRINT_INTERNAL
#define K_PRINT_INTERNAL(level, fmt, ...) \
    do                                    \
    {                                     \
        klog(level, fmt, ##__VA_ARGS__);  \
    } while (0)
#endif

// PANIC：Fatal 级别的 klog 不应返回；若平台实现返回了，就地停机
#ifndef K_PANIC
#define K_PANIC(fmt, ...)                                        \
    do                                                           \
    {                                                            \
        K_PRINT_INTERNAL(LogLevel::Fatal, fmt, ##__VA_ARGS__);   \
        for (;;)                                                 \
            ;                                                    \
    } while (0)
#endif

// 日志宏：打印后正常返回，继续执行
#ifndef K_INFO
#define K_INFO(fmt, ...) K_PRINT_INTERNAL(LogLevel::Info, fmt, ##__VA_ARGS__)
#endif

#ifndef K_DEBUG
#define K_DEBUG(fmt, ...) K_PRINT_INTERNAL(LogLevel::Debug, fmt, ##__VA_ARGS__)
#endif

#ifndef K_WARN
#define K_WARN(fmt, ...) K_PRINT_INTERNAL(LogLevel::Warn, fmt, ##__VA_ARGS__)
#endif

#ifndef K_ERROR
#define K_ERROR(fmt, ...) K_PRINT_INTERNAL(LogLevel::Error, fmt, ##__VA_ARGS__)
#endif

// 断言宏：只记录，不挂起（行号交给平台层的 klog 自行处理）
#ifndef K_ASSERT
#ifdef NDEBUG
#define K_ASSERT(condition, fmt, ...) ((void)0)
#else
#define K_ASSERT(condition, fmt, ...)                      \
    do                                                     \
    {                                                      \
        if (!(condition))                                  \
        {                                                  \
            K_ERROR("ASSERT FAILED: " fmt, ##__VA_ARGS__); \
        }                                                  \
    } while (0)
#endif
#endif

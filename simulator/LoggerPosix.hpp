#pragma once

#include <cstdio> // 仅在此平台相关文件中包含
#include <cstdarg>
#include <exception>

#include <common/diagnostics.hpp>

extern "C"
{
    void klog(LogLevel level, const char *fmt, ...)
    {
        const char *level_strs[] = {"DEBUG", "INFO", "WARN", "ERROR", "FATAL"};

        char buffer[1024];
        va_list args;
        va_start(args, fmt);

        // 模拟器下借用宿主机的 vsnprintf
        std::vsnprintf(buffer, sizeof(buffer), fmt, args);

        va_end(args);

        std::FILE *out = (level >= LogLevel::Warn) ? stderr : stdout;
        std::fprintf(out, "[%s] %s\n", level_strs[(int)level], buffer);
        std::fflush(out);

        if (level == LogLevel::Fatal)
        {
            std::terminate(); // 确保不归路
        }
    }
}

#pragma once
#include <cstdint>
#include <cstddef>

/**
 * KernelUtils: 内核基础工具箱
 * 采用命名空间隔离，避免强制依赖标准库
 */
namespace KernelUtils
{
    namespace Bit
    {
        /**
         * 检查一个无符号整数是否为 2 的幂
         * 原理：n 是 2 的幂时，n 与 n-1 按位与的结果必为 0
         */
        static inline bool is_power_of_two(uint64_t val)
        {
            return val > 0 && (val & (val - 1)) == 0;
        }
    }

    /**
     * Align: 内存地址与数值对齐工具
     * alignment 必须是 2 的幂
     */
    namespace Align
    {
        template <typename T>
        static inline T up(T value, size_t alignment)
        {
            size_t a = (size_t)alignment;
            return (T)(((size_t)value + a - 1) & ~(a - 1));
        }
    }

    /**
     * Memory: 基础内存操作
     */
    namespace Memory
    {
        static inline void copy(void *dest, const void *src, size_t n)
        {
            auto d = static_cast<uint8_t *>(dest);
            auto s = static_cast<const uint8_t *>(src);
            while (n--)
                *d++ = *s++;
        }

        static inline void zero(void *s, size_t n)
        {
            auto p = static_cast<uint8_t *>(s);
            while (n--)
                *p++ = 0;
        }
    }
}

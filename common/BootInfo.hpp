// common/BootInfo.hpp
#pragma once
#include <cstdint>

#define BOOTINFO_MAGIC 0xDEADBEEF
#define BOOTINFO_VERSION 2

struct BootInfo
{
    uint32_t magic; // 用于校验，固定为 BOOTINFO_MAGIC
    uint32_t version;

    // 应用目录表：table[0] = N，table[1..N+1] = 各应用的起止地址
    // 链接期由 link_app.S 中的 <prefix>_num_app 提供；模拟器下由加载器重建
    const uint64_t *app_table;

    uint64_t memory_size;
};

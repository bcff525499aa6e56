#pragma once

#include <cstddef>

// 应用槽位：app_i 被装载到 slot_base + i * APP_SIZE_LIMIT
constexpr size_t APP_SIZE_LIMIT = 0x20000;
constexpr size_t MAX_APP_NUM = 16;

// 槽位区域的起始对齐（页对齐）
constexpr size_t APP_SLOT_ALIGN = 4096;

// 目录表中每个条目的宽度（对应 link_app.S 里的 .quad）
constexpr size_t APP_TABLE_ENTRY_SIZE = 8;

// 链接表中 count 的合理上限，防止读到损坏的表时越界扫描
constexpr size_t APP_DIR_MAX_COUNT = 1u << 16;

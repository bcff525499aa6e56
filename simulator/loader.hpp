#pragma once

#include <cstddef>

#include <common/BootInfo.hpp>
#include <kernel/Memory.hpp>

/**
 * @brief 把 apps.img 读入模拟物理内存，并为内核重建应用目录表
 *
 * 镜像按原样放在 region.base；镜像中的边界是相对偏移，
 * 加载器在镜像之后构造一张 count-first 的绝对地址表，并写入 info->app_table。
 *
 * @param used 可选，返回镜像与目录表一共占用的字节数
 * @return 文件缺失、截断或边界不一致时返回 false
 */
bool load_app_image(const char *path, PhysicalMemoryLayout region, BootInfo *info, size_t *used = nullptr);

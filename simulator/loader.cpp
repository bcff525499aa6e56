// simulator/loader.cpp

#include <iostream>
#include <fstream>
#include <cstdint>

#include "loader.hpp"

#include <common/AppImg.hpp>
#include <kernel/KernelConfig.hpp>
#include <kernel/KernelUtils.hpp>

namespace
{
    uint64_t read_u64_le(const uint8_t *p)
    {
        uint64_t value = 0;
        for (int i = 7; i >= 0; --i)
            value = (value << 8) | p[i];
        return value;
    }
}

bool load_app_image(const char *path, PhysicalMemoryLayout region, BootInfo *info, size_t *used)
{
    std::ifstream f(path, std::ios::binary | std::ios::ate);
    if (!f)
    {
        std::cerr << "[Loader] Failed to open image: " << path << std::endl;
        return false;
    }

    // 1. 文件大小与头部
    std::streamoff file_size = f.tellg();
    if (file_size < (std::streamoff)AppImg::table_bytes(0))
    {
        std::cerr << "[Loader] Image too small: " << file_size << " bytes" << std::endl;
        return false;
    }
    f.seekg(0);

    AppImgHeader header{};
    f.read(reinterpret_cast<char *>(&header), sizeof(header));
    uint64_t count = read_u64_le(reinterpret_cast<const uint8_t *>(&header));

    if (!f || count > APP_DIR_MAX_COUNT || AppImg::table_bytes(count) > (uint64_t)file_size)
    {
        std::cerr << "[Loader] Corrupted app table header (count = " << count << ")" << std::endl;
        return false;
    }

    // 2. 容量检查：镜像本体 + 8 字节对齐 + 重建的目录表
    size_t image_size = (size_t)file_size;
    size_t table_offset = KernelUtils::Align::up(image_size, APP_TABLE_ENTRY_SIZE);
    size_t total = table_offset + (size_t)AppImg::table_bytes(count);
    if (region.base == nullptr || total > region.size)
    {
        std::cerr << "[Loader] Image needs " << total << " bytes, region has " << region.size << std::endl;
        return false;
    }

    // 3. 整个镜像原样读入模拟物理内存
    uint8_t *base = static_cast<uint8_t *>(region.base);
    f.seekg(0);
    f.read(reinterpret_cast<char *>(base), (std::streamsize)image_size);
    if (!f)
    {
        std::cerr << "[Loader] Short read on " << path << std::endl;
        return false;
    }

    // 4. 偏移 -> 绝对地址；任何越出文件的边界都视为损坏
    uint64_t *table = reinterpret_cast<uint64_t *>(base + table_offset);
    uint64_t blobs_begin = AppImg::table_bytes(count);
    table[0] = count;

    for (uint64_t i = 0; i <= count; ++i)
    {
        uint64_t offset = read_u64_le(base + sizeof(AppImgHeader) + i * sizeof(uint64_t));
        if (offset < blobs_begin || offset > (uint64_t)image_size)
        {
            std::cerr << "[Loader] Boundary " << i << " (offset " << offset << ") lies outside the blob area" << std::endl;
            return false;
        }
        table[i + 1] = (uint64_t)(uintptr_t)base + offset;
    }

    info->app_table = table;
    if (used)
        *used = total;

    std::cout << "[Loader] App image loaded: " << count << " apps, " << image_size << " bytes." << std::endl;
    return true;
}

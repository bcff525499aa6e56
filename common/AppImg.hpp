#pragma once
#include <cstdint>

// 扁平应用镜像 (apps.img) 的磁盘布局，由 mkappimg 生成、模拟器加载器读取：
//
//   +0                 uint64_t count
//   +8                 uint64_t boundaries[count + 1]   (相对镜像起点的偏移)
//   +8*(count+2)       [对齐填充]
//   boundaries[0]      app_0 字节 ... app_{count-1} 字节
//
// count 必须放在最前面：读者先拿到数量，才能一次性确定边界表的大小。
// 所有整数均为小端序。

#define APPIMG_ALIGN_MAX 4096

#pragma pack(push, 1)

struct AppImgHeader
{
    uint64_t count; // 8 bytes，紧随其后的是 count + 1 个 uint64_t 边界
};

#pragma pack(pop)

namespace AppImg
{
    // 边界表（含 count 本身）占用的字节数
    inline uint64_t table_bytes(uint64_t count)
    {
        return sizeof(AppImgHeader) + (count + 1) * sizeof(uint64_t);
    }
}

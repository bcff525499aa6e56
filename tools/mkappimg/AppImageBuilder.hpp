#pragma once

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * BuildError: 构建期错误（程序文件读不到、清单损坏、输出写不进去）
 * 只会在宿主机的构建步骤中抛出，绝不会出现在内核启动阶段
 */
class BuildError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * ProgramImage: 一个待嵌入的用户程序
 * index 由清单顺序决定；name 只在构建期使用
 */
struct ProgramImage
{
    uint32_t index;
    std::string name;
    std::string path;
    std::vector<uint8_t> bytes;
};

/**
 * AppPlacement: 程序在镜像中的半开区间 [start, end)
 */
struct AppPlacement
{
    uint64_t start;
    uint64_t end;

    uint64_t size() const { return end - start; }
};

// 以二进制方式读入整个程序文件
ProgramImage load_program(const std::string &name, const std::string &path, uint32_t index);

// 读取清单：每行 "<path>" 或 "<name> <path>"，# 开头为注释，相对路径以清单所在目录为基准
std::vector<ProgramImage> load_manifest(const std::string &manifest_path);

// 按输入顺序首尾相接地放置程序，每个起点向上对齐到 alignment
std::vector<AppPlacement> embed(const std::vector<ProgramImage> &programs, uint64_t base, size_t alignment);

/**
 * AppImageBuilder: 收集程序并产出两种制品
 *   1. link_app.S —— 带 .incbin 的汇编表，链接进内核静态数据段
 *   2. apps.img   —— 扁平镜像（count + 边界偏移 + 程序字节），供模拟器加载
 */
class AppImageBuilder
{
private:
    std::vector<ProgramImage> _programs;
    size_t _alignment;
    std::string _prefix;

public:
    explicit AppImageBuilder(size_t alignment = 1, const std::string &prefix = "");

    void add_manifest(const std::string &manifest_path);
    void add_program(const std::string &name, const std::string &path);

    const std::vector<ProgramImage> &programs() const { return _programs; }
    size_t alignment() const { return _alignment; }

    // 符号命名：prefix 为空时与手写表一致（_num_app / app_0_start）
    std::string table_symbol() const;
    std::string app_label(size_t index, const char *edge) const;
    std::string blobs_end_label() const;

    // 扁平镜像内的放置结果（偏移相对镜像起点）
    std::vector<AppPlacement> image_layout() const;

    std::string render_asm() const;
    std::vector<uint8_t> render_image() const;

    void write_asm(const std::string &path) const;
    void write_image(const std::string &path) const;
};

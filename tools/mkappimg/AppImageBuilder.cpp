#include "AppImageBuilder.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

#include <common/AppImg.hpp>
#include <kernel/KernelUtils.hpp>

namespace fs = std::filesystem;

namespace
{
    std::string trim(const std::string &s)
    {
        size_t b = s.find_first_not_of(" \t\r\n");
        if (b == std::string::npos)
            return "";
        size_t e = s.find_last_not_of(" \t\r\n");
        return s.substr(b, e - b + 1);
    }

    // 去掉成对的双引号；不成对返回 false
    bool unquote(std::string &field)
    {
        if (field.empty() || field[0] != '"')
            return true;
        if (field.size() < 2 || field.back() != '"' || field.find('"', 1) != field.size() - 1)
            return false;
        field = field.substr(1, field.size() - 2);
        return true;
    }

    void check_alignment(size_t alignment)
    {
        if (!KernelUtils::Bit::is_power_of_two(alignment) || alignment > APPIMG_ALIGN_MAX)
        {
            throw BuildError("alignment must be a power of two no larger than " +
                             std::to_string(APPIMG_ALIGN_MAX) + ", got " + std::to_string(alignment));
        }
    }

    void check_prefix(const std::string &prefix)
    {
        for (char c : prefix)
        {
            bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
            if (!ok)
                throw BuildError("symbol prefix '" + prefix + "' may only contain [A-Za-z0-9_]");
        }
    }

    // .incbin 的路径放在双引号里，反斜杠和引号需要转义
    std::string quote_path(const std::string &path)
    {
        std::string out = "\"";
        for (char c : path)
        {
            if (c == '\\' || c == '"')
                out += '\\';
            out += c;
        }
        out += '"';
        return out;
    }

    void put_u64_le(std::vector<uint8_t> &out, uint64_t value)
    {
        for (int i = 0; i < 8; ++i)
            out.push_back((uint8_t)(value >> (8 * i)));
    }
}

ProgramImage load_program(const std::string &name, const std::string &path, uint32_t index)
{
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw BuildError("cannot open program '" + name + "' at " + path);

    ProgramImage image;
    image.index = index;
    image.name = name;
    image.path = path;
    image.bytes.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());

    if (f.bad())
        throw BuildError("failed to read program '" + name + "' at " + path);

    return image;
}

std::vector<ProgramImage> load_manifest(const std::string &manifest_path)
{
    std::ifstream f(manifest_path);
    if (!f)
        throw BuildError("cannot open manifest " + manifest_path);

    fs::path base_dir = fs::path(manifest_path).parent_path();
    std::vector<ProgramImage> programs;

    std::string raw;
    size_t line_no = 0;
    while (std::getline(f, raw))
    {
        ++line_no;
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#')
            continue;

        // "<name> <path>" 或 "<path>"；含空格的路径需要用双引号括起来
        std::string name;
        std::string path;
        size_t split = line.find_first_of(" \t");
        if (line[0] == '"' || split == std::string::npos)
        {
            path = line;
        }
        else
        {
            name = line.substr(0, split);
            path = trim(line.substr(split));
        }

        if (!unquote(path) || path.empty())
            throw BuildError(manifest_path + ":" + std::to_string(line_no) + ": malformed program path: " + line);

        fs::path resolved(path);
        if (resolved.is_relative())
            resolved = base_dir / resolved;

        if (name.empty())
            name = resolved.stem().string();

        try
        {
            programs.push_back(load_program(name, resolved.string(), (uint32_t)programs.size()));
        }
        catch (const BuildError &e)
        {
            throw BuildError(manifest_path + ":" + std::to_string(line_no) + ": " + e.what());
        }
    }

    return programs;
}

std::vector<AppPlacement> embed(const std::vector<ProgramImage> &programs, uint64_t base, size_t alignment)
{
    check_alignment(alignment);

    std::vector<AppPlacement> placements;
    placements.reserve(programs.size());

    uint64_t cursor = base;
    for (const auto &program : programs)
    {
        uint64_t start = KernelUtils::Align::up(cursor, alignment);
        uint64_t end = start + program.bytes.size();
        placements.push_back({start, end});
        cursor = end;
    }

    return placements;
}

AppImageBuilder::AppImageBuilder(size_t alignment, const std::string &prefix)
    : _alignment(alignment), _prefix(prefix)
{
    check_alignment(alignment);
    check_prefix(prefix);
}

void AppImageBuilder::add_manifest(const std::string &manifest_path)
{
    for (auto &program : load_manifest(manifest_path))
    {
        program.index = (uint32_t)_programs.size();
        _programs.push_back(std::move(program));
    }
}

void AppImageBuilder::add_program(const std::string &name, const std::string &path)
{
    std::string effective = name.empty() ? fs::path(path).stem().string() : name;
    _programs.push_back(load_program(effective, path, (uint32_t)_programs.size()));
}

std::string AppImageBuilder::table_symbol() const
{
    return _prefix.empty() ? "_num_app" : _prefix + "_num_app";
}

std::string AppImageBuilder::app_label(size_t index, const char *edge) const
{
    std::string label = _prefix.empty() ? "" : _prefix + "_";
    return label + "app_" + std::to_string(index) + "_" + edge;
}

std::string AppImageBuilder::blobs_end_label() const
{
    return _prefix.empty() ? "app_blobs_end" : _prefix + "_app_blobs_end";
}

std::vector<AppPlacement> AppImageBuilder::image_layout() const
{
    uint64_t base = KernelUtils::Align::up(AppImg::table_bytes(_programs.size()), _alignment);
    return embed(_programs, base, _alignment);
}

std::string AppImageBuilder::render_asm() const
{
    std::ostringstream out;
    size_t n = _programs.size();

    // 目录表：count 在前，随后 N+1 个边界
    out << "    .section .data\n";
    out << "    .balign 8\n";
    out << "    .global " << table_symbol() << "\n";
    out << table_symbol() << ":\n";
    out << "    .quad " << n << "\n";
    for (size_t i = 0; i < n; ++i)
        out << "    .quad " << app_label(i, "start") << "\n";
    if (n > 0)
        out << "    .quad " << app_label(n - 1, "end") << "\n";
    else
        out << "    .quad " << blobs_end_label() << "\n";

    for (size_t i = 0; i < n; ++i)
    {
        out << "\n";
        out << "    .section .data\n";
        out << "    .global " << app_label(i, "start") << "\n";
        out << "    .global " << app_label(i, "end") << "\n";
        if (_alignment > 1)
            out << "    .balign " << _alignment << "\n";
        out << app_label(i, "start") << ":\n";
        out << "    .incbin " << quote_path(fs::absolute(_programs[i].path).string()) << "\n";
        out << app_label(i, "end") << ":\n";
    }

    out << "\n";
    out << "    .global " << blobs_end_label() << "\n";
    out << blobs_end_label() << ":\n";
    out << "\n";
    out << "    .section .note.GNU-stack,\"\",%progbits\n";
    return out.str();
}

std::vector<uint8_t> AppImageBuilder::render_image() const
{
    std::vector<AppPlacement> placements = image_layout();
    size_t n = _programs.size();

    std::vector<uint8_t> image;
    put_u64_le(image, n);

    uint64_t first = KernelUtils::Align::up(AppImg::table_bytes(n), _alignment);
    for (const auto &p : placements)
        put_u64_le(image, p.start);
    put_u64_le(image, n > 0 ? placements.back().end : first);

    for (size_t i = 0; i < n; ++i)
    {
        image.resize(placements[i].start, 0);
        image.insert(image.end(), _programs[i].bytes.begin(), _programs[i].bytes.end());
    }

    image.resize(n > 0 ? placements.back().end : first, 0);
    return image;
}

void AppImageBuilder::write_asm(const std::string &path) const
{
    std::ofstream f(path, std::ios::trunc);
    if (!f)
        throw BuildError("cannot write " + path);

    f << render_asm();
    if (!f)
        throw BuildError("failed while writing " + path);
}

void AppImageBuilder::write_image(const std::string &path) const
{
    std::vector<uint8_t> image = render_image();

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
        throw BuildError("cannot write " + path);

    f.write(reinterpret_cast<const char *>(image.data()), (std::streamsize)image.size());
    if (!f)
        throw BuildError("failed while writing " + path);
}

// mkappimg: 把清单中的用户程序打包成内核可链接的应用表
//
//   mkappimg [--manifest FILE] [--asm OUT.S] [--image OUT.img]
//            [--prefix SYM] [--align N] [--list] [program ...]

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "AppImageBuilder.hpp"

static void print_usage(const char *argv0)
{
    std::cerr << "usage: " << argv0
              << " [--manifest FILE] [--asm OUT.S] [--image OUT.img] [--prefix SYM] [--align N] [--list] [program ...]"
              << std::endl;
}

static void print_layout(const AppImageBuilder &builder)
{
    auto placements = builder.image_layout();
    const auto &programs = builder.programs();

    std::cout << "num_app = " << programs.size() << std::endl;
    for (size_t i = 0; i < programs.size(); ++i)
    {
        std::cout << "app_" << i << " " << std::left << std::setw(24) << programs[i].name
                  << std::right << " [0x" << std::hex << placements[i].start
                  << ", 0x" << placements[i].end << ")" << std::dec
                  << " " << placements[i].size() << " bytes" << std::endl;
    }
}

int main(int argc, char **argv)
{
    std::string manifest;
    std::string asm_out;
    std::string image_out;
    std::string prefix;
    size_t alignment = 1;
    bool list = false;
    std::vector<std::string> extra_programs;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        bool has_value = (i + 1 < argc);

        if (arg == "--manifest" && has_value)
            manifest = argv[++i];
        else if (arg == "--asm" && has_value)
            asm_out = argv[++i];
        else if (arg == "--image" && has_value)
            image_out = argv[++i];
        else if (arg == "--prefix" && has_value)
            prefix = argv[++i];
        else if (arg == "--align" && has_value)
        {
            char *end = nullptr;
            unsigned long long value = std::strtoull(argv[++i], &end, 0);
            if (end == nullptr || *end != '\0')
            {
                std::cerr << "[mkappimg] invalid alignment: " << argv[i] << std::endl;
                return 1;
            }
            alignment = (size_t)value;
        }
        else if (arg == "--list")
            list = true;
        else if (arg == "-h" || arg == "--help")
        {
            print_usage(argv[0]);
            return 0;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << "[mkappimg] unknown or incomplete option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
        else
            extra_programs.push_back(arg);
    }

    if (asm_out.empty() && image_out.empty() && !list)
    {
        std::cerr << "[mkappimg] nothing to do: pass --asm, --image or --list" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    try
    {
        AppImageBuilder builder(alignment, prefix);

        if (!manifest.empty())
            builder.add_manifest(manifest);
        for (const auto &path : extra_programs)
            builder.add_program("", path);

        if (!asm_out.empty())
            builder.write_asm(asm_out);
        if (!image_out.empty())
            builder.write_image(image_out);
        if (list)
            print_layout(builder);

        std::cerr << "[mkappimg] packed " << builder.programs().size() << " programs" << std::endl;
    }
    catch (const BuildError &e)
    {
        std::cerr << "[mkappimg] build error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[mkappimg] error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

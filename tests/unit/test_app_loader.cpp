#include <cstdint>
#include <cstring>
#include <vector>

#include "test_framework.hpp"
#include "mock/LoggerMock.hpp"
#include "kernel/AppLoader.hpp"

namespace
{
    // 三个程序：10 字节 / 空 / 4 字节，紧密排列
    uint8_t g_blobs[] = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'A', 'B', 'C', 'D'};

    struct LoaderFixture
    {
        uint64_t table[5];
        AppDirectory dir;
        std::vector<uint8_t> slots;

        LoaderFixture(size_t slot_size, size_t max_apps)
            : slots(slot_size * max_apps, 0xCC)
        {
            uint64_t A = (uint64_t)(uintptr_t)g_blobs;
            uint64_t t[] = {3, A, A + 10, A + 10, A + 14};
            std::memcpy(table, t, sizeof(t));
            dir.build_from_table(table);
        }

        AppSlotLayout layout(size_t slot_size, size_t max_apps)
        {
            return AppSlotLayout{reinterpret_cast<uintptr_t>(slots.data()), slot_size, max_apps};
        }
    };
}

void test_loader_copies_and_clears_slot()
{
    LoaderFixture fx(32, 3);
    AppLoader loader(fx.dir, fx.layout(32, 3));

    AppRange loaded{};
    K_T_ASSERT(loader.load_app(0, loaded) == AppDirStatus::OK, "load app_0 failed");
    K_T_ASSERT(loaded.start == (uint64_t)(uintptr_t)fx.slots.data(), "app_0 not at slot 0");
    K_T_ASSERT(loaded.size() == 10, "app_0 loaded size " << loaded.size());
    K_T_ASSERT(std::memcmp(fx.slots.data(), "0123456789", 10) == 0, "app_0 bytes differ");

    // 槽位剩余部分必须被清零，且不越界写到下一个槽位
    for (size_t i = 10; i < 32; ++i)
        K_T_ASSERT(fx.slots[i] == 0, "slot 0 byte " << i << " not cleared");
    K_T_ASSERT(fx.slots[32] == 0xCC, "load spilled into slot 1");

    K_T_ASSERT(loader.load_app(2, loaded) == AppDirStatus::OK, "load app_2 failed");
    K_T_ASSERT(std::memcmp(fx.slots.data() + 64, "ABCD", 4) == 0, "app_2 bytes differ");
    K_T_ASSERT(loaded.start == (uint64_t)(uintptr_t)(fx.slots.data() + 64), "app_2 slot address");
}

void test_loader_empty_program()
{
    LoaderFixture fx(16, 3);
    AppLoader loader(fx.dir, fx.layout(16, 3));

    AppRange loaded{};
    K_T_ASSERT(loader.load_app(1, loaded) == AppDirStatus::OK, "empty app_1 should load");
    K_T_ASSERT(loaded.empty(), "empty app_1 produced bytes");
    for (size_t i = 16; i < 32; ++i)
        K_T_ASSERT(fx.slots[i] == 0, "slot 1 not cleared");
}

void test_loader_unknown_program()
{
    LoaderFixture fx(16, 4);
    AppLoader loader(fx.dir, fx.layout(16, 4));

    LogCapture::clear();
    AppRange loaded{7, 7};
    K_T_ASSERT(loader.load_app(3, loaded) == AppDirStatus::INDEX_OUT_OF_RANGE, "app_3 does not exist");
    K_T_ASSERT(loader.load_app(-1, loaded) == AppDirStatus::INDEX_OUT_OF_RANGE, "app_-1 does not exist");
    K_T_ASSERT(LogCapture::contains("unknown program requested"), "unknown program not reported");
    K_T_ASSERT(loaded.start == 7 && loaded.end == 7, "output touched on failure");

    for (uint8_t b : fx.slots)
        K_T_ASSERT(b == 0xCC, "slot memory touched for unknown program");
}

void test_loader_overflow()
{
    // 槽位只有 8 字节：app_0 (10 字节) 放不下
    LoaderFixture fx(8, 3);
    AppLoader loader(fx.dir, fx.layout(8, 3));

    AppRange loaded{};
    K_T_ASSERT(loader.load_app(0, loaded) == AppDirStatus::LOAD_OVERFLOW, "oversized app accepted");
    for (size_t i = 0; i < 8; ++i)
        K_T_ASSERT(fx.slots[i] == 0xCC, "oversized app partially copied");

    // 只有 2 个槽位：app_2 无处可放
    LoaderFixture fx2(16, 2);
    AppLoader loader2(fx2.dir, fx2.layout(16, 2));
    K_T_ASSERT(loader2.load_app(2, loaded) == AppDirStatus::LOAD_OVERFLOW, "app without slot accepted");

    size_t count = 0;
    K_T_ASSERT(loader2.load_all(count) == AppDirStatus::LOAD_OVERFLOW, "load_all should stop at app_2");
    K_T_ASSERT(count == 2, "load_all loaded " << count);
}

void test_loader_batch_cursor()
{
    LoaderFixture fx(16, 3);
    AppLoader loader(fx.dir, fx.layout(16, 3));

    size_t count = 0;
    K_T_ASSERT(loader.load_all(count) == AppDirStatus::OK, "load_all failed");
    K_T_ASSERT(count == 3, "load_all count " << count);

    std::vector<size_t> order;
    while (loader.has_next())
    {
        order.push_back(loader.current_app());
        loader.move_to_next_app();
    }

    K_T_ASSERT((order == std::vector<size_t>{0, 1, 2}), "batch order wrong");
    K_T_ASSERT(!loader.has_next(), "cursor should be exhausted");
}

void test_loader_slot_addresses()
{
    LoaderFixture fx(0x20, 3);
    AppLoader loader(fx.dir, fx.layout(0x20, 3));

    AppRange slot{};
    K_T_ASSERT(loader.slot_of(2, slot) == AppDirStatus::OK, "slot_of(2)");
    uint64_t base = (uint64_t)(uintptr_t)fx.slots.data();
    K_T_ASSERT(slot.start == base + 0x40 && slot.end == base + 0x60, "slot 2 address");
    K_T_ASSERT(loader.slot_of(3, slot) == AppDirStatus::LOAD_OVERFLOW, "slot beyond max_apps");
}

K_TEST_CASE("AppLoader: copy into cleared slot", test_loader_copies_and_clears_slot);
K_TEST_CASE("AppLoader: zero-length program", test_loader_empty_program);
K_TEST_CASE("AppLoader: unknown program refused", test_loader_unknown_program);
K_TEST_CASE("AppLoader: slot overflow", test_loader_overflow);
K_TEST_CASE("AppLoader: batch cursor order", test_loader_batch_cursor);
K_TEST_CASE("AppLoader: slot addresses", test_loader_slot_addresses);

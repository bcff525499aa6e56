#include <cstdint>
#include <cstdlib>
#include <stdexcept>

#include "test_framework.hpp"
#include "kernel/StaticLayoutAllocator.hpp"
#include "kernel/KernelObjectBuilder.hpp"

void test_allocator_out_of_memory()
{
    alignas(16) uint8_t buffer[64];
    StaticLayoutAllocator allocator(buffer, sizeof(buffer));

    // 契约验证：不应崩溃，应返回 nullptr
    if (allocator.allocate(128) != nullptr)
    {
        throw std::runtime_error("Allocator handed out memory beyond its limits!");
    }

    K_T_ASSERT(allocator.allocate(60, 4) != nullptr, "fitting allocation refused");
    K_T_ASSERT(allocator.allocate(8, 8) == nullptr, "padding pushed the allocation past the end");
}

void test_allocator_alignment_integrity()
{
    size_t pool_size = 8192;
    void *pool = std::malloc(pool_size);
    PhysicalMemoryLayout layout{pool, pool_size};
    StaticLayoutAllocator *allocator = StaticLayoutAllocator::create(layout);

    // 先申请一个奇数大小，观察下一次分配是否依然对齐
    allocator->allocate(13, 1);
    void *p2 = allocator->allocate(8, 8);
    void *page = allocator->allocate(16, 4096);

    K_T_ASSERT(reinterpret_cast<uintptr_t>(p2) % 8 == 0, "subsequent allocation lost alignment");
    K_T_ASSERT(page != nullptr && reinterpret_cast<uintptr_t>(page) % 4096 == 0, "page alignment");
    K_T_ASSERT(allocator->allocate(8, 3) == nullptr, "non power-of-two alignment accepted");

    std::free(pool);
}

void test_allocator_no_overlap()
{
    alignas(16) uint8_t buffer[2048];
    StaticLayoutAllocator allocator(buffer, sizeof(buffer));

    uint64_t *p1 = (uint64_t *)allocator.allocate(64);
    for (int i = 0; i < 8; ++i)
        p1[i] = 0xAAAAAAAAAAAAAAAA;

    uint64_t *p2 = (uint64_t *)allocator.allocate(64);
    for (int i = 0; i < 8; ++i)
        p2[i] = 0xBBBBBBBBBBBBBBBB;

    for (int i = 0; i < 8; ++i)
    {
        if (p1[i] != 0xAAAAAAAAAAAAAAAA)
        {
            throw std::runtime_error("Memory overlap detected: Object A corrupted by Object B");
        }
    }
}

void test_allocator_create_rejects_tiny_layout()
{
    alignas(16) uint8_t buffer[8];
    PhysicalMemoryLayout layout{buffer, sizeof(buffer)};
    K_T_ASSERT(StaticLayoutAllocator::create(layout) == nullptr, "allocator created inside 8 bytes");
}

void test_builder_tracks_objects()
{
    alignas(16) uint8_t buffer[256];
    StaticLayoutAllocator allocator(buffer, sizeof(buffer));
    KernelObjectBuilder builder(&allocator);

    struct Pair
    {
        uint64_t a;
        uint64_t b;
        Pair(uint64_t x, uint64_t y) : a(x), b(y) {}
    };

    Pair *p = builder.construct<Pair>(1, 2);
    K_T_ASSERT(p != nullptr && p->a == 1 && p->b == 2, "construct did not forward arguments");
    K_T_ASSERT(builder.get_active_objects() == 1, "active object count");

    builder.destroy(p);
    K_T_ASSERT(builder.get_active_objects() == 0, "destroy did not decrement");
}

K_TEST_CASE("StaticLayoutAllocator: out of memory", test_allocator_out_of_memory);
K_TEST_CASE("StaticLayoutAllocator: alignment", test_allocator_alignment_integrity);
K_TEST_CASE("StaticLayoutAllocator: no overlap", test_allocator_no_overlap);
K_TEST_CASE("StaticLayoutAllocator: tiny layout", test_allocator_create_rejects_tiny_layout);
K_TEST_CASE("KernelObjectBuilder: object accounting", test_builder_tracks_objects);

#include "memory/AlignedAlloc.hpp"
#include "memory/FieldBuffer.hpp"
#include "memory/MemoryManager.hpp"
#include <catch2/catch_all.hpp>
#include <cstdint>
#include <utility>

using wavegrid::memory::FieldBuffer;
using wavegrid::memory::MemoryManager;

TEMPLATE_TEST_CASE("Aligned allocations respect HW boundary", "[memory][alignment]", float, double,
                   int64_t)
{
    auto& mm = MemoryManager::instance();
    const std::size_t N = 257; // an odd count
    TestType* ptr = mm.allocate<TestType>(N);
    REQUIRE(reinterpret_cast<uintptr_t>(ptr) % wavegrid::memory::HW_ALIGN == 0);

    mm.release(ptr);
}

TEST_CASE("MemoryManager registry tracks blocks", "[memory][registry]")
{
    auto& mm = MemoryManager::instance();
    const auto base = mm.debug_count();
    auto* p1 = mm.allocate<double>(100);
    auto* p2 = mm.allocate<double>(50);

    REQUIRE(mm.debug_count() == base + 2);
    CHECK(mm.owns(p1));

    mm.release(p1);
    mm.release(p2);
    REQUIRE(mm.debug_count() == base);
    CHECK_FALSE(mm.owns(p1));

    // unknown and null pointers are ignored
    int local = 0;
    mm.release(&local);
    mm.release(nullptr);
    CHECK(mm.debug_count() == base);
}

TEST_CASE("FieldBuffer gives its block back on reset", "[memory][fieldbuffer]")
{
    auto& mm = MemoryManager::instance();
    const auto base = mm.bytes_in_use();

    FieldBuffer buf({3, 4, 5});
    REQUIRE(buf.allocated());
    CHECK(buf.count() == 60u);
    CHECK(mm.bytes_in_use() == base + 60 * sizeof(float));
    CHECK(buf.span()[59] == 0.f); // zero-filled

    buf.reset();
    CHECK_FALSE(buf.allocated());
    CHECK(buf.span().empty());
    CHECK(buf.shape() == std::vector<int>({3, 4, 5})); // shape survives the release
    CHECK(mm.bytes_in_use() == base);
}

TEST_CASE("FieldBuffer ownership moves", "[memory][fieldbuffer]")
{
    auto& mm = MemoryManager::instance();
    const auto base = mm.debug_count();
    {
        FieldBuffer a({8});
        a.data()[0] = 4.f;
        FieldBuffer b(std::move(a));
        CHECK_FALSE(a.allocated());
        REQUIRE(b.allocated());
        CHECK(b.data()[0] == 4.f);
        CHECK(mm.debug_count() == base + 1);

        FieldBuffer c({2});
        c = std::move(b); // c's own block is released first
        CHECK(mm.debug_count() == base + 1);
        CHECK(c.shape() == std::vector<int>({8}));
    }
    CHECK(mm.debug_count() == base);
}

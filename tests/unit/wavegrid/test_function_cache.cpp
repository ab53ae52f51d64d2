#include "master/Errors.hpp"
#include "master/FunctionCache.hpp"
#include "memory/MemoryManager.hpp"
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace wavegrid::master;

namespace
{

struct CountingFactory
{
    int calls = 0;
    std::vector<int> shape{4, 4};

    FunctionCache::Factory make(const std::string& name)
    {
        return [this, name]
        {
            ++calls;
            auto f = std::make_shared<FunctionDecl>();
            f->name = name;
            f->data = wavegrid::memory::FieldBuffer(shape);
            return f;
        };
    }
};

} // namespace

TEST_CASE("Repeated requests reuse the cached declaration", "[cache]")
{
    FunctionCache cache;
    CountingFactory fac;

    auto a = cache.get_or_create("vp", fac.make("vp"));
    auto b = cache.get_or_create("vp", fac.make("vp"));
    CHECK(fac.calls == 1);
    CHECK(a == b);
    CHECK(cache.contains("vp"));
    CHECK(cache.size() == 1);
    CHECK(cache.find("vp") == a);
    CHECK(cache.find("missing") == nullptr);
}

TEST_CASE("Released names are rebuilt on the next request", "[cache]")
{
    FunctionCache cache;
    CountingFactory fac;

    auto a = cache.get_or_create("p", fac.make("p"));
    cache.release("p");
    CHECK_FALSE(cache.contains("p"));
    CHECK_FALSE(a->allocated()); // holders keep a valid, empty declaration

    auto b = cache.get_or_create("p", fac.make("p"));
    CHECK(fac.calls == 2);
    CHECK(a != b);
    CHECK(b->allocated());

    cache.release("never-created"); // ignored
    CHECK(cache.size() == 1);
}

TEST_CASE("A fresh request replaces the entry after freeing the old buffer", "[cache]")
{
    auto& mm = wavegrid::memory::MemoryManager::instance();
    const auto base = mm.debug_count();

    FunctionCache cache;
    CountingFactory fac;

    auto a = cache.get_or_create("u", fac.make("u"));
    CHECK(mm.debug_count() == base + 1);

    auto b = cache.get_or_create("u", fac.make("u"), /*reuse*/ false);
    CHECK(fac.calls == 2);
    CHECK(a != b);
    CHECK_FALSE(a->allocated());
    CHECK(mm.debug_count() == base + 1); // never two live buffers under one name
    CHECK(cache.names() == std::vector<std::string>{"u"});
}

TEST_CASE("Deallocate frees the buffer but keeps the declaration", "[cache]")
{
    auto& mm = wavegrid::memory::MemoryManager::instance();
    const auto base = mm.bytes_in_use();

    FunctionCache cache;
    CountingFactory fac;
    fac.shape = {256, 256};

    auto a = cache.get_or_create("big", fac.make("big"));
    CHECK(mm.bytes_in_use() == base + 256 * 256 * sizeof(float));

    cache.deallocate("big");
    CHECK(mm.bytes_in_use() == base);
    CHECK(cache.contains("big"));
    CHECK_FALSE(a->allocated());
    CHECK(a->shape() == std::vector<int>({256, 256}));
}

TEST_CASE("Listing keeps creation order and clear empties the cache", "[cache]")
{
    auto& mm = wavegrid::memory::MemoryManager::instance();
    const auto base = mm.debug_count();
    FunctionCache cache;
    CountingFactory fac;

    for (const char* n : {"vp", "p", "src", "rec"})
        cache.get_or_create(n, fac.make(n));
    CHECK(cache.names() == std::vector<std::string>{"vp", "p", "src", "rec"});
    REQUIRE(cache.all().size() == 4);
    CHECK(cache.all()[2]->name == "src");

    cache.release("p");
    CHECK(cache.names() == std::vector<std::string>{"vp", "src", "rec"});

    cache.clear();
    CHECK(cache.size() == 0);
    CHECK(mm.debug_count() == base);
}

TEST_CASE("A factory must produce a declaration", "[cache][errors]")
{
    FunctionCache cache;
    CHECK_THROWS_AS(cache.get_or_create("x", [] { return FunctionCache::Handle{}; }),
                    wavegrid::ConfigurationError);
    CHECK_FALSE(cache.contains("x"));
}

TEST_CASE("Function kinds have stable display names", "[cache]")
{
    CHECK(std::string(function_kind_name(FunctionKind::Function)) == "Function");
    CHECK(std::string(function_kind_name(FunctionKind::TimeFunction)) == "TimeFunction");
    CHECK(std::string(function_kind_name(FunctionKind::SparseTimeFunction)) ==
          "SparseTimeFunction");
    CHECK(std::string(function_kind_name(FunctionKind::PrecomputedSparseTimeFunction)) ==
          "PrecomputedSparseTimeFunction");
}

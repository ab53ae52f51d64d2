#pragma once
#include "master/FunctionDecl.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

/**
 * @file FunctionCache.hpp
 * @brief Name-keyed memo of function declarations with eager buffer release.
 *
 * @details
 * Every function request goes through the cache. A request for a name that is already cached
 * returns the existing declaration unless the caller asks for a fresh one; a fresh one replaces
 * the old entry after the old buffer has been released, so at most one valid declaration
 * exists per name.
 *
 * :cpp:func:`FunctionCache::release` hands the buffer back to the MemoryManager before it
 * returns. Holders of the declaration keep a valid object with ``allocated() == false``.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   FunctionCache cache;
 *   auto u = cache.get_or_create("u", [&]{ return make_decl("u"); });
 *   auto same = cache.get_or_create("u", [&]{ return make_decl("u"); }); // factory not called
 *   cache.release("u");   // buffer freed here
 * @endrst
 *
 * @note Not synchronised: one cache belongs to one problem instance.
 */

namespace wavegrid::master
{

class FunctionCache
{
  public:
    using Handle = std::shared_ptr<FunctionDecl>;
    using Factory = std::function<Handle()>;

    Handle get_or_create(const std::string& name, const Factory& factory, bool reuse = true);

    /// Drop the declaration and free its buffer now. Unknown names are ignored.
    void release(std::string_view name);

    /// Free the buffer but keep the declaration cached.
    void deallocate(std::string_view name);

    bool contains(std::string_view name) const noexcept;
    Handle find(std::string_view name) const;
    std::size_t size() const noexcept { return entries_.size(); }
    std::vector<std::string> names() const;
    std::vector<Handle> all() const;

    void clear();

    ~FunctionCache();

  private:
    std::unordered_map<std::string, Handle> entries_;
    std::vector<std::string> order_; // creation order, for deterministic listing
};

} // namespace wavegrid::master

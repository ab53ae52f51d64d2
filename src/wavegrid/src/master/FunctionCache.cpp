#include "master/FunctionCache.hpp"
#include "master/Errors.hpp"
#include "master/Log.hpp"
#include <algorithm>

using namespace wavegrid::master;

FunctionCache::Handle FunctionCache::get_or_create(const std::string& name, const Factory& factory,
                                                   bool reuse)
{
    auto it = entries_.find(name);
    if (reuse && it != entries_.end())
        return it->second;

    if (it != entries_.end())
        release(name); // never two live declarations under one name

    Handle fun = factory();
    if (!fun)
        throw ConfigurationError("FunctionCache: factory for '" + name + "' returned nothing");

    entries_[name] = fun;
    order_.push_back(name);
    LOGD("function cache: created '%s' (%zu entries)\n", name.c_str(), entries_.size());
    return fun;
}

void FunctionCache::release(std::string_view name)
{
    auto it = entries_.find(std::string(name));
    if (it == entries_.end())
        return;

    it->second->data.reset();
    entries_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
    LOGD("function cache: released '%.*s'\n", static_cast<int>(name.size()), name.data());
}

void FunctionCache::deallocate(std::string_view name)
{
    auto it = entries_.find(std::string(name));
    if (it != entries_.end())
        it->second->data.reset();
}

bool FunctionCache::contains(std::string_view name) const noexcept
{
    return entries_.find(std::string(name)) != entries_.end();
}

FunctionCache::Handle FunctionCache::find(std::string_view name) const
{
    auto it = entries_.find(std::string(name));
    return it == entries_.end() ? nullptr : it->second;
}

std::vector<std::string> FunctionCache::names() const
{
    return order_;
}

std::vector<FunctionCache::Handle> FunctionCache::all() const
{
    std::vector<Handle> out;
    out.reserve(order_.size());
    for (const auto& n : order_)
        out.push_back(entries_.at(n));
    return out;
}

void FunctionCache::clear()
{
    for (auto& kv : entries_)
        kv.second->data.reset();
    entries_.clear();
    order_.clear();
}

FunctionCache::~FunctionCache()
{
    clear();
}

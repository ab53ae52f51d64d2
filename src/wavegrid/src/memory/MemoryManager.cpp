#include "memory/MemoryManager.hpp"

namespace wavegrid::memory
{

MemoryManager& MemoryManager::instance()
{
    static MemoryManager mm;
    return mm;
}

std::size_t MemoryManager::debug_count() const noexcept
{
    std::lock_guard<std::mutex> lk(mtx_);
    return registry_.size();
}

bool MemoryManager::owns(const void* host_ptr) const noexcept
{
    std::lock_guard<std::mutex> lk(mtx_);
    return registry_.find(host_ptr) != registry_.end();
}

std::size_t MemoryManager::bytes_in_use() const noexcept
{
    std::lock_guard<std::mutex> lk(mtx_);
    std::size_t total = 0;
    for (const auto& kv : registry_)
        total += kv.second.bytes;
    return total;
}

void MemoryManager::release(void* host_ptr) noexcept
{
    if (!host_ptr)
        return;
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = registry_.find(host_ptr);
    if (it == registry_.end())
        return;

    aligned_free(it->second.host);
    registry_.erase(it);
}

MemoryManager::~MemoryManager()
{
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto& kv : registry_)
        aligned_free(kv.second.host);
    registry_.clear();
}

} // namespace wavegrid::memory

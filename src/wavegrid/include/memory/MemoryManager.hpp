#pragma once
#include "memory/AlignedAlloc.hpp"
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <unordered_map>

/**
 * @defgroup memory Field buffer ownership
 * @brief Allocation and deterministic release of the large per-function buffers.
 *
 * Every buffer a function declaration needs is obtained from the MemoryManager and
 * returned to it the moment the declaration is released. Nothing waits on a later sweep:
 * when many large fields are declared and discarded in sequence, peak memory stays at
 * the size of the fields that are actually alive.
 *
 * @note All raw pointers returned by this layer are **owned** by the MemoryManager.
 * Non‑owning access goes through FieldBuffer.
 * @see MemoryManager, FieldBuffer
 */

/**
 * @file MemoryManager.hpp
 * @ingroup memory
 * @brief Singleton owner of all field buffers.
 *
 * ### Thread‑safety
 * All public methods are thread‑safe. The registry is protected by a mutex.
 *
 * ### Typical use
 * @rst
 *.. code-block:: cpp
 *
 *   auto& mm = MemoryManager::instance();
 *   float* u = mm.allocate<float>(nx_ext*ny_ext);
 *   // ...
 *   mm.release(u);
 * @endrst
 *
 * @warning Pointers are invalid after \c release.
 */

namespace wavegrid::memory
{

struct Block
{
    void* host = nullptr;
    std::size_t bytes = 0;
};

class MemoryManager
{
  public:
    static MemoryManager& instance();

    template <class T> T* allocate(std::size_t n);

    void release(void* host_ptr) noexcept;

    bool owns(const void* host_ptr) const noexcept;
    std::size_t bytes_in_use() const noexcept;

    // Introspection for tests
    std::size_t debug_count() const noexcept;

    ~MemoryManager();

  private:
    MemoryManager() = default;
    MemoryManager(const MemoryManager&) = delete;
    MemoryManager& operator=(const MemoryManager&) = delete;

    mutable std::mutex mtx_;
    std::unordered_map<const void*, Block> registry_; // keyed by host pointer
};

// ---- template implementation ----

template <class T> T* MemoryManager::allocate(std::size_t n)
{
    const std::size_t bytes = n * sizeof(T);
    Block blk{};
    blk.host = aligned_malloc(bytes);
    blk.bytes = bytes;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        registry_.emplace(blk.host, blk);
    }
    return static_cast<T*>(blk.host);
}

} // namespace wavegrid::memory

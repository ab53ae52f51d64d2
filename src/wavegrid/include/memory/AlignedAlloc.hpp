#pragma once
#include <cstddef>
#include <cstdlib>
#include <new>

/**
 * @file AlignedAlloc.hpp
 * @ingroup memory
 * @brief Low‑level aligned allocation helpers for host memory.
 *
 * Provides \c aligned_malloc(bytes, alignment) and \c aligned_free(ptr) used by the
 * memory subsystem so field buffers start on a cache line (≥64 B by default), which is
 * what the stencil backend assumes for its vectorised loads.
 */

namespace wavegrid::memory
{

inline constexpr std::size_t HW_ALIGN = 64;

inline void* aligned_malloc(std::size_t bytes, std::size_t alignment = HW_ALIGN)
{
    // std::aligned_alloc requires size multiple of alignment
    if (alignment == 0 || (alignment & (alignment - 1)) != 0)
        alignment = HW_ALIGN;
    std::size_t padded = ((bytes + alignment - 1) / alignment) * alignment;
    if (padded == 0)
        padded = alignment;
    void* p = std::aligned_alloc(alignment, padded);
    if (!p)
        throw std::bad_alloc{};
    return p;
}

inline void aligned_free(void* p) noexcept
{
    std::free(p);
}

} // namespace wavegrid::memory

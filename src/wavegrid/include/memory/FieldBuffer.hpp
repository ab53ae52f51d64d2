#pragma once
#include "memory/MemoryManager.hpp"
#include <algorithm>
#include <cstddef>
#include <numeric>
#include <span>
#include <utility>
#include <vector>

/**
 * @file FieldBuffer.hpp
 * @ingroup memory
 * @brief Move-only ownership handle for one function's float32 data.
 *
 * The handle allocates a zero-filled block from the MemoryManager on construction and gives
 * it back in \c reset() or the destructor. \c reset() is the explicit "drop the buffer now"
 * operation used when a cached function is released while other code still holds its
 * declaration.
 *
 * @rst
 *.. code-block:: cpp
 *
 *   FieldBuffer buf({nt, nx, ny});
 *   buf.data()[0] = 1.f;
 *   buf.reset();          // block is back in the MemoryManager here
 *   REQUIRE(!buf.allocated());
 * @endrst
 */

namespace wavegrid::memory
{

class FieldBuffer
{
  public:
    FieldBuffer() = default;

    explicit FieldBuffer(std::vector<int> shape) : shape_(std::move(shape))
    {
        const std::size_t n = count();
        data_ = MemoryManager::instance().allocate<float>(n);
        std::fill_n(data_, n, 0.f);
    }

    FieldBuffer(const FieldBuffer&) = delete;
    FieldBuffer& operator=(const FieldBuffer&) = delete;

    FieldBuffer(FieldBuffer&& o) noexcept : data_(o.data_), shape_(std::move(o.shape_))
    {
        o.data_ = nullptr;
    }
    FieldBuffer& operator=(FieldBuffer&& o) noexcept
    {
        if (this != &o)
        {
            reset();
            data_ = o.data_;
            shape_ = std::move(o.shape_);
            o.data_ = nullptr;
        }
        return *this;
    }

    ~FieldBuffer() { reset(); }

    void reset() noexcept
    {
        if (data_)
            MemoryManager::instance().release(data_);
        data_ = nullptr;
    }

    bool allocated() const noexcept { return data_ != nullptr; }

    float* data() noexcept { return data_; }
    const float* data() const noexcept { return data_; }

    std::span<float> span() noexcept { return {data_, data_ ? count() : 0}; }
    std::span<const float> span() const noexcept { return {data_, data_ ? count() : 0}; }

    const std::vector<int>& shape() const noexcept { return shape_; }

    std::size_t count() const noexcept
    {
        return std::accumulate(shape_.begin(), shape_.end(), std::size_t{1},
                               [](std::size_t a, int b) { return a * static_cast<std::size_t>(b); });
    }

  private:
    float* data_ = nullptr;
    std::vector<int> shape_;
};

} // namespace wavegrid::memory

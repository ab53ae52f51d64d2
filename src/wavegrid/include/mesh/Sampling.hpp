#pragma once
#include <cstddef>
#include <vector>

/**
 * @file Sampling.hpp
 * @brief 1-D sample generation shared by the spatial and temporal grids.
 *
 * Coordinates are evaluated in double precision as \c start + i*step and stored as float32;
 * the last sample is pinned to \c stop so the endpoint never drifts with rounding. The
 * stencil backend works in float32 and compares these arrays bit for bit.
 */

namespace wavegrid::mesh
{

// Half-open index window [begin, end) along one axis.
struct Range
{
    int begin = 0;
    int end = 0;

    int size() const noexcept { return end - begin; }
    bool contains(int i) const noexcept { return i >= begin && i < end; }
    bool operator==(const Range&) const = default;
};

inline std::vector<float> linspace_f32(double start, double stop, int num)
{
    std::vector<float> out;
    if (num <= 0)
        return out;
    out.resize(static_cast<std::size_t>(num));
    if (num == 1)
    {
        out[0] = static_cast<float>(start);
        return out;
    }
    const double step = (stop - start) / static_cast<double>(num - 1);
    for (int i = 0; i < num; ++i)
        out[static_cast<std::size_t>(i)] = static_cast<float>(start + step * i);
    out.back() = static_cast<float>(stop);
    return out;
}

inline std::vector<int> arange(int num)
{
    std::vector<int> out(static_cast<std::size_t>(num > 0 ? num : 0));
    for (int i = 0; i < num; ++i)
        out[static_cast<std::size_t>(i)] = i;
    return out;
}

} // namespace wavegrid::mesh

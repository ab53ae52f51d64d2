#include "mesh/SpatialGrid.hpp"
#include "master/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <utility>

namespace wavegrid::mesh
{

namespace
{

std::size_t product(const std::vector<int>& v)
{
    return std::accumulate(v.begin(), v.end(), std::size_t{1},
                           [](std::size_t a, int b) { return a * static_cast<std::size_t>(b); });
}

// Tensor-product mesh over per-axis 1-D arrays. With xy=true the first two axes of the output
// layout are swapped (Cartesian indexing), otherwise the layout follows the axes (ij).
template <class T>
std::vector<std::vector<T>> meshgrid(const std::vector<std::vector<T>>& axes, bool xy)
{
    const int d = static_cast<int>(axes.size());
    std::vector<int> out_shape(d);
    std::vector<int> axis_at(d); // which input axis drives each output position
    for (int p = 0; p < d; ++p)
        axis_at[p] = p;
    if (xy && d >= 2)
        std::swap(axis_at[0], axis_at[1]);
    for (int p = 0; p < d; ++p)
        out_shape[p] = static_cast<int>(axes[axis_at[p]].size());

    const std::size_t total = product(out_shape);
    std::vector<std::vector<T>> out(d, std::vector<T>(total));
    if (total == 0)
        return out;

    std::vector<int> idx(d, 0);
    for (std::size_t lin = 0; lin < total; ++lin)
    {
        for (int p = 0; p < d; ++p)
            out[axis_at[p]][lin] = axes[axis_at[p]][idx[p]];
        for (int p = d - 1; p >= 0; --p)
        {
            if (++idx[p] < out_shape[p])
                break;
            idx[p] = 0;
        }
    }
    return out;
}

template <class T, class F>
const T& cached(std::optional<T>& slot, F&& build)
{
    if (!slot)
        slot.emplace(std::forward<F>(build)());
    return *slot;
}

} // namespace

SpatialGrid::SpatialGrid(std::vector<int> shape, double spacing, std::vector<int> extra,
                         std::vector<int> absorbing)
    : SpatialGrid(shape, std::vector<double>(shape.size(), spacing), std::move(extra),
                  std::move(absorbing))
{
}

SpatialGrid::SpatialGrid(std::vector<int> shape, std::vector<double> spacing,
                         std::vector<int> extra, std::vector<int> absorbing)
    : shape_(std::move(shape)), spacing_(std::move(spacing)), extra_(std::move(extra)),
      absorbing_(std::move(absorbing))
{
    const std::size_t d = shape_.size();
    if (d == 0)
        throw ConfigurationError("SpatialGrid: shape must have at least one axis");
    if (spacing_.size() == 1 && d > 1)
        spacing_.assign(d, spacing_[0]);
    if (extra_.empty())
        extra_.assign(d, 0);
    if (absorbing_.empty())
        absorbing_.assign(d, 0);
    if (spacing_.size() != d || extra_.size() != d || absorbing_.size() != d)
        throw ConfigurationError("SpatialGrid: shape, spacing, extra and absorbing must have " +
                                 std::to_string(d) + " entries");

    for (std::size_t i = 0; i < d; ++i)
    {
        const std::string ax = std::to_string(i);
        if (shape_[i] < 1)
            throw ConfigurationError("SpatialGrid: shape[" + ax + "] must be positive");
        if (!(spacing_[i] > 0.0) || !std::isfinite(spacing_[i]))
            throw ConfigurationError("SpatialGrid: spacing[" + ax + "] must be positive");
        if (extra_[i] < 0 || absorbing_[i] < 0)
            throw ConfigurationError("SpatialGrid: extra/absorbing[" + ax + "] must be >= 0");
        if (absorbing_[i] > extra_[i])
            throw ConfigurationError("SpatialGrid: absorbing[" + ax + "]=" +
                                     std::to_string(absorbing_[i]) + " exceeds extra[" + ax +
                                     "]=" + std::to_string(extra_[i]));
    }

    origin_.assign(d, 0.0);
    pml_origin_.resize(d);
    extended_shape_.resize(d);
    limit_.resize(d);
    extended_limit_.resize(d);
    for (std::size_t i = 0; i < d; ++i)
    {
        pml_origin_[i] = origin_[i] - spacing_[i] * extra_[i];
        extended_shape_[i] = shape_[i] + 2 * extra_[i];
        limit_[i] = spacing_[i] * (shape_[i] - 1);
        extended_limit_[i] = pml_origin_[i] + spacing_[i] * (extended_shape_[i] - 1);
    }
}

std::size_t SpatialGrid::num_points() const noexcept
{
    return product(shape_);
}

std::size_t SpatialGrid::extended_num_points() const noexcept
{
    return product(extended_shape_);
}

SpatialGrid SpatialGrid::resample(double spacing, std::optional<std::vector<int>> extra,
                                  std::optional<std::vector<int>> absorbing) const
{
    return resample(std::vector<double>(shape_.size(), spacing), std::move(extra),
                    std::move(absorbing));
}

SpatialGrid SpatialGrid::resample(std::vector<double> spacing,
                                  std::optional<std::vector<int>> extra,
                                  std::optional<std::vector<int>> absorbing) const
{
    const std::size_t d = shape_.size();
    if (spacing.size() != d)
        throw ConfigurationError("SpatialGrid::resample: spacing must have " + std::to_string(d) +
                                 " entries");
    for (double s : spacing)
        if (!(s > 0.0))
            throw ConfigurationError("SpatialGrid::resample: spacing must be positive");

    std::vector<int> shape(d);
    for (std::size_t i = 0; i < d; ++i)
        shape[i] = static_cast<int>(std::lround(limit_[i] / spacing[i])) + 1;

    auto rescale = [&](const std::vector<int>& old)
    {
        std::vector<int> out(d);
        for (std::size_t i = 0; i < d; ++i)
            out[i] = std::max(0,
                              static_cast<int>(spacing_[i] * (old[i] - 1) / spacing[i] + 1));
        return out;
    };

    std::vector<int> new_extra = extra ? *extra : rescale(extra_);
    std::vector<int> new_absorbing = absorbing ? *absorbing : rescale(absorbing_);

    return SpatialGrid(std::move(shape), std::move(spacing), std::move(new_extra),
                       std::move(new_absorbing));
}

std::vector<Range> SpatialGrid::inner() const
{
    std::vector<Range> out(shape_.size());
    for (std::size_t i = 0; i < shape_.size(); ++i)
        out[i] = Range{extra_[i], extra_[i] + shape_[i]};
    return out;
}

std::vector<float> SpatialGrid::inner_mask() const
{
    const auto win = inner();
    const int d = dim();
    std::vector<float> mask(extended_num_points(), 0.f);

    std::vector<int> idx(d, 0);
    for (std::size_t lin = 0; lin < mask.size(); ++lin)
    {
        bool in = true;
        for (int a = 0; a < d && in; ++a)
            in = win[a].contains(idx[a]);
        if (in)
            mask[lin] = 1.f;
        for (int a = d - 1; a >= 0; --a)
        {
            if (++idx[a] < extended_shape_[a])
                break;
            idx[a] = 0;
        }
    }
    return mask;
}

const std::vector<std::vector<float>>& SpatialGrid::grid() const
{
    return cached(grid_,
                  [this]
                  {
                      std::vector<std::vector<float>> axes;
                      for (int a = 0; a < dim(); ++a)
                          axes.push_back(linspace_f32(origin_[a], limit_[a], shape_[a]));
                      return axes;
                  });
}

const std::vector<std::vector<float>>& SpatialGrid::extended_grid() const
{
    return cached(extended_grid_,
                  [this]
                  {
                      std::vector<std::vector<float>> axes;
                      for (int a = 0; a < dim(); ++a)
                          axes.push_back(linspace_f32(pml_origin_[a], extended_limit_[a],
                                                      extended_shape_[a]));
                      return axes;
                  });
}

const std::vector<std::vector<int>>& SpatialGrid::indices() const
{
    return cached(indices_,
                  [this]
                  {
                      std::vector<std::vector<int>> axes;
                      for (int n : shape_)
                          axes.push_back(arange(n));
                      return axes;
                  });
}

const std::vector<std::vector<int>>& SpatialGrid::extended_indices() const
{
    return cached(extended_indices_,
                  [this]
                  {
                      std::vector<std::vector<int>> axes;
                      for (int n : extended_shape_)
                          axes.push_back(arange(n));
                      return axes;
                  });
}

const std::vector<std::vector<float>>& SpatialGrid::mesh() const
{
    return cached(mesh_, [this] { return meshgrid(grid(), false); });
}

const std::vector<std::vector<float>>& SpatialGrid::extended_mesh() const
{
    return cached(extended_mesh_, [this] { return meshgrid(extended_grid(), false); });
}

const std::vector<std::vector<int>>& SpatialGrid::mesh_indices() const
{
    return cached(mesh_indices_, [this] { return meshgrid(indices(), true); });
}

const std::vector<std::vector<int>>& SpatialGrid::extended_mesh_indices() const
{
    return cached(extended_mesh_indices_,
                  [this] { return meshgrid(extended_indices(), true); });
}

} // namespace wavegrid::mesh

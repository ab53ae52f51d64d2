#pragma once
#include "mesh/Sampling.hpp"
#include <cstddef>
#include <optional>
#include <vector>

/**
 * @file SpatialGrid.hpp
 * @brief Inner/extended spatial domain of a finite-difference problem.
 *
 * @details
 * The grid is an inner domain of \c shape cells with per-axis \c spacing, padded on every side
 * by \c extra cells. The first \c absorbing cells of that padding (counted from the outer edge)
 * form the PML. The inner domain starts at the origin; the extended domain starts at
 * \c pml_origin = -spacing*extra.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   SpatialGrid space({100, 80}, 0.5e-3, {20, 20}, {10, 10});
 *   space.extended_shape();   // {140, 120}
 *   space.pml_origin();       // {-10e-3, -10e-3}
 *   const auto& x = space.extended_grid()[0];   // float32, 140 points
 * @endrst
 *
 * Coordinate arrays and meshes are derived views: they are built on first access and kept for
 * the lifetime of the object. The object itself never changes after construction; resampling
 * returns a new grid.
 */

namespace wavegrid::mesh
{

class SpatialGrid
{
  public:
    SpatialGrid(std::vector<int> shape, std::vector<double> spacing, std::vector<int> extra = {},
                std::vector<int> absorbing = {});
    SpatialGrid(std::vector<int> shape, double spacing, std::vector<int> extra = {},
                std::vector<int> absorbing = {});

    int dim() const noexcept { return static_cast<int>(shape_.size()); }

    const std::vector<int>& shape() const noexcept { return shape_; }
    const std::vector<double>& spacing() const noexcept { return spacing_; }
    const std::vector<int>& extra() const noexcept { return extra_; }
    const std::vector<int>& absorbing() const noexcept { return absorbing_; }

    const std::vector<double>& origin() const noexcept { return origin_; }
    const std::vector<double>& pml_origin() const noexcept { return pml_origin_; }
    const std::vector<int>& extended_shape() const noexcept { return extended_shape_; }
    const std::vector<double>& limit() const noexcept { return limit_; }
    const std::vector<double>& extended_limit() const noexcept { return extended_limit_; }

    // Aliases of limit()/extended_limit()
    const std::vector<double>& size() const noexcept { return limit_; }
    const std::vector<double>& extended_size() const noexcept { return extended_limit_; }

    std::size_t num_points() const noexcept;
    std::size_t extended_num_points() const noexcept;

    /// New grid covering the same physical size at a different spacing.
    /// Omitted extra/absorbing widths are rescaled with the proportional formula
    /// int(old_spacing*(old-1)/new_spacing + 1); this is best-effort and can be one cell
    /// away from what a fresh construction at the target spacing would choose.
    SpatialGrid resample(std::vector<double> spacing,
                         std::optional<std::vector<int>> extra = std::nullopt,
                         std::optional<std::vector<int>> absorbing = std::nullopt) const;
    SpatialGrid resample(double spacing, std::optional<std::vector<int>> extra = std::nullopt,
                         std::optional<std::vector<int>> absorbing = std::nullopt) const;

    /// Index window of the inner domain inside the extended domain, per axis.
    std::vector<Range> inner() const;

    /// Extended-shape array (row-major) with 1 inside the inner domain and 0 in the padding.
    std::vector<float> inner_mask() const;

    // Per-axis 1-D views
    const std::vector<std::vector<float>>& grid() const;
    const std::vector<std::vector<float>>& extended_grid() const;
    const std::vector<std::vector<int>>& indices() const;
    const std::vector<std::vector<int>>& extended_indices() const;

    // Matrix-indexed (ij) coordinate meshes, one row-major array of shape() per axis
    const std::vector<std::vector<float>>& mesh() const;
    const std::vector<std::vector<float>>& extended_mesh() const;

    // Cartesian-indexed (xy) index meshes: for dim >= 2 the first two axes of the
    // array layout are swapped, i.e. arrays have shape (n1, n0, n2, ...).
    const std::vector<std::vector<int>>& mesh_indices() const;
    const std::vector<std::vector<int>>& extended_mesh_indices() const;

  private:
    std::vector<int> shape_;
    std::vector<double> spacing_;
    std::vector<int> extra_;
    std::vector<int> absorbing_;

    std::vector<double> origin_;
    std::vector<double> pml_origin_;
    std::vector<int> extended_shape_;
    std::vector<double> limit_;
    std::vector<double> extended_limit_;

    mutable std::optional<std::vector<std::vector<float>>> grid_;
    mutable std::optional<std::vector<std::vector<float>>> extended_grid_;
    mutable std::optional<std::vector<std::vector<int>>> indices_;
    mutable std::optional<std::vector<std::vector<int>>> extended_indices_;
    mutable std::optional<std::vector<std::vector<float>>> mesh_;
    mutable std::optional<std::vector<std::vector<float>>> extended_mesh_;
    mutable std::optional<std::vector<std::vector<int>>> mesh_indices_;
    mutable std::optional<std::vector<std::vector<int>>> extended_mesh_indices_;
};

} // namespace wavegrid::mesh

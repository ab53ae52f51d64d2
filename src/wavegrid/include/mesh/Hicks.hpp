#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

/**
 * @file Hicks.hpp
 * @brief Kaiser-windowed sinc (Hicks) coefficients for off-grid points.
 *
 * @details
 * A continuous coordinate \f$c\f$ is mapped to grid-index space with
 * \f$g = (c - o_{pml}) / h\f$. With \f$n = \mathrm{round}(g)\f$ and \f$\delta = g - n\f$, tap
 * \f$t \in [-W, W]\f$ gets the weight
 *
 * \f[
 *   w_t = \mathrm{sinc}(t+\delta)\,
 *         \frac{I_0\!\left(\beta\sqrt{1-\min(1, ((t+\delta)/W_e)^2)}\right)}{I_0(\beta)},
 *   \qquad \beta = 4.14,\; W_e = W/0.99,
 * \f]
 *
 * and the reference gridpoint is \f$n - W\f$, so tap \f$t\f$ lands on index \f$n + t\f$. The
 * kernel is separable: the value at a point is the tensor product of the per-axis weights.
 * The constants match the reference datasets and must not be tuned.
 */

namespace wavegrid::mesh
{

class SpatialGrid;

enum class InterpolationType : uint8_t
{
    Linear,
    Hicks
};

/// "linear" or "hicks"; anything else throws InvalidInterpolationMode.
InterpolationType parse_interpolation_type(std::string_view name);
const char* interpolation_name(InterpolationType t) noexcept;

struct HicksParams
{
    int half_width = 3;
    double beta = 4.14;
    double window_scale = 0.99; // extended half width = half_width / window_scale
};

struct InterpolationRecord
{
    int num_points = 0;
    int dim = 0;
    int taps = 0; // 2*half_width + 1

    std::vector<int32_t> reference_gridpoints; // num_points x dim
    std::vector<double> coefficients;          // num_points x dim x taps

    int32_t gridpoint(int p, int d) const noexcept
    {
        return reference_gridpoints[static_cast<std::size_t>(p) * dim + d];
    }
    double coefficient(int p, int d, int t) const noexcept
    {
        return coefficients[(static_cast<std::size_t>(p) * dim + d) * taps + t];
    }
    std::span<const double> axis_coefficients(int p, int d) const noexcept
    {
        return {coefficients.data() + (static_cast<std::size_t>(p) * dim + d) * taps,
                static_cast<std::size_t>(taps)};
    }
};

/// Coefficients for the points in \p coordinates (row-major, num_points x space.dim()).
InterpolationRecord calculate_hicks(const SpatialGrid& space, std::span<const double> coordinates,
                                    const HicksParams& params = {});

/// Tensor-product evaluation of point \p p against a row-major field of the extended shape.
/// Taps outside the field contribute nothing. A field whose size does not match \p shape is a
/// ConfigurationError.
double interpolate(const InterpolationRecord& rec, int p, std::span<const float> field,
                   std::span<const int> shape);

} // namespace wavegrid::mesh

#include "mesh/Hicks.hpp"
#include "master/Errors.hpp"
#include "mesh/SpatialGrid.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>
#include <numeric>
#include <string>

namespace wavegrid::mesh
{

InterpolationType parse_interpolation_type(std::string_view name)
{
    if (name == "linear")
        return InterpolationType::Linear;
    if (name == "hicks")
        return InterpolationType::Hicks;
    throw InvalidInterpolationMode("Only \"linear\" and \"hicks\" interpolations are allowed, got \"" +
                                   std::string(name) + "\"");
}

const char* interpolation_name(InterpolationType t) noexcept
{
    return t == InterpolationType::Hicks ? "hicks" : "linear";
}

namespace
{

// Normalised sinc, sin(pi x)/(pi x)
inline double sinc(double x)
{
    if (x == 0.0)
        return 1.0;
    const double px = std::numbers::pi * x;
    return std::sin(px) / px;
}

} // namespace

InterpolationRecord calculate_hicks(const SpatialGrid& space, std::span<const double> coordinates,
                                    const HicksParams& params)
{
    const int dim = space.dim();
    if (params.half_width < 0)
        throw ConfigurationError("calculate_hicks: half_width must be >= 0");
    if (coordinates.size() % static_cast<std::size_t>(dim) != 0)
        throw ConfigurationError("calculate_hicks: coordinate array is not a multiple of dim=" +
                                 std::to_string(dim));

    InterpolationRecord rec;
    rec.num_points = static_cast<int>(coordinates.size() / static_cast<std::size_t>(dim));
    rec.dim = dim;
    rec.taps = 2 * params.half_width + 1;
    rec.reference_gridpoints.resize(static_cast<std::size_t>(rec.num_points) * dim);
    rec.coefficients.assign(static_cast<std::size_t>(rec.num_points) * dim * rec.taps, 0.0);

    const double den = std::cyl_bessel_i(0.0, params.beta);
    const double extended_width = params.half_width / params.window_scale;

    const auto& origin = space.pml_origin();
    const auto& spacing = space.spacing();

    for (int p = 0; p < rec.num_points; ++p)
    {
        for (int d = 0; d < dim; ++d)
        {
            const std::size_t pd = static_cast<std::size_t>(p) * dim + d;
            const double g = (coordinates[pd] - origin[d]) / spacing[d];
            // round half to even
            const double nearest = std::nearbyint(g);
            const double offset = g - nearest;
            rec.reference_gridpoints[pd] = static_cast<int32_t>(nearest) - params.half_width;

            for (int t = -params.half_width; t <= params.half_width; ++t)
            {
                const double x = t + offset;
                const double r = std::min(1.0, (x / extended_width) * (x / extended_width));
                const double w = std::cyl_bessel_i(0.0, params.beta * std::sqrt(1 - r)) / den;
                rec.coefficients[pd * rec.taps + (t + params.half_width)] = sinc(x) * w;
            }
        }
    }
    return rec;
}

double interpolate(const InterpolationRecord& rec, int p, std::span<const float> field,
                   std::span<const int> shape)
{
    const int d = rec.dim;
    if (shape.size() != static_cast<std::size_t>(d))
        throw ConfigurationError("interpolate: field has " + std::to_string(shape.size()) +
                                 " axes, record has " + std::to_string(d));
    const std::size_t expected = std::accumulate(shape.begin(), shape.end(), std::size_t{1},
                                                 [](std::size_t a, int n)
                                                 { return a * static_cast<std::size_t>(n); });
    if (field.size() != expected)
        throw ConfigurationError("interpolate: field holds " + std::to_string(field.size()) +
                                 " values, shape needs " + std::to_string(expected));
    if (p < 0 || p >= rec.num_points)
        throw ConfigurationError("interpolate: point " + std::to_string(p) + " out of range");
    std::vector<int> tap(d, 0);
    double sum = 0.0;

    // Walk every tap combination (taps^dim of them)
    for (;;)
    {
        double w = 1.0;
        std::size_t lin = 0;
        bool inside = true;
        for (int a = 0; a < d && inside; ++a)
        {
            const int i = rec.gridpoint(p, a) + tap[a];
            inside = i >= 0 && i < shape[a];
            lin = lin * static_cast<std::size_t>(shape[a]) + static_cast<std::size_t>(i);
            w *= rec.coefficient(p, a, tap[a]);
        }
        if (inside)
            sum += w * field[lin];

        int a = d - 1;
        for (; a >= 0; --a)
        {
            if (++tap[a] < rec.taps)
                break;
            tap[a] = 0;
        }
        if (a < 0)
            break;
    }
    return sum;
}

} // namespace wavegrid::mesh

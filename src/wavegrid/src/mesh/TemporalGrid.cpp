#include "mesh/TemporalGrid.hpp"
#include "master/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace wavegrid::mesh
{

TemporalGrid::TemporalGrid(const TimeSpec& spec)
{
    const int given = int(spec.start.has_value()) + int(spec.step.has_value()) +
                      int(spec.num.has_value()) + int(spec.stop.has_value());
    if (given < 3)
        throw ConfigurationError("TemporalGrid: three of start, step, num and stop must be set (" +
                                 std::to_string(given) + " given)");

    if (spec.num && *spec.num < 1)
        throw ConfigurationError("TemporalGrid: num must be >= 1");
    if (spec.step && !(*spec.step > 0.0))
        throw ConfigurationError("TemporalGrid: step must be positive");

    if (!spec.start)
    {
        step_ = *spec.step;
        num_ = *spec.num;
        stop_ = *spec.stop;
        start_ = stop_ - step_ * (num_ - 1);
    }
    else if (!spec.step)
    {
        start_ = *spec.start;
        num_ = *spec.num;
        stop_ = *spec.stop;
        if (num_ < 2)
            throw ConfigurationError("TemporalGrid: step cannot be derived from num < 2");
        step_ = (stop_ - start_) / (num_ - 1);
        if (!(step_ > 0.0))
            throw ConfigurationError("TemporalGrid: stop must be after start");
    }
    else if (!spec.num)
    {
        start_ = *spec.start;
        step_ = *spec.step;
        const double n = std::ceil((*spec.stop - start_) / step_ + 1);
        if (n < 1)
            throw ConfigurationError("TemporalGrid: stop must not precede start");
        num_ = static_cast<int>(n);
        stop_ = step_ * (num_ - 1) + start_;
    }
    else
    {
        start_ = *spec.start;
        step_ = *spec.step;
        num_ = *spec.num;
        stop_ = start_ + step_ * (num_ - 1);
        if (spec.stop)
        {
            const double tol =
                1e-9 * std::max({std::abs(start_), std::abs(stop_), std::abs(*spec.stop)});
            if (std::abs(stop_ - *spec.stop) > tol)
                throw ConfigurationError("TemporalGrid: start + step*(num-1) = " +
                                         std::to_string(stop_) + " disagrees with stop = " +
                                         std::to_string(*spec.stop));
        }
    }

    extended_start_ = start_;
    extended_stop_ = stop_;
    extended_num_ = num_;
}

void TemporalGrid::extend(std::array<int, 2> extra)
{
    if (extended_)
        throw ConfigurationError("TemporalGrid: padding has already been set");
    if (extra[0] < 0 || extra[1] < 0)
        throw ConfigurationError("TemporalGrid: padding must be non-negative");

    extended_ = true;
    extra_ = extra;
    extended_start_ = start_ - (extra_[0] - 1) * step_;
    extended_stop_ = stop_ + (extra_[1] - 1) * step_;
    extended_num_ = num_ + extra_[0] + extra_[1];
    extended_grid_.reset();
}

void TemporalGrid::resample() const
{
    throw UnsupportedOperationError("TemporalGrid: resampling is not supported");
}

const std::vector<float>& TemporalGrid::grid() const
{
    if (!grid_)
        grid_ = linspace_f32(start_, stop_, num_);
    return *grid_;
}

const std::vector<float>& TemporalGrid::extended_grid() const
{
    if (!extended_grid_)
        extended_grid_ = linspace_f32(extended_start_, extended_stop_, extended_num_);
    return *extended_grid_;
}

} // namespace wavegrid::mesh

#pragma once
#include "mesh/Sampling.hpp"
#include <array>
#include <optional>
#include <vector>

/**
 * @file TemporalGrid.hpp
 * @brief Uniform time axis with optional padding on both ends.
 *
 * @details
 * A time axis is fully defined by three of ``start``, ``step``, ``num`` and ``stop``; the
 * fourth is derived. Passing fewer than three, or four that disagree, is a configuration error.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   TemporalGrid time({.start = 0.0, .step = 0.1, .num = 11});   // stop == 1.0
 *   time.extend({2, 3});
 *   time.extended_num();    // 16
 *   time.extended_start();  // -0.1, padding by k steps moves the edge by (k-1)*step
 *   time.extended_stop();   //  1.2
 * @endrst
 */

namespace wavegrid::mesh
{

struct TimeSpec
{
    std::optional<double> start;
    std::optional<double> step;
    std::optional<int> num;
    std::optional<double> stop;
};

class TemporalGrid
{
  public:
    explicit TemporalGrid(const TimeSpec& spec);

    double start() const noexcept { return start_; }
    double stop() const noexcept { return stop_; }
    double step() const noexcept { return step_; }
    int num() const noexcept { return num_; }

    /// Pad the axis by {left, right} samples. Can only be done once.
    void extend(std::array<int, 2> extra);
    bool extended() const noexcept { return extended_; }

    const std::array<int, 2>& extra() const noexcept { return extra_; }
    double extended_start() const noexcept { return extended_start_; }
    double extended_stop() const noexcept { return extended_stop_; }
    int extended_num() const noexcept { return extended_num_; }

    /// Always throws UnsupportedOperationError.
    [[noreturn]] void resample() const;

    /// Window of the inner samples inside the extended axis.
    Range inner() const noexcept { return Range{extra_[0], extra_[0] + num_}; }

    const std::vector<float>& grid() const;
    const std::vector<float>& extended_grid() const;

  private:
    double start_ = 0.0;
    double stop_ = 0.0;
    double step_ = 0.0;
    int num_ = 0;

    bool extended_ = false;
    std::array<int, 2> extra_{0, 0};
    double extended_start_ = 0.0;
    double extended_stop_ = 0.0;
    int extended_num_ = 0;

    mutable std::optional<std::vector<float>> grid_;
    mutable std::optional<std::vector<float>> extended_grid_;
};

} // namespace wavegrid::mesh

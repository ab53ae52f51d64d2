#pragma once
#include "mesh/Sampling.hpp"
#include <optional>
#include <vector>

/**
 * @file AcquisitionGrid.hpp
 * @brief Two-level (frame, acquisition-within-frame) time base.
 *
 * @details
 * Frames are spaced by ``frame_step`` (or ``1/frame_rate``). Inside each frame, ``num_acq``
 * acquisitions may be taken ``acq_step`` (or ``1/acq_rate``) apart; they must all fit inside a
 * single frame. When neither ``acq_step`` nor ``acq_rate`` is given there is one acquisition per
 * frame, stored internally as ``acq_rate == -1``.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   AcquisitionGrid slow({.frame_rate = 10.0, .acq_step = 1e-3, .num_frame = 5, .num_acq = 4});
 *   slow.num();   // 20 samples
 * @endrst
 */

namespace wavegrid::mesh
{

struct AcquisitionSpec
{
    std::optional<double> frame_rate;
    std::optional<double> acq_rate;
    std::optional<double> frame_step;
    std::optional<double> acq_step;
    std::optional<int> num_frame;
    std::optional<int> num_acq;
};

class AcquisitionGrid
{
  public:
    explicit AcquisitionGrid(const AcquisitionSpec& spec);

    double start() const noexcept { return start_; }
    double stop() const noexcept { return stop_; }

    double frame_step() const noexcept { return frame_step_; }
    double frame_rate() const noexcept { return frame_rate_; }
    int num_frame() const noexcept { return num_frame_; }

    double acq_step() const noexcept { return acq_step_; }
    double acq_rate() const noexcept { return acq_rate_; }
    int num_acq() const noexcept { return num_acq_; }

    bool subsampled() const noexcept { return acq_rate_ > 0; }

    int num() const noexcept { return num_frame_ * num_acq_; }
    int extended_num() const noexcept { return num(); }
    Range inner() const noexcept { return Range{0, num()}; }

    /// Always throws UnsupportedOperationError.
    [[noreturn]] void resample() const;

    const std::vector<float>& grid() const;

  private:
    double start_ = 0.0;
    double stop_ = 0.0;
    double frame_step_ = 0.0;
    double frame_rate_ = 0.0;
    int num_frame_ = 0;
    double acq_step_ = 0.0;
    double acq_rate_ = -1.0;
    int num_acq_ = 1;

    mutable std::optional<std::vector<float>> grid_;
};

} // namespace wavegrid::mesh

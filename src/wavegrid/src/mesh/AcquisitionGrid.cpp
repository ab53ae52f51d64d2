#include "mesh/AcquisitionGrid.hpp"
#include "master/Errors.hpp"
#include <cstdio>
#include <string>
#include <utility>

namespace wavegrid::mesh
{

AcquisitionGrid::AcquisitionGrid(const AcquisitionSpec& spec)
{
    if (spec.frame_step)
    {
        frame_step_ = *spec.frame_step;
        if (!(frame_step_ > 0.0))
            throw ConfigurationError("AcquisitionGrid: frame_step must be positive");
        frame_rate_ = 1 / frame_step_;
    }
    else if (spec.frame_rate)
    {
        frame_rate_ = *spec.frame_rate;
        if (!(frame_rate_ > 0.0))
            throw ConfigurationError("AcquisitionGrid: frame_rate must be positive");
        frame_step_ = 1 / frame_rate_;
    }
    else
    {
        throw ConfigurationError("AcquisitionGrid: either frame_rate or frame_step has to be set");
    }

    if (!spec.num_frame || *spec.num_frame < 1)
        throw ConfigurationError("AcquisitionGrid: num_frame must be a positive integer");
    num_frame_ = *spec.num_frame;

    if (!spec.acq_step && !spec.acq_rate)
    {
        acq_step_ = 0;
        acq_rate_ = -1;
        num_acq_ = 1;
    }
    else
    {
        if (!spec.num_acq || *spec.num_acq < 1)
            throw ConfigurationError("AcquisitionGrid: num_acq must be a positive integer");
        num_acq_ = *spec.num_acq;

        if (spec.acq_step)
        {
            acq_step_ = *spec.acq_step;
            if (!(acq_step_ > 0.0))
                throw ConfigurationError("AcquisitionGrid: acq_step must be positive");
            acq_rate_ = spec.acq_rate ? *spec.acq_rate : 1 / acq_step_;
        }
        else
        {
            acq_rate_ = *spec.acq_rate;
            if (!(acq_rate_ > 0.0))
                throw ConfigurationError("AcquisitionGrid: acq_rate must be positive");
            acq_step_ = 1 / acq_rate_;
        }
    }

    if (num_acq_ * acq_step_ > frame_step_)
    {
        char buf[160];
        std::snprintf(buf, sizeof(buf),
                      "AcquisitionGrid: acquisition step (%e s) too large for frame step (%e s)",
                      num_acq_ * acq_step_, frame_step_);
        throw ConfigurationError(buf);
    }

    start_ = 0.;
    stop_ = start_ + frame_step_ * (num_frame_ - 1);
}

void AcquisitionGrid::resample() const
{
    throw UnsupportedOperationError("AcquisitionGrid: resampling is not supported");
}

const std::vector<float>& AcquisitionGrid::grid() const
{
    if (grid_)
        return *grid_;

    if (acq_rate_ > 0)
    {
        std::vector<float> all;
        all.reserve(static_cast<std::size_t>(num()));
        const double last = acq_step_ * (num_acq_ - 1);
        for (int f = 0; f < num_frame_; ++f)
        {
            const double t0 = frame_step_ * f;
            const auto frame = linspace_f32(t0, last + t0, num_acq_);
            all.insert(all.end(), frame.begin(), frame.end());
        }
        grid_ = std::move(all);
    }
    else
    {
        grid_ = linspace_f32(start_, stop_, num_frame_);
    }
    return *grid_;
}

} // namespace wavegrid::mesh

#pragma once
#include "mesh/AcquisitionGrid.hpp"
#include "mesh/SpatialGrid.hpp"
#include "mesh/TemporalGrid.hpp"
#include <optional>

/**
 * @file GridBundle.hpp
 * @brief The grids of one problem, passed as a unit to the backend layer.
 */

namespace wavegrid::mesh
{

struct GridBundle
{
    SpatialGrid space;
    TemporalGrid time;
    std::optional<AcquisitionGrid> acquisition{};
};

} // namespace wavegrid::mesh

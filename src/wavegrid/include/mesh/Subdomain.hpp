#pragma once
#include "mesh/Sampling.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file Subdomain.hpp
 * @brief Named region predicates that split the extended domain for PML terms.
 *
 * @details
 * A :cpp:struct:`Subdomain` maps every axis to an :cpp:struct:`AxisSelector`:
 *
 * - ``identity``      : the whole axis,
 * - ``middle(k)``     : ``[k, n-k)``,
 * - ``side(left, k)``: ``[0, k)``; ``side(right, k)``: ``[n-k, n)``.
 *
 * :cpp:func:`decompose` enumerates, for a grid of dimension ``d`` and absorbing width ``a``:
 *
 * ==========  =================================  ======================================
 * kind        name                               selectors
 * ==========  =================================  ======================================
 * Full        ``full_domain``                    identity everywhere
 * Interior    ``interior_domain``                middle(a_i) everywhere
 * Side        ``pml_side_<left|right><d>``       side on axis d, identity elsewhere
 * Partial     ``pml_partial_<left|right><d>``    middle, identity on axis 0, side on d
 * Centre      ``pml_centre_<left|right><d>``     middle, side on axis d
 * Corner      ``pml_corner_<s0>_<s1>...``        side(s_i, a_i) on every axis
 * ==========  =================================  ======================================
 *
 * for a total of ``2 + 4d + 2d + 2^d`` regions. The predicates are plain data: the backend
 * receives them verbatim and indexes them by name.
 */

namespace wavegrid::mesh
{

class SpatialGrid;

enum class Side : uint8_t
{
    Left,
    Right
};

const char* side_name(Side s) noexcept;

struct AxisSelector
{
    enum class Kind : uint8_t
    {
        Identity,
        Middle,
        Side
    };

    Kind kind = Kind::Identity;
    mesh::Side side = mesh::Side::Left; // only meaningful for Kind::Side
    int thickness = 0;

    static AxisSelector identity() noexcept { return {}; }
    static AxisSelector middle(int k) noexcept { return {Kind::Middle, mesh::Side::Left, k}; }
    static AxisSelector on_side(mesh::Side s, int k) noexcept { return {Kind::Side, s, k}; }

    /// Cells selected along an axis of length n.
    Range range(int n) const noexcept;

    bool operator==(const AxisSelector&) const = default;
};

enum class RegionKind : uint8_t
{
    Full,
    Interior,
    Side,
    Partial,
    Centre,
    Corner
};

struct Subdomain
{
    std::string name;
    RegionKind kind = RegionKind::Full;
    std::vector<AxisSelector> axes;

    std::vector<Range> ranges(std::span<const int> shape) const;
    bool contains(std::span<const int> index, std::span<const int> shape) const;
    std::size_t count(std::span<const int> shape) const;
};

struct SubdomainSet
{
    Subdomain full;
    Subdomain interior;
    std::vector<Subdomain> pml_left;
    std::vector<Subdomain> pml_right;
    std::vector<Subdomain> pml_centres;
    std::vector<Subdomain> pml_partials;
    std::vector<Subdomain> pml_corners;

    /// Order handed to the backend: full, interior, partials, left, right, centres, corners.
    std::vector<Subdomain> ordered() const;
    std::size_t size() const noexcept;
    const Subdomain* find(std::string_view name) const;
};

SubdomainSet decompose(std::span<const int> absorbing);
SubdomainSet decompose(const SpatialGrid& space);

constexpr std::size_t expected_region_count(int dim) noexcept
{
    return 2 + 4 * static_cast<std::size_t>(dim) + 2 * static_cast<std::size_t>(dim) +
           (std::size_t{1} << dim);
}

} // namespace wavegrid::mesh

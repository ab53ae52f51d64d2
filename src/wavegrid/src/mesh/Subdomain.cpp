#include "mesh/Subdomain.hpp"
#include "mesh/SpatialGrid.hpp"
#include <algorithm>
#include <initializer_list>
#include <string>

namespace wavegrid::mesh
{

const char* side_name(Side s) noexcept
{
    return s == Side::Left ? "left" : "right";
}

Range AxisSelector::range(int n) const noexcept
{
    switch (kind)
    {
    case Kind::Middle:
        return Range{std::min(thickness, n), std::max(std::min(thickness, n), n - thickness)};
    case Kind::Side:
        if (side == mesh::Side::Left)
            return Range{0, std::min(thickness, n)};
        return Range{std::max(0, n - thickness), n};
    default:
        return Range{0, n};
    }
}

std::vector<Range> Subdomain::ranges(std::span<const int> shape) const
{
    std::vector<Range> out(axes.size());
    for (std::size_t a = 0; a < axes.size(); ++a)
        out[a] = axes[a].range(shape[a]);
    return out;
}

bool Subdomain::contains(std::span<const int> index, std::span<const int> shape) const
{
    for (std::size_t a = 0; a < axes.size(); ++a)
        if (!axes[a].range(shape[a]).contains(index[a]))
            return false;
    return true;
}

std::size_t Subdomain::count(std::span<const int> shape) const
{
    std::size_t n = 1;
    for (const Range& r : ranges(shape))
        n *= static_cast<std::size_t>(r.size());
    return n;
}

namespace
{

std::vector<AxisSelector> all_middle(std::span<const int> absorbing)
{
    std::vector<AxisSelector> axes;
    for (int a : absorbing)
        axes.push_back(AxisSelector::middle(a));
    return axes;
}

Subdomain pml_side(std::span<const int> absorbing, int dim, Side side)
{
    Subdomain s{"pml_side_" + std::string(side_name(side)) + std::to_string(dim), RegionKind::Side,
                std::vector<AxisSelector>(absorbing.size(), AxisSelector::identity())};
    s.axes[dim] = AxisSelector::on_side(side, absorbing[dim]);
    return s;
}

Subdomain pml_centre(std::span<const int> absorbing, int dim, Side side)
{
    Subdomain s{"pml_centre_" + std::string(side_name(side)) + std::to_string(dim),
                RegionKind::Centre, all_middle(absorbing)};
    s.axes[dim] = AxisSelector::on_side(side, absorbing[dim]);
    return s;
}

Subdomain pml_partial(std::span<const int> absorbing, int dim, Side side)
{
    Subdomain s{"pml_partial_" + std::string(side_name(side)) + std::to_string(dim),
                RegionKind::Partial, all_middle(absorbing)};
    s.axes[0] = AxisSelector::identity();
    s.axes[dim] = AxisSelector::on_side(side, absorbing[dim]);
    return s;
}

Subdomain pml_corner(std::span<const int> absorbing, const std::vector<Side>& sides)
{
    Subdomain s{"pml_corner", RegionKind::Corner, {}};
    for (std::size_t a = 0; a < sides.size(); ++a)
    {
        s.name += "_";
        s.name += side_name(sides[a]);
        s.axes.push_back(AxisSelector::on_side(sides[a], absorbing[a]));
    }
    return s;
}

} // namespace

SubdomainSet decompose(std::span<const int> absorbing)
{
    const int d = static_cast<int>(absorbing.size());
    SubdomainSet set;

    set.full = Subdomain{"full_domain", RegionKind::Full,
                         std::vector<AxisSelector>(absorbing.size(), AxisSelector::identity())};
    set.interior = Subdomain{"interior_domain", RegionKind::Interior, all_middle(absorbing)};

    for (int dim = 0; dim < d; ++dim)
    {
        set.pml_left.push_back(pml_side(absorbing, dim, Side::Left));
        set.pml_right.push_back(pml_side(absorbing, dim, Side::Right));
        set.pml_centres.push_back(pml_centre(absorbing, dim, Side::Left));
        set.pml_centres.push_back(pml_centre(absorbing, dim, Side::Right));
        set.pml_partials.push_back(pml_partial(absorbing, dim, Side::Left));
        set.pml_partials.push_back(pml_partial(absorbing, dim, Side::Right));
    }

    // Cartesian product of {left, right} over the axes, axis 0 varying slowest
    const std::size_t combos = std::size_t{1} << d;
    for (std::size_t c = 0; c < combos; ++c)
    {
        std::vector<Side> sides(d);
        for (int a = 0; a < d; ++a)
            sides[a] = ((c >> (d - 1 - a)) & 1u) ? Side::Right : Side::Left;
        set.pml_corners.push_back(pml_corner(absorbing, sides));
    }

    return set;
}

SubdomainSet decompose(const SpatialGrid& space)
{
    return decompose(std::span<const int>(space.absorbing()));
}

std::vector<Subdomain> SubdomainSet::ordered() const
{
    std::vector<Subdomain> out;
    out.reserve(size());
    out.push_back(full);
    out.push_back(interior);
    out.insert(out.end(), pml_partials.begin(), pml_partials.end());
    out.insert(out.end(), pml_left.begin(), pml_left.end());
    out.insert(out.end(), pml_right.begin(), pml_right.end());
    out.insert(out.end(), pml_centres.begin(), pml_centres.end());
    out.insert(out.end(), pml_corners.begin(), pml_corners.end());
    return out;
}

std::size_t SubdomainSet::size() const noexcept
{
    return 2 + pml_left.size() + pml_right.size() + pml_centres.size() + pml_partials.size() +
           pml_corners.size();
}

const Subdomain* SubdomainSet::find(std::string_view name) const
{
    if (full.name == name)
        return &full;
    if (interior.name == name)
        return &interior;
    for (const auto* group : {&pml_left, &pml_right, &pml_centres, &pml_partials, &pml_corners})
        for (const Subdomain& s : *group)
            if (s.name == name)
                return &s;
    return nullptr;
}

} // namespace wavegrid::mesh

#pragma once
#include "master/FunctionCache.hpp"
#include "master/backend/IBackend.hpp"
#include "mesh/GridBundle.hpp"
#include "mesh/Hicks.hpp"
#include "mesh/Subdomain.hpp"
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

/**
 * @file GridBackend.hpp
 * @brief Binds a problem's grids to the backend grid and declares functions on it.
 *
 * @details
 * ``set_problem`` derives, once, the backend :cpp:struct:`backend::GridDescriptor` from the
 * spatial grid: extended shape, extent ``spacing*(extended_shape-1)``, origin at the PML origin,
 * float32, and the ordered PML subdomains built from the absorbing widths. Every creator then
 * goes through the :cpp:class:`FunctionCache`, so asking twice for ``"vp"`` yields the same
 * declaration unless ``cached = false``.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   GridBackend grid(10, 2);   // space_order, time_order
 *   grid.set_problem(bundle);
 *   auto vp  = grid.function("vp");
 *   auto p   = grid.time_function("p");
 *   auto src = grid.sparse_time_function("src", 1, coords, mesh::InterpolationType::Hicks);
 *   grid.deallocate("p");   // buffer freed, declaration kept
 * @endrst
 */

namespace wavegrid::master
{

struct FunctionOptions
{
    std::optional<int> space_order; // defaults to the grid's
    std::optional<int> time_order;  // defaults to the grid's
    bool cached = true;             // reuse a cached declaration of the same name
};

class GridBackend
{
  public:
    GridBackend(int space_order, int time_order);

    int space_order() const noexcept { return space_order_; }
    int time_order() const noexcept { return time_order_; }

    // TODO rebuild the descriptor when a later problem changes the space or time extent
    void set_problem(const mesh::GridBundle& problem);
    bool has_problem() const noexcept { return problem_.has_value(); }
    const mesh::GridBundle& problem() const;

    const backend::GridDescriptor& grid() const;
    const mesh::SubdomainSet& subdomains() const;

    FunctionCache& cache() noexcept { return cache_; }
    const FunctionCache& cache() const noexcept { return cache_; }

    FunctionCache::Handle function(const std::string& name, const FunctionOptions& opt = {});

    FunctionCache::Handle time_function(const std::string& name, const FunctionOptions& opt = {},
                                        std::optional<int> save = std::nullopt);

    /// Time function stored every \p factor steps: (extended_num + factor - 1)/factor buffers.
    FunctionCache::Handle undersampled_time_function(const std::string& name, int factor,
                                                     const FunctionOptions& opt = {});

    /// Point function with \p num points over the extended time axis. Hicks placement
    /// precomputes the interpolation record from \p coordinates (num x dim, row-major).
    FunctionCache::Handle sparse_time_function(const std::string& name, int num = 1,
                                               std::span<const double> coordinates = {},
                                               mesh::InterpolationType interpolation =
                                                   mesh::InterpolationType::Linear,
                                               const FunctionOptions& opt = {}, int radius = 7);

    mesh::InterpolationRecord calculate_hicks(std::span<const double> coordinates) const;

    /// Release the buffer of a cached function now; the declaration stays cached.
    void deallocate(const std::string& name);

    /// Edge-mode pad of a row-major array of \p shape by space_order cells on every side.
    std::vector<float> with_halo(std::span<const float> data, std::span<const int> shape) const;

  private:
    void require_problem(const char* what) const;
    std::vector<int> padded_shape(int space_order) const;
    FunctionCache::Handle make_time_decl(const std::string& name, int space_order,
                                         int time_order, std::optional<int> save) const;

    int space_order_;
    int time_order_;
    std::optional<mesh::GridBundle> problem_;
    std::optional<backend::GridDescriptor> grid_;
    std::optional<mesh::SubdomainSet> subdomains_;
    FunctionCache cache_;
};

} // namespace wavegrid::master

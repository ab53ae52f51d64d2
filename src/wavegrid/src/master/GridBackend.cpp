#include "master/GridBackend.hpp"
#include "master/Errors.hpp"
#include "master/Log.hpp"
#include <algorithm>
#include <cstddef>
#include <numeric>
#include <utility>

namespace wavegrid::master
{

GridBackend::GridBackend(int space_order, int time_order)
    : space_order_(space_order), time_order_(time_order)
{
    if (space_order < 0 || time_order < 0)
        throw ConfigurationError("GridBackend: space_order and time_order must be >= 0");
}

void GridBackend::set_problem(const mesh::GridBundle& problem)
{
    problem_.emplace(problem);
    if (grid_)
        return;

    const auto& space = problem_->space;
    backend::GridDescriptor g;
    g.shape = space.extended_shape();
    g.spacing = space.spacing();
    g.origin = space.pml_origin();
    g.extent.resize(g.shape.size());
    for (std::size_t d = 0; d < g.shape.size(); ++d)
        g.extent[d] = g.spacing[d] * (g.shape[d] - 1);
    g.dtype = DType::Float32;

    subdomains_ = mesh::decompose(space);
    g.subdomains = subdomains_->ordered();
    grid_ = std::move(g);

    LOGD("grid backend: %zu-d grid, %zu subdomains, space_order=%d time_order=%d\n",
         grid_->shape.size(), grid_->subdomains.size(), space_order_, time_order_);
}

const mesh::GridBundle& GridBackend::problem() const
{
    require_problem("problem");
    return *problem_;
}

const backend::GridDescriptor& GridBackend::grid() const
{
    require_problem("grid");
    return *grid_;
}

const mesh::SubdomainSet& GridBackend::subdomains() const
{
    require_problem("subdomains");
    return *subdomains_;
}

void GridBackend::require_problem(const char* what) const
{
    if (!problem_ || !grid_)
        throw ConfigurationError(std::string("GridBackend::") + what +
                                 ": set_problem must be called first");
}

std::vector<int> GridBackend::padded_shape(int space_order) const
{
    std::vector<int> shape = grid_->shape;
    for (auto& n : shape)
        n += 2 * space_order;
    return shape;
}

FunctionCache::Handle GridBackend::function(const std::string& name, const FunctionOptions& opt)
{
    require_problem("function");
    const int so = opt.space_order.value_or(space_order_);

    return cache_.get_or_create(
        name,
        [&]
        {
            auto fun = std::make_shared<FunctionDecl>();
            fun->name = name;
            fun->kind = FunctionKind::Function;
            fun->space_order = so;
            fun->data = memory::FieldBuffer(padded_shape(so));
            return fun;
        },
        opt.cached);
}

FunctionCache::Handle GridBackend::time_function(const std::string& name,
                                                 const FunctionOptions& opt,
                                                 std::optional<int> save)
{
    require_problem("time_function");
    const int so = opt.space_order.value_or(space_order_);
    const int to = opt.time_order.value_or(time_order_);
    if (save && *save < 1)
        throw ConfigurationError("GridBackend::time_function: save must be >= 1 for '" + name +
                                 "'");

    return cache_.get_or_create(
        name, [&] { return make_time_decl(name, so, to, save); }, opt.cached);
}

FunctionCache::Handle GridBackend::make_time_decl(const std::string& name, int space_order,
                                                  int time_order, std::optional<int> save) const
{
    auto fun = std::make_shared<FunctionDecl>();
    fun->name = name;
    fun->kind = FunctionKind::TimeFunction;
    fun->space_order = space_order;
    fun->time_order = time_order;
    fun->save = save;

    std::vector<int> shape{save.value_or(time_order + 1)};
    const auto spatial = padded_shape(space_order);
    shape.insert(shape.end(), spatial.begin(), spatial.end());
    fun->data = memory::FieldBuffer(std::move(shape));
    return fun;
}

FunctionCache::Handle GridBackend::undersampled_time_function(const std::string& name,
                                                              int factor,
                                                              const FunctionOptions& opt)
{
    require_problem("undersampled_time_function");
    if (factor < 1)
        throw ConfigurationError("GridBackend::undersampled_time_function: factor must be >= 1, "
                                 "got " +
                                 std::to_string(factor));

    const int num = problem_->time.extended_num();
    const int buffer_size = (num + factor - 1) / factor;

    const int so = opt.space_order.value_or(space_order_);
    const int to = opt.time_order.value_or(time_order_);

    // a cached declaration is returned as is, factor included
    return cache_.get_or_create(
        name,
        [&]
        {
            auto fun = make_time_decl(name, so, to, buffer_size);
            fun->factor = factor;
            return fun;
        },
        opt.cached);
}

FunctionCache::Handle GridBackend::sparse_time_function(const std::string& name, int num,
                                                        std::span<const double> coordinates,
                                                        mesh::InterpolationType interpolation,
                                                        const FunctionOptions& opt, int radius)
{
    require_problem("sparse_time_function");
    if (num < 1)
        throw ConfigurationError("GridBackend::sparse_time_function: num must be >= 1 for '" +
                                 name + "'");

    const int dim = static_cast<int>(grid_->shape.size());
    if (interpolation == mesh::InterpolationType::Hicks &&
        coordinates.size() != static_cast<std::size_t>(num) * dim)
        throw ConfigurationError("GridBackend::sparse_time_function: hicks placement of '" + name +
                                 "' needs " + std::to_string(num * dim) + " coordinates, got " +
                                 std::to_string(coordinates.size()));

    const int so = opt.space_order.value_or(space_order_);
    const int to = opt.time_order.value_or(time_order_);
    const int nt = problem_->time.extended_num();

    return cache_.get_or_create(
        name,
        [&]
        {
            auto fun = std::make_shared<FunctionDecl>();
            fun->name = name;
            fun->kind = FunctionKind::SparseTimeFunction;
            fun->space_order = so;
            fun->time_order = to;
            fun->npoint = num;
            fun->nt = nt;

            if (interpolation == mesh::InterpolationType::Hicks)
            {
                fun->kind = FunctionKind::PrecomputedSparseTimeFunction;
                fun->radius = radius;
                fun->interpolation = calculate_hicks(coordinates);
            }

            fun->data = memory::FieldBuffer({nt, num});
            LOGD("grid backend: %s '%s' npoint=%d nt=%d (%s)\n", function_kind_name(fun->kind),
                 name.c_str(), num, nt, mesh::interpolation_name(interpolation));
            return fun;
        },
        opt.cached);
}

mesh::InterpolationRecord GridBackend::calculate_hicks(std::span<const double> coordinates) const
{
    require_problem("calculate_hicks");
    return mesh::calculate_hicks(problem_->space, coordinates);
}

void GridBackend::deallocate(const std::string& name)
{
    cache_.deallocate(name);
}

std::vector<float> GridBackend::with_halo(std::span<const float> data,
                                          std::span<const int> shape) const
{
    const std::size_t count =
        std::accumulate(shape.begin(), shape.end(), std::size_t{1},
                        [](std::size_t a, int b) { return a * static_cast<std::size_t>(b); });
    if (shape.empty() || std::any_of(shape.begin(), shape.end(), [](int n) { return n < 1; }))
        throw ConfigurationError("GridBackend::with_halo: shape must be non-empty and positive");
    if (data.size() != count)
        throw ConfigurationError("GridBackend::with_halo: data has " + std::to_string(data.size()) +
                                 " values, shape needs " + std::to_string(count));

    const int pad = space_order_;
    const std::size_t dim = shape.size();
    std::vector<int> out_shape(shape.begin(), shape.end());
    for (auto& n : out_shape)
        n += 2 * pad;

    const std::size_t out_count =
        std::accumulate(out_shape.begin(), out_shape.end(), std::size_t{1},
                        [](std::size_t a, int b) { return a * static_cast<std::size_t>(b); });
    std::vector<float> out(out_count);

    // Walk the padded array in row-major order, clamping each coordinate onto the source
    std::vector<int> idx(dim, 0);
    for (std::size_t o = 0; o < out_count; ++o)
    {
        std::size_t src = 0;
        for (std::size_t d = 0; d < dim; ++d)
        {
            const int s = std::clamp(idx[d] - pad, 0, shape[d] - 1);
            src = src * static_cast<std::size_t>(shape[d]) + static_cast<std::size_t>(s);
        }
        out[o] = data[src];

        for (std::size_t d = dim; d-- > 0;)
        {
            if (++idx[d] < out_shape[d])
                break;
            idx[d] = 0;
        }
    }
    return out;
}

} // namespace wavegrid::master

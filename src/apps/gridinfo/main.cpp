#include "master/Errors.hpp"
#include "master/GridBackend.hpp"
#include "master/Log.hpp"
#include "master/Operator.hpp"
#include "master/backend/NullBackend.hpp"
#include "master/io/ConfigYAML.hpp" // ProblemConfig + load_problem_from_yaml()
#include "memory/MemoryManager.hpp"
#include "mesh/GridBundle.hpp"
#include "mesh/Subdomain.hpp"

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <mpi.h>

using wavegrid::master::GridBackend;
using wavegrid::master::OperatorDriver;
using wavegrid::master::backend::NullBackend;
using wavegrid::master::io::build_grid_bundle;
using wavegrid::master::io::load_problem_from_yaml;
using wavegrid::master::io::ProblemConfig;

// ---- MPI once-only lifetime ------------------------------------------------
// Initializes MPI if nobody did and finalizes only if we were the owner.
struct MpiOnce
{
    bool mpi_owner{false};

    MpiOnce(int& argc, char**& argv)
    {
        int inited = 0;
        MPI_Initialized(&inited);
        if (!inited)
        {
            int provided = MPI_THREAD_SINGLE;
            MPI_Init_thread(&argc, &argv, MPI_THREAD_FUNNELED, &provided);
            mpi_owner = true;
        }
    }
    ~MpiOnce()
    {
        int mfin = 0;
        MPI_Finalized(&mfin);
        if (!mfin && mpi_owner)
            MPI_Finalize();
    }
};

template <class T> static std::string join(const std::vector<T>& v, const char* sep = "x")
{
    std::ostringstream os;
    for (std::size_t i = 0; i < v.size(); ++i)
        os << (i ? sep : "") << v[i];
    return os.str();
}

static void print_grids(const wavegrid::mesh::GridBundle& b)
{
    const auto& s = b.space;
    LOGI("[space] shape=%s extended=%s spacing=%s extra=%s absorbing=%s\n",
         join(s.shape()).c_str(), join(s.extended_shape()).c_str(), join(s.spacing(), ",").c_str(),
         join(s.extra(), ",").c_str(), join(s.absorbing(), ",").c_str());
    LOGI("[space] pml_origin=%s extended_limit=%s points=%zu/%zu\n",
         join(s.pml_origin(), ",").c_str(), join(s.extended_limit(), ",").c_str(),
         s.num_points(), s.extended_num_points());

    const auto& t = b.time;
    LOGI("[time]  start=%g stop=%g step=%g num=%d | extended [%g, %g] num=%d pad=%d,%d\n",
         t.start(), t.stop(), t.step(), t.num(), t.extended_start(), t.extended_stop(),
         t.extended_num(), t.extra()[0], t.extra()[1]);

    if (b.acquisition)
    {
        const auto& a = *b.acquisition;
        LOGI("[acq]   frames=%d x acq=%d (frame_step=%g acq_step=%g) num=%d\n", a.num_frame(),
             a.num_acq(), a.frame_step(), a.subsampled() ? a.acq_step() : 0.0, a.num());
    }
}

static void print_subdomains(const GridBackend& grid)
{
    const auto& g = grid.grid();
    LOGI("[subdomains] %zu regions over %s\n", g.subdomains.size(), join(g.shape).c_str());
    for (const auto& sd : g.subdomains)
        LOGD("  %-28s %zu cells\n", sd.name.c_str(), sd.count(g.shape));
}

int main(int argc, char** argv)
{
    MpiOnce runtime(argc, argv);

    // Users can override with: WAVEGRID_LOG=quiet|error|warn|info|debug
    wavegrid::master::logx::init({wavegrid::master::logx::Level::Info, /*rank0_only*/ true});

    if (argc < 2)
    {
        LOGE("usage: %s <problem.yaml>\n", argv[0]);
        return 2;
    }

    try
    {
        // 1) Parse YAML config
        const ProblemConfig cfg = load_problem_from_yaml(argv[1]);
        if (cfg.log.level != wavegrid::master::logx::Level::Info || cfg.log.rank0_only)
            wavegrid::master::logx::init(cfg.log);

        // 2) Grids
        const auto bundle = build_grid_bundle(cfg);
        print_grids(bundle);

        // 3) Backend grid + decomposition
        GridBackend grid(cfg.op.space_order, cfg.op.time_order);
        grid.set_problem(bundle);
        print_subdomains(grid);

        // 4) Declare the usual acoustic fields and size them
        grid.function("vp");
        grid.time_function("p");
        for (const auto& f : grid.cache().all())
            LOGI("[function] %-4s %-14s %s\n", f->name.c_str(),
                 wavegrid::master::function_kind_name(f->kind), join(f->shape()).c_str());
        LOGI("[memory] %zu bytes in %zu blocks\n",
             wavegrid::memory::MemoryManager::instance().bytes_in_use(),
             wavegrid::memory::MemoryManager::instance().debug_count());

        // 5) Smoke run through the null backend
        NullBackend backend;
        OperatorDriver op(backend, grid);
        op.set_operator({}, cfg.op.name, cfg.op.options);
        op.compile();
        op.run();

        grid.cache().clear();
    }
    catch (const std::exception& e)
    {
        LOGE("%s\n", e.what());
        return 1;
    }

    return 0;
}

#include "master/Errors.hpp"
#include "master/GridBackend.hpp"
#include "master/Log.hpp"
#include "master/Operator.hpp"
#include "master/backend/NullBackend.hpp"
#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

using namespace wavegrid::master;
using namespace wavegrid::mesh;
using wavegrid::master::backend::KV;
using wavegrid::master::backend::NullBackend;
using wavegrid::master::backend::NullKernel;

namespace
{

GridBundle make_bundle()
{
    SpatialGrid space({16, 12}, 1.0, {3, 3}, {2, 2});
    TemporalGrid time({.start = 0.0, .step = 0.5, .num = 21});
    time.extend({1, 1});
    return GridBundle{space, time};
}

} // namespace

TEST_CASE("Default configuration and options", "[operator]")
{
    const KV conf = OperatorDriver::default_configuration();
    CHECK(conf.at("autotuning") == "aggressive,runtime");
    CHECK(conf.at("develop-mode") == "false");
    CHECK(conf.at("mpi") == "false");
    CHECK(conf.at("log-level") == "DEBUG");

    unsetenv("WAVEGRID_LANGUAGE");
    unsetenv("WAVEGRID_PLATFORM");
    unsetenv("WAVEGRID_COMPILER");
    KV opts = OperatorDriver::default_options();
    CHECK(opts.at("opt") == "advanced");
    CHECK(opts.at("language") == "openmp");
    CHECK(opts.count("platform") == 0);
    CHECK(opts.count("compiler") == 0);

    setenv("WAVEGRID_LANGUAGE", "openacc", 1);
    setenv("WAVEGRID_COMPILER", "nvc", 1);
    opts = OperatorDriver::default_options();
    CHECK(opts.at("language") == "openacc");
    CHECK(opts.at("compiler") == "nvc");
    unsetenv("WAVEGRID_LANGUAGE");
    unsetenv("WAVEGRID_COMPILER");
}

TEST_CASE("set_operator hands grid, functions and merged options to the backend", "[operator]")
{
    GridBackend grid(4, 2);
    grid.set_problem(make_bundle());
    grid.function("vp");
    grid.time_function("p");

    NullBackend be;
    OperatorDriver op(be, grid);
    CHECK_FALSE(op.has_operator());

    op.set_operator({"p.forward = p"}, "acoustic", {{"opt", "noop"}, {"extra", "1"}});
    REQUIRE(op.has_operator());
    CHECK(be.compiles == 1);

    CHECK(be.last_request.name == "acoustic");
    CHECK(be.last_request.updates == std::vector<std::string>{"p.forward = p"});
    CHECK(be.last_request.options.at("opt") == "noop"); // caller wins
    CHECK(be.last_request.options.at("extra") == "1");
    CHECK(be.last_request.options.count("language") == 1);
    CHECK(be.last_request.configuration.at("mpi") == "false");

    CHECK(be.last_grid.shape == std::vector<int>({22, 18}));
    REQUIRE(be.last_functions.size() == 2);
    CHECK(be.last_functions[0]->name == "vp");
    CHECK(be.last_functions[1]->name == "p");

    CHECK(op.request().name == "acoustic");
}

TEST_CASE("Caller options replace configuration entries", "[operator]")
{
    GridBackend grid(2, 2);
    grid.set_problem(make_bundle());

    NullBackend be;
    OperatorDriver op(be, grid);
    op.set_operator({}, "k", {{"mpi", "true"}, {"log-level", "ERROR"}, {"opt", "noop"}});

    CHECK(be.last_request.configuration.at("mpi") == "true");
    CHECK(be.last_request.configuration.at("log-level") == "ERROR");
    CHECK(be.last_request.configuration.at("develop-mode") == "false");
    CHECK(be.last_request.options.count("mpi") == 0);
    CHECK(be.last_request.options.count("log-level") == 0);
    CHECK(be.last_request.options.at("opt") == "noop");
}

TEST_CASE("Operator settings are logged in key order", "[operator][log]")
{
    namespace logx = wavegrid::master::logx;

    GridBackend grid(2, 2);
    grid.set_problem(make_bundle());
    NullBackend be;
    OperatorDriver op(be, grid);

    std::vector<std::string> lines;
    logx::init({logx::Level::Info, false});
    logx::set_sink([&](logx::Level, const std::string& msg) { lines.push_back(msg); });
    op.set_operator({}, "k", {{"zeta", "1"}, {"alpha", "2"}});
    logx::set_sink({});

    std::vector<std::string> settings;
    for (const auto& l : lines)
        if (l.rfind("  ", 0) == 0)
            settings.push_back(l);

    REQUIRE(settings.size() >= 6);
    CHECK(settings[0] == "  configuration autotuning = aggressive,runtime\n");
    CHECK(settings[1] == "  configuration develop-mode = false\n");
    CHECK(settings[2] == "  configuration log-level = DEBUG\n");
    CHECK(settings[3] == "  configuration mpi = false\n");
    CHECK(settings[4] == "  option alpha = 2\n");
    CHECK(std::is_sorted(settings.begin() + 4, settings.end()));
    CHECK(settings.back() == "  option zeta = 1\n");
}

TEST_CASE("Run fills the time window unless overridden", "[operator]")
{
    GridBackend grid(2, 2);
    grid.set_problem(make_bundle());

    NullBackend be;
    OperatorDriver op(be, grid);
    op.set_operator({});

    const KV args = op.arguments();
    CHECK(args.at("time_m") == "0");
    CHECK(args.at("time_M") == "22"); // 23 extended samples

    const KV custom = op.arguments({{"time_M", "5"}, {"dt", "0.5"}});
    CHECK(custom.at("time_m") == "0");
    CHECK(custom.at("time_M") == "5");
    CHECK(custom.at("dt") == "0.5");

    op.compile();
    op.run();
    op.run({{"time_m", "3"}});

    CHECK(be.compiles == 1); // compiled once, run twice
}

TEST_CASE("Kernel sees prepare and apply calls", "[operator]")
{
    struct KeepingBackend final : backend::IBackend
    {
        NullKernel* kernel = nullptr;
        std::unique_ptr<backend::IKernel> compile(const backend::GridDescriptor&,
                                                  const std::vector<backend::FunctionHandle>&,
                                                  const backend::OperatorRequest& req) override
        {
            auto k = std::make_unique<NullKernel>(req.name);
            kernel = k.get();
            return k;
        }
    };

    GridBackend grid(2, 2);
    grid.set_problem(make_bundle());
    KeepingBackend be;
    OperatorDriver op(be, grid);
    op.set_operator({"u = 1"}, "fill");

    REQUIRE(be.kernel != nullptr);
    CHECK(be.kernel->name() == "fill");
    op.compile();
    CHECK(be.kernel->prepared == 1);
    op.run({{"time_m", "3"}});
    CHECK(be.kernel->applied == 1);
    CHECK(be.kernel->last_arguments.at("time_m") == "3");
    CHECK(be.kernel->last_arguments.at("time_M") == "22");
}

TEST_CASE("Driver use before setup is an error", "[operator][errors]")
{
    GridBackend grid(2, 2);
    NullBackend be;
    OperatorDriver op(be, grid);

    CHECK_THROWS_AS(op.set_operator({}), wavegrid::ConfigurationError);

    grid.set_problem(make_bundle());
    CHECK_THROWS_AS(op.compile(), wavegrid::ConfigurationError);
    CHECK_THROWS_AS(op.run(), wavegrid::ConfigurationError);
}

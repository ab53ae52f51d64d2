#include "master/Operator.hpp"
#include "master/Errors.hpp"
#include "master/Log.hpp"
#include <cstdlib>
#include <map>
#include <string>
#include <utility>

namespace wavegrid::master
{

namespace
{

void set_from_env(backend::KV& kv, const char* key, const char* var)
{
    if (const char* v = std::getenv(var))
        kv[key] = v;
}

void log_sorted(const char* what, const backend::KV& kv)
{
    const std::map<std::string, std::string> sorted(kv.begin(), kv.end());
    for (const auto& [k, v] : sorted)
        LOGI("  %s %s = %s\n", what, k.c_str(), v.c_str());
}

} // namespace

OperatorDriver::OperatorDriver(backend::IBackend& backend, GridBackend& grid)
    : backend_(backend), grid_(grid)
{
}

backend::KV OperatorDriver::default_configuration()
{
    return {{"autotuning", "aggressive,runtime"},
            {"develop-mode", "false"},
            {"mpi", "false"},
            {"log-level", "DEBUG"}};
}

backend::KV OperatorDriver::default_options()
{
    backend::KV kv{{"opt", "advanced"}, {"language", "openmp"}};
    set_from_env(kv, "language", "WAVEGRID_LANGUAGE");
    set_from_env(kv, "platform", "WAVEGRID_PLATFORM");
    set_from_env(kv, "compiler", "WAVEGRID_COMPILER");
    return kv;
}

void OperatorDriver::set_operator(std::vector<std::string> updates, std::string name,
                                  const backend::KV& options)
{
    if (!grid_.has_problem())
        throw ConfigurationError("OperatorDriver::set_operator: grid has no problem set");

    backend::OperatorRequest req;
    req.name = std::move(name);
    req.updates = std::move(updates);
    req.configuration = default_configuration();
    req.options = default_options();
    for (const auto& [k, v] : options)
    {
        if (auto it = req.configuration.find(k); it != req.configuration.end())
            it->second = v;
        else
            req.options[k] = v;
    }

    LOGI("operator '%s': %zu updates\n", req.name.c_str(), req.updates.size());
    log_sorted("configuration", req.configuration);
    log_sorted("option", req.options);

    std::vector<backend::FunctionHandle> functions;
    for (auto& f : grid_.cache().all())
        functions.push_back(f);

    auto kernel = backend_.compile(grid_.grid(), functions, req);
    if (!kernel)
        throw ConfigurationError("OperatorDriver::set_operator: backend returned no kernel for '" +
                                 req.name + "'");

    kernel_ = std::move(kernel);
    request_ = std::move(req);
}

void OperatorDriver::require_operator(const char* what) const
{
    if (!kernel_)
        throw ConfigurationError(std::string("OperatorDriver::") + what +
                                 ": set_operator must be called first");
}

void OperatorDriver::compile()
{
    require_operator("compile");
    kernel_->prepare();
}

backend::KV OperatorDriver::arguments(const backend::KV& overrides) const
{
    backend::KV args = overrides;
    args.try_emplace("time_m", "0");
    args.try_emplace("time_M", std::to_string(grid_.problem().time.extended_num() - 1));
    return args;
}

void OperatorDriver::run(const backend::KV& overrides)
{
    require_operator("run");
    const auto args = arguments(overrides);
    LOGD("operator '%s': run time_m=%s time_M=%s\n", request_.name.c_str(),
         args.at("time_m").c_str(), args.at("time_M").c_str());
    kernel_->apply(args);
}

} // namespace wavegrid::master

#pragma once
#include "master/Errors.hpp"
#include "master/Log.hpp"
#include "master/backend/IBackend.hpp"
#include "mesh/AcquisitionGrid.hpp"
#include "mesh/GridBundle.hpp"
#include "mesh/SpatialGrid.hpp"
#include "mesh/TemporalGrid.hpp"
#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

/**
 * @file   ConfigYAML.hpp
 * @brief  YAML → ProblemConfig loader and schema for the grid tools.
 *
 * @details
 * @rst
 * A problem file describes the grids of one forward problem and the discretisation the
 * operator is built with. This file defines:
 *
 * - :cpp:struct:`ProblemConfig`: the strongly-typed config object
 * - :cpp:func:`load_problem_from_yaml` / :cpp:func:`parse_problem_yaml`: file and string loaders
 * - :cpp:func:`build_grid_bundle`: turns the config into a :cpp:struct:`wavegrid::mesh::GridBundle`
 *
 * **Schema (v0)**
 *
 * .. code-block:: yaml
 *
 *    space:
 *      shape: [100, 80]             # inner cells per axis (required)
 *      spacing: 0.5e-3              # scalar or per-axis list (required)
 *      extra: [20, 20]              # padding per side, default 0
 *      absorbing: [10, 10]          # PML width inside the padding, default 0
 *
 *    time:                          # exactly three of start/step/num/stop
 *      start: 0.0
 *      step: 1.0e-4
 *      num: 1000
 *      extend: [2, 3]               # optional left/right padding in samples
 *
 *    acquisition:                   # optional
 *      frame_rate: 10.0             # or frame_step
 *      acq_step: 1.0e-3             # or acq_rate; omit both for one sample per frame
 *      num_frame: 5
 *      num_acq: 4
 *
 *    operator:
 *      name: acoustic
 *      space_order: 10
 *      time_order: 2
 *      options:                     # free-form KV (string → string), overrides defaults
 *        opt: advanced
 *
 *    log:
 *      level: info                  # quiet | error | warn | info | debug
 *      rank0_only: true
 *
 * **Semantics**
 *
 * - Malformed YAML and values of the wrong type raise :cpp:class:`wavegrid::ConfigurationError`.
 * - Consistency of the values is checked by the grid constructors, not here.
 * @endrst
 */

namespace wavegrid::master::io
{

struct ProblemConfig
{
    struct Space
    {
        std::vector<int> shape;
        std::vector<double> spacing; // one entry means isotropic
        std::vector<int> extra{};
        std::vector<int> absorbing{};
    } space;

    mesh::TimeSpec time{};
    std::optional<std::array<int, 2>> time_extend;

    std::optional<mesh::AcquisitionSpec> acquisition;

    struct Operator
    {
        std::string name = "kernel";
        int space_order = 4;
        int time_order = 2;
        backend::KV options{};
    } op;

    logx::Config log{};
};

namespace detail
{

template <class T> inline std::optional<T> opt_as(const YAML::Node& n, const char* key)
{
    if (auto v = n[key])
        return v.as<T>();
    return std::nullopt;
}

inline std::vector<double> as_spacing(const YAML::Node& n)
{
    if (n.IsSequence())
        return n.as<std::vector<double>>();
    return {n.as<double>()};
}

inline ProblemConfig parse_problem_node(const YAML::Node& root)
{
    ProblemConfig cfg;

    auto s = root["space"];
    if (!s)
        throw ConfigurationError("problem config: missing 'space' section");
    if (!s["shape"] || !s["spacing"])
        throw ConfigurationError("problem config: 'space' needs 'shape' and 'spacing'");
    cfg.space.shape = s["shape"].as<std::vector<int>>();
    cfg.space.spacing = as_spacing(s["spacing"]);
    if (auto n = s["extra"])
        cfg.space.extra = n.as<std::vector<int>>();
    if (auto n = s["absorbing"])
        cfg.space.absorbing = n.as<std::vector<int>>();

    auto t = root["time"];
    if (!t)
        throw ConfigurationError("problem config: missing 'time' section");
    cfg.time.start = opt_as<double>(t, "start");
    cfg.time.step = opt_as<double>(t, "step");
    cfg.time.num = opt_as<int>(t, "num");
    cfg.time.stop = opt_as<double>(t, "stop");
    if (auto n = t["extend"])
    {
        auto v = n.as<std::vector<int>>();
        if (v.size() != 2)
            throw ConfigurationError("problem config: 'time.extend' must be [left, right]");
        cfg.time_extend = std::array<int, 2>{v[0], v[1]};
    }

    if (auto a = root["acquisition"])
    {
        mesh::AcquisitionSpec acq;
        acq.frame_rate = opt_as<double>(a, "frame_rate");
        acq.acq_rate = opt_as<double>(a, "acq_rate");
        acq.frame_step = opt_as<double>(a, "frame_step");
        acq.acq_step = opt_as<double>(a, "acq_step");
        acq.num_frame = opt_as<int>(a, "num_frame");
        acq.num_acq = opt_as<int>(a, "num_acq");
        cfg.acquisition = acq;
    }

    if (auto o = root["operator"])
    {
        if (auto n = o["name"])
            cfg.op.name = n.as<std::string>();
        if (auto n = o["space_order"])
            cfg.op.space_order = n.as<int>();
        if (auto n = o["time_order"])
            cfg.op.time_order = n.as<int>();
        if (auto K = o["options"])
        {
            for (auto it = K.begin(); it != K.end(); ++it)
                cfg.op.options.emplace(it->first.as<std::string>(), it->second.as<std::string>());
        }
    }

    if (auto l = root["log"])
    {
        if (auto n = l["level"])
            cfg.log.level = logx::level_from_string(n.as<std::string>());
        if (auto n = l["rank0_only"])
            cfg.log.rank0_only = n.as<bool>();
    }

    return cfg;
}

} // namespace detail

inline ProblemConfig parse_problem_yaml(const std::string& text)
{
    try
    {
        return detail::parse_problem_node(YAML::Load(text));
    }
    catch (const YAML::Exception& e)
    {
        throw ConfigurationError(std::string("problem config: ") + e.what());
    }
}

inline ProblemConfig load_problem_from_yaml(const std::string& path)
{
    try
    {
        return detail::parse_problem_node(YAML::LoadFile(path));
    }
    catch (const YAML::Exception& e)
    {
        throw ConfigurationError("problem config '" + path + "': " + e.what());
    }
}

inline mesh::GridBundle build_grid_bundle(const ProblemConfig& cfg)
{
    auto spacing = cfg.space.spacing;
    if (spacing.size() == 1 && cfg.space.shape.size() > 1)
        spacing.assign(cfg.space.shape.size(), spacing.front());

    mesh::SpatialGrid space(cfg.space.shape, std::move(spacing), cfg.space.extra,
                            cfg.space.absorbing);
    mesh::TemporalGrid time(cfg.time);
    if (cfg.time_extend)
        time.extend(*cfg.time_extend);

    mesh::GridBundle bundle{std::move(space), std::move(time)};
    if (cfg.acquisition)
        bundle.acquisition.emplace(*cfg.acquisition);
    return bundle;
}

} // namespace wavegrid::master::io

#pragma once
#include "master/GridBackend.hpp"
#include "master/backend/IBackend.hpp"
#include <memory>
#include <string>
#include <vector>

/**
 * @file Operator.hpp
 * @brief Builds, compiles and runs one backend kernel over a problem's grid.
 *
 * @details
 * :cpp:func:`OperatorDriver::set_operator` merges two layers of defaults with the caller's
 * options (caller wins; a key that names a configuration entry replaces that entry and is
 * not repeated among the options), logs the result in key order and hands the grid descriptor, every cached function
 * declaration and the named updates to the backend. The returned kernel is kept until the next
 * ``set_operator``.
 *
 * Global configuration defaults:
 *
 * ==================  ======================
 * key                 value
 * ==================  ======================
 * ``autotuning``      ``aggressive,runtime``
 * ``develop-mode``    ``false``
 * ``mpi``             ``false``
 * ``log-level``       ``DEBUG``
 * ==================  ======================
 *
 * Operator defaults: ``opt=advanced`` and ``language`` from ``WAVEGRID_LANGUAGE`` (``openmp``
 * when unset); ``platform`` and ``compiler`` are only set when ``WAVEGRID_PLATFORM`` /
 * ``WAVEGRID_COMPILER`` are.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   backend::NullBackend be;
 *   OperatorDriver op(be, grid);
 *   op.set_operator({"p.forward = 2*p - p.backward + dt**2*vp**2*p.laplace"}, "acoustic");
 *   op.compile();
 *   op.run();   // time_m = 0, time_M = extended_num - 1
 * @endrst
 */

namespace wavegrid::master
{

class OperatorDriver
{
  public:
    OperatorDriver(backend::IBackend& backend, GridBackend& grid);

    static backend::KV default_configuration();
    static backend::KV default_options();

    void set_operator(std::vector<std::string> updates, std::string name = "kernel",
                      const backend::KV& options = {});
    bool has_operator() const noexcept { return kernel_ != nullptr; }
    const backend::OperatorRequest& request() const noexcept { return request_; }

    /// Force code generation and compilation of the current kernel.
    void compile();

    /// Run-time arguments: \p overrides plus time_m / time_M where not given.
    backend::KV arguments(const backend::KV& overrides = {}) const;

    void run(const backend::KV& overrides = {});

  private:
    void require_operator(const char* what) const;

    backend::IBackend& backend_;
    GridBackend& grid_;
    backend::OperatorRequest request_;
    std::unique_ptr<backend::IKernel> kernel_;
};

} // namespace wavegrid::master

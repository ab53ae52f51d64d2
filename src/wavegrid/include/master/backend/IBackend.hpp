#pragma once
#include "master/FunctionDecl.hpp"
#include "mesh/Subdomain.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @file IBackend.hpp
 * @brief Seam to the stencil-compiler backend.
 *
 * @details
 * The core describes *what* to compile; the backend decides *how*. A backend receives
 *
 * - a :cpp:struct:`GridDescriptor` (extended shape, physical extent, origin, dtype and the
 *   ordered list of named subdomains),
 * - the function declarations the kernel touches,
 * - an :cpp:struct:`OperatorRequest` with the named updates and the merged configuration,
 *
 * and returns an opaque :cpp:class:`IKernel`. The core never looks inside the kernel.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   struct CountingBackend : IBackend {
 *     int compiles = 0;
 *     std::unique_ptr<IKernel> compile(const GridDescriptor&, const std::vector<FunctionHandle>&,
 *                                      const OperatorRequest&) override {
 *       ++compiles;
 *       return std::make_unique<NullKernel>("kernel");
 *     }
 *   };
 * @endrst
 */

namespace wavegrid::master::backend
{

using KV = std::unordered_map<std::string, std::string>;
using FunctionHandle = std::shared_ptr<const FunctionDecl>;

struct GridDescriptor
{
    std::vector<int> shape;      // extended shape
    std::vector<double> extent;  // spacing*(extended_shape-1)
    std::vector<double> origin;  // pml origin
    std::vector<double> spacing;
    DType dtype = DType::Float32;
    std::vector<mesh::Subdomain> subdomains;
};

struct OperatorRequest
{
    std::string name = "kernel";
    std::vector<std::string> updates; // opaque update expressions, in order
    KV configuration;                 // global backend configuration
    KV options;                       // per-operator options
};

// Compiled, callable kernel.
class IKernel
{
  public:
    virtual ~IKernel() = default;
    virtual const std::string& name() const noexcept = 0;
    virtual void prepare() = 0; // force code generation/compilation
    virtual void apply(const KV& arguments) = 0;
};

class IBackend
{
  public:
    virtual ~IBackend() = default;
    virtual std::unique_ptr<IKernel> compile(const GridDescriptor& grid,
                                             const std::vector<FunctionHandle>& functions,
                                             const OperatorRequest& request) = 0;
};

} // namespace wavegrid::master::backend

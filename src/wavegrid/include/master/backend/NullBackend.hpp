#pragma once
#include "master/backend/IBackend.hpp"
#include <memory>
#include <string>
#include <utility>

namespace wavegrid::master::backend
{

/// Kernel that does nothing but count calls (smoke tests, info app)
class NullKernel final : public IKernel
{
  public:
    explicit NullKernel(std::string name) : name_(std::move(name)) {}

    const std::string& name() const noexcept override { return name_; }
    void prepare() override { ++prepared; }
    void apply(const KV& arguments) override
    {
        ++applied;
        last_arguments = arguments;
    }

    int prepared = 0;
    int applied = 0;
    KV last_arguments;

  private:
    std::string name_;
};

/// Backend that records the last compile request and hands out NullKernels
class NullBackend final : public IBackend
{
  public:
    std::unique_ptr<IKernel> compile(const GridDescriptor& grid,
                                     const std::vector<FunctionHandle>& functions,
                                     const OperatorRequest& request) override
    {
        ++compiles;
        last_grid = grid;
        last_functions = functions;
        last_request = request;
        return std::make_unique<NullKernel>(request.name);
    }

    int compiles = 0;
    GridDescriptor last_grid;
    std::vector<FunctionHandle> last_functions;
    OperatorRequest last_request;
};

} // namespace wavegrid::master::backend

#pragma once
#include "memory/FieldBuffer.hpp"
#include "mesh/Hicks.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @file FunctionDecl.hpp
 * @brief Declaration of one discretised function as handed to the stencil backend.
 *
 * @details
 * A declaration carries what the backend needs to lay out and bind a function: its name, kind,
 * discretisation orders, buffer shape and, for point functions, the sparse sizes and optional
 * precomputed interpolation record. The data itself lives in ``data``, a
 * :cpp:class:`wavegrid::memory::FieldBuffer` that can be dropped on its own while the
 * declaration stays referenced.
 *
 * Buffer layouts (row-major):
 *
 * - ``Function``                       : extended shape + 2*space_order per axis
 * - ``TimeFunction``                   : [time buffers] + the above
 * - ``SparseTimeFunction`` /
 *   ``PrecomputedSparseTimeFunction``  : [nt, npoint]
 */

namespace wavegrid::master
{

enum class FunctionKind : uint8_t
{
    Function,
    TimeFunction,
    SparseTimeFunction,
    PrecomputedSparseTimeFunction
};

const char* function_kind_name(FunctionKind k) noexcept;

enum class DType : uint8_t
{
    Float32
};

struct FunctionDecl
{
    std::string name;
    FunctionKind kind = FunctionKind::Function;
    DType dtype = DType::Float32;

    int space_order = 0;
    int time_order = 0;

    std::optional<int> save;   // time buffers kept for saved/undersampled functions
    std::optional<int> factor; // time undersampling factor

    // Sparse functions
    int npoint = 0;
    int nt = 0;
    int radius = 0; // interpolation support, 2*half_width+1 for precomputed
    std::optional<mesh::InterpolationRecord> interpolation;

    memory::FieldBuffer data;

    bool allocated() const noexcept { return data.allocated(); }
    const std::vector<int>& shape() const noexcept { return data.shape(); }
};

} // namespace wavegrid::master

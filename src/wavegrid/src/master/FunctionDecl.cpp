#include "master/FunctionDecl.hpp"

namespace wavegrid::master
{

const char* function_kind_name(FunctionKind k) noexcept
{
    switch (k)
    {
    case FunctionKind::Function:
        return "Function";
    case FunctionKind::TimeFunction:
        return "TimeFunction";
    case FunctionKind::SparseTimeFunction:
        return "SparseTimeFunction";
    case FunctionKind::PrecomputedSparseTimeFunction:
        return "PrecomputedSparseTimeFunction";
    }
    return "?";
}

} // namespace wavegrid::master

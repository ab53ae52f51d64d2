#pragma once
#include <stdexcept>
#include <string>

/**
 * @file Errors.hpp
 * @brief Exception types raised by grid construction and function declaration.
 *
 * @details
 * Every failure in the core is a caller contract violation, so nothing is retried:
 *
 * - :cpp:class:`ConfigurationError`: inconsistent grid parameters, bad counts, use before setup.
 * - :cpp:class:`UnsupportedOperationError`: operations that are rejected outright (resampling
 *   of time grids).
 * - :cpp:class:`InvalidInterpolationMode`: unknown interpolation kind.
 */

namespace wavegrid
{

struct ConfigurationError : std::runtime_error
{
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

struct UnsupportedOperationError : std::logic_error
{
    explicit UnsupportedOperationError(const std::string& what) : std::logic_error(what) {}
};

struct InvalidInterpolationMode : std::invalid_argument
{
    explicit InvalidInterpolationMode(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace wavegrid

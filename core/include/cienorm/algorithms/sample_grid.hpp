#pragma once

#include "../types.hpp"
#include <vector>
#include <string>
#include <stdexcept>

namespace cienorm {
namespace algorithms {

/**
 * @brief Exception thrown for invalid sample grid parameters.
 */
class InvalidRangeError : public std::runtime_error {
public:
    explicit InvalidRangeError(const std::string& msg)
        : std::runtime_error("Sample grid error: " + msg) {}
};

/**
 * @brief Generate a uniform grid over the half-open interval [start, stop).
 *
 * Element k is computed as start + k * step rather than by repeated
 * addition, so rounding error does not accumulate along the grid. Every
 * emitted value is strictly less than stop.
 *
 * @param start First wavelength
 * @param stop Exclusive upper bound
 * @param step Spacing (must be positive)
 * @return Grid values in ascending order
 * @throws InvalidRangeError if step <= 0, start >= stop, or any
 *         argument is not finite
 */
std::vector<Wavelength> generateSampleGrid(Wavelength start, Wavelength stop,
                                           Wavelength step);

/// Number of values generateSampleGrid() would return
std::size_t sampleGridSize(Wavelength start, Wavelength stop, Wavelength step);

} // namespace algorithms
} // namespace cienorm

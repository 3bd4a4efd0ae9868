#pragma once

#include "../types.hpp"
#include <vector>
#include <string>
#include <stdexcept>

namespace cienorm {
namespace algorithms {

/**
 * @brief Exception thrown when too few samples reach the integrator.
 */
class InsufficientSamplesError : public std::runtime_error {
public:
    explicit InsufficientSamplesError(const std::string& msg)
        : std::runtime_error("Integration error: " + msg) {}
};

/**
 * @brief Trapezoidal-rule integral of sampled values.
 *
 * Computes sum over i of (w[i+1] - w[i]) * (v[i] + v[i+1]) / 2.
 *
 * @param wavelengths Ascending sample positions
 * @param values Sampled values, parallel to wavelengths
 * @return Estimated area under the sampled curve
 * @throws std::invalid_argument if the arrays differ in size
 * @throws InsufficientSamplesError if fewer than two samples are given
 */
double trapezoid(const std::vector<Wavelength>& wavelengths,
                 const std::vector<Value>& values);

} // namespace algorithms
} // namespace cienorm

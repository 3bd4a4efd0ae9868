#pragma once

#include "../types.hpp"
#include <vector>
#include <string>
#include <stdexcept>

namespace cienorm {
namespace algorithms {

/**
 * @brief Exception thrown when an interpolant is queried outside its domain.
 */
class DomainError : public std::runtime_error {
public:
    explicit DomainError(const std::string& msg)
        : std::runtime_error("Interpolation domain error: " + msg) {}
};

/**
 * @brief Piecewise-linear interpolant over tabulated control points.
 *
 * The interpolant is defined on [wavelengths.front(), wavelengths.back()]
 * and never extrapolates. At a control point it returns the tabulated
 * value exactly; between two control points it returns the value on the
 * straight line joining them.
 */
class LinearInterpolator {
public:
    /**
     * @brief Build an interpolant from control points.
     *
     * @param wavelengths Strictly increasing abscissae (at least two)
     * @param values Channel values, parallel to wavelengths
     * @throws std::invalid_argument if the arrays differ in size
     * @throws DomainError if fewer than two points are given or the
     *         abscissae are not strictly increasing
     */
    LinearInterpolator(std::vector<Wavelength> wavelengths,
                       std::vector<Value> values);

    /**
     * @brief Interpolate at a single wavelength.
     *
     * @throws DomainError if w lies outside the domain or is NaN
     */
    [[nodiscard]] Value operator()(Wavelength w) const;

    /// Interpolate at each wavelength in turn
    [[nodiscard]] std::vector<Value> evaluate(const std::vector<Wavelength>& ws) const;

    /// Closed interval on which the interpolant is defined
    [[nodiscard]] WavelengthRange domain() const noexcept {
        return WavelengthRange(wavelengths_.front(), wavelengths_.back());
    }

    /// Number of control points
    [[nodiscard]] std::size_t size() const noexcept { return wavelengths_.size(); }

private:
    std::vector<Wavelength> wavelengths_;
    std::vector<Value> values_;
};

} // namespace algorithms
} // namespace cienorm

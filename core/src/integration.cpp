#include "cienorm/algorithms/integration.hpp"

namespace cienorm {
namespace algorithms {

double trapezoid(const std::vector<Wavelength>& wavelengths,
                 const std::vector<Value>& values) {
    if (wavelengths.size() != values.size()) {
        throw std::invalid_argument(
            "Wavelength and value arrays must have same size");
    }
    if (wavelengths.size() < 2) {
        throw InsufficientSamplesError(
            "trapezoidal rule needs at least 2 samples, got " +
            std::to_string(wavelengths.size()));
    }

    double area = 0.0;
    for (std::size_t i = 1; i < wavelengths.size(); ++i) {
        double dw = wavelengths[i] - wavelengths[i-1];
        area += 0.5 * (values[i] + values[i-1]) * dw;
    }
    return area;
}

} // namespace algorithms
} // namespace cienorm

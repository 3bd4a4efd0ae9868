#include "cienorm/algorithms/sample_grid.hpp"
#include <cmath>
#include <sstream>

namespace cienorm {
namespace algorithms {

namespace {

// Upper bound on grid length; a larger request is a configuration error
constexpr double MAX_GRID_SIZE = 1e8;

void validateGridParameters(Wavelength start, Wavelength stop, Wavelength step) {
    if (!std::isfinite(start) || !std::isfinite(stop) || !std::isfinite(step)) {
        throw InvalidRangeError("start, stop and step must be finite");
    }
    if (step <= 0.0) {
        std::ostringstream msg;
        msg << "step must be positive, got " << step;
        throw InvalidRangeError(msg.str());
    }
    if (start >= stop) {
        std::ostringstream msg;
        msg << "start (" << start << ") must be less than stop (" << stop << ")";
        throw InvalidRangeError(msg.str());
    }
}

} // namespace

std::size_t sampleGridSize(Wavelength start, Wavelength stop, Wavelength step) {
    validateGridParameters(start, stop, step);

    double count = std::ceil((stop - start) / step);
    if (count > MAX_GRID_SIZE) {
        throw InvalidRangeError("grid would hold more than " +
                                std::to_string(static_cast<long long>(MAX_GRID_SIZE)) +
                                " samples");
    }

    // The division can be off by one ulp either way; settle the count on
    // the grid values themselves
    auto n = static_cast<std::size_t>(count);
    while (n > 0 && start + static_cast<double>(n - 1) * step >= stop) {
        --n;
    }
    while (start + static_cast<double>(n) * step < stop) {
        ++n;
    }

    // Spacing is coarsest at the largest magnitude, at one end of the grid
    if (n > 1) {
        const double last = start + static_cast<double>(n - 1) * step;
        const double before_last = start + static_cast<double>(n - 2) * step;
        if (!(start + step > start) || !(last > before_last)) {
            std::ostringstream msg;
            msg << "step " << step << " is below floating-point resolution in ["
                << start << ", " << stop << ")";
            throw InvalidRangeError(msg.str());
        }
    }
    return n;
}

std::vector<Wavelength> generateSampleGrid(Wavelength start, Wavelength stop,
                                           Wavelength step) {
    const std::size_t n = sampleGridSize(start, stop, step);

    std::vector<Wavelength> grid;
    grid.reserve(n);
    for (std::size_t k = 0; k < n; ++k) {
        Wavelength w = start + static_cast<double>(k) * step;
        if (!grid.empty() && !(w > grid.back())) {
            std::ostringstream msg;
            msg << "grid values not strictly increasing at " << w;
            throw InvalidRangeError(msg.str());
        }
        grid.push_back(w);
    }
    return grid;
}

} // namespace algorithms
} // namespace cienorm

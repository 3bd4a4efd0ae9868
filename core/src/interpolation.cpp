#include "cienorm/algorithms/interpolation.hpp"
#include <algorithm>
#include <iterator>
#include <cmath>
#include <sstream>

namespace cienorm {
namespace algorithms {

LinearInterpolator::LinearInterpolator(std::vector<Wavelength> wavelengths,
                                       std::vector<Value> values)
    : wavelengths_(std::move(wavelengths)), values_(std::move(values)) {
    if (wavelengths_.size() != values_.size()) {
        throw std::invalid_argument(
            "Wavelength and value arrays must have same size");
    }
    if (wavelengths_.size() < 2) {
        throw DomainError("at least two control points are required");
    }
    for (std::size_t i = 1; i < wavelengths_.size(); ++i) {
        if (!(wavelengths_[i] > wavelengths_[i-1])) {
            throw DomainError("control points not strictly increasing at index " +
                              std::to_string(i));
        }
    }
}

Value LinearInterpolator::operator()(Wavelength w) const {
    if (std::isnan(w) || w < wavelengths_.front() || w > wavelengths_.back()) {
        std::ostringstream msg;
        msg << "wavelength " << w << " outside ["
            << wavelengths_.front() << ", " << wavelengths_.back() << "]";
        throw DomainError(msg.str());
    }

    // First control point not below w
    auto it = std::lower_bound(wavelengths_.begin(), wavelengths_.end(), w);
    std::size_t i = static_cast<std::size_t>(std::distance(wavelengths_.begin(), it));

    if (*it == w) {
        return values_[i];
    }

    // w lies strictly inside (wavelengths_[i-1], wavelengths_[i])
    const Wavelength w0 = wavelengths_[i-1];
    const Wavelength w1 = wavelengths_[i];
    const Value v0 = values_[i-1];
    const Value v1 = values_[i];
    return v0 + (v1 - v0) * (w - w0) / (w1 - w0);
}

std::vector<Value> LinearInterpolator::evaluate(const std::vector<Wavelength>& ws) const {
    std::vector<Value> result;
    result.reserve(ws.size());
    for (Wavelength w : ws) {
        result.push_back((*this)(w));
    }
    return result;
}

} // namespace algorithms
} // namespace cienorm

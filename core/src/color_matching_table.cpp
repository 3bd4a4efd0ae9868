#include "cienorm/color_matching_table.hpp"
#include <cmath>

namespace cienorm {

ColorMatchingTable::ColorMatchingTable(std::vector<Wavelength> wavelengths,
                                       std::vector<Value> xbar,
                                       std::vector<Value> ybar,
                                       std::vector<Value> zbar)
    : wavelengths_(std::move(wavelengths)),
      xbar_(std::move(xbar)),
      ybar_(std::move(ybar)),
      zbar_(std::move(zbar)) {
    if (xbar_.size() != wavelengths_.size() ||
        ybar_.size() != wavelengths_.size() ||
        zbar_.size() != wavelengths_.size()) {
        throw std::invalid_argument(
            "Wavelength and channel arrays must have same size");
    }
    validate();
}

const std::vector<Value>& ColorMatchingTable::channel(Channel c) const noexcept {
    switch (c) {
        case Channel::X: return xbar_;
        case Channel::Y: return ybar_;
        case Channel::Z: return zbar_;
    }
    return ybar_;
}

void ColorMatchingTable::validate() const {
    if (wavelengths_.size() < MIN_ROWS) {
        throw DataFormatError("table has " + std::to_string(wavelengths_.size()) +
                              " rows, at least " + std::to_string(MIN_ROWS) +
                              " are required");
    }

    for (std::size_t i = 0; i < wavelengths_.size(); ++i) {
        if (!std::isfinite(wavelengths_[i])) {
            throw DataFormatError("non-finite wavelength in row " +
                                  std::to_string(i + 1));
        }
        if (i > 0 && !(wavelengths_[i] > wavelengths_[i-1])) {
            throw DataFormatError("wavelengths not strictly increasing at row " +
                                  std::to_string(i + 1));
        }
    }
}

} // namespace cienorm

#pragma once

#include <cstdint>
#include <cstddef>

namespace cienorm {

/// Wavelength in nanometres
using Wavelength = double;

/// Tabulated or sampled channel value
using Value = double;

/// Row index into a table or sample grid
using Index = std::size_t;

/// Color-matching channel
enum class Channel : std::uint8_t {
    X = 0,   // x-bar
    Y,       // y-bar (luminous efficiency)
    Z        // z-bar
};

/// Closed min/max interval
template<typename T>
struct Range {
    T min_value;
    T max_value;

    Range(T min_val, T max_val) : min_value(min_val), max_value(max_val) {}

    T span() const { return max_value - min_value; }

    bool contains(T value) const {
        return value >= min_value && value <= max_value;
    }
};

using WavelengthRange = Range<Wavelength>;

} // namespace cienorm

#pragma once

#include "types.hpp"
#include <vector>
#include <string>
#include <stdexcept>

namespace cienorm {

/**
 * @brief Exception thrown when color-matching data is malformed.
 *
 * Raised for rows with the wrong column count, non-numeric fields,
 * tables with fewer than two rows, and wavelengths that are not
 * strictly increasing.
 */
class DataFormatError : public std::runtime_error {
public:
    explicit DataFormatError(const std::string& msg)
        : std::runtime_error("CMF data format error: " + msg) {}
};

/**
 * @brief Tabulated CIE color-matching functions.
 *
 * A ColorMatchingTable stores four parallel columns: wavelength and the
 * x-bar, y-bar and z-bar channel values. Rows are sorted by strictly
 * increasing wavelength and the table holds at least two rows. The
 * table cannot be modified after construction.
 */
class ColorMatchingTable {
public:
    /// Minimum number of rows needed to interpolate
    static constexpr std::size_t MIN_ROWS = 2;

    /**
     * @brief Construct from the four columns.
     *
     * @throws std::invalid_argument if the columns differ in length
     * @throws DataFormatError if there are fewer than two rows or the
     *         wavelengths are not strictly increasing
     */
    ColorMatchingTable(std::vector<Wavelength> wavelengths,
                       std::vector<Value> xbar,
                       std::vector<Value> ybar,
                       std::vector<Value> zbar);

    // Copy-only: no move operations, so a table never ends up without rows
    ColorMatchingTable(const ColorMatchingTable&) = default;
    ColorMatchingTable& operator=(const ColorMatchingTable&) = default;

    // =========================================================================
    // Data Access
    // =========================================================================

    /// Get number of rows
    [[nodiscard]] std::size_t size() const noexcept { return wavelengths_.size(); }

    /// Get wavelength column
    [[nodiscard]] const std::vector<Wavelength>& wavelengths() const noexcept {
        return wavelengths_;
    }

    /// Get x-bar column
    [[nodiscard]] const std::vector<Value>& xbar() const noexcept { return xbar_; }

    /// Get y-bar column
    [[nodiscard]] const std::vector<Value>& ybar() const noexcept { return ybar_; }

    /// Get z-bar column
    [[nodiscard]] const std::vector<Value>& zbar() const noexcept { return zbar_; }

    /// Get the column for a channel
    [[nodiscard]] const std::vector<Value>& channel(Channel c) const noexcept;

    /// Get wavelength at index
    [[nodiscard]] Wavelength wavelengthAt(Index i) const { return wavelengths_.at(i); }

    /// Get channel value at index
    [[nodiscard]] Value valueAt(Channel c, Index i) const { return channel(c).at(i); }

    /// Get the tabulated wavelength range
    [[nodiscard]] WavelengthRange wavelengthRange() const noexcept {
        return WavelengthRange(wavelengths_.front(), wavelengths_.back());
    }

    /// Get the shortest tabulated wavelength
    [[nodiscard]] Wavelength minWavelength() const noexcept {
        return wavelengths_.front();
    }

    /// Get the longest tabulated wavelength
    [[nodiscard]] Wavelength maxWavelength() const noexcept {
        return wavelengths_.back();
    }

private:
    void validate() const;

    std::vector<Wavelength> wavelengths_;
    std::vector<Value> xbar_;
    std::vector<Value> ybar_;
    std::vector<Value> zbar_;
};

} // namespace cienorm

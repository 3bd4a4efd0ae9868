#pragma once

#include "../color_matching_table.hpp"
#include "interpolation.hpp"
#include "sample_grid.hpp"
#include "integration.hpp"
#include <vector>

// Build-time wavelength grid (overridden by the CMake cache variables)
#ifndef CIENORM_WAVELENGTH_MIN
#define CIENORM_WAVELENGTH_MIN 380.0
#endif
#ifndef CIENORM_WAVELENGTH_MAX
#define CIENORM_WAVELENGTH_MAX 780.0
#endif
#ifndef CIENORM_WAVELENGTH_STEP
#define CIENORM_WAVELENGTH_STEP 5.0
#endif

namespace cienorm {
namespace algorithms {

/**
 * @brief Options for resampling color-matching functions.
 */
struct ResamplingOptions {
    /// First grid wavelength (nm)
    Wavelength wavelength_min = CIENORM_WAVELENGTH_MIN;

    /// Exclusive upper bound of the grid (nm)
    Wavelength wavelength_max = CIENORM_WAVELENGTH_MAX;

    /// Grid spacing (nm)
    Wavelength wavelength_step = CIENORM_WAVELENGTH_STEP;

    /// @throws InvalidRangeError if the grid parameters are invalid
    void validate() const {
        sampleGridSize(wavelength_min, wavelength_max, wavelength_step);
    }
};

/**
 * @brief Color-matching functions sampled on a uniform grid.
 */
struct ResampledCMF {
    std::vector<Wavelength> wavelengths;
    std::vector<Value> xbar;
    std::vector<Value> ybar;
    std::vector<Value> zbar;

    [[nodiscard]] std::size_t size() const noexcept { return wavelengths.size(); }

    /// Get the sampled values for a channel
    [[nodiscard]] const std::vector<Value>& channel(Channel c) const noexcept;

    /// Trapezoidal integral of a channel over the grid
    [[nodiscard]] double integrate(Channel c) const;

    /// Trapezoidal integral of y-bar over the grid
    [[nodiscard]] double integrateY() const { return integrate(Channel::Y); }

    /**
     * @brief Luminance normalization factor, 1 / integrateY().
     *
     * @throws DomainError if the y-bar integral is not positive
     */
    [[nodiscard]] double normalization() const;
};

/// CIE XYZ tristimulus values
struct XYZ {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

/**
 * @brief Resamples a color-matching table onto a uniform wavelength grid.
 *
 * Holds one LinearInterpolator per channel, all built over the table's
 * wavelength column.
 *
 * Usage:
 * @code
 * auto table = io::loadCMF("data/ciexyz31.csv");
 * CMFResampler resampler(table);
 * double k = resampler.resample().integrateY();
 * @endcode
 */
class CMFResampler {
public:
    explicit CMFResampler(const ColorMatchingTable& table);

    /**
     * @brief Generate the grid and sample all three channels on it.
     *
     * @throws InvalidRangeError if the grid parameters are invalid
     * @throws DomainError if the grid leaves the tabulated range
     */
    [[nodiscard]] ResampledCMF resample(const ResamplingOptions& options = {}) const;

    /**
     * @brief Resampled rows as a table on the uniform grid.
     *
     * @throws DataFormatError if the grid holds fewer than two samples
     */
    [[nodiscard]] ColorMatchingTable table(const ResamplingOptions& options = {}) const;

    /// Generate the grid and check it against the interpolation domain
    [[nodiscard]] std::vector<Wavelength> grid(const ResamplingOptions& options) const;

    [[nodiscard]] const LinearInterpolator& interpolator(Channel c) const noexcept;

    /// Wavelength range the interpolators are defined on
    [[nodiscard]] WavelengthRange domain() const noexcept { return y_.domain(); }

private:
    LinearInterpolator x_;
    LinearInterpolator y_;
    LinearInterpolator z_;
};

/**
 * @brief Integrate y-bar over the configured grid.
 *
 * Interpolates the table's y-bar column onto the grid described by
 * options and applies the trapezoidal rule.
 */
double computeYIntegral(const ColorMatchingTable& table,
                        const ResamplingOptions& options = {});

/**
 * @brief Convert a spectrum sampled on the resampled grid to XYZ.
 *
 * Each tristimulus value is the trapezoidal integral of the spectrum
 * times the channel, scaled by resampled.normalization(). A constant unit
 * spectrum maps to Y = 1.
 *
 * @throws std::invalid_argument if spectrum.size() != resampled.size()
 */
XYZ toXYZ(const ResampledCMF& resampled, const std::vector<Value>& spectrum);

} // namespace algorithms
} // namespace cienorm

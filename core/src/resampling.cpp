#include "cienorm/algorithms/resampling.hpp"
#include <sstream>

namespace cienorm {
namespace algorithms {

const std::vector<Value>& ResampledCMF::channel(Channel c) const noexcept {
    switch (c) {
        case Channel::X: return xbar;
        case Channel::Y: return ybar;
        case Channel::Z: return zbar;
    }
    return ybar;
}

double ResampledCMF::integrate(Channel c) const {
    return trapezoid(wavelengths, channel(c));
}

double ResampledCMF::normalization() const {
    double integral = integrateY();
    if (!(integral > 0.0)) {
        std::ostringstream msg;
        msg << "ybar integral " << integral << " cannot be used for normalization";
        throw DomainError(msg.str());
    }
    return 1.0 / integral;
}

CMFResampler::CMFResampler(const ColorMatchingTable& table)
    : x_(table.wavelengths(), table.xbar()),
      y_(table.wavelengths(), table.ybar()),
      z_(table.wavelengths(), table.zbar()) {}

const LinearInterpolator& CMFResampler::interpolator(Channel c) const noexcept {
    switch (c) {
        case Channel::X: return x_;
        case Channel::Y: return y_;
        case Channel::Z: return z_;
    }
    return y_;
}

std::vector<Wavelength> CMFResampler::grid(const ResamplingOptions& options) const {
    auto ws = generateSampleGrid(options.wavelength_min, options.wavelength_max,
                                 options.wavelength_step);

    WavelengthRange range = domain();
    if (ws.front() < range.min_value || ws.back() > range.max_value) {
        std::ostringstream msg;
        msg << "sample grid [" << ws.front() << ", " << ws.back()
            << "] exceeds tabulated range ["
            << range.min_value << ", " << range.max_value << "]";
        throw DomainError(msg.str());
    }
    return ws;
}

ResampledCMF CMFResampler::resample(const ResamplingOptions& options) const {
    ResampledCMF result;
    result.wavelengths = grid(options);
    result.xbar = x_.evaluate(result.wavelengths);
    result.ybar = y_.evaluate(result.wavelengths);
    result.zbar = z_.evaluate(result.wavelengths);
    return result;
}

ColorMatchingTable CMFResampler::table(const ResamplingOptions& options) const {
    ResampledCMF r = resample(options);
    return ColorMatchingTable(std::move(r.wavelengths), std::move(r.xbar),
                              std::move(r.ybar), std::move(r.zbar));
}

double computeYIntegral(const ColorMatchingTable& table,
                        const ResamplingOptions& options) {
    CMFResampler resampler(table);
    return resampler.resample(options).integrateY();
}

XYZ toXYZ(const ResampledCMF& resampled, const std::vector<Value>& spectrum) {
    if (spectrum.size() != resampled.size()) {
        throw std::invalid_argument(
            "Spectrum must be sampled on the resampled wavelength grid");
    }

    const double norm = resampled.normalization();

    auto weighted = [&](Channel c) {
        const auto& cmf = resampled.channel(c);
        std::vector<Value> product(spectrum.size());
        for (std::size_t i = 0; i < spectrum.size(); ++i) {
            product[i] = spectrum[i] * cmf[i];
        }
        return trapezoid(resampled.wavelengths, product) * norm;
    };

    XYZ xyz;
    xyz.x = weighted(Channel::X);
    xyz.y = weighted(Channel::Y);
    xyz.z = weighted(Channel::Z);
    return xyz;
}

} // namespace algorithms
} // namespace cienorm

#include "photnorm/FluxConverter.hpp"
#include "photnorm/TextUtils.hpp"
#include <cmath>
#include <stdexcept>

namespace photnorm {

FluxConverter::FluxConverter(const ZeroPointTable& zp) : zp_(zp) {}

FluxTable FluxConverter::convert(const PhotometryTable& obs,
                                 const std::string& mag_system) const
{
    static const double kErrScale = 0.4 * std::log(10.0);

    const Eigen::Index n = static_cast<Eigen::Index>(obs.size());
    const std::string  system = to_lower(mag_system);

    FluxTable out;
    out.obs = obs;
    out.flux   .resize(n);
    out.fluxerr.resize(n);
    out.zp = Vector::Constant(n, kInstrumentalZeroPoint);
    out.zpsys.assign(obs.size(), system);

    for (Eigen::Index i = 0; i < n; ++i) {
        const double f0 = zp_.flux(system, obs.band[static_cast<std::size_t>(i)]);
        const double f  = f0 * std::pow(10.0, -0.4 * obs.mag[i]);
        out.flux[i]    = f;
        out.fluxerr[i] = std::isfinite(obs.magerr[i])
                       ? f * kErrScale * obs.magerr[i]
                       : kMissingValue;
    }
    return out;
}

void require_zero_points(const PassbandVocabulary&      vocab,
                         const ZeroPointTable&          zp,
                         const std::vector<std::string>& systems)
{
    std::string gaps;
    std::size_t n = 0;
    for (const auto& sys : systems) {
        const std::string system = to_lower(sys);
        for (const auto& band : vocab.passbands()) {
            if (zp.find(system, band)) continue;
            if (n++ < 10) gaps += (gaps.empty() ? "" : ", ") + system + "/" + band;
        }
    }
    if (n == 0) return;
    if (n > 10) gaps += ", ...";
    throw std::runtime_error("No zero point for " + std::to_string(n) +
                             " passband(s) of the vocabulary: " + gaps +
                             " (add them to the zeropoints file)");
}

} // namespace photnorm

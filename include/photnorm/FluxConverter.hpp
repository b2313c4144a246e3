#pragma once
#include "PassbandVocabulary.hpp"
#include "Photometry.hpp"
#include "ZeroPoints.hpp"
#include <string>
#include <vector>

namespace photnorm {

/*
 *   flux    = F0(system, band) * 10^(-0.4 mag)
 *   fluxerr = flux * 0.4 ln(10) * magerr      (kMissingValue if magerr unknown)
 *   zp      = kInstrumentalZeroPoint,  zpsys = lower-case system name
 *
 * Pure: the same input always gives bit-identical output.
 */
class FluxConverter {
public:
    explicit FluxConverter(const ZeroPointTable& zp = ZeroPointTable::builtin());

    // std::out_of_range when a (system, band) pair has no zero point
    FluxTable convert(const PhotometryTable& obs, const std::string& mag_system) const;

private:
    const ZeroPointTable& zp_;
};

/*
 * Start-up check: every passband the vocabulary accepts must have a zero
 * point in each magnitude system the registry uses.  Throws
 * std::runtime_error listing the missing (system, passband) pairs.
 */
void require_zero_points(const PassbandVocabulary&      vocab,
                         const ZeroPointTable&          zp,
                         const std::vector<std::string>& systems);

} // namespace photnorm

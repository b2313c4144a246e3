#include "photnorm/Photometry.hpp"
#include <algorithm>
#include <set>

namespace photnorm {

Observation PhotometryTable::row(std::size_t i) const
{
    return Observation{time[static_cast<Eigen::Index>(i)],
                       mag[static_cast<Eigen::Index>(i)],
                       magerr[static_cast<Eigen::Index>(i)],
                       band[i], reference[i]};
}

PhotometryTable PhotometryTable::select(const std::vector<std::size_t>& idx) const
{
    const Eigen::Index n = static_cast<Eigen::Index>(idx.size());
    PhotometryTable out;
    out.time  .resize(n);
    out.mag   .resize(n);
    out.magerr.resize(n);
    out.band     .reserve(idx.size());
    out.reference.reserve(idx.size());

    for (Eigen::Index k = 0; k < n; ++k) {
        const auto i = static_cast<Eigen::Index>(idx[k]);
        out.time  [k] = time  [i];
        out.mag   [k] = mag   [i];
        out.magerr[k] = magerr[i];
        out.band     .push_back(band     [idx[k]]);
        out.reference.push_back(reference[idx[k]]);
    }
    return out;
}

PhotometryTable PhotometryTable::from_rows(const std::vector<Observation>& rows)
{
    const Eigen::Index n = static_cast<Eigen::Index>(rows.size());
    PhotometryTable out;
    out.time  .resize(n);
    out.mag   .resize(n);
    out.magerr.resize(n);
    for (Eigen::Index k = 0; k < n; ++k) {
        const auto& r = rows[static_cast<std::size_t>(k)];
        out.time  [k] = r.time;
        out.mag   [k] = r.mag;
        out.magerr[k] = r.magerr;
        out.band     .push_back(r.band);
        out.reference.push_back(r.reference);
    }
    return out;
}

PhotometryTable PhotometryTable::concatenate(const std::vector<PhotometryTable>& parts)
{
    std::size_t total = 0;
    for (const auto& p : parts) total += p.size();

    PhotometryTable out;
    out.time  .resize(static_cast<Eigen::Index>(total));
    out.mag   .resize(static_cast<Eigen::Index>(total));
    out.magerr.resize(static_cast<Eigen::Index>(total));
    out.band     .reserve(total);
    out.reference.reserve(total);

    Eigen::Index off = 0;
    for (const auto& p : parts) {
        const auto n = static_cast<Eigen::Index>(p.size());
        out.time  .segment(off, n) = p.time;
        out.mag   .segment(off, n) = p.mag;
        out.magerr.segment(off, n) = p.magerr;
        out.band     .insert(out.band.end(),      p.band.begin(),      p.band.end());
        out.reference.insert(out.reference.end(), p.reference.begin(), p.reference.end());
        off += n;
    }
    return out;
}

std::vector<std::string> FluxTable::distinct_bands() const
{
    std::set<std::string> uniq(obs.band.begin(), obs.band.end());
    return {uniq.begin(), uniq.end()};
}

} // namespace photnorm

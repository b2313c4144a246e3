#pragma once
#include "Types.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace photnorm {

// label of a row whose band cell exists but is empty; never a passband
inline const std::string kBlankBand = "<blank>";

// One validated row, used when building tables row by row
struct Observation {
    Real        time;
    Real        mag;
    Real        magerr;        // NaN == missing
    std::string band;
    std::string reference;
};

/*
 * Canonical column-oriented photometry.  Invariant: time and mag are finite
 * on every row; sanitize() is the only producer from raw input.
 */
struct PhotometryTable {
    Vector                   time;       // Julian date
    Vector                   mag;
    Vector                   magerr;     // NaN where unknown
    std::vector<std::string> band;
    std::vector<std::string> reference;

    std::size_t size()  const { return band.size(); }
    bool        empty() const { return band.empty(); }

    Observation row(std::size_t i) const;

    // rows in the given order
    PhotometryTable select(const std::vector<std::size_t>& idx) const;

    static PhotometryTable from_rows(const std::vector<Observation>& rows);
    static PhotometryTable concatenate(const std::vector<PhotometryTable>& parts);
};

// Photometry with linear fluxes, ready to be written out
struct FluxTable {
    PhotometryTable          obs;
    Vector                   flux;
    Vector                   fluxerr;    // kMissingValue where magerr unknown
    Vector                   zp;
    std::vector<std::string> zpsys;

    std::size_t size() const { return obs.size(); }

    // sorted, duplicates removed
    std::vector<std::string> distinct_bands() const;
};

} // namespace photnorm

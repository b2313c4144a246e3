#pragma once
#include "Photometry.hpp"
#include "RawTable.hpp"
#include <optional>
#include <string>
#include <vector>

namespace photnorm {

// canonical column names
namespace col {
    inline const std::string time      = "time";
    inline const std::string mag       = "mag";
    inline const std::string magerr    = "magerr";
    inline const std::string band      = "band";
    inline const std::string reference = "reference";
}

inline const std::string kUnknownBand     = "UNKNOWN";
inline const std::string kUnknownReference = "N/A";

// `source` is renamed to `canonical`; several sources may name one canonical
// column, the first one present in the table wins
struct ColumnAlias {
    std::string canonical;
    std::string source;
};
using ColumnAliases = std::vector<ColumnAlias>;

/*
 * Turn a loosely typed table into validated photometry:
 *   1. rename aliased columns
 *   2. coerce time / mag / magerr to numbers (non-numeric -> missing,
 *      absent magerr column -> all missing)
 *   3. drop rows whose time or mag is missing or non-finite
 *   4. band "UNKNOWN" when the table has no band column, kBlankBand for an
 *      empty cell; reference "N/A" when absent or empty
 *   5. band and reference as text
 * Returns std::nullopt when time or mag is absent or no row survives.
 * Never throws.
 */
std::optional<PhotometryTable> sanitize(RawTable table,
                                        const ColumnAliases& aliases = {});

} // namespace photnorm

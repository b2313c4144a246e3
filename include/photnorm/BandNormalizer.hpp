#pragma once
#include "Photometry.hpp"
#include "PassbandVocabulary.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace photnorm {

// What happened to the labels of one object; reported, never raised
struct BandDiagnostics {
    std::vector<std::string> before_mapping;   // distinct labels, first-seen order
    std::vector<std::string> unaliased;        // not in the alias table
    std::vector<std::string> excluded;         // outside vocabulary, dropped on purpose
    std::vector<std::string> unrecognised;     // outside vocabulary, no rule for it

    std::size_t composite_rows = 0;            // label contained '('
    std::size_t duplicate_rows = 0;            // same (time, mag) seen before
    std::size_t rejected_rows  = 0;            // outside vocabulary
};

struct NormalizedPhotometry {
    PhotometryTable table;                     // the object's observation set
    BandDiagnostics diagnostics;
};

/*
 * Fan-in of the per-file tables of one object:
 *   concatenate (file order) -> trim labels -> drop composite "(...)" labels
 *   -> deduplicate on (time, mag), first wins -> map aliases
 *   -> keep vocabulary passbands only
 */
class BandNormalizer {
public:
    explicit BandNormalizer(const PassbandVocabulary& vocab = PassbandVocabulary::builtin());

    NormalizedPhotometry normalize(const std::vector<PhotometryTable>& tables) const;

private:
    const PassbandVocabulary& vocab_;
};

} // namespace photnorm

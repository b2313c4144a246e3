#include "photnorm/BandNormalizer.hpp"
#include "photnorm/TextUtils.hpp"

#include <ankerl/unordered_dense.h>
#include <cstdint>
#include <cstring>

namespace photnorm {
namespace {

/* ---------- (time, mag) key, compared bit for bit -------------------- */
struct PointKey {
    std::uint64_t t, m;
    bool operator==(const PointKey& o) const noexcept { return t == o.t && m == o.m; }
};

std::uint64_t bits_of(double x) noexcept
{
    x += 0.0;                                   // -0.0 -> +0.0
    std::uint64_t b; std::memcpy(&b, &x, sizeof b);
    return b;
}

struct PointKeyHash {
    std::size_t operator()(const PointKey& k) const noexcept
    {
        std::size_t seed = ankerl::unordered_dense::hash<std::uint64_t>{}(k.t);
        seed ^= ankerl::unordered_dense::hash<std::uint64_t>{}(k.m)
                + 0x9E3779B97F4A7C15ULL + (seed << 6) + (seed >> 2);
        return seed;
    }
};

/* ---------- first-seen ordered set of labels ------------------------- */
class LabelList {
public:
    void add(const std::string& s)
    {
        if (seen_.insert(s).second) items_.push_back(s);
    }
    std::vector<std::string> take() { return std::move(items_); }
private:
    ankerl::unordered_dense::set<std::string> seen_;
    std::vector<std::string>                  items_;
};

} // unnamed namespace

BandNormalizer::BandNormalizer(const PassbandVocabulary& vocab) : vocab_(vocab) {}

NormalizedPhotometry BandNormalizer::normalize(const std::vector<PhotometryTable>& tables) const
{
    NormalizedPhotometry out;
    BandDiagnostics&     diag = out.diagnostics;

    // 1. concatenate, 2. trim
    PhotometryTable all = PhotometryTable::concatenate(tables);
    for (auto& b : all.band) b = trim(b);

    // 3. composite labels, 4. duplicates
    ankerl::unordered_dense::set<PointKey, PointKeyHash> seen;
    std::vector<std::size_t> kept;
    kept.reserve(all.size());

    for (std::size_t i = 0; i < all.size(); ++i) {
        if (all.band[i].find('(') != std::string::npos) {
            ++diag.composite_rows;
            continue;
        }
        const auto k = static_cast<Eigen::Index>(i);
        if (!seen.insert(PointKey{bits_of(all.time[k]), bits_of(all.mag[k])}).second) {
            ++diag.duplicate_rows;
            continue;
        }
        kept.push_back(i);
    }

    // 5. alias mapping, 6. vocabulary filter
    LabelList before, unaliased, excluded, unrecognised;
    std::vector<std::size_t> accepted;
    std::vector<std::string> mapped;

    for (std::size_t i : kept) {
        const std::string& label = all.band[i];
        before.add(label);
        if (!vocab_.has_alias(label)) unaliased.add(label);

        if (auto id = vocab_.resolve(label)) {
            accepted.push_back(i);
            mapped.push_back(std::move(*id));
        } else {
            ++diag.rejected_rows;
            if (vocab_.is_excluded(label)) excluded.add(label);
            else                           unrecognised.add(label);
        }
    }

    out.table      = all.select(accepted);
    out.table.band = std::move(mapped);

    diag.before_mapping = before.take();
    diag.unaliased      = unaliased.take();
    diag.excluded       = excluded.take();
    diag.unrecognised   = unrecognised.take();
    return out;
}

} // namespace photnorm

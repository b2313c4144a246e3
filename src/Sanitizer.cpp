#include "photnorm/Sanitizer.hpp"
#include "photnorm/TextUtils.hpp"
#include <cmath>
#include <exception>

namespace photnorm {

std::optional<PhotometryTable> sanitize(RawTable table, const ColumnAliases& aliases)
{
    try {
        // -------------------- 1. rename -----------------------------------------------
        for (const auto& a : aliases) {
            if (!table.has(a.canonical)) table.rename(a.source, a.canonical);
        }

        const RawColumn* t_col = table.find(col::time);
        const RawColumn* m_col = table.find(col::mag);
        if (!t_col || !m_col) return std::nullopt;

        const RawColumn* e_col = table.find(col::magerr);
        const RawColumn* b_col = table.find(col::band);
        const RawColumn* r_col = table.find(col::reference);

        // -------------------- 2. + 3. coerce and reject -------------------------------
        std::vector<Observation> rows;
        rows.reserve(table.rows());

        for (std::size_t i = 0; i < table.rows(); ++i) {
            const double t = t_col->number_at(i);
            const double m = m_col->number_at(i);
            if (!std::isfinite(t) || !std::isfinite(m)) continue;

            double e = e_col ? e_col->number_at(i) : missing();
            if (!std::isfinite(e)) e = missing();

            // -------------------- 4. + 5. defaults and text ---------------------------
            std::string band = kUnknownBand;
            if (b_col) {
                band = trim(b_col->text_at(i));
                if (band.empty()) band = kBlankBand;
            }

            std::string ref = r_col ? trim(r_col->text_at(i)) : std::string();
            if (ref.empty()) ref = kUnknownReference;

            rows.push_back(Observation{t, m, e, std::move(band), std::move(ref)});
        }

        if (rows.empty()) return std::nullopt;
        return PhotometryTable::from_rows(rows);
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace photnorm

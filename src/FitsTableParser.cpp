#include "photnorm/PhotometryParsers.hpp"
#include "photnorm/TextUtils.hpp"

#include <CCfits/CCfits>
#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace photnorm {

/* -------- column kinds we can turn into RawTable columns ------------ */
static bool is_scalar_numeric(const CCfits::Column& c)
{
    if (c.varLength() || c.repeat() != 1) return false;
    switch (c.type()) {
        case CCfits::Tbyte:  case CCfits::Tshort: case CCfits::Tushort:
        case CCfits::Tint:   case CCfits::Tuint:  case CCfits::Tlong:
        case CCfits::Tulong: case CCfits::Tlonglong:
        case CCfits::Tfloat: case CCfits::Tdouble:
            return true;
        default:
            return false;
    }
}

const ColumnAliases& FitsTableParser::aliases()
{
    static const ColumnAliases lut = {
        {col::time, "JD"},
        {col::mag,  "m"},
    };
    return lut;
}

bool FitsTableParser::applicable(const RawFile& file) const
{
    return file.has_fits_signature();
}

std::optional<PhotometryTable> FitsTableParser::parse(const RawFile& file) const
{
    RawTable tbl;
    try {
        // headers of every HDU are read, table data only on demand
        CCfits::FITS fits(file.path, CCfits::Read, false);
        if (fits.extension().empty()) return std::nullopt;

        CCfits::ExtHDU& ext = fits.extension(1);
        auto* table = dynamic_cast<CCfits::Table*>(&ext);
        if (!table) return std::nullopt;

        const long nrows = table->rows();
        if (nrows <= 0) return std::nullopt;

        for (const auto& [name, column] : table->column()) {
            if (column->type() == CCfits::Tstring) {
                std::vector<std::string> buf;
                column->read(buf, 1, nrows);
                for (auto& s : buf) s = trim(s);
                tbl.add_text_column(name, std::move(buf));
            }
            else if (is_scalar_numeric(*column)) {
                std::vector<double> buf;
                column->read(buf, 1, nrows);
                tbl.add_numeric_column(name, std::move(buf));
            }
            // vector, logical and complex columns carry no photometry
        }
    }
    catch (const CCfits::FitsException&) {
        return std::nullopt;
    }
    catch (const std::exception&) {
        return std::nullopt;
    }

    const RawColumn* band = tbl.find(col::band);
    if (!band) return std::nullopt;

    /* colour indices such as "(B-V)" are not single-band magnitudes */
    std::vector<bool> keep(tbl.rows());
    for (std::size_t i = 0; i < keep.size(); ++i)
        keep[i] = band->text_at(i).find('(') == std::string::npos;
    tbl.filter_rows(keep);

    return sanitize(std::move(tbl), aliases());
}

} // namespace photnorm

#include "photnorm/LightCurveWriter.hpp"
#include "photnorm/TextUtils.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace photnorm {

static std::string fixed(double v, int prec)
{
    std::ostringstream s; s << std::fixed << std::setprecision(prec) << v;
    return s.str();
}

// magerr column: unknown errors are written as the sentinel
static std::string value_or_sentinel(double v)
{
    return format_double(std::isnan(v) ? kMissingValue : v);
}

LightCurveWriter::LightCurveWriter(std::string output_dir, std::string survey)
    : output_dir_(std::move(output_dir)), survey_(std::move(survey))
{}

std::string LightCurveWriter::output_path(const std::string& object) const
{
    return (fs::path(output_dir_) / object / "Photometry"
            / (object + ".photometry.snana.dat")).string();
}

void LightCurveWriter::write_snana(std::ostream&         os,
                                   const std::string&    object,
                                   const ObjectMetadata& meta,
                                   const FluxTable&      lc) const
{
    std::string filters;
    for (const auto& b : lc.distinct_bands())
        filters += (filters.empty() ? "" : " ") + b;

    os << "SURVEY: "         << survey_                 << '\n'
       << "SNID: "           << object                  << '\n'
       << "RA: "             << fixed(meta.ra, 8)       << '\n'
       << "DEC: "            << fixed(meta.dec, 8)      << '\n'
       << "MWEBV: "          << fixed(meta.mwebv, 4)    << '\n'
       << "REDSHIFT_HELIO: " << fixed(meta.redshift, 6) << '\n'
       << "FILTERS: "        << filters                 << '\n'
       << "NOBS: "           << lc.size()               << '\n';

    os << "\n# ---------------------------------------------------------\n"
       << "NVAR: 8\n"
       << "VARLIST: TIME BAND FLUX FLUXERR MAG MAGERR ZP ZPSYS\n";

    const auto& o = lc.obs;
    for (std::size_t i = 0; i < lc.size(); ++i) {
        const auto k = static_cast<Eigen::Index>(i);
        os << "OBS: "
           << format_double(o.time[k])      << ' '
           << o.band[i]                     << ' '
           << format_double(lc.flux[k])     << ' '
           << format_double(lc.fluxerr[k])  << ' '
           << format_double(o.mag[k])       << ' '
           << value_or_sentinel(o.magerr[k]) << ' '
           << format_double(lc.zp[k])       << ' '
           << lc.zpsys[i]                   << '\n';
    }
    os << "END:\n";
}

std::string LightCurveWriter::write(const std::string&    object,
                                    const ObjectMetadata& meta,
                                    const FluxTable&      lc) const
{
    const fs::path out = output_path(object);
    fs::create_directories(out.parent_path());

    fs::path tmp = out;
    tmp += ".tmp";
    bool written = false;
    {
        std::ofstream f(tmp);
        if (!f)
            throw std::runtime_error("Cannot open '" + tmp.string() + "' for writing");
        write_snana(f, object, meta, lc);
        f.flush();
        written = static_cast<bool>(f);
    }

    // a failed write or move never leaves the temporary behind
    std::error_code ec;
    if (!written) {
        fs::remove(tmp, ec);
        throw std::runtime_error("Error while writing '" + tmp.string() + "'");
    }
    fs::rename(tmp, out, ec);
    if (ec) {
        const std::string why = ec.message();
        fs::remove(tmp, ec);
        throw std::runtime_error("Cannot move '" + tmp.string() + "' to '" +
                                 out.string() + "': " + why);
    }
    return out.string();
}

} // namespace photnorm

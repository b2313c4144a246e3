#include "photnorm/ZeroPoints.hpp"
#include "photnorm/JsonUtils.hpp"
#include "photnorm/TextUtils.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace photnorm {

/*
 * Vega: per-Angstrom photon fluxes of Bessell, Castelli & Plez (1998,
 * Table A2) times the effective band widths.  AB: 3631 Jy / h times
 * d(lambda)/lambda_eff.  The standard:: filters share the Bessell values.
 */
namespace {
struct Entry { const char* band; double vega; double ab; };

constexpr Entry kBuiltin[] = {
    {"bessellux", 4.990e5, 1.005e6},
    {"bessellb",  1.309e6, 1.176e6},
    {"bessellv",  8.760e5, 8.848e5},
    {"bessellr",  9.688e5, 1.180e6},
    {"besselli",  6.735e5, 1.023e6},
    {"standard::u", 4.990e5, 1.005e6},
    {"standard::b", 1.309e6, 1.176e6},
    {"standard::v", 8.760e5, 8.848e5},
    {"standard::r", 9.688e5, 1.180e6},
    {"standard::i", 6.735e5, 1.023e6},
};
} // unnamed namespace

const ZeroPointTable& ZeroPointTable::builtin()
{
    static const ZeroPointTable table = [] {
        ZeroPointTable t;
        for (const auto& e : kBuiltin) {
            t.set("vega", e.band, e.vega);
            t.set("ab",   e.band, e.ab);
        }
        return t;
    }();
    return table;
}

ZeroPointTable ZeroPointTable::from_json(const nlohmann::json& j)
{
    if (!j.is_object())
        throw std::runtime_error("Malformed zero-point table: expected an object of systems");

    ZeroPointTable t = builtin();
    try {
        for (const auto& [system, bands] : j.items()) {
            if (!bands.is_object())
                throw std::runtime_error("Malformed zero-point table: system '" + system +
                                         "' must map passbands to values");
            for (const auto& [band, value] : bands.items()) {
                const double v = value.get<double>();
                if (!std::isfinite(v) || v <= 0.0)
                    throw std::runtime_error("Zero point for " + system + "/" + band +
                                             " must be positive");
                t.set(system, band, v);
            }
        }
    }
    catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed zero-point table: ") + e.what());
    }
    return t;
}

ZeroPointTable ZeroPointTable::load(const std::string& path)
{
    return from_json(load_json(path));
}

void ZeroPointTable::set(const std::string& system, const std::string& band,
                         double photon_flux)
{
    systems_[to_lower(system)].insert_or_assign(band, photon_flux);
}

bool ZeroPointTable::has_system(const std::string& system) const
{
    return systems_.contains(to_lower(system));
}

std::optional<double> ZeroPointTable::find(const std::string& system,
                                           const std::string& band) const
{
    auto s = systems_.find(to_lower(system));
    if (s == systems_.end()) return std::nullopt;
    auto b = s->second.find(band);
    if (b == s->second.end()) return std::nullopt;
    return b->second;
}

double ZeroPointTable::flux(const std::string& system, const std::string& band) const
{
    if (!has_system(system))
        throw std::out_of_range("Unknown magnitude system '" + system + "'");
    if (auto v = find(system, band)) return *v;
    throw std::out_of_range("No zero point for passband '" + band +
                            "' in magnitude system '" + system + "'");
}

std::vector<std::string> ZeroPointTable::systems() const
{
    std::vector<std::string> out;
    for (const auto& [name, bands] : systems_) out.push_back(name);
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace photnorm

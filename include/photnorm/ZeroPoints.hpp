#pragma once
#include <ankerl/unordered_dense.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace photnorm {

/*
 * Photon flux of a zero-magnitude source (photons s^-1 cm^-2) per magnitude
 * system and passband.  System names are case-insensitive.
 */
class ZeroPointTable {
public:
    ZeroPointTable() = default;

    // vega and ab entries for the Bessell / standard UBVRI passbands
    static const ZeroPointTable& builtin();

    /* {"vega": {"bessellb": 1.3e6, ...}, "ab": {...}} merged over builtin();
     * throws std::runtime_error on malformed content                        */
    static ZeroPointTable from_json(const nlohmann::json& j);
    static ZeroPointTable load(const std::string& path);

    void set(const std::string& system, const std::string& band, double photon_flux);

    bool has_system(const std::string& system) const;
    std::optional<double> find(const std::string& system, const std::string& band) const;

    // std::out_of_range when the system or the band is unknown
    double flux(const std::string& system, const std::string& band) const;

    std::vector<std::string> systems() const;

private:
    using BandMap = ankerl::unordered_dense::map<std::string, double>;
    ankerl::unordered_dense::map<std::string, BandMap> systems_;
};

} // namespace photnorm

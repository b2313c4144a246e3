#include "photnorm/PassbandVocabulary.hpp"
#include "photnorm/JsonUtils.hpp"
#include "photnorm/Photometry.hpp"
#include <algorithm>
#include <stdexcept>

namespace photnorm {

/* ---------- passbands with a built-in zero point (ZeroPoints.cpp) ---- */
static std::vector<std::string> builtin_passbands()
{
    return {
        "bessellux", "bessellb", "bessellv", "bessellr", "besselli",
        "standard::u", "standard::b", "standard::v", "standard::r", "standard::i",
    };
}

/* ---------- labels used by the hand-made source tables --------------- */
static std::vector<std::pair<std::string, std::string>> builtin_aliases()
{
    return {
        {"U", "bessellux"}, {"B", "bessellb"}, {"V", "bessellv"},
        {"R", "bessellr"},  {"I", "besselli"},
        {"pg",      "standard::b"},
        {"pv",      "standard::v"},
        {"m_v",     "bessellv"},
        {"m_pg",    "standard::b"},
        {"B_max",   "bessellb"},
        {"blue",    "bessellb"},
        {"red",     "bessellr"},
        {"'blue'",  "bessellb"},
        {"'red'",   "bessellr"},
        {"UNKNOWN", "standard::u"},
        {"C",       "standard::b"},
    };
}

PassbandVocabulary::PassbandVocabulary(
        std::vector<std::string> passbands,
        std::vector<std::pair<std::string, std::string>> aliases,
        std::vector<std::string> excluded)
{
    for (auto& p : passbands) passbands_.insert(std::move(p));

    for (auto& [label, target] : aliases) {
        if (!passbands_.contains(target))
            throw std::runtime_error("Passband alias '" + label +
                                     "' points to unknown passband '" + target + "'");
        aliases_.insert_or_assign(std::move(label), std::move(target));
    }
    for (auto& e : excluded) excluded_.insert(std::move(e));
}

const PassbandVocabulary& PassbandVocabulary::builtin()
{
    static const PassbandVocabulary vocab(builtin_passbands(), builtin_aliases());
    return vocab;
}

PassbandVocabulary PassbandVocabulary::from_json(const nlohmann::json& j)
{
    try {
        auto passbands = j.at("passbands").get<std::vector<std::string>>();

        std::vector<std::pair<std::string, std::string>> aliases;
        if (j.contains("aliases"))
            for (const auto& [label, target] : j.at("aliases").items())
                aliases.emplace_back(label, target.get<std::string>());

        std::vector<std::string> excluded;
        if (j.contains("excluded"))
            excluded = j.at("excluded").get<std::vector<std::string>>();

        return PassbandVocabulary(std::move(passbands), std::move(aliases),
                                  std::move(excluded));
    }
    catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed passband vocabulary: ") + e.what());
    }
}

PassbandVocabulary PassbandVocabulary::load(const std::string& path)
{
    return from_json(load_json(path));
}

bool PassbandVocabulary::is_passband(const std::string& id) const
{
    return passbands_.contains(id);
}

bool PassbandVocabulary::has_alias(const std::string& label) const
{
    return aliases_.contains(label);
}

bool PassbandVocabulary::is_excluded(const std::string& label) const
{
    return excluded_.contains(label);
}

std::vector<std::string> PassbandVocabulary::passbands() const
{
    std::vector<std::string> out(passbands_.begin(), passbands_.end());
    std::sort(out.begin(), out.end());
    return out;
}

std::string PassbandVocabulary::alias_or_self(const std::string& label) const
{
    auto it = aliases_.find(label);
    return it == aliases_.end() ? label : it->second;
}

std::optional<std::string> PassbandVocabulary::resolve(const std::string& label) const
{
    if (label == kBlankBand) return std::nullopt;
    std::string id = alias_or_self(label);
    if (!is_passband(id)) return std::nullopt;
    return id;
}

} // namespace photnorm

#pragma once
#include <ankerl/unordered_dense.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace photnorm {

/*
 * Closed set of passband identifiers plus the table that maps free-text
 * labels found in the input files onto them.  Built once at start-up and
 * read-only afterwards; every member function is const.
 *
 * `excluded` labels are auxiliary columns that are dropped on purpose.  Any
 * other label outside the vocabulary is reported as unrecognised.
 */
class PassbandVocabulary {
public:
    PassbandVocabulary(std::vector<std::string> passbands,
                       std::vector<std::pair<std::string, std::string>> aliases,
                       std::vector<std::string> excluded = {});

    // Bessell and standard UBVRI, the passbands ZeroPointTable::builtin() covers
    static const PassbandVocabulary& builtin();

    /* {"passbands": [...], "aliases": {...}, "excluded": [...]};
     * throws std::runtime_error on malformed content                        */
    static PassbandVocabulary from_json(const nlohmann::json& j);
    static PassbandVocabulary load(const std::string& path);

    bool is_passband(const std::string& id) const;
    bool has_alias(const std::string& label) const;
    bool is_excluded(const std::string& label) const;

    // alias target, or the label itself when it has no alias
    std::string alias_or_self(const std::string& label) const;

    // sorted
    std::vector<std::string> passbands() const;

    // total mapping: label -> passband, std::nullopt outside the vocabulary
    // (and always for kBlankBand)
    std::optional<std::string> resolve(const std::string& label) const;

    std::size_t size() const { return passbands_.size(); }

private:
    ankerl::unordered_dense::set<std::string>              passbands_;
    ankerl::unordered_dense::map<std::string, std::string> aliases_;
    ankerl::unordered_dense::set<std::string>              excluded_;
};

} // namespace photnorm

#include "photnorm/Metadata.hpp"
#include "photnorm/JsonUtils.hpp"
#include <cmath>
#include <stdexcept>

namespace photnorm {

static std::optional<double> number_or_none(const nlohmann::json& entry, const char* key)
{
    if (!entry.contains(key)) return std::nullopt;
    const auto& v = entry.at(key);
    if (!v.is_number()) return std::nullopt;
    const double d = v.get<double>();
    if (!std::isfinite(d)) return std::nullopt;
    return d;
}

JsonMetadataCatalog::JsonMetadataCatalog(nlohmann::json catalogue)
    : catalogue_(std::move(catalogue))
{
    if (!catalogue_.is_object())
        throw std::runtime_error("Metadata catalogue must be a JSON object");
}

JsonMetadataCatalog JsonMetadataCatalog::load(const std::string& path)
{
    return JsonMetadataCatalog(load_json(path));
}

std::optional<ObjectMetadata> JsonMetadataCatalog::lookup(const std::string& object) const
{
    auto it = catalogue_.find(object);
    if (it == catalogue_.end() || !it->is_object()) return std::nullopt;

    const auto ra  = number_or_none(*it, "ra");
    const auto dec = number_or_none(*it, "dec");
    if (!ra || !dec) return std::nullopt;

    ObjectMetadata m;
    m.ra       = *ra;
    m.dec      = *dec;
    m.redshift = number_or_none(*it, "redshift").value_or(0.0);
    m.mwebv    = number_or_none(*it, "mwebv").value_or(0.0);
    return m;
}

} // namespace photnorm

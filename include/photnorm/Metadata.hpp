#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace photnorm {

struct ObjectMetadata {
    double ra       = 0.0;    // deg
    double dec      = 0.0;    // deg
    double redshift = 0.0;    // heliocentric, 0 when unknown
    double mwebv    = 0.0;    // Galactic E(B-V), 0 when unknown
};

// Source of per-object coordinates, redshift and extinction
class MetadataProvider {
public:
    virtual ~MetadataProvider() = default;

    // std::nullopt when the object cannot be resolved
    virtual std::optional<ObjectMetadata> lookup(const std::string& object) const = 0;
};

/*
 * Static catalogue:
 *   { "SN1939A": { "ra": 186.57, "dec": 4.33, "redshift": null, "mwebv": 0.02 } }
 * ra/dec are required per entry; a null or absent redshift / mwebv is 0.
 */
class JsonMetadataCatalog final : public MetadataProvider {
public:
    explicit JsonMetadataCatalog(nlohmann::json catalogue);
    static JsonMetadataCatalog load(const std::string& path);

    std::optional<ObjectMetadata> lookup(const std::string& object) const override;

private:
    nlohmann::json catalogue_;
};

} // namespace photnorm

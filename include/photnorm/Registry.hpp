#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace photnorm {

struct FileSpec {
    std::string name;                 // relative to <rawDir>/<object>/Photometry
    std::string format = "auto";      // "auto" or a parser name
};

struct ObjectSpec {
    std::string           name;
    std::vector<FileSpec> files;      // processing order
    std::string           mag_system = "Vega";
};

// Everything read from the pipeline configuration file
struct PipelineSettings {
    std::string raw_dir    = "raw_virgo_data";
    std::string output_dir = "snana_virgo_data";
    std::string survey     = "VIRGO_PROJECT";
    std::string vocabulary;           // empty: built-in vocabulary
    std::string zeropoints;           // empty: built-in zero points
    std::string metadata;             // metadata catalogue (required)

    std::vector<ObjectSpec> objects;  // sorted by name

    const ObjectSpec* find(const std::string& object) const;
};

/* throws std::runtime_error naming the offending key */
ObjectSpec       parse_object(const std::string& name, const nlohmann::json& j);
PipelineSettings parse_settings(const nlohmann::json& j);

/* load_json + expand_env + parse_settings */
PipelineSettings load_settings(const std::string& path);

} // namespace photnorm

#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace photnorm {
// throws std::runtime_error when the file is missing or not valid JSON
nlohmann::json load_json(const std::string& path);
// replaces ${VAR} in every string value by the environment variable
void expand_env(nlohmann::json& j);
} // namespace photnorm

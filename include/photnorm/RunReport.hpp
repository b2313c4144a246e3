#pragma once
#include "ObjectProcessor.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace photnorm {

nlohmann::json to_json(const ObjectReport& r);

// {"objects": [...], "summary": {"emitted": n, ...}}
nlohmann::json make_run_report(const std::vector<ObjectReport>& reports);

// throws std::runtime_error when the file cannot be written
void write_run_report(const std::string& path, const std::vector<ObjectReport>& reports);

} // namespace photnorm

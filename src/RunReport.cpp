#include "photnorm/RunReport.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace photnorm {

nlohmann::json to_json(const ObjectReport& r)
{
    nlohmann::json files = nlohmann::json::array();
    for (const auto& f : r.files) {
        files.push_back({
            {"file",   f.file},
            {"found",  f.found},
            {"parser", f.parser.empty() ? nlohmann::json(nullptr) : nlohmann::json(f.parser)},
            {"rows",   f.rows}
        });
    }

    const auto& d = r.diagnostics;
    nlohmann::json j = {
        {"object",   r.name},
        {"status",   to_string(r.status)},
        {"files",    files},
        {"points",   r.n_points},
        {"bands", {
            {"beforeMapping", d.before_mapping},
            {"unaliased",     d.unaliased},
            {"excluded",      d.excluded},
            {"unrecognised",  d.unrecognised},
            {"compositeRows", d.composite_rows},
            {"duplicateRows", d.duplicate_rows},
            {"rejectedRows",  d.rejected_rows}
        }}
    };
    if (!r.output_path.empty()) j["output"]  = r.output_path;
    if (!r.message.empty())     j["message"] = r.message;
    return j;
}

nlohmann::json make_run_report(const std::vector<ObjectReport>& reports)
{
    nlohmann::json objects = nlohmann::json::array();
    nlohmann::json summary = {
        {to_string(ObjectStatus::Emitted),           0},
        {to_string(ObjectStatus::SkippedNoData),     0},
        {to_string(ObjectStatus::SkippedEmpty),      0},
        {to_string(ObjectStatus::SkippedNoMetadata), 0},
        {to_string(ObjectStatus::Failed),            0}
    };
    for (const auto& r : reports) {
        objects.push_back(to_json(r));
        summary[to_string(r.status)] = summary[to_string(r.status)].get<int>() + 1;
    }
    return {{"objects", objects}, {"summary", summary}};
}

void write_run_report(const std::string& path, const std::vector<ObjectReport>& reports)
{
    const std::filesystem::path p(path);
    if (p.has_parent_path())
        std::filesystem::create_directories(p.parent_path());

    std::ofstream f(path);
    if (!f)
        throw std::runtime_error("Cannot open '" + path + "' for writing");
    f << make_run_report(reports).dump(2) << '\n';
    if (!f)
        throw std::runtime_error("Error while writing '" + path + "'");
}

} // namespace photnorm

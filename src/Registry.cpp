#include "photnorm/Registry.hpp"
#include "photnorm/JsonUtils.hpp"
#include "photnorm/PhotometryParsers.hpp"
#include <algorithm>
#include <stdexcept>

namespace photnorm {

const ObjectSpec* PipelineSettings::find(const std::string& object) const
{
    auto it = std::find_if(objects.begin(), objects.end(),
                           [&](const ObjectSpec& o) { return o.name == object; });
    return it == objects.end() ? nullptr : &*it;
}

static bool known_format(const std::string& f)
{
    static const std::vector<std::string> names = ParserChain().names();
    return f == "auto" || std::find(names.begin(), names.end(), f) != names.end();
}

ObjectSpec parse_object(const std::string& name, const nlohmann::json& j)
{
    ObjectSpec spec;
    spec.name = name;

    try {
        for (const auto& f : j.at("files")) {
            FileSpec fs;
            if (f.is_string()) {
                fs.name = f.get<std::string>();
            } else {
                fs.name   = f.at("name").get<std::string>();
                fs.format = f.value("format", std::string("auto"));
            }
            if (!known_format(fs.format))
                throw std::runtime_error("object '" + name + "': unknown format '" +
                                         fs.format + "' for file " + fs.name);
            spec.files.push_back(std::move(fs));
        }

        if (j.contains("magSystem"))
            spec.mag_system = j.at("magSystem").get<std::string>();
        else if (j.contains("mag_system"))
            spec.mag_system = j.at("mag_system").get<std::string>();
    }
    catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("object '" + name + "': " + e.what());
    }
    return spec;
}

PipelineSettings parse_settings(const nlohmann::json& j)
{
    PipelineSettings s;
    try {
        s.raw_dir    = j.value("rawDir",     s.raw_dir);
        s.output_dir = j.value("outputDir",  s.output_dir);
        s.survey     = j.value("survey",     s.survey);
        s.vocabulary = j.value("vocabulary", s.vocabulary);
        s.zeropoints = j.value("zeropoints", s.zeropoints);
        s.metadata   = j.at("metadata").get<std::string>();

        for (const auto& [name, obj] : j.at("objects").items())
            s.objects.push_back(parse_object(name, obj));
    }
    catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed pipeline settings: ") + e.what());
    }

    std::sort(s.objects.begin(), s.objects.end(),
              [](const ObjectSpec& a, const ObjectSpec& b) { return a.name < b.name; });
    return s;
}

PipelineSettings load_settings(const std::string& path)
{
    auto j = load_json(path);
    expand_env(j);
    return parse_settings(j);
}

} // namespace photnorm

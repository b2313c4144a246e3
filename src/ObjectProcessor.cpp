#include "photnorm/ObjectProcessor.hpp"
#include "photnorm/RawFile.hpp"
#include <exception>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace photnorm {

const char* to_string(ObjectStatus s)
{
    switch (s) {
        case ObjectStatus::Emitted:           return "emitted";
        case ObjectStatus::SkippedNoData:     return "skipped_no_data";
        case ObjectStatus::SkippedEmpty:      return "skipped_empty";
        case ObjectStatus::SkippedNoMetadata: return "skipped_no_metadata";
        case ObjectStatus::Failed:            return "failed";
    }
    return "unknown";
}

static std::string join(const std::vector<std::string>& v)
{
    std::string out = "[";
    for (std::size_t i = 0; i < v.size(); ++i)
        out += (i ? ", '" : "'") + v[i] + "'";
    return out + "]";
}

/* ------------------------------------------------------------------------- */
/*  constructor                                                              */
/* ------------------------------------------------------------------------- */
ObjectProcessor::ObjectProcessor(const Config&           config,
                                 const ParserChain&      chain,
                                 const BandNormalizer&   normalizer,
                                 const FluxConverter&    converter,
                                 const MetadataProvider& metadata,
                                 const LightCurveWriter& writer)
    : config_(config)
    , chain_(chain)
    , normalizer_(normalizer)
    , converter_(converter)
    , metadata_(metadata)
    , writer_(writer)
{}

std::string ObjectProcessor::input_path(const std::string& object,
                                        const std::string& file) const
{
    return (fs::path(config_.raw_dir) / object / "Photometry" / file).string();
}

/* ------------------------------------------------------------------------- */
/*  one file: read, then first matching parser                               */
/* ------------------------------------------------------------------------- */
std::optional<PhotometryTable>
ObjectProcessor::read_one_(const std::string& object,
                           const FileSpec&    file,
                           FileOutcome&       outcome) const
{
    outcome.file = file.name;
    const std::string path = input_path(object, file.name);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        if (config_.verbose)
            std::cout << "  Missing file: " << file.name << '\n';
        return std::nullopt;
    }
    outcome.found = true;

    if (config_.verbose)
        std::cout << "  Reading file: " << file.name << '\n';

    std::optional<ParseResult> res;
    try {
        res = chain_.try_parse(read_raw_file(path), file.format);
    }
    catch (const std::exception& ex) {
        std::cerr << "  WARNING: " << ex.what() << '\n';
    }

    if (!res) {
        std::cerr << "  WARNING: Could not parse file " << file.name
                  << " with any available parser.\n";
        return std::nullopt;
    }

    outcome.parser = res->parser;
    outcome.rows   = res->table.size();
    if (config_.verbose)
        std::cout << "    Successfully parsed with: " << res->parser
                  << " (" << outcome.rows << " rows)\n";
    return std::move(res->table);
}

/* ------------------------------------------------------------------------- */
std::optional<FluxTable> ObjectProcessor::build(const ObjectSpec& spec,
                                                ObjectReport&     report) const
{
    report.name = spec.name;

    std::vector<PhotometryTable> tables;
    for (const auto& f : spec.files) {
        FileOutcome outcome;
        if (auto t = read_one_(spec.name, f, outcome))
            tables.push_back(std::move(*t));
        report.files.push_back(std::move(outcome));
    }

    if (tables.empty()) {
        report.status = ObjectStatus::SkippedNoData;
        if (config_.verbose)
            std::cout << "--- No data processed for " << spec.name
                      << ", skipping light-curve creation. ---\n\n";
        return std::nullopt;
    }

    auto norm = normalizer_.normalize(tables);
    report.diagnostics = norm.diagnostics;

    const auto& d = norm.diagnostics;
    if (config_.verbose) {
        std::cout << "  Bands before mapping: " << join(d.before_mapping) << '\n'
                  << "  Bands without alias: "  << join(d.unaliased)      << '\n';
        if (!d.excluded.empty())
            std::cout << "  Excluded bands: " << join(d.excluded) << '\n';
    }
    if (!d.unrecognised.empty())
        std::cerr << "  WARNING: " << spec.name << ": unrecognised bands dropped: "
                  << join(d.unrecognised) << '\n';

    if (norm.table.empty()) {
        report.status = ObjectStatus::SkippedEmpty;
        std::cerr << "  WARNING: No usable data remains for " << spec.name
                  << " after parsing and band mapping.\n\n";
        return std::nullopt;
    }

    if (config_.verbose)
        std::cout << "  Found " << norm.table.size()
                  << " unique, usable photometric points for " << spec.name << ".\n";

    FluxTable lc = converter_.convert(norm.table, spec.mag_system);
    report.n_points = lc.size();
    return lc;
}

/* ------------------------------------------------------------------------- */
ObjectReport ObjectProcessor::process(const ObjectSpec& spec) const
{
    ObjectReport report;
    report.name = spec.name;

    if (config_.verbose)
        std::cout << "--- Processing " << spec.name << " ---\n";

    try {
        auto lc = build(spec, report);
        if (!lc) return report;

        const auto meta = metadata_.lookup(spec.name);
        if (!meta) {
            report.status = ObjectStatus::SkippedNoMetadata;
            std::cerr << "  WARNING: No metadata for " << spec.name << ", skipping.\n\n";
            return report;
        }

        report.output_path = writer_.write(spec.name, *meta, *lc);
        report.status      = ObjectStatus::Emitted;

        if (config_.verbose)
            std::cout << "  Wrote light curve to: " << report.output_path << '\n'
                      << "--- Finished " << spec.name << " --- \n\n";
    }
    catch (const std::exception& ex) {
        report.status  = ObjectStatus::Failed;
        report.message = ex.what();
        std::cerr << "  ERROR: " << spec.name << ": " << ex.what() << "\n\n";
    }
    return report;
}

std::vector<ObjectReport> ObjectProcessor::run(const std::vector<ObjectSpec>& objects) const
{
    std::vector<ObjectReport> reports;
    reports.reserve(objects.size());
    for (const auto& o : objects)
        reports.push_back(process(o));
    return reports;
}

} // namespace photnorm

#include "photnorm/BandNormalizer.hpp"
#include "photnorm/FluxConverter.hpp"
#include "photnorm/LightCurveWriter.hpp"
#include "photnorm/Metadata.hpp"
#include "photnorm/ObjectProcessor.hpp"
#include "photnorm/PassbandVocabulary.hpp"
#include "photnorm/PhotometryParsers.hpp"
#include "photnorm/Registry.hpp"
#include "photnorm/RunReport.hpp"
#include "photnorm/ZeroPoints.hpp"
#include <cxxopts.hpp>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <map>

namespace fs = std::filesystem;
using namespace photnorm;

// Find the pipeline configuration when --config is not given
std::string find_pipeline_config() {
    std::vector<std::string> search_paths = {
        // 1. Current working directory
        "photnorm.json",

        // 2. Same directory as executable
        []() {
            std::error_code ec;
            auto exe_path = fs::canonical("/proc/self/exe", ec);
            if (ec) return std::string("./photnorm.json");
            return (exe_path.parent_path() / "photnorm.json").string();
        }(),

        // 3. Build directory (for development)
        "../photnorm.json",
        "config/photnorm.json"
    };

    for (const auto& path : search_paths) {
        if (fs::exists(path)) return path;
    }
    throw std::runtime_error("Could not find photnorm.json (use --config)");
}

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    std::map<ObjectStatus, int> counts;
    try {
        cxxopts::Options opts("photnorm",
                              "Normalise heterogeneous photometry into SNANA light curves");
        opts.add_options()
            ("c,config", "Pipeline configuration JSON", cxxopts::value<std::string>())
            ("o,object", "Process only this object (repeatable)",
                         cxxopts::value<std::vector<std::string>>())
            ("raw-dir", "Override rawDir of the configuration", cxxopts::value<std::string>())
            ("output-dir", "Override outputDir of the configuration", cxxopts::value<std::string>())
            ("report", "Write a JSON run report to this path", cxxopts::value<std::string>())
            ("q,quiet", "Only print warnings and errors")
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        const std::string cfg_path = cli.count("config")
                                   ? cli["config"].as<std::string>()
                                   : find_pipeline_config();
        PipelineSettings settings = load_settings(cfg_path);
        std::cout << "Loaded config from: " << cfg_path << std::endl;

        if (cli.count("raw-dir"))    settings.raw_dir    = cli["raw-dir"].as<std::string>();
        if (cli.count("output-dir")) settings.output_dir = cli["output-dir"].as<std::string>();

        // Immutable tables, loaded once
        const PassbandVocabulary vocab = settings.vocabulary.empty()
                                       ? PassbandVocabulary::builtin()
                                       : PassbandVocabulary::load(settings.vocabulary);
        const ZeroPointTable zeropoints = settings.zeropoints.empty()
                                        ? ZeroPointTable::builtin()
                                        : ZeroPointTable::load(settings.zeropoints);
        const JsonMetadataCatalog metadata = JsonMetadataCatalog::load(settings.metadata);

        // Select objects
        std::vector<ObjectSpec> objects;
        if (cli.count("object")) {
            for (const auto& name : cli["object"].as<std::vector<std::string>>()) {
                if (const ObjectSpec* o = settings.find(name)) objects.push_back(*o);
                else std::cerr << "WARNING: object '" << name << "' is not in the registry\n";
            }
        } else {
            objects = settings.objects;
        }

        // Every accepted passband must be convertible in every system used
        std::vector<std::string> systems;
        for (const auto& o : objects)
            if (std::find(systems.begin(), systems.end(), o.mag_system) == systems.end())
                systems.push_back(o.mag_system);
        require_zero_points(vocab, zeropoints, systems);

        std::vector<std::string> no_meta;
        for (const auto& o : objects)
            if (!metadata.lookup(o.name)) no_meta.push_back(o.name);
        if (!no_meta.empty()) {
            std::cerr << "WARNING: " << no_meta.size() << " of " << objects.size()
                      << " objects have no coordinates in " << settings.metadata
                      << " and will be skipped:";
            for (const auto& n : no_meta) std::cerr << ' ' << n;
            std::cerr << '\n';
        }

        // Setup
        const ParserChain      chain;
        const BandNormalizer   normalizer(vocab);
        const FluxConverter    converter(zeropoints);
        const LightCurveWriter writer(settings.output_dir, settings.survey);

        ObjectProcessor::Config proc_config;
        proc_config.raw_dir = settings.raw_dir;
        proc_config.verbose = cli.count("quiet") == 0;

        ObjectProcessor processor(proc_config, chain, normalizer, converter,
                                  metadata, writer);
        const auto reports = processor.run(objects);

        for (const auto& r : reports) ++counts[r.status];

        if (cli.count("report")) {
            write_run_report(cli["report"].as<std::string>(), reports);
            std::cout << "Run report: " << cli["report"].as<std::string>() << '\n';
        }

        std::cout << "\nObjects: " << reports.size()
                  << "  emitted: "  << counts[ObjectStatus::Emitted]
                  << "  no data: "  << counts[ObjectStatus::SkippedNoData]
                  << "  empty: "    << counts[ObjectStatus::SkippedEmpty]
                  << "  no metadata: " << counts[ObjectStatus::SkippedNoMetadata]
                  << "  failed: "   << counts[ObjectStatus::Failed] << '\n';

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    std::cout << "Took: " << duration / 1000.0 << "s\n";

    return 0;
}

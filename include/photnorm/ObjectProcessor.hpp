#pragma once
#include "BandNormalizer.hpp"
#include "FluxConverter.hpp"
#include "LightCurveWriter.hpp"
#include "Metadata.hpp"
#include "PhotometryParsers.hpp"
#include "Registry.hpp"
#include <optional>
#include <string>
#include <vector>

namespace photnorm {

enum class ObjectStatus {
    Emitted,              // light curve written
    SkippedNoData,        // no file could be read and parsed
    SkippedEmpty,         // nothing left after band normalisation
    SkippedNoMetadata,    // metadata lookup failed
    Failed                // conversion or output error
};

const char* to_string(ObjectStatus s);

struct FileOutcome {
    std::string file;
    bool        found  = false;
    std::string parser;             // empty: unparsable
    std::size_t rows   = 0;
};

struct ObjectReport {
    std::string              name;
    ObjectStatus             status = ObjectStatus::SkippedNoData;
    std::vector<FileOutcome> files;
    BandDiagnostics          diagnostics;
    std::size_t              n_points = 0;
    std::string              output_path;
    std::string              message;    // reason for Failed
};

/*
 * Runs one object through  files -> ParserChain -> BandNormalizer
 * -> FluxConverter -> metadata -> LightCurveWriter.  Holds no per-object
 * state, so one instance serves a whole batch.
 */
class ObjectProcessor {
public:
    struct Config {
        std::string raw_dir = "raw_virgo_data";
        bool        verbose = true;
    };

    ObjectProcessor(const Config&           config,
                    const ParserChain&      chain,
                    const BandNormalizer&   normalizer,
                    const FluxConverter&    converter,
                    const MetadataProvider& metadata,
                    const LightCurveWriter& writer);

    // <raw_dir>/<object>/Photometry/<file>
    std::string input_path(const std::string& object, const std::string& file) const;

    /* parse, merge and convert; std::nullopt (with report.status set) when
     * the object has no usable data. Throws on conversion errors.          */
    std::optional<FluxTable> build(const ObjectSpec& spec, ObjectReport& report) const;

    // the whole object; never throws
    ObjectReport process(const ObjectSpec& spec) const;

    // every object in order; one failure never stops the batch
    std::vector<ObjectReport> run(const std::vector<ObjectSpec>& objects) const;

private:
    std::optional<PhotometryTable> read_one_(const std::string& object,
                                             const FileSpec&    file,
                                             FileOutcome&       outcome) const;

    Config                  config_;
    const ParserChain&      chain_;
    const BandNormalizer&   normalizer_;
    const FluxConverter&    converter_;
    const MetadataProvider& metadata_;
    const LightCurveWriter& writer_;
};

} // namespace photnorm

// PhotometryParsers.hpp
#pragma once
#include "photnorm/Photometry.hpp"        //  time, mag, magerr, band container
#include "photnorm/RawFile.hpp"
#include "photnorm/RawTable.hpp"
#include "photnorm/Sanitizer.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace photnorm {

// ---------------------------------------------------------------------------
// parser interface
// ---------------------------------------------------------------------------
/*
 * One supported file shape.  applicable() looks at a structural fingerprint
 * only (header tokens, signature bytes); parse() does the full read and
 * returns sanitized photometry.  Neither may throw: malformed input yields
 * false / std::nullopt.
 */
class PhotometryParser {
public:
    virtual ~PhotometryParser() = default;

    virtual std::string name() const = 0;
    virtual bool applicable(const RawFile& file) const = 0;
    virtual std::optional<PhotometryTable> parse(const RawFile& file) const = 0;
};

using ParserPtr = std::unique_ptr<PhotometryParser>;

// comma separated text with a header row ("JD, Mag, Band, Ref" style)
class DelimitedTextParser final : public PhotometryParser {
public:
    std::string name() const override { return "delimited"; }
    bool applicable(const RawFile& file) const override;
    std::optional<PhotometryTable> parse(const RawFile& file) const override;

    static const ColumnAliases& aliases();
};

// tab separated export: "Julian Date / Gregorian Day / Magnitude / Indmag and Band"
class TabularExportParser final : public PhotometryParser {
public:
    std::string name() const override { return "tabular"; }
    bool applicable(const RawFile& file) const override;
    std::optional<PhotometryTable> parse(const RawFile& file) const override;

    static const std::vector<std::string>& required_header();
    static const ColumnAliases& aliases();
};

// whitespace aligned notes with comment lines and </> limit rows
class NotesAndLimitsParser final : public PhotometryParser {
public:
    std::string name() const override { return "notes"; }
    bool applicable(const RawFile& file) const override;
    std::optional<PhotometryTable> parse(const RawFile& file) const override;

    static const std::vector<std::string>& field_names();
};

// first extension of a FITS file, read with CCfits (VizieR style tables)
class FitsTableParser final : public PhotometryParser {
public:
    std::string name() const override { return "fits"; }
    bool applicable(const RawFile& file) const override;
    std::optional<PhotometryTable> parse(const RawFile& file) const override;

    static const ColumnAliases& aliases();
};

// ---------------------------------------------------------------------------
// ordered fallback chain
// ---------------------------------------------------------------------------
struct ParseResult {
    PhotometryTable table;
    std::string     parser;      // name() of the accepting parser
};

class ParserChain {
public:
    // delimited, tabular, notes, fits - in that priority
    ParserChain();
    explicit ParserChain(std::vector<ParserPtr> parsers);

    /* first parser whose fingerprint matches and which yields >= 1 row;
     * std::nullopt == unparsable                                          */
    std::optional<ParseResult> try_parse(const RawFile& file) const;

    /* "auto" runs the chain, any other value forces the named parser;
     * std::invalid_argument for an unknown name                            */
    std::optional<ParseResult> try_parse(const RawFile& file,
                                         const std::string& format) const;

    const PhotometryParser* find(const std::string& name) const;
    std::vector<std::string> names() const;

private:
    static std::optional<PhotometryTable> attempt_(const PhotometryParser& p,
                                                   const RawFile& file);

    std::vector<ParserPtr> parsers_;
};

std::vector<ParserPtr> default_parsers();

// main entry point -----------------------------------------------------------
std::optional<ParseResult> load_photometry(const std::string& path,
                                           const std::string& format = "auto");

} // namespace photnorm

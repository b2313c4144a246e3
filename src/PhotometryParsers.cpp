#include "photnorm/PhotometryParsers.hpp"
#include "photnorm/TextUtils.hpp"
#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace photnorm {
namespace {

// ----------------------------------------------------------------------------
//  Cheap pre-checks shared by the text formats
// ----------------------------------------------------------------------------
bool is_text_candidate(const RawFile& f)
{
    return !f.content.empty() && !f.has_fits_signature() && !f.looks_binary();
}

// first line that is not blank, or "" when there is none
std::string first_nonblank_line(const std::vector<std::string>& lines,
                                std::size_t* index = nullptr)
{
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (!trim(lines[i]).empty()) {
            if (index) *index = i;
            return lines[i];
        }
    }
    return {};
}

bool names_any(const std::vector<std::string>& header,
               const ColumnAliases& aliases,
               const std::string& canonical)
{
    for (const auto& a : aliases) {
        if (a.canonical != canonical) continue;
        if (std::find(header.begin(), header.end(), a.source) != header.end())
            return true;
    }
    return false;
}

// header names made unique ("X", "X.1", ...)
std::vector<std::string> unique_names(std::vector<std::string> names)
{
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i].empty()) names[i] = "Unnamed: " + std::to_string(i);
        int k = 1;
        const std::string base = names[i];
        while (std::find(names.begin(), names.begin() + i, names[i])
               != names.begin() + i)
            names[i] = base + "." + std::to_string(k++);
    }
    return names;
}

// ----------------------------------------------------------------------------
//  Read a header + delimited rows into text columns.  Rows longer than the
//  header make the whole file malformed; shorter rows are padded.
// ----------------------------------------------------------------------------
std::optional<RawTable>
read_delimited_table(const std::vector<std::string>& lines,
                     std::size_t header_idx,
                     char        delim)
{
    const auto header = unique_names(split_delimited(lines[header_idx], delim));
    const std::size_t ncols = header.size();

    std::vector<std::vector<std::string>> cells(ncols);
    for (std::size_t i = header_idx + 1; i < lines.size(); ++i)
    {
        if (trim(lines[i]).empty()) continue;               // blank line
        auto fields = split_delimited(lines[i], delim);
        if (fields.size() > ncols) return std::nullopt;
        fields.resize(ncols);
        for (std::size_t c = 0; c < ncols; ++c)
            cells[c].push_back(std::move(fields[c]));
    }

    RawTable tbl;
    for (std::size_t c = 0; c < ncols; ++c)
        tbl.add_text_column(header[c], std::move(cells[c]));
    return tbl;
}

} // unnamed namespace

// ============================================================================
//  1. delimited text
// ============================================================================
const ColumnAliases& DelimitedTextParser::aliases()
{
    static const ColumnAliases lut = {
        {col::time,      "Julian Date"},
        {col::time,      "JD"},
        {col::mag,       "Magnitude"},
        {col::mag,       "Mag"},
        {col::magerr,    "Magerr"},
        {col::magerr,    "Mag Err"},
        {col::magerr,    "e_mag"},
        {col::band,      "Band"},
        {col::band,      "Filter"},
        {col::reference, "Ref"},
        {col::reference, "Reference"},
    };
    return lut;
}

bool DelimitedTextParser::applicable(const RawFile& file) const
{
    if (!is_text_candidate(file)) return false;

    const auto header = first_nonblank_line(split_lines(file.content));
    if (header.find(',') == std::string::npos) return false;

    const auto names = split_delimited(header, ',');
    auto resolves = [&](const std::string& canonical) {
        return names_any(names, aliases(), canonical) ||
               std::find(names.begin(), names.end(), canonical) != names.end();
    };
    return resolves(col::time) && resolves(col::mag);
}

std::optional<PhotometryTable> DelimitedTextParser::parse(const RawFile& file) const
{
    const auto lines = split_lines(file.content);
    std::size_t header_idx = 0;
    if (first_nonblank_line(lines, &header_idx).empty()) return std::nullopt;

    auto raw = read_delimited_table(lines, header_idx, ',');
    if (!raw) return std::nullopt;

    // hand-typed band cells carry stray quotes ("'B'", "\"V\"")
    RawTable cleaned;
    for (const auto& c : raw->columns()) {
        bool is_band = c.name == col::band;
        for (const auto& a : aliases())
            if (a.canonical == col::band && a.source == c.name) is_band = true;

        std::vector<std::string> cells = c.text;
        if (is_band)
            for (auto& s : cells) s = strip_quotes(s);
        cleaned.add_text_column(c.name, std::move(cells));
    }
    return sanitize(std::move(cleaned), aliases());
}

// ============================================================================
//  2. tab separated export
// ============================================================================
const std::vector<std::string>& TabularExportParser::required_header()
{
    static const std::vector<std::string> tokens = {
        "Julian Date", "Gregorian Day", "Magnitude", "Indmag and Band"
    };
    return tokens;
}

const ColumnAliases& TabularExportParser::aliases()
{
    static const ColumnAliases lut = {
        {col::time,      "Julian Date"},
        {col::mag,       "Magnitude"},
        {col::band,      "Indmag and Band"},
        {col::magerr,    "Uncertainty"},
        {col::reference, "Reference Text"},
        {col::reference, "Reference"},
    };
    return lut;
}

bool TabularExportParser::applicable(const RawFile& file) const
{
    if (!is_text_candidate(file)) return false;

    const auto lines = split_lines(file.content);
    if (lines.empty()) return false;
    const std::string& header = lines.front();
    if (header.find('\t') == std::string::npos) return false;

    return std::all_of(required_header().begin(), required_header().end(),
                       [&](const std::string& t) { return contains(header, t); });
}

std::optional<PhotometryTable> TabularExportParser::parse(const RawFile& file) const
{
    const auto lines = split_lines(file.content);
    if (lines.empty()) return std::nullopt;

    auto raw = read_delimited_table(lines, 0, '\t');
    if (!raw) return std::nullopt;

    const RawColumn* ib = raw->find("Indmag and Band");
    if (!ib) return std::nullopt;

    /* "Indmag and Band" may embed the error: "'B' 0.05" -> band, magerr   */
    const bool has_error_col = raw->has("Uncertainty") || raw->has(col::magerr);
    std::vector<std::string> band(ib->text);
    std::vector<std::string> magerr(band.size());
    bool split_any = false;

    if (!has_error_col) {
        for (std::size_t i = 0; i < band.size(); ++i) {
            const auto tokens = split_on_blank_runs(band[i], 1);
            double e = 0.0;
            if (tokens.size() == 2 && parse_double(tokens[1], e)) {
                band[i]   = strip_quotes(tokens[0]);
                magerr[i] = tokens[1];
                split_any = true;
            }
        }
    }

    RawTable tbl;
    for (const auto& c : raw->columns()) {
        if (c.name == "Indmag and Band") continue;
        tbl.add_text_column(c.name, c.text);
    }
    tbl.add_text_column(col::band, std::move(band));
    if (split_any) tbl.add_text_column(col::magerr, std::move(magerr));

    return sanitize(std::move(tbl), aliases());
}

// ============================================================================
//  3. notes with limits
// ============================================================================
namespace {

bool is_comment_or_limit(const std::string& line)
{
    const std::string t = trim(line);
    if (t.empty()) return true;
    if (t.front() == '#') return true;
    return line.find('<') != std::string::npos || line.find('>') != std::string::npos;
}

// header followed by data rows, comments / limits / blank lines removed
std::vector<std::string> notes_body(const RawFile& file)
{
    std::vector<std::string> kept;
    for (auto& line : split_lines(file.content))
        if (!is_comment_or_limit(line)) kept.push_back(std::move(line));
    return kept;
}

} // unnamed namespace

const std::vector<std::string>& NotesAndLimitsParser::field_names()
{
    static const std::vector<std::string> names = {
        col::time, "gregorian", col::mag, col::magerr, col::band, col::reference, "notes"
    };
    return names;
}

bool NotesAndLimitsParser::applicable(const RawFile& file) const
{
    if (!is_text_candidate(file)) return false;

    const auto body = notes_body(file);
    if (body.size() < 2) return false;

    std::size_t widest = 0;
    for (std::size_t i = 1; i < body.size(); ++i)
        widest = std::max(widest, split_on_blank_runs(body[i]).size());
    return widest == field_names().size();
}

std::optional<PhotometryTable> NotesAndLimitsParser::parse(const RawFile& file) const
{
    const auto body = notes_body(file);
    if (body.size() < 2) return std::nullopt;

    const std::size_t ncols = field_names().size();
    std::vector<std::vector<std::string>> cells(ncols);

    // body[0] is the header line; its spacing does not follow the data
    for (std::size_t i = 1; i < body.size(); ++i) {
        auto fields = split_on_blank_runs(body[i]);
        if (fields.size() > ncols) return std::nullopt;
        fields.resize(ncols);
        for (std::size_t c = 0; c < ncols; ++c)
            cells[c].push_back(std::move(fields[c]));
    }

    for (auto& e : cells[3]) {                      // magerr
        const std::string low = to_lower(trim(e));
        if (low == "null" || low == "nul") e.clear();
    }

    RawTable tbl;
    for (std::size_t c = 0; c < ncols; ++c)
        tbl.add_text_column(field_names()[c], std::move(cells[c]));
    return sanitize(std::move(tbl));
}

// ============================================================================
//  Chain
// ============================================================================
std::vector<ParserPtr> default_parsers()
{
    std::vector<ParserPtr> v;
    v.push_back(std::make_unique<DelimitedTextParser>());
    v.push_back(std::make_unique<TabularExportParser>());
    v.push_back(std::make_unique<NotesAndLimitsParser>());
    v.push_back(std::make_unique<FitsTableParser>());
    return v;
}

ParserChain::ParserChain() : parsers_(default_parsers()) {}

ParserChain::ParserChain(std::vector<ParserPtr> parsers)
    : parsers_(std::move(parsers))
{}

std::optional<PhotometryTable>
ParserChain::attempt_(const PhotometryParser& p, const RawFile& file)
{
    try {
        if (!p.applicable(file)) return std::nullopt;
        auto t = p.parse(file);
        if (t && !t->empty()) return t;
    }
    catch (const std::exception&) { /* malformed: same as not applicable */ }
    return std::nullopt;
}

std::optional<ParseResult> ParserChain::try_parse(const RawFile& file) const
{
    for (const auto& p : parsers_) {
        if (auto t = attempt_(*p, file))
            return ParseResult{std::move(*t), p->name()};
    }
    return std::nullopt;
}

std::optional<ParseResult> ParserChain::try_parse(const RawFile& file,
                                                  const std::string& format) const
{
    if (format.empty() || format == "auto") return try_parse(file);

    const PhotometryParser* p = find(format);
    if (!p)
        throw std::invalid_argument("Unsupported photometry format: " + format);

    if (auto t = attempt_(*p, file))
        return ParseResult{std::move(*t), p->name()};
    return std::nullopt;
}

const PhotometryParser* ParserChain::find(const std::string& name) const
{
    for (const auto& p : parsers_)
        if (p->name() == name) return p.get();
    return nullptr;
}

std::vector<std::string> ParserChain::names() const
{
    std::vector<std::string> out;
    for (const auto& p : parsers_) out.push_back(p->name());
    return out;
}

std::optional<ParseResult> load_photometry(const std::string& path,
                                           const std::string& format)
{
    static const ParserChain chain;
    return chain.try_parse(read_raw_file(path), format);
}

} // namespace photnorm

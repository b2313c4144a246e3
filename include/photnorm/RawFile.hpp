#pragma once
#include <string>

namespace photnorm {

/*
 * Immutable in-memory copy of one input file.  Parsers only ever read from
 * `content`; the file on disk is opened, read and closed by read_raw_file().
 */
struct RawFile {
    std::string path;
    std::string extension;     // lower-case, e.g. ".csv"; a hint, never trusted
    std::string content;

    // primary FITS header card ("SIMPLE  =") at offset 0
    bool has_fits_signature() const;

    // NUL bytes never occur in the supported text formats
    bool looks_binary() const;
};

RawFile read_raw_file(const std::string& path);

// wraps already loaded bytes (tests, in-memory sources)
RawFile make_raw_file(std::string content, std::string path = "<memory>");

} // namespace photnorm

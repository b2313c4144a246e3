#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace photnorm {

// whitespace trimming on both ends (space, tab, CR, LF)
std::string trim(std::string_view s);

// removes surrounding single or double quotes, then whitespace, repeatedly
std::string strip_quotes(std::string_view s);

std::string to_lower(std::string_view s);

bool contains(std::string_view haystack, std::string_view needle);

/*
 * Split one line of delimited text.  Fields enclosed in double quotes may
 * contain the delimiter; a doubled quote inside a quoted field is a literal
 * quote.  Surrounding whitespace of every field is trimmed.
 */
std::vector<std::string> split_delimited(std::string_view line, char delim);

// split on runs of >= min_run blanks (spaces or tabs)
std::vector<std::string> split_on_blank_runs(std::string_view line,
                                             std::size_t      min_run = 2);

/*
 * Strict numeric conversion: the whole (trimmed) token must be a number.
 * Returns false for empty or non-numeric text and leaves `value` untouched.
 */
bool parse_double(std::string_view tok, double& value);

// shortest text that reads back to the identical double
std::string format_double(double v);

// splits raw file content into lines, dropping '\r' line endings
std::vector<std::string> split_lines(const std::string& content);

} // namespace photnorm

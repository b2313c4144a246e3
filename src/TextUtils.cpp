#include "photnorm/TextUtils.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace photnorm {

static bool is_blank(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string trim(std::string_view s)
{
    std::size_t b = 0, e = s.size();
    while (b < e && is_blank(s[b]))     ++b;
    while (e > b && is_blank(s[e - 1])) --e;
    return std::string(s.substr(b, e - b));
}

std::string strip_quotes(std::string_view s)
{
    std::string out = trim(s);
    while (out.size() >= 1 && (out.front() == '\'' || out.front() == '"' ||
                               out.back()  == '\'' || out.back()  == '"'))
    {
        if (out.front() == '\'' || out.front() == '"') out.erase(0, 1);
        if (!out.empty() && (out.back() == '\'' || out.back() == '"'))
            out.pop_back();
        out = trim(out);
    }
    return out;
}

std::string to_lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains(std::string_view haystack, std::string_view needle)
{
    return haystack.find(needle) != std::string_view::npos;
}

std::vector<std::string> split_delimited(std::string_view line, char delim)
{
    std::vector<std::string> fields;
    std::string cur;
    bool in_quotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {   // escaped ""
                    cur.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                cur.push_back(c);
            }
        } else if (c == '"' && trim(cur).empty()) {
            cur.clear();
            in_quotes = true;
        } else if (c == delim) {
            fields.push_back(trim(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    fields.push_back(trim(cur));
    return fields;
}

std::vector<std::string> split_on_blank_runs(std::string_view line,
                                             std::size_t      min_run)
{
    std::vector<std::string> fields;
    const std::string s = trim(line);
    std::size_t start = 0, i = 0;

    while (i < s.size()) {
        if (s[i] == ' ' || s[i] == '\t') {
            std::size_t j = i;
            while (j < s.size() && (s[j] == ' ' || s[j] == '\t')) ++j;
            if (j - i >= min_run) {
                fields.push_back(s.substr(start, i - start));
                start = j;
            }
            i = j;
        } else {
            ++i;
        }
    }
    if (start < s.size()) fields.push_back(s.substr(start));
    return fields;
}

bool parse_double(std::string_view tok, double& value)
{
    std::string t = trim(tok);
    if (!t.empty() && t.front() == '+') t.erase(0, 1);
    if (t.empty()) return false;

    double v = 0.0;
    const char* b = t.data();
    const char* e = t.data() + t.size();
    auto res = std::from_chars(b, e, v);
    if (res.ec != std::errc{} || res.ptr != e) return false;
    value = v;
    return true;
}

std::string format_double(double v)
{
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof buf, v);
    return std::string(buf, res.ptr);
}

std::vector<std::string> split_lines(const std::string& content)
{
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < content.size()) {
        std::size_t nl = content.find('\n', start);
        if (nl == std::string::npos) nl = content.size();
        std::string line = content.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        start = nl + 1;
    }
    return lines;
}

} // namespace photnorm

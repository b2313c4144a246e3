#pragma once
#include <optional>
#include <string>
#include <vector>

namespace photnorm {

/*
 * One column of a loosely typed table.  Text parsers produce text columns,
 * the FITS reader produces numeric columns where the file stores numbers.
 * Nothing is validated here; see sanitize().
 */
struct RawColumn {
    std::string              name;
    bool                     numeric = false;
    std::vector<std::string> text;       // valid when !numeric
    std::vector<double>      values;     // valid when  numeric

    std::size_t size() const { return numeric ? values.size() : text.size(); }

    // numeric view, NaN where a text cell is not a number
    double      number_at(std::size_t i) const;
    // text view, numbers written in shortest round-trip form
    std::string text_at(std::size_t i) const;
};

class RawTable {
public:
    std::size_t rows() const;
    std::size_t cols() const { return columns_.size(); }

    bool             has(const std::string& name) const;
    const RawColumn* find(const std::string& name) const;
    const std::vector<RawColumn>& columns() const { return columns_; }

    /* columns must all have the same length; std::invalid_argument otherwise */
    void add_text_column   (std::string name, std::vector<std::string> cells);
    void add_numeric_column(std::string name, std::vector<double> cells);

    /* renames `from` to `to`; no-op when `from` is absent or `to` exists   */
    bool rename(const std::string& from, const std::string& to);

    /* keep.size() must equal rows() */
    void filter_rows(const std::vector<bool>& keep);

private:
    void check_length_(std::size_t n, const std::string& name) const;

    std::vector<RawColumn> columns_;
};

} // namespace photnorm

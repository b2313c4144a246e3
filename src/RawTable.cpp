#include "photnorm/RawTable.hpp"
#include "photnorm/TextUtils.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace photnorm {

double RawColumn::number_at(std::size_t i) const
{
    if (numeric) return values.at(i);
    double v = std::numeric_limits<double>::quiet_NaN();
    parse_double(text.at(i), v);
    return v;
}

std::string RawColumn::text_at(std::size_t i) const
{
    return numeric ? format_double(values.at(i)) : text.at(i);
}

/* ------------------------------------------------------------------ */
std::size_t RawTable::rows() const
{
    return columns_.empty() ? 0 : columns_.front().size();
}

bool RawTable::has(const std::string& name) const
{
    return find(name) != nullptr;
}

const RawColumn* RawTable::find(const std::string& name) const
{
    auto it = std::find_if(columns_.begin(), columns_.end(),
                           [&](const RawColumn& c) { return c.name == name; });
    return it == columns_.end() ? nullptr : &*it;
}

void RawTable::check_length_(std::size_t n, const std::string& name) const
{
    if (!columns_.empty() && n != rows())
        throw std::invalid_argument("RawTable: column '" + name +
                                    "' has " + std::to_string(n) +
                                    " rows, expected " + std::to_string(rows()));
}

void RawTable::add_text_column(std::string name, std::vector<std::string> cells)
{
    check_length_(cells.size(), name);
    RawColumn c;
    c.name    = std::move(name);
    c.numeric = false;
    c.text    = std::move(cells);
    columns_.push_back(std::move(c));
}

void RawTable::add_numeric_column(std::string name, std::vector<double> cells)
{
    check_length_(cells.size(), name);
    RawColumn c;
    c.name    = std::move(name);
    c.numeric = true;
    c.values  = std::move(cells);
    columns_.push_back(std::move(c));
}

bool RawTable::rename(const std::string& from, const std::string& to)
{
    if (from == to || has(to)) return false;
    for (auto& c : columns_) {
        if (c.name == from) { c.name = to; return true; }
    }
    return false;
}

void RawTable::filter_rows(const std::vector<bool>& keep)
{
    if (keep.size() != rows())
        throw std::invalid_argument("RawTable::filter_rows: mask size mismatch");

    for (auto& c : columns_) {
        std::size_t out = 0;
        for (std::size_t i = 0; i < keep.size(); ++i) {
            if (!keep[i]) continue;
            if (c.numeric) c.values[out] = c.values[i];
            else           c.text[out]   = std::move(c.text[i]);
            ++out;
        }
        if (c.numeric) c.values.resize(out);
        else           c.text.resize(out);
    }
}

} // namespace photnorm

#include "record.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace geosync {

namespace {

const Value kAbsent{};

std::string trim(const std::string &s) {
    size_t start = s.find_first_not_of(" \t\n\r\"");
    size_t end   = s.find_last_not_of(" \t\n\r\"");
    if (start == std::string::npos || end == std::string::npos)
        return "";
    return s.substr(start, end - start + 1);
}

std::string number_text(double d) {
    if (std::isfinite(d) && std::floor(d) == d &&
        std::fabs(d) < static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
        return std::to_string(static_cast<std::int64_t>(d));
    }
    std::ostringstream os;
    os << std::setprecision(17) << d;
    return os.str();
}

} // namespace

bool is_absent(const Value &v) {
    if (std::holds_alternative<std::monostate>(v)) return true;
    if (const double *d = std::get_if<double>(&v)) return std::isnan(*d);
    return false;
}

Value normalize(const Value &v) {
    return is_absent(v) ? Value{} : v;
}

std::optional<double> as_number(const Value &v) {
    if (is_absent(v)) return std::nullopt;
    if (const std::int64_t *i = std::get_if<std::int64_t>(&v)) return static_cast<double>(*i);
    if (const double *d = std::get_if<double>(&v)) return *d;
    if (const std::string *s = std::get_if<std::string>(&v)) {
        const std::string t = trim(*s);
        if (t.empty()) return std::nullopt;
        try {
            size_t pos = 0;
            double d = std::stod(t, &pos);
            if (pos == t.size() && !std::isnan(d)) return d;
        } catch (const std::logic_error &) {}
    }
    return std::nullopt;
}

std::string to_text(const Value &v) {
    if (is_absent(v)) return "";
    if (const bool *b = std::get_if<bool>(&v)) return *b ? "true" : "false";
    if (const std::int64_t *i = std::get_if<std::int64_t>(&v)) return std::to_string(*i);
    if (const double *d = std::get_if<double>(&v)) {
        std::ostringstream os;
        os << std::setprecision(15) << *d;
        return os.str();
    }
    return std::get<std::string>(v);
}

std::string key_text(const Value &v) {
    if (is_absent(v)) return "";
    if (const bool *b = std::get_if<bool>(&v)) return *b ? "true" : "false";
    if (const std::int64_t *i = std::get_if<std::int64_t>(&v)) return std::to_string(*i);
    if (const double *d = std::get_if<double>(&v)) return number_text(*d);

    // Integer-looking strings collapse onto the integer key.
    const std::string t = trim(std::get<std::string>(v));
    try {
        size_t pos = 0;
        long long n = std::stoll(t, &pos);
        if (pos == t.size()) return std::to_string(n);
    } catch (const std::logic_error &) {}
    return t;
}

bool same_value(const Value &a, const Value &b) {
    const bool absentA = is_absent(a);
    const bool absentB = is_absent(b);
    if (absentA || absentB) return absentA && absentB;

    const bool numA = std::holds_alternative<std::int64_t>(a) || std::holds_alternative<double>(a);
    const bool numB = std::holds_alternative<std::int64_t>(b) || std::holds_alternative<double>(b);
    if (numA && numB) {
        if (std::holds_alternative<std::int64_t>(a) && std::holds_alternative<std::int64_t>(b))
            return std::get<std::int64_t>(a) == std::get<std::int64_t>(b);
        return *as_number(a) == *as_number(b);
    }
    return a == b;
}

const Value &Record::get(const std::string &column) const {
    auto it = fields.find(column);
    return it == fields.end() ? kAbsent : it->second;
}

bool operator==(const Record &a, const Record &b) {
    for (const auto &kv : a.fields)
        if (!same_value(kv.second, b.get(kv.first))) return false;
    for (const auto &kv : b.fields)
        if (!same_value(kv.second, a.get(kv.first))) return false;
    return a.geometry == b.geometry;
}

bool Table::has_column(const std::string &name) const {
    return std::find(columns.begin(), columns.end(), name) != columns.end();
}

void Table::add_column(const std::string &name) {
    if (!has_column(name)) columns.push_back(name);
}

void Table::append(Record row) {
    for (const auto &kv : row.fields) add_column(kv.first);
    rows.push_back(std::move(row));
}

Table Table::schema_only() const {
    Table t;
    t.columns = columns;
    return t;
}

void normalize_nulls(Table &table) {
    for (auto &row : table.rows) {
        for (auto &kv : row.fields) {
            if (is_absent(kv.second)) kv.second = Value{};
        }
    }
}

void rename_columns(Table &table, const std::map<std::string, std::string> &mapping) {
    if (mapping.empty()) return;
    auto target = [&mapping](const std::string &name) -> const std::string & {
        auto it = mapping.find(name);
        return it == mapping.end() ? name : it->second;
    };

    std::vector<std::string> columns;
    for (const auto &c : table.columns) {
        const std::string &to = target(c);
        if (std::find(columns.begin(), columns.end(), to) == columns.end()) columns.push_back(to);
    }
    table.columns = columns;

    for (auto &row : table.rows) {
        std::map<std::string, Value> fields;
        for (auto &kv : row.fields) {
            if (!mapping.count(kv.first)) fields.emplace(kv.first, std::move(kv.second));
        }
        for (auto &kv : row.fields) {
            auto it = mapping.find(kv.first);
            if (it != mapping.end()) fields[it->second] = std::move(kv.second);
        }
        row.fields.swap(fields);
    }
}

std::vector<std::string> union_columns(const std::vector<std::string> &base,
                                       const std::vector<std::string> &extra) {
    std::vector<std::string> out = base;
    for (const auto &c : extra) {
        if (std::find(out.begin(), out.end(), c) == out.end()) out.push_back(c);
    }
    return out;
}

} // namespace geosync

#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "geometry.h"

namespace geosync {

// std::monostate is the one "absent" sentinel for every flavor of missing value.
typedef std::variant<std::monostate, bool, std::int64_t, double, std::string> Value;

bool is_absent(const Value &v);
Value normalize(const Value &v);
std::optional<double> as_number(const Value &v);
std::string to_text(const Value &v);

// Canonical text used to compare key values: 5, 5.0 and "5" are the same key.
std::string key_text(const Value &v);

// Equality after normalization. Integers and doubles compare numerically.
bool same_value(const Value &a, const Value &b);

struct Record {
    std::map<std::string, Value> fields;
    std::optional<Geometry> geometry;

    // Unset fields read as absent.
    const Value &get(const std::string &column) const;
    void set(const std::string &column, Value value) { fields[column] = std::move(value); }
    bool has(const std::string &column) const { return fields.count(column) != 0; }
};

bool operator==(const Record &a, const Record &b);
inline bool operator!=(const Record &a, const Record &b) { return !(a == b); }

struct Table {
    std::vector<std::string> columns;
    std::vector<Record> rows;

    bool has_column(const std::string &name) const;
    void add_column(const std::string &name);
    // Appends the row and registers any field the schema does not know yet.
    void append(Record row);

    size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }
    Table schema_only() const;
};

// Replaces NaN and other missing markers with the absent sentinel, in place.
void normalize_nulls(Table &table);

// Renames all mapped columns at once, so {x: y, y: x} exchanges two columns.
// Unmapped names stay; a renamed column replaces an existing one of the same name.
// Mapped names the table lacks are ignored.
void rename_columns(Table &table, const std::map<std::string, std::string> &mapping);

// Columns of `base` followed by columns of `extra` that `base` lacks.
std::vector<std::string> union_columns(const std::vector<std::string> &base,
                                       const std::vector<std::string> &extra);

} // namespace geosync

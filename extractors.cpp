#include "extractors.h"

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "errors.h"

namespace fs = std::filesystem;

namespace geosync {

namespace {

std::string trim(const std::string &s) {
    size_t start = s.find_first_not_of(" \t\n\r\"");
    size_t end   = s.find_last_not_of(" \t\n\r\"");
    if (start == std::string::npos || end == std::string::npos)
        return "";
    return s.substr(start, end - start + 1);
}

void check(const arrow::Status &st, const std::string &what) {
    if (!st.ok()) throw ExtractError(what + ": " + st.ToString());
}

enum class ColumnKind { empty, integer, real, text };

ColumnKind infer_kind(const std::vector<std::vector<std::string>> &rows, size_t col, char decimal) {
    bool anyValue = false, allInt = true, allReal = true;
    for (const auto &r : rows) {
        if (col >= r.size() || r[col].empty()) continue;
        anyValue = true;
        std::string tok = r[col];
        if (decimal != '.') std::replace(tok.begin(), tok.end(), decimal, '.');
        if (allInt) {
            try {
                size_t pos = 0;
                std::stoll(tok, &pos);
                if (pos != tok.size()) allInt = false;
            } catch (const std::logic_error &) { allInt = false; }
        }
        if (allReal) {
            try {
                size_t pos = 0;
                std::stod(tok, &pos);
                if (pos != tok.size()) allReal = false;
            } catch (const std::logic_error &) { allReal = false; }
        }
        if (!allInt && !allReal) break;
    }
    if (!anyValue) return ColumnKind::empty;
    if (allInt)    return ColumnKind::integer;
    if (allReal)   return ColumnKind::real;
    return ColumnKind::text;
}

Value to_value(const std::string &token, ColumnKind kind, char decimal) {
    if (token.empty() || kind == ColumnKind::empty) return Value{};
    std::string tok = token;
    if (kind != ColumnKind::text && decimal != '.')
        std::replace(tok.begin(), tok.end(), decimal, '.');
    switch (kind) {
        case ColumnKind::integer: return Value{static_cast<std::int64_t>(std::stoll(tok))};
        case ColumnKind::real:    return Value{std::stod(tok)};
        default:                  return Value{token};
    }
}

std::shared_ptr<arrow::Array> build_column(const Table &table, const std::string &col,
                                           std::shared_ptr<arrow::DataType> &type) {
    bool anyInt = false, anyReal = false, anyBool = false, anyText = false;
    for (const auto &row : table.rows) {
        const Value &v = row.get(col);
        if (is_absent(v)) continue;
        if (std::holds_alternative<bool>(v))              anyBool = true;
        else if (std::holds_alternative<std::int64_t>(v)) anyInt = true;
        else if (std::holds_alternative<double>(v))       anyReal = true;
        else                                              anyText = true;
    }

    std::shared_ptr<arrow::Array> array;
    if (anyText || (anyBool && (anyInt || anyReal)) || !(anyInt || anyReal || anyBool)) {
        arrow::StringBuilder b;
        for (const auto &row : table.rows) {
            const Value &v = row.get(col);
            check(is_absent(v) ? b.AppendNull() : b.Append(to_text(v)), "append " + col);
        }
        check(b.Finish(&array), "finish " + col);
        type = arrow::utf8();
    } else if (anyReal) {
        arrow::DoubleBuilder b;
        for (const auto &row : table.rows) {
            const auto n = as_number(row.get(col));
            check(n ? b.Append(*n) : b.AppendNull(), "append " + col);
        }
        check(b.Finish(&array), "finish " + col);
        type = arrow::float64();
    } else if (anyInt) {
        arrow::Int64Builder b;
        for (const auto &row : table.rows) {
            const Value &v = row.get(col);
            check(is_absent(v) ? b.AppendNull() : b.Append(std::get<std::int64_t>(v)), "append " + col);
        }
        check(b.Finish(&array), "finish " + col);
        type = arrow::int64();
    } else {
        arrow::BooleanBuilder b;
        for (const auto &row : table.rows) {
            const Value &v = row.get(col);
            check(is_absent(v) ? b.AppendNull() : b.Append(std::get<bool>(v)), "append " + col);
        }
        check(b.Finish(&array), "finish " + col);
        type = arrow::boolean();
    }
    return array;
}

Value cell(const arrow::Array &arr, int64_t i) {
    if (arr.IsNull(i)) return Value{};
    switch (arr.type_id()) {
        case arrow::Type::INT64:
            return Value{static_cast<std::int64_t>(static_cast<const arrow::Int64Array&>(arr).Value(i))};
        case arrow::Type::INT32:
            return Value{static_cast<std::int64_t>(static_cast<const arrow::Int32Array&>(arr).Value(i))};
        case arrow::Type::DOUBLE:
            return Value{static_cast<const arrow::DoubleArray&>(arr).Value(i)};
        case arrow::Type::FLOAT:
            return Value{static_cast<double>(static_cast<const arrow::FloatArray&>(arr).Value(i))};
        case arrow::Type::BOOL:
            return Value{static_cast<const arrow::BooleanArray&>(arr).Value(i)};
        case arrow::Type::STRING:
            return Value{static_cast<const arrow::StringArray&>(arr).GetString(i)};
        default: {
            auto scalar = arr.GetScalar(i);
            if (!scalar.ok()) throw ExtractError("Unreadable parquet cell: " + scalar.status().ToString());
            return Value{(*scalar)->ToString()};
        }
    }
}

} // namespace

std::vector<std::string> split_line(const std::string &line, char delim) {
    std::vector<std::string> tokens;
    std::string token;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '"') {
            if (quoted && i + 1 < line.size() && line[i + 1] == '"') {
                token += '"';
                ++i;
            } else {
                quoted = !quoted;
            }
        } else if (c == delim && !quoted) {
            tokens.push_back(trim(token));
            token.clear();
        } else if (c != '\r') {
            token += c;
        }
    }
    tokens.push_back(trim(token));
    return tokens;
}

Table CsvExtractor::parse(std::istream &in) const {
    std::vector<std::string> header = options_.columns;
    std::string line;
    if (header.empty()) {
        if (!std::getline(in, line))
            throw ExtractError("CSV input is empty.");
        header = split_line(line, options_.delimiter);
    }

    std::vector<std::vector<std::string>> raw;
    while (std::getline(in, line)) {
        if (trim(line).empty()) continue;
        std::vector<std::string> tokens = split_line(line, options_.delimiter);
        if (tokens.size() < header.size()) continue;
        raw.push_back(std::move(tokens));
    }

    std::vector<ColumnKind> kinds;
    for (size_t c = 0; c < header.size(); ++c)
        kinds.push_back(infer_kind(raw, c, options_.decimal));

    Table table;
    table.columns = header;
    table.rows.reserve(raw.size());
    for (const auto &tokens : raw) {
        Record r;
        for (size_t c = 0; c < header.size(); ++c)
            r.set(header[c], to_value(tokens[c], kinds[c], options_.decimal));
        table.rows.push_back(std::move(r));
    }
    return table;
}

Table CsvExtractor::extract(const fs::path &path) {
    const fs::path csvPath = fs::path(path).replace_extension(".csv");
    const fs::path cachePath = fs::path(path).replace_extension(".parquet");

    const bool haveCsv = fs::exists(csvPath);
    const bool haveCache = options_.use_cache && fs::exists(cachePath);
    if (haveCache && (!haveCsv || fs::last_write_time(cachePath) >= fs::last_write_time(csvPath))) {
        Table cached = read_parquet(cachePath);
        log_.debug("extract", "Loaded " + std::to_string(cached.size()) + " records from cache " +
                              cachePath.string());
        return cached;
    }
    if (!haveCsv) throw ExtractError("Cannot open csv file " + csvPath.string());

    std::ifstream file(csvPath);
    if (!file.is_open()) throw ExtractError("Cannot open csv file " + csvPath.string());
    Table table = parse(file);
    log_.debug("extract", "Loaded " + std::to_string(table.size()) + " records from " + csvPath.string());

    if (options_.use_cache) {
        try {
            write_parquet(table, cachePath);
        } catch (const ExtractError &e) {
            log_.warning("extract", std::string("Cache not written: ") + e.what());
        }
    }
    return table;
}

Table ParquetExtractor::extract(const fs::path &path) {
    const fs::path p = fs::path(path).replace_extension(".parquet");
    Table table = read_parquet(p);
    log_.debug("extract", "Loaded " + std::to_string(table.size()) + " records from " + p.string());
    return table;
}

Table read_parquet(const fs::path &path) {
    auto infile = arrow::io::ReadableFile::Open(path.string());
    if (!infile.ok()) throw ExtractError("Cannot open parquet file " + path.string());

    parquet::arrow::FileReaderBuilder builder;
    check(builder.Open(*infile), "open " + path.string());
    std::unique_ptr<parquet::arrow::FileReader> reader;
    check(builder.Build(&reader), "reader " + path.string());
    std::shared_ptr<arrow::Table> raw;
    check(reader->ReadTable(&raw), "read " + path.string());
    auto combined = raw->CombineChunks();
    if (!combined.ok()) throw ExtractError("combine " + path.string() + ": " + combined.status().ToString());
    std::shared_ptr<arrow::Table> t = *combined;

    Table table;
    for (int c = 0; c < t->num_columns(); ++c)
        table.columns.push_back(t->field(c)->name());
    table.rows.resize(static_cast<size_t>(t->num_rows()));
    for (int c = 0; c < t->num_columns(); ++c) {
        const auto &chunked = t->column(c);
        if (chunked->num_chunks() == 0) continue;
        const arrow::Array &arr = *chunked->chunk(0);
        for (int64_t i = 0; i < arr.length(); ++i)
            table.rows[static_cast<size_t>(i)].set(table.columns[c], cell(arr, i));
    }
    return table;
}

void write_parquet(const Table &table, const fs::path &path) {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    for (const auto &col : table.columns) {
        std::shared_ptr<arrow::DataType> type;
        arrays.push_back(build_column(table, col, type));
        fields.push_back(arrow::field(col, type));
    }
    auto schema = arrow::schema(fields);
    auto arrowTable = arrow::Table::Make(schema, arrays, static_cast<int64_t>(table.size()));

    auto out = arrow::io::FileOutputStream::Open(path.string());
    if (!out.ok()) throw ExtractError("Cannot write parquet file " + path.string());
    check(parquet::arrow::WriteTable(*arrowTable, arrow::default_memory_pool(), *out, 64 * 1024),
          "write " + path.string());
    check((*out)->Close(), "close " + path.string());
}

Table transform(const Table &table, const ExtractOptions &options, Logger &log) {
    Table out;

    // Columns without a single value carry nothing.
    for (const auto &col : table.columns) {
        bool anyValue = false;
        for (const auto &row : table.rows) {
            if (!is_absent(row.get(col))) { anyValue = true; break; }
        }
        const bool dropped = std::find(options.drop_columns.begin(), options.drop_columns.end(), col)
                             != options.drop_columns.end();
        if (anyValue && !dropped) out.columns.push_back(col);
    }

    size_t emptyRows = 0;
    for (const auto &row : table.rows) {
        Record r;
        r.geometry = row.geometry;
        bool anyValue = false;
        for (const auto &col : out.columns) {
            const Value &v = row.get(col);
            if (!is_absent(v)) anyValue = true;
            r.set(col, normalize(v));
        }
        if (!anyValue) {
            ++emptyRows;
            continue;
        }
        out.rows.push_back(std::move(r));
    }
    if (emptyRows > 0) log.debug("transform", "Dropped " + std::to_string(emptyRows) + " empty entries");

    rename_columns(out, options.rename_columns);

    if (options.date_config) {
        const DateConfig &dc = *options.date_config;
        size_t unparsed = 0;
        for (const auto &col : dc.columns) {
            if (!out.has_column(col)) continue;
            for (auto &row : out.rows) {
                const Value &v = row.get(col);
                if (is_absent(v)) continue;
                std::tm tm{};
                std::istringstream in(to_text(v));
                in >> std::get_time(&tm, dc.in_format.c_str());
                if (in.fail()) {
                    ++unparsed;
                    row.set(col, Value{});
                    continue;
                }
                std::ostringstream os;
                os << std::put_time(&tm, dc.out_format.c_str());
                row.set(col, Value{os.str()});
            }
        }
        if (unparsed > 0)
            log.warning("transform", std::to_string(unparsed) + " date values did not match '" +
                                     dc.in_format + "' and were cleared");
    }
    return out;
}

} // namespace geosync

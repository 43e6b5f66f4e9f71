#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "record.h"
#include "sync_log.h"

namespace geosync {

struct DateConfig {
    std::vector<std::string> columns;
    std::string in_format;    // std::get_time syntax, e.g. "%d.%m.%Y"
    std::string out_format;   // std::put_time syntax
};

struct ExtractOptions {
    char delimiter = ',';
    char decimal = '.';
    std::vector<std::string> columns;   // when set, the file has no header line
    std::vector<std::string> drop_columns;
    std::map<std::string, std::string> rename_columns;
    std::optional<DateConfig> date_config;
    bool use_cache = true;
};

// Turns one source file into a table of raw records.
class Extractor {
public:
    virtual ~Extractor() = default;
    // Throws ExtractError when the file cannot be read.
    virtual Table extract(const std::filesystem::path &path) = 0;
};

/*
 * Delimited text reader. Column types are inferred per column (integer,
 * double, else text; empty cells are absent). The parsed table is cached as
 * <stem>.parquet next to the file and reused while it is not older than the
 * CSV, or when the CSV has been removed.
 */
class CsvExtractor : public Extractor {
public:
    CsvExtractor(ExtractOptions options, Logger &log) : options_(std::move(options)), log_(log) {}
    Table extract(const std::filesystem::path &path) override;

    Table parse(std::istream &in) const;

private:
    ExtractOptions options_;
    Logger &log_;
};

class ParquetExtractor : public Extractor {
public:
    explicit ParquetExtractor(Logger &log) : log_(log) {}
    Table extract(const std::filesystem::path &path) override;

private:
    Logger &log_;
};

Table read_parquet(const std::filesystem::path &path);
void write_parquet(const Table &table, const std::filesystem::path &path);

// Splits one line on `delim`, honoring double-quoted fields.
std::vector<std::string> split_line(const std::string &line, char delim);

// Drops all-absent columns and rows, configured columns, then renames and reformats dates.
Table transform(const Table &table, const ExtractOptions &options, Logger &log);

} // namespace geosync

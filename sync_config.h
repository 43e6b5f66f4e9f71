#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "extractors.h"
#include "sync_log.h"

namespace geosync {

enum class BackendKind { gdal, memory };

enum class SourceFormat { csv, parquet };

struct LogConfig {
    std::string log_file;
    std::string file_mode = "a";
    LogLevel level = LogLevel::info;
};

// Region every spatial record must fall into.
struct PolygonFilterConfig {
    std::string file_path;          // OGR dataset (gdal backend)
    std::string layer;              // empty: first layer
    std::string polygon_id_col;
    std::string polygon_id;
    std::vector<std::pair<std::string, std::string>> wkt;   // (id, WKT), memory backend
};

struct StoreConfig {
    std::string driver = "GPKG";
    std::string file_path;
};

// One configured data file, keyed by its stem in `data_files`.
struct SourceConfig {
    std::string name;
    SourceFormat format = SourceFormat::csv;
    std::string id_column;
    // Source coordinate column -> "x" / "y". Empty map: non-spatial source.
    std::map<std::string, std::string> coordinates;
    int file_order = 1;
    std::string table;              // store layer; defaults to the source name
    bool skip_existing = false;
    std::string flag_column;        // 0/1 change flag written on commit; empty: off
    ExtractOptions extract;

    bool spatial() const { return !coordinates.empty(); }
};

struct SyncConfig {
    LogConfig logs;
    std::string data_folder;
    int crs = 5514;
    BackendKind backend = BackendKind::gdal;
    int commit_retries = 1;
    std::optional<PolygonFilterConfig> polygon_filter;
    StoreConfig store;
    std::map<std::string, SourceConfig> data_files;

    const SourceConfig *find_source(const std::string &stem) const;
};

// Reads and validates a JSON configuration. Throws ConfigurationError.
SyncConfig load_config(const std::string &path);
SyncConfig parse_config(const std::string &json_text);

const char *backend_name(BackendKind kind);

} // namespace geosync

#include "sync_config.h"
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "errors.h"

namespace geosync {

using nlohmann::json;

namespace {

std::string get_string(const json &j, const char *key, const std::string &fallback = "") {
    if (!j.contains(key) || j[key].is_null()) return fallback;
    if (!j[key].is_string())
        throw ConfigurationError(std::string("'") + key + "' must be a string");
    return j[key].get<std::string>();
}

char get_char(const json &j, const char *key, char fallback) {
    const std::string s = get_string(j, key);
    if (s.empty()) return fallback;
    if (s.size() != 1)
        throw ConfigurationError(std::string("'") + key + "' must be a single character");
    return s[0];
}

std::vector<std::string> get_strings(const json &j, const char *key) {
    std::vector<std::string> out;
    if (!j.contains(key) || j[key].is_null()) return out;
    if (!j[key].is_array())
        throw ConfigurationError(std::string("'") + key + "' must be a list of strings");
    for (const auto &v : j[key]) out.push_back(v.get<std::string>());
    return out;
}

std::map<std::string, std::string> get_string_map(const json &j, const char *key) {
    std::map<std::string, std::string> out;
    if (!j.contains(key) || j[key].is_null()) return out;
    if (!j[key].is_object())
        throw ConfigurationError(std::string("'") + key + "' must be an object of strings");
    for (auto it = j[key].begin(); it != j[key].end(); ++it)
        out[it.key()] = it.value().get<std::string>();
    return out;
}

SourceConfig parse_source(const std::string &name, const json &j) {
    SourceConfig s;
    s.name = name;

    const std::string format = get_string(j, "format", "csv");
    if (format == "csv")          s.format = SourceFormat::csv;
    else if (format == "parquet") s.format = SourceFormat::parquet;
    else throw ConfigurationError("data_files." + name + ": unknown format '" + format + "'");

    s.id_column = get_string(j, "id_column");
    if (s.id_column.empty())
        throw ConfigurationError("data_files." + name + ": 'id_column' is required");

    s.coordinates = get_string_map(j, "coordinates");
    if (!s.coordinates.empty()) {
        bool hasX = false, hasY = false;
        for (const auto &kv : s.coordinates) {
            if (kv.second == "x") hasX = true;
            else if (kv.second == "y") hasY = true;
            else throw ConfigurationError("data_files." + name + ": coordinates must map onto 'x' and 'y'");
        }
        if (!hasX || !hasY)
            throw ConfigurationError("data_files." + name + ": coordinates must map onto 'x' and 'y'");
    }

    s.file_order = j.value("file_order", 1);
    s.table = get_string(j, "table", name);
    s.skip_existing = j.value("skip_existing", false);
    s.flag_column = get_string(j, "flag_column");

    s.extract.delimiter = get_char(j, "delimiter", ',');
    s.extract.decimal = get_char(j, "decimal", '.');
    s.extract.columns = get_strings(j, "columns");
    s.extract.drop_columns = get_strings(j, "drop_columns");
    s.extract.rename_columns = get_string_map(j, "rename_columns");
    s.extract.use_cache = j.value("cache", true);
    if (j.contains("date_config") && !j["date_config"].is_null()) {
        const json &d = j["date_config"];
        DateConfig dc;
        dc.columns = get_strings(d, "columns");
        dc.in_format = get_string(d, "in_format");
        dc.out_format = get_string(d, "out_format");
        if (dc.in_format.empty() || dc.out_format.empty())
            throw ConfigurationError("data_files." + name + ": date_config needs in_format and out_format");
        s.extract.date_config = dc;
    }
    return s;
}

} // namespace

const SourceConfig *SyncConfig::find_source(const std::string &stem) const {
    auto it = data_files.find(stem);
    return it == data_files.end() ? nullptr : &it->second;
}

const char *backend_name(BackendKind kind) {
    return kind == BackendKind::gdal ? "gdal" : "memory";
}

SyncConfig parse_config(const std::string &json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error &e) {
        throw ConfigurationError(std::string("Configuration is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) throw ConfigurationError("Configuration must be a JSON object");

    SyncConfig c;
    try {
        if (j.contains("logs")) {
            const json &l = j["logs"];
            c.logs.log_file = get_string(l, "log_file");
            c.logs.file_mode = get_string(l, "file_mode", "a");
            c.logs.level = parse_log_level(get_string(l, "level", "info"));
        }

        c.data_folder = get_string(j, "data_folder");
        if (c.data_folder.empty()) throw ConfigurationError("'data_folder' is required");

        c.crs = j.value("crs", 5514);
        if (c.crs <= 0) throw ConfigurationError("'crs' must be a positive EPSG code");

        const std::string backend = get_string(j, "backend", "gdal");
        if (backend == "gdal")        c.backend = BackendKind::gdal;
        else if (backend == "memory") c.backend = BackendKind::memory;
        else throw ConfigurationError("Unknown backend '" + backend + "'");

        c.commit_retries = j.value("commit_retries", 1);
        if (c.commit_retries < 0) throw ConfigurationError("'commit_retries' must not be negative");

        if (j.contains("polygon_filter") && !j["polygon_filter"].is_null()) {
            const json &p = j["polygon_filter"];
            PolygonFilterConfig pf;
            pf.file_path = get_string(p, "file_path");
            pf.layer = get_string(p, "layer");
            pf.polygon_id_col = get_string(p, "polygon_id_col");
            pf.polygon_id = get_string(p, "polygon_id");
            for (const auto &kv : get_string_map(p, "wkt")) pf.wkt.emplace_back(kv.first, kv.second);
            if (pf.polygon_id.empty())
                throw ConfigurationError("polygon_filter: 'polygon_id' is required");
            if (c.backend == BackendKind::gdal && (pf.file_path.empty() || pf.polygon_id_col.empty()))
                throw ConfigurationError("polygon_filter: 'file_path' and 'polygon_id_col' are required");
            c.polygon_filter = pf;
        }

        if (j.contains("store")) {
            c.store.driver = get_string(j["store"], "driver", "GPKG");
            c.store.file_path = get_string(j["store"], "file_path");
        }
        if (c.backend == BackendKind::gdal && c.store.file_path.empty())
            throw ConfigurationError("store: 'file_path' is required for the gdal backend");

        if (!j.contains("data_files") || !j["data_files"].is_object())
            throw ConfigurationError("'data_files' must be an object");
        for (auto it = j["data_files"].begin(); it != j["data_files"].end(); ++it) {
            SourceConfig s = parse_source(it.key(), it.value());
            if (s.spatial() && !c.polygon_filter)
                throw ConfigurationError("data_files." + s.name + " has coordinates but no polygon_filter is set");
            c.data_files.emplace(it.key(), std::move(s));
        }
    } catch (const json::exception &e) {
        throw ConfigurationError(std::string("Invalid configuration: ") + e.what());
    }
    return c;
}

SyncConfig load_config(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) throw ConfigurationError("Cannot open configuration file " + path);
    std::stringstream buffer;
    buffer << f.rdbuf();
    return parse_config(buffer.str());
}

} // namespace geosync

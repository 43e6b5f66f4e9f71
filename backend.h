#pragma once
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "extractors.h"
#include "geo_validator.h"
#include "geometry_factory.h"
#include "polygon_filter.h"
#include "record_store.h"
#include "sync_config.h"
#include "sync_log.h"

namespace geosync {

// Stores shared by every unit of a run, keyed by table name.
typedef std::map<std::string, std::shared_ptr<RecordStore>> StoreCache;

/*
 * Capability set of one backend family: extract, store, validate geometry,
 * filter by polygon. A unit gets one Backend, built by make_backend() from
 * the configured BackendKind.
 */
class Backend {
public:
    Backend(BackendKind kind, std::unique_ptr<Extractor> extractor,
            std::shared_ptr<RecordStore> store, std::unique_ptr<PolygonSource> polygons,
            int epsg, Logger &log);

    Backend(const Backend &) = delete;
    Backend &operator=(const Backend &) = delete;

    BackendKind kind() const { return kind_; }

    Table extract(const std::filesystem::path &path) { return extractor_->extract(path); }
    RecordStore &store() { return *store_; }
    const GeometryFactory &geometry() const { return geometry_; }

    GeoValidation validate_geometry(const std::vector<Record> &records) const { return validator_.validate(records); }
    std::vector<Record> swap_xy(const std::vector<Record> &records) const { return validator_.swap(records); }

    // Loads the region on first use. Throws ConfigurationError.
    std::vector<Record> filter_by_polygon(const std::vector<Record> &records, const std::string &polygon_id);

private:
    BackendKind kind_;
    std::unique_ptr<Extractor> extractor_;
    std::shared_ptr<RecordStore> store_;
    std::unique_ptr<PolygonSource> polygons_;
    GeometryFactory geometry_;
    GeoValidator validator_;
    PolygonFilter filter_;
    std::optional<Polygon> polygon_;
};

std::unique_ptr<Backend> make_backend(const SyncConfig &config, const SourceConfig &source,
                                      Logger &log, StoreCache &stores);

typedef std::function<std::unique_ptr<Backend>(const SyncConfig &, const SourceConfig &,
                                               Logger &, StoreCache &)> BackendFactory;

} // namespace geosync

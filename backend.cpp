#include "backend.h"

#include "errors.h"
#include "ogr_polygon_source.h"
#include "ogr_record_store.h"

namespace geosync {

Backend::Backend(BackendKind kind, std::unique_ptr<Extractor> extractor,
                 std::shared_ptr<RecordStore> store, std::unique_ptr<PolygonSource> polygons,
                 int epsg, Logger &log)
    : kind_(kind), extractor_(std::move(extractor)), store_(std::move(store)),
      polygons_(std::move(polygons)), geometry_(epsg), validator_(geometry_), filter_(log) {}

std::vector<Record> Backend::filter_by_polygon(const std::vector<Record> &records,
                                               const std::string &polygon_id) {
    if (!polygons_) throw ConfigurationError("No polygon source configured");
    if (!polygon_ || polygon_->id != polygon_id) polygon_ = load_polygon(*polygons_, polygon_id);
    return filter_.intersect(records, *polygon_);
}

std::unique_ptr<Backend> make_backend(const SyncConfig &config, const SourceConfig &source,
                                      Logger &log, StoreCache &stores) {
    std::unique_ptr<Extractor> extractor;
    switch (source.format) {
        case SourceFormat::csv:     extractor.reset(new CsvExtractor(source.extract, log)); break;
        case SourceFormat::parquet: extractor.reset(new ParquetExtractor(log)); break;
    }

    std::shared_ptr<RecordStore> &store = stores[source.table];
    std::unique_ptr<PolygonSource> polygons;
    const PolygonFilterConfig *pf = config.polygon_filter ? &*config.polygon_filter : nullptr;

    switch (config.backend) {
        case BackendKind::gdal:
            if (!store) {
                store = std::make_shared<OgrRecordStore>(config.store.file_path, config.store.driver,
                                                         source.table, config.crs, log);
            }
            if (pf && source.spatial()) {
                polygons.reset(new OgrPolygonSource(pf->file_path, pf->layer, pf->polygon_id_col, config.crs));
            }
            break;
        case BackendKind::memory:
            if (!store) store = std::make_shared<MemoryRecordStore>();
            if (pf && source.spatial()) polygons.reset(new WktPolygonSource(pf->wkt, config.crs));
            break;
    }

    return std::unique_ptr<Backend>(new Backend(config.backend, std::move(extractor), store,
                                                std::move(polygons), config.crs, log));
}

} // namespace geosync

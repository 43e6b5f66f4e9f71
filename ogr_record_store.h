#pragma once
#include <string>

#include "gdal_util.h"
#include "record_store.h"
#include "sync_log.h"

namespace geosync {

/*
 * Record store backed by one layer of a GDAL vector dataset. GeoPackage is
 * the default driver; any OGR driver with write and transaction support works.
 * Attribute columns map to layer fields, record geometry to point geometry.
 */
class OgrRecordStore : public RecordStore {
public:
    OgrRecordStore(std::string file_path, std::string driver, std::string layer_name,
                   int epsg, Logger &log);

    Table load_all(const std::string &key_column) override;
    void commit(const ReconciliationPlan &plan) override;
    std::string describe() const override;

private:
    DatasetPtr open_for_update();
    OGRLayer *ensure_layer(GDALDataset &ds, const ReconciliationPlan &plan);
    void ensure_fields(OGRLayer &layer, const ReconciliationPlan &plan);

    std::string file_path_;
    std::string driver_;
    std::string layer_name_;
    int epsg_;
    Logger &log_;
};

} // namespace geosync

#pragma once
#include <memory>
#include <string>

#include "gdal_priv.h"
#include "ogrsf_frmts.h"

namespace geosync {

struct DatasetCloser {
    void operator()(GDALDataset *ds) const {
        if (ds) GDALClose(ds);
    }
};
typedef std::unique_ptr<GDALDataset, DatasetCloser> DatasetPtr;

// GDALAllRegister() once per process.
void ensure_gdal_registered();

// Spatial reference for an EPSG code with x/y in easting/northing order.
OGRSpatialReference make_srs(int epsg);

} // namespace geosync

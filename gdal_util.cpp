#include "gdal_util.h"
#include <mutex>

#include "errors.h"

namespace geosync {

void ensure_gdal_registered() {
    static std::once_flag once;
    std::call_once(once, [] {
        GDALAllRegister();
    });
}

OGRSpatialReference make_srs(int epsg) {
    OGRSpatialReference srs;
    if (srs.importFromEPSG(epsg) != OGRERR_NONE)
        throw ConfigurationError("Unknown EPSG code: " + std::to_string(epsg));
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return srs;
}

} // namespace geosync

#pragma once
#include <string>
#include <vector>

#include "polygon_filter.h"

namespace geosync {

// Polygons read from one layer of a GDAL vector dataset (shapefile, GeoPackage, ...).
class OgrPolygonSource : public PolygonSource {
public:
    OgrPolygonSource(std::string file_path, std::string layer_name,
                     std::string id_column, int epsg);

    // Geometries in another reference system are reprojected to `epsg`.
    std::vector<Polygon> find_all(const std::string &polygon_id) const override;
    std::string describe() const override;

private:
    std::string file_path_;
    std::string layer_name_;
    std::string id_column_;
    int epsg_;
};

} // namespace geosync

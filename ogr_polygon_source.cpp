#include "ogr_polygon_source.h"

#include "cpl_conv.h"
#include "errors.h"
#include "gdal_util.h"

namespace geosync {

OgrPolygonSource::OgrPolygonSource(std::string file_path, std::string layer_name,
                                   std::string id_column, int epsg)
    : file_path_(std::move(file_path)), layer_name_(std::move(layer_name)),
      id_column_(std::move(id_column)), epsg_(epsg) {}

std::string OgrPolygonSource::describe() const {
    return file_path_ + (layer_name_.empty() ? "" : ":" + layer_name_) + " (" + id_column_ + ")";
}

std::vector<Polygon> OgrPolygonSource::find_all(const std::string &polygon_id) const {
    ensure_gdal_registered();

    DatasetPtr ds(static_cast<GDALDataset*>(
        GDALOpenEx(file_path_.c_str(), GDAL_OF_VECTOR, nullptr, nullptr, nullptr)));
    if (!ds) throw ConfigurationError("Unable to open polygon source: " + file_path_);

    OGRLayer *layer = layer_name_.empty() ? ds->GetLayer(0) : ds->GetLayerByName(layer_name_.c_str());
    if (!layer) throw ConfigurationError("No polygon layer in " + describe());

    const int idIdx = layer->GetLayerDefn()->GetFieldIndex(id_column_.c_str());
    if (idIdx < 0)
        throw ConfigurationError("Column '" + id_column_ + "' not found in " + file_path_);

    const OGRSpatialReference target = make_srs(epsg_);
    const OGRSpatialReference *layerSrs = layer->GetSpatialRef();

    std::vector<Polygon> polygons;
    layer->ResetReading();
    OGRFeature *raw;
    while ((raw = layer->GetNextFeature()) != nullptr) {
        OGRFeatureUniquePtr feat(raw);
        if (!feat->IsFieldSetAndNotNull(idIdx) || polygon_id != feat->GetFieldAsString(idIdx))
            continue;
        const OGRGeometry *geom = feat->GetGeometryRef();
        if (!geom) continue;

        std::unique_ptr<OGRGeometry> clone(geom->clone());
        const OGRSpatialReference *srs = clone->getSpatialReference();
        if (!srs) srs = layerSrs;
        if (srs && !srs->IsSame(&target)) {
            if (!clone->getSpatialReference()) clone->assignSpatialReference(layerSrs);
            if (clone->transformTo(const_cast<OGRSpatialReference*>(&target)) != OGRERR_NONE)
                throw ConfigurationError("Cannot reproject polygon " + polygon_id +
                                         " to EPSG:" + std::to_string(epsg_));
        }

        char *wkt = nullptr;
        clone->exportToWkt(&wkt);
        std::string text = wkt ? wkt : "";
        CPLFree(wkt);
        polygons.push_back(make_polygon(polygon_id, text, epsg_));
    }
    return polygons;
}

} // namespace geosync

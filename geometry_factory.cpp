#include "geometry_factory.h"
#include <cmath>

#include "errors.h"

namespace geosync {

GeometryFactory::GeometryFactory(int epsg, std::string x_column, std::string y_column)
    : epsg_(epsg), x_column_(std::move(x_column)), y_column_(std::move(y_column)) {
    if (epsg_ <= 0)
        throw ConfigurationError("Invalid EPSG code: " + std::to_string(epsg_));
}

Geometry GeometryFactory::from_xy(double x, double y, int crs) const {
    if (crs != epsg_) {
        throw ConfigurationError("Geometry requested in EPSG:" + std::to_string(crs) +
                                 ", expected EPSG:" + std::to_string(epsg_));
    }
    Geometry g;
    g.point = BoostPoint(x, y);
    g.epsg = crs;
    return g;
}

std::optional<Geometry> GeometryFactory::from_record(const Record &record) const {
    const auto x = as_number(record.get(x_column_));
    const auto y = as_number(record.get(y_column_));
    if (!x || !y || !std::isfinite(*x) || !std::isfinite(*y))
        return std::nullopt;
    return from_xy(*x, *y, epsg_);
}

std::vector<Record> GeometryFactory::with_geometry(const std::vector<Record> &records) const {
    std::vector<Record> out = records;
    for (auto &r : out) r.geometry = from_record(r);
    return out;
}

} // namespace geosync

#pragma once
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/polygon.hpp>

namespace geosync {

namespace bg = boost::geometry;

// Planar points in the configured projected reference system.
typedef bg::model::point<double, 2, bg::cs::cartesian> BoostPoint;
typedef bg::model::box<BoostPoint> BoostBox;
typedef bg::model::polygon<BoostPoint> BoostPolygon;
typedef bg::model::multi_polygon<BoostPolygon> BoostMultiPolygon;

struct Geometry {
    BoostPoint point;
    int epsg = 0;

    double x() const { return bg::get<0>(point); }
    double y() const { return bg::get<1>(point); }
};

inline bool operator==(const Geometry &a, const Geometry &b) {
    return a.epsg == b.epsg && a.x() == b.x() && a.y() == b.y();
}
inline bool operator!=(const Geometry &a, const Geometry &b) { return !(a == b); }

} // namespace geosync

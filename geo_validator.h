#pragma once
#include <vector>

#include "geometry_factory.h"
#include "record.h"

namespace geosync {

struct GeoValidation {
    std::vector<Record> valid;
    std::vector<Record> invalid;
    size_t excluded = 0;    // records without geometry, in neither list
};

/*
 * Coordinate sanity check for the project's projected reference system.
 * In the area of interest the easting (x) is larger than the northing (y)
 * everywhere, so x <= y means the source labelled its columns the wrong way.
 */
class GeoValidator {
public:
    explicit GeoValidator(const GeometryFactory &factory) : factory_(factory) {}

    GeoValidation validate(const std::vector<Record> &records) const;

    // Exchanges the coordinate fields and rebuilds geometry. Input is untouched.
    std::vector<Record> swap(const std::vector<Record> &records) const;

    static bool is_valid_point(const Geometry &g) { return g.x() > g.y(); }

private:
    const GeometryFactory &factory_;
};

} // namespace geosync

#pragma once
#include <string>
#include <utility>
#include <vector>

#include "geometry.h"
#include "record.h"
#include "sync_log.h"

namespace geosync {

struct Polygon {
    std::string id;
    BoostMultiPolygon shape;
    BoostBox envelope;
    int epsg = 0;
};

// Parses POLYGON or MULTIPOLYGON WKT. Throws ConfigurationError on bad input.
Polygon make_polygon(const std::string &id, const std::string &wkt, int epsg);

// A collection of identified polygons, e.g. a vector layer of regions.
class PolygonSource {
public:
    virtual ~PolygonSource() = default;

    // Every polygon carrying the identifier, in source order.
    virtual std::vector<Polygon> find_all(const std::string &polygon_id) const = 0;
    virtual std::string describe() const = 0;

    // Exactly one match or ConfigurationError. Never picks "the first" of many.
    Polygon get(const std::string &polygon_id) const;
};

// Polygons given inline as (id, WKT) pairs.
class WktPolygonSource : public PolygonSource {
public:
    WktPolygonSource(std::vector<std::pair<std::string, std::string>> entries, int epsg);

    std::vector<Polygon> find_all(const std::string &polygon_id) const override;
    std::string describe() const override;

private:
    std::vector<std::pair<std::string, std::string>> entries_;
    int epsg_;
};

Polygon load_polygon(const PolygonSource &source, const std::string &polygon_id);

// Keeps the records whose point lies inside or on the boundary of a region.
class PolygonFilter {
public:
    explicit PolygonFilter(Logger &log) : log_(log) {}

    // Records without geometry are dropped first. Order of the kept records is preserved.
    std::vector<Record> intersect(const std::vector<Record> &records, const Polygon &polygon) const;

    static bool contains(const Polygon &polygon, const BoostPoint &pt);

private:
    Logger &log_;
};

} // namespace geosync

#pragma once
#include <optional>
#include <string>
#include <vector>

#include "record.h"

namespace geosync {

// Builds point geometry in one fixed reference system.
class GeometryFactory {
public:
    explicit GeometryFactory(int epsg, std::string x_column = "x", std::string y_column = "y");

    int epsg() const { return epsg_; }
    const std::string &x_column() const { return x_column_; }
    const std::string &y_column() const { return y_column_; }

    // Throws ConfigurationError when crs is not the factory's reference system.
    Geometry from_xy(double x, double y, int crs) const;

    // Empty when either coordinate is absent or not numeric.
    std::optional<Geometry> from_record(const Record &record) const;

    // Copy of the records with geometry regenerated from their coordinate fields.
    std::vector<Record> with_geometry(const std::vector<Record> &records) const;

private:
    int epsg_;
    std::string x_column_;
    std::string y_column_;
};

} // namespace geosync

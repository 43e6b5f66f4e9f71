#include "geo_validator.h"

namespace geosync {

GeoValidation GeoValidator::validate(const std::vector<Record> &records) const {
    GeoValidation out;
    out.valid.reserve(records.size());
    for (const auto &r : records) {
        if (!r.geometry) {
            ++out.excluded;
            continue;
        }
        if (is_valid_point(*r.geometry))
            out.valid.push_back(r);
        else
            out.invalid.push_back(r);
    }
    return out;
}

std::vector<Record> GeoValidator::swap(const std::vector<Record> &records) const {
    const std::string &xc = factory_.x_column();
    const std::string &yc = factory_.y_column();

    std::vector<Record> out;
    out.reserve(records.size());
    for (const auto &r : records) {
        Record s = r;
        if (r.has(xc) || r.has(yc)) {
            s.set(xc, r.get(yc));
            s.set(yc, r.get(xc));
            s.geometry = factory_.from_record(s);
        } else if (r.geometry) {
            // Geometry without coordinate fields: swap the point itself.
            s.geometry = factory_.from_xy(r.geometry->y(), r.geometry->x(), r.geometry->epsg);
        }
        out.push_back(std::move(s));
    }
    return out;
}

} // namespace geosync

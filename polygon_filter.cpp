#include "polygon_filter.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#ifdef _OPENMP
  #include <omp.h>
#endif

#include "errors.h"

namespace geosync {

Polygon make_polygon(const std::string &id, const std::string &wkt, int epsg) {
    const size_t start = std::min(wkt.size(), wkt.find_first_not_of(" \t\n\r"));
    std::string head = wkt.substr(start, 16);
    std::transform(head.begin(), head.end(), head.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    Polygon p;
    p.id = id;
    p.epsg = epsg;
    try {
        if (head.rfind("MULTIPOLYGON", 0) == 0) {
            bg::read_wkt(wkt, p.shape);
        } else if (head.rfind("POLYGON", 0) == 0) {
            BoostPolygon single;
            bg::read_wkt(wkt, single);
            p.shape.push_back(single);
        } else {
            throw ConfigurationError("Polygon " + id + " is not a (multi)polygon: " + head);
        }
    } catch (const bg::read_wkt_exception &e) {
        throw ConfigurationError("Invalid WKT for polygon " + id + ": " + e.what());
    }
    if (p.shape.empty())
        throw ConfigurationError("Polygon " + id + " is empty.");

    bg::correct(p.shape);
    bg::envelope(p.shape, p.envelope);
    return p;
}

Polygon PolygonSource::get(const std::string &polygon_id) const {
    std::vector<Polygon> matches = find_all(polygon_id);
    if (matches.empty()) {
        throw ConfigurationError("No polygon with id '" + polygon_id + "' found in " + describe() + ".");
    }
    if (matches.size() > 1) {
        throw ConfigurationError("Multiple polygons (" + std::to_string(matches.size()) +
                                 ") with id '" + polygon_id + "' found in " + describe() +
                                 ". Check 'polygon_filter' in the configuration file.");
    }
    return std::move(matches.front());
}

WktPolygonSource::WktPolygonSource(std::vector<std::pair<std::string, std::string>> entries, int epsg)
    : entries_(std::move(entries)), epsg_(epsg) {}

std::vector<Polygon> WktPolygonSource::find_all(const std::string &polygon_id) const {
    std::vector<Polygon> out;
    for (const auto &e : entries_) {
        if (e.first == polygon_id) out.push_back(make_polygon(e.first, e.second, epsg_));
    }
    return out;
}

std::string WktPolygonSource::describe() const {
    return "inline WKT list (" + std::to_string(entries_.size()) + " polygons)";
}

Polygon load_polygon(const PolygonSource &source, const std::string &polygon_id) {
    return source.get(polygon_id);
}

bool PolygonFilter::contains(const Polygon &polygon, const BoostPoint &pt) {
    if (!bg::covered_by(pt, polygon.envelope)) return false;
    return bg::covered_by(pt, polygon.shape);
}

std::vector<Record> PolygonFilter::intersect(const std::vector<Record> &records,
                                             const Polygon &polygon) const {
    const auto t0 = std::chrono::steady_clock::now();

    std::vector<const Record*> candidates;
    candidates.reserve(records.size());
    for (const auto &r : records) {
        if (!r.geometry) continue;
        if (r.geometry->epsg != polygon.epsg) {
            throw ConfigurationError("Record geometry in EPSG:" + std::to_string(r.geometry->epsg) +
                                     " cannot be tested against polygon " + polygon.id +
                                     " in EPSG:" + std::to_string(polygon.epsg));
        }
        candidates.push_back(&r);
    }

    std::vector<char> keep(candidates.size(), 0);
#ifdef _OPENMP
    #pragma omp parallel for schedule(static)
    for (long i = 0; i < (long)candidates.size(); ++i) {
        keep[i] = contains(polygon, candidates[i]->geometry->point) ? 1 : 0;
    }
#else
    for (size_t i = 0; i < candidates.size(); ++i)
        keep[i] = contains(polygon, candidates[i]->geometry->point) ? 1 : 0;
#endif

    std::vector<Record> out;
    out.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i)
        if (keep[i]) out.push_back(*candidates[i]);

    const auto t1 = std::chrono::steady_clock::now();
    std::ostringstream msg;
    msg << "Kept " << out.size() << " of " << records.size() << " inside polygon "
        << polygon.id << " (" << (records.size() - candidates.size()) << " without geometry) in "
        << std::chrono::duration<double>(t1 - t0).count() << " s.";
    log_.debug("intersect", msg.str());
    return out;
}

} // namespace geosync

#include <cassert>
#include <filesystem>
#include <iostream>
#include <sstream>

#include "errors.h"
#include "geometry_factory.h"
#include "ogr_polygon_source.h"
#include "ogr_record_store.h"
#include "reconciliation.h"

namespace fs = std::filesystem;
using namespace geosync;

static Record well(std::int64_t id, const std::string &name, double x, double y) {
    Record r;
    r.set("id", Value{id});
    r.set("name", Value{name});
    r.set("x", Value{x});
    r.set("y", Value{y});
    r.geometry = GeometryFactory(5514).from_record(r);
    return r;
}

void test_round_trip() {
    std::cout << "Testing GeoPackage store round trip..." << std::endl;

    fs::path dir = fs::temp_directory_path() / "geosync_test_ogr_store";
    fs::remove_all(dir);
    fs::create_directories(dir);
    const std::string path = (dir / "store.gpkg").string();

    std::ostringstream sink;
    Logger log(sink, LogLevel::debug);
    ReconciliationEngine engine(log);
    OgrRecordStore store(path, "GPKG", "wells", 5514, log);

    Table nothing = store.load_all("id");
    assert(nothing.columns.empty() && nothing.empty());

    Table first;
    first.columns = {"id", "name", "x", "y"};
    first.rows = {well(1, "A", -740000, -1040000), well(2, "B", -741000, -1041000)};
    store.commit(engine.reconcile(nothing, first, "id"));
    assert(fs::exists(path));

    Table stored = store.load_all("id");
    assert(stored.size() == 2);
    assert(stored.has_column("name"));
    assert(stored.rows[0].get("id") == Value{std::int64_t{1}});
    assert(stored.rows[1].get("name") == Value{std::string("B")});
    assert(stored.rows[1].geometry);
    assert(stored.rows[1].geometry->x() == -741000.0);
    assert(stored.rows[1].geometry->epsg == 5514);

    // update one entry with a new column, insert another
    Record b2 = well(2, "B2", -741000, -1041000);
    b2.set("depth", Value{3.5});
    Table second;
    second.columns = {"id", "name", "x", "y", "depth"};
    second.rows = {b2, well(3, "C", -742000, -1042000)};
    ReconciliationPlan plan = engine.reconcile(stored, second, "id");
    assert((plan.update_mask == std::vector<bool>{false, true}));
    store.commit(plan);

    Table after = store.load_all("id");
    assert(after.size() == 3);
    assert(after.has_column("depth"));
    assert(after.rows[0].get("name") == Value{std::string("A")});
    assert(is_absent(after.rows[0].get("depth")));
    assert(after.rows[1].get("name") == Value{std::string("B2")});
    assert(after.rows[1].get("depth") == Value{3.5});
    assert(after.rows[2].get("id") == Value{std::int64_t{3}});
    assert(sink.str().find("Inserting 1 new entries, updating 1 existing entries") != std::string::npos);

    // a stale plan is refused and leaves the layer as it was
    bool threw = false;
    try {
        store.commit(plan);
    } catch (const StoreCommitError &) {
        threw = true;
    }
    assert(threw);
    assert(store.load_all("id").size() == 3);

    threw = false;
    try {
        store.load_all("code");
    } catch (const SchemaError &) {
        threw = true;
    }
    assert(threw);

    fs::remove_all(dir);
    std::cout << "  GeoPackage store round trip test passed!" << std::endl;
}

void test_attribute_table() {
    std::cout << "Testing store without geometry..." << std::endl;

    fs::path dir = fs::temp_directory_path() / "geosync_test_ogr_table";
    fs::remove_all(dir);
    fs::create_directories(dir);
    const std::string path = (dir / "store.gpkg").string();

    std::ostringstream sink;
    Logger log(sink, LogLevel::info);
    ReconciliationEngine engine(log);
    OgrRecordStore store(path, "GPKG", "layers", 5514, log);

    Table incoming;
    incoming.columns = {"id", "depth", "ok"};
    for (std::int64_t i = 0; i < 3; ++i) {
        Record r;
        r.set("id", Value{std::int64_t{7}});
        r.set("depth", Value{1.0 * i});
        r.set("ok", Value{i % 2 == 0});
        incoming.rows.push_back(r);
    }
    store.commit(engine.reconcile(store.load_all("id"), incoming, "id"));

    Table stored = store.load_all("id");
    assert(stored.size() == 3);
    assert(!stored.rows[0].geometry);
    assert(stored.rows[2].get("depth") == Value{2.0});
    assert(stored.rows[1].get("ok") == Value{false});

    fs::remove_all(dir);
    std::cout << "  Store without geometry test passed!" << std::endl;
}

void test_polygon_layer_lookup() {
    std::cout << "Testing polygon lookup in a vector layer..." << std::endl;

    fs::path dir = fs::temp_directory_path() / "geosync_test_ogr_regions";
    fs::remove_all(dir);
    fs::create_directories(dir);
    const std::string path = (dir / "regions.gpkg").string();

    ensure_gdal_registered();
    {
        GDALDriver *drv = GetGDALDriverManager()->GetDriverByName("GPKG");
        assert(drv != nullptr);
        DatasetPtr ds(drv->Create(path.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
        assert(ds);
        OGRSpatialReference srs = make_srs(5514);
        OGRLayer *layer = ds->CreateLayer("regions", &srs, wkbPolygon, nullptr);
        assert(layer != nullptr);
        OGRFieldDefn code("code", OFTString);
        OGRErr err = layer->CreateField(&code);
        assert(err == OGRERR_NONE);

        const std::pair<const char*, const char*> regions[] = {
            {"A", "POLYGON((0 0, 100 0, 100 100, 0 100, 0 0))"},
            {"B", "POLYGON((200 0, 300 0, 300 100, 200 100, 200 0))"},
            {"B", "POLYGON((400 0, 500 0, 500 100, 400 100, 400 0))"},
        };
        for (const auto &r : regions) {
            OGRFeatureUniquePtr feat(OGRFeature::CreateFeature(layer->GetLayerDefn()));
            feat->SetField("code", r.first);
            OGRGeometry *geom = nullptr;
            err = OGRGeometryFactory::createFromWkt(r.second, nullptr, &geom);
            assert(err == OGRERR_NONE);
            feat->SetGeometryDirectly(geom);
            err = layer->CreateFeature(feat.get());
            assert(err == OGRERR_NONE);
        }
    }

    OgrPolygonSource source(path, "regions", "code", 5514);
    Polygon a = load_polygon(source, "A");
    assert(a.id == "A");
    assert(PolygonFilter::contains(a, BoostPoint(50, 50)));
    assert(!PolygonFilter::contains(a, BoostPoint(250, 50)));
    assert(source.find_all("B").size() == 2);

    bool threw = false;
    try {
        load_polygon(source, "B");
    } catch (const ConfigurationError &) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        OgrPolygonSource(path, "regions", "name", 5514).find_all("A");
    } catch (const ConfigurationError &) {
        threw = true;
    }
    assert(threw);

    fs::remove_all(dir);
    std::cout << "  Polygon layer lookup test passed!" << std::endl;
}

int main() {
    try {
        test_round_trip();
        test_attribute_table();
        test_polygon_layer_lookup();

        std::cout << std::endl;
        std::cout << "All OGR store tests passed!" << std::endl;
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}

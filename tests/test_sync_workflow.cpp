#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "errors.h"
#include "sync_config.h"
#include "sync_workflow.h"

namespace fs = std::filesystem;
using namespace geosync;

// Square around the test wells, easting/northing in EPSG:5514.
static const char *kRegion =
    "POLYGON((-800000 -1100000, -700000 -1100000, -700000 -1000000, -800000 -1000000, -800000 -1100000))";

static fs::path make_data_folder(const std::string &name) {
    fs::path dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static void write_file(const fs::path &path, const std::string &content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

static SyncConfig memory_config(const fs::path &dataFolder, int retries = 1) {
    std::ostringstream json;
    json << R"({"data_folder": ")" << dataFolder.generic_string() << R"(",
        "backend": "memory", "crs": 5514, "commit_retries": )" << retries << R"(,
        "polygon_filter": {"polygon_id": "region", "wkt": {"region": ")" << kRegion << R"("}},
        "data_files": {
            "wells": {"id_column": "ID", "coordinates": {"X": "x", "Y": "y"}, "cache": false},
            "layers": {"id_column": "ID", "cache": false}
        }})";
    return parse_config(json.str());
}

static const UnitResult &unit(const RunSummary &summary, const std::string &name) {
    for (const auto &u : summary.units)
        if (u.name == name) return u;
    throw std::runtime_error("no unit " + name);
}

static const MemoryRecordStore &memory_store(SyncWorkflow &workflow, const std::string &table) {
    auto store = std::dynamic_pointer_cast<MemoryRecordStore>(workflow.stores().at(table));
    if (!store) throw std::runtime_error("not a memory store: " + table);
    return *store;
}

static const Record &stored_row(const Table &table, std::int64_t id) {
    for (const auto &r : table.rows)
        if (r.get("ID") == Value{id}) return r;
    throw std::runtime_error("no stored row " + std::to_string(id));
}

// Accepts reads, refuses every commit.
class RefusingStore : public RecordStore {
public:
    Table load_all(const std::string &) override { return Table{}; }
    void commit(const ReconciliationPlan &) override {
        ++attempts;
        throw StoreCommitError("disk full");
    }
    std::string describe() const override { return "refusing"; }

    int attempts = 0;
};

void test_run_pipeline() {
    std::cout << "Testing full run..." << std::endl;

    fs::path data = make_data_folder("geosync_test_workflow");
    write_file(data / "group1" / "wells.csv",
               "ID,X,Y,NAME\n"
               "1,-750000,-1050000,A\n"       // inside
               "2,-1060000,-760000,B\n"       // axes swapped, inside once corrected
               "3,-500000,-900000,C\n"        // outside the region
               "4,-900000,-900000,D\n");      // invalid either way
    write_file(data / "group1" / "layers.csv", "ID,DEPTH\n1,2.5\n2,4.0\n3,1.5\n");
    write_file(data / "group1" / "readme.txt", "not configured\n");
    write_file(data / "group2" / "layers.csv", "ID,DEPTH\n3,5.0\n9,1.0\n");

    SyncConfig config = memory_config(data);
    std::ostringstream sink;
    Logger log(sink, LogLevel::debug);
    SyncWorkflow workflow(config, log);

    std::vector<fs::path> plan = workflow.plan_group(data / "group1");
    assert(plan.size() == 2);
    assert(plan[0].stem() == "wells");
    assert(plan[1].stem() == "layers");
    assert(sink.str().find("No configuration for") != std::string::npos);

    RunSummary summary = workflow.run();
    assert(summary.units.size() == 2);
    assert(summary.failed() == 0);
    assert(summary.units[0].name == "group1/wells");

    const UnitResult &wells = unit(summary, "group1/wells");
    assert(wells.status == UnitStatus::ok);
    assert(wells.extracted == 4);
    assert(wells.dropped == 2);
    assert(wells.inserted == 2);

    const UnitResult &layers = unit(summary, "group1/layers");
    assert(layers.status == UnitStatus::ok);
    assert(layers.extracted == 3);
    assert(layers.dropped == 1);
    assert(layers.inserted == 2);

    // group2 holds no spatial file, so none of its files are synced
    for (const auto &u : summary.units) assert(u.name != "group2/layers");
    assert(sink.str().find("None of the files inside") != std::string::npos);

    const Table &storedWells = memory_store(workflow, "wells").table();
    assert(storedWells.size() == 2);
    const Record &corrected = stored_row(storedWells, 2);
    assert(*as_number(corrected.get("x")) == -760000.0);
    assert(*as_number(corrected.get("y")) == -1060000.0);
    assert(corrected.geometry && corrected.geometry->x() == -760000.0);
    assert(memory_store(workflow, "layers").table().size() == 2);

    // a second run over the same files only updates
    RunSummary again = workflow.run();
    assert(again.failed() == 0);
    assert(unit(again, "group1/wells").inserted == 0);
    assert(unit(again, "group1/wells").updated == 2);
    assert(unit(again, "group1/layers").updated == 2);
    assert(memory_store(workflow, "wells").table().size() == 2);
    assert(memory_store(workflow, "layers").table().size() == 2);

    std::ostringstream out;
    print_summary(again, out);
    assert(out.str().find("--- Sync Summary ---") != std::string::npos);
    assert(out.str().find("2 completed, 0 failed") != std::string::npos);

    fs::remove_all(data);
    std::cout << "  Full run test passed!" << std::endl;
}

void test_skip_existing() {
    std::cout << "Testing skip_existing..." << std::endl;

    fs::path data = make_data_folder("geosync_test_workflow_skip");
    write_file(data / "g" / "wells.csv", "ID,X,Y\n1,-750000,-1050000\n2,-760000,-1060000\n");

    SyncConfig config = memory_config(data);
    config.data_files.at("wells").skip_existing = true;
    std::ostringstream sink;
    Logger log(sink, LogLevel::info);
    SyncWorkflow workflow(config, log);

    Table seeded;
    seeded.columns = {"ID", "x", "y"};
    Record one;
    one.set("ID", Value{std::int64_t{1}});
    one.set("x", Value{std::int64_t{-1}});
    one.set("y", Value{std::int64_t{-2}});
    seeded.rows.push_back(one);
    workflow.stores()["wells"] = std::make_shared<MemoryRecordStore>(seeded);

    RunSummary summary = workflow.run();
    const UnitResult &wells = unit(summary, "g/wells");
    assert(wells.skipped == 1);
    assert(wells.inserted == 1);
    assert(wells.updated == 0);
    assert(*as_number(stored_row(memory_store(workflow, "wells").table(), 1).get("x")) == -1.0);

    fs::remove_all(data);
    std::cout << "  skip_existing test passed!" << std::endl;
}

void test_reversed_coordinate_labels() {
    std::cout << "Testing exchanged coordinate labels..." << std::endl;

    // Column "x" carries northings and "y" eastings.
    fs::path data = make_data_folder("geosync_test_workflow_labels");
    write_file(data / "g" / "wells.csv", "ID,x,y\n1,-1050000,-750000\n2,-1060000,-760000\n");

    SyncConfig config = memory_config(data);
    config.data_files.at("wells").coordinates = {{"x", "y"}, {"y", "x"}};
    std::ostringstream sink;
    Logger log(sink, LogLevel::debug);
    SyncWorkflow workflow(config, log);

    RunSummary summary = workflow.run();
    const UnitResult &wells = unit(summary, "g/wells");
    assert(wells.status == UnitStatus::ok);
    assert(wells.inserted == 2);
    assert(wells.dropped == 0);

    const Table &stored = memory_store(workflow, "wells").table();
    assert(stored.size() == 2);
    const Record &first = stored_row(stored, 1);
    assert(*as_number(first.get("x")) == -750000.0);
    assert(*as_number(first.get("y")) == -1050000.0);
    assert(*as_number(stored_row(stored, 2).get("x")) == -760000.0);
    assert(sink.str().find("Swapped coordinates") == std::string::npos);

    fs::remove_all(data);
    std::cout << "  Exchanged coordinate labels test passed!" << std::endl;
}

void test_change_flags_across_groups() {
    std::cout << "Testing change flags across groups..." << std::endl;

    fs::path data = make_data_folder("geosync_test_workflow_flags");
    write_file(data / "g1" / "wells.csv", "ID,X,Y\n1,-750000,-1050000\n2,-751000,-1051000\n");
    write_file(data / "g2" / "wells.csv",
               "ID,X,Y\n3,-752000,-1052000\n1,-753000,-1053000\n4,-754000,-1054000\n");

    SyncConfig config = memory_config(data);
    config.data_files.at("wells").flag_column = "last_modify";
    std::ostringstream sink;
    Logger log(sink, LogLevel::debug);
    SyncWorkflow workflow(config, log);

    RunSummary summary = workflow.run();
    assert(summary.failed() == 0);
    assert(unit(summary, "g1/wells").inserted == 2);
    assert(unit(summary, "g2/wells").inserted == 2);
    assert(unit(summary, "g2/wells").updated == 1);

    // only the last directory flags its last insert and its last update
    const Table &stored = memory_store(workflow, "wells").table();
    assert(stored.has_column("last_modify"));
    assert(stored.size() == 4);
    assert(stored_row(stored, 1).get("last_modify") == Value{std::int64_t{1}});
    assert(stored_row(stored, 2).get("last_modify") == Value{std::int64_t{0}});
    assert(stored_row(stored, 3).get("last_modify") == Value{std::int64_t{0}});
    assert(stored_row(stored, 4).get("last_modify") == Value{std::int64_t{1}});
    assert(*as_number(stored_row(stored, 1).get("x")) == -753000.0);

    fs::remove_all(data);
    std::cout << "  Change flags across groups test passed!" << std::endl;
}

void test_failure_isolation() {
    std::cout << "Testing per-unit failure isolation..." << std::endl;

    fs::path data = make_data_folder("geosync_test_workflow_fail");
    write_file(data / "a" / "wells.csv", "ID,X,NAME\n1,-750000,A\n");   // no Y column
    write_file(data / "a" / "layers.csv", "ID,DEPTH\n1,2.5\n");
    write_file(data / "b" / "wells.csv", "ID,X,Y\n5,-750000,-1050000\n");
    write_file(data / "b" / "layers.csv", "ID,DEPTH\n5,2.5\n");

    SyncConfig config = memory_config(data, 2);
    std::ostringstream sink;
    Logger log(sink, LogLevel::debug);

    auto refusing = std::make_shared<RefusingStore>();
    BackendFactory factory = [refusing](const SyncConfig &c, const SourceConfig &s, Logger &l, StoreCache &stores) {
        if (s.name == "layers") stores[s.table] = refusing;
        return make_backend(c, s, l, stores);
    };
    SyncWorkflow workflow(config, log, factory);
    RunSummary summary = workflow.run();

    assert(summary.units.size() == 4);
    assert(summary.failed() == 2);

    const UnitResult &broken = unit(summary, "a/wells");
    assert(broken.status == UnitStatus::failed);
    assert(broken.message.find("schema error") != std::string::npos);

    // related rows of a failed spatial file are not stored on their own
    assert(unit(summary, "a/layers").status == UnitStatus::no_data);

    const UnitResult &good = unit(summary, "b/wells");
    assert(good.status == UnitStatus::ok);
    assert(good.inserted == 1);

    const UnitResult &refused = unit(summary, "b/layers");
    assert(refused.status == UnitStatus::failed);
    assert(refused.attempts == 3);
    assert(refusing->attempts == 3);
    assert(refused.message.find("commit failed") != std::string::npos);
    assert(sink.str().find("reloading and retrying") != std::string::npos);

    std::ostringstream out;
    print_summary(summary, out);
    assert(out.str().find("FAILED") != std::string::npos);
    assert(out.str().find("2 completed, 2 failed") != std::string::npos);

    SyncConfig missing = memory_config(data / "nowhere");
    SyncWorkflow nowhere(missing, log);
    bool threw = false;
    try {
        nowhere.run();
    } catch (const ConfigurationError &) {
        threw = true;
    }
    assert(threw);

    fs::remove_all(data);
    std::cout << "  Failure isolation test passed!" << std::endl;
}

int main() {
    try {
        test_run_pipeline();
        test_skip_existing();
        test_reversed_coordinate_labels();
        test_change_flags_across_groups();
        test_failure_isolation();

        std::cout << std::endl;
        std::cout << "All workflow tests passed!" << std::endl;
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}

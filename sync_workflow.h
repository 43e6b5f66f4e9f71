#pragma once
#include <filesystem>
#include <iosfwd>
#include <set>
#include <string>
#include <vector>

#include "backend.h"
#include "reconciliation.h"
#include "sync_config.h"
#include "sync_log.h"

namespace geosync {

enum class UnitStatus { ok, no_data, failed };

const char *unit_status_name(UnitStatus status);

// Outcome of one file.
struct UnitResult {
    std::string name;
    UnitStatus status = UnitStatus::ok;
    size_t extracted = 0;
    size_t dropped = 0;     // invalid coordinates, outside the region, unrelated keys
    size_t inserted = 0;
    size_t updated = 0;
    size_t promoted = 0;
    size_t skipped = 0;     // already stored, dropped by skip_existing
    size_t attempts = 0;
    std::string message;
    double duration_seconds = 0.0;
};

// Keys seen by the spatial units of one directory. Once a spatial unit has
// run, related files of the same directory keep only rows with these keys.
struct GroupState {
    bool gated = false;
    bool last = false;      // last directory of the walk; decides change flags
    std::set<std::string> keys;
};

struct RunSummary {
    std::vector<UnitResult> units;

    size_t failed() const;
    size_t succeeded() const { return units.size() - failed(); }
};

void print_summary(const RunSummary &summary, std::ostream &out);

/*
 * Drives extract -> transform -> validate -> filter -> reconcile -> commit for
 * every configured file under the data folder. Each sub-directory is one
 * group: spatial files run first and their keys gate the related files.
 * A failing unit is recorded and the run moves on.
 */
class SyncWorkflow {
public:
    SyncWorkflow(const SyncConfig &config, Logger &log, BackendFactory factory = make_backend);

    RunSummary run();

    // One directory. Files are ordered, unconfigured ones skipped. A directory
    // whose files are all non-spatial is skipped as a whole.
    std::vector<UnitResult> run_group(const std::filesystem::path &dir, bool last = false);

    // Configured files of `dir` in processing order.
    std::vector<std::filesystem::path> plan_group(const std::filesystem::path &dir) const;

    // Never throws for data or store problems; they end up in the result.
    UnitResult run_unit(const std::filesystem::path &file, const SourceConfig &source,
                        GroupState &group);

    // Validates, swaps mislabelled coordinates and keeps the records inside the region.
    Table spatial_filter(Backend &backend, const Table &table, size_t &dropped) const;

    StoreCache &stores() { return stores_; }

private:
    void process(Backend &backend, const std::filesystem::path &file, const SourceConfig &source,
                 GroupState &group, UnitResult &result);
    void reconcile_and_commit(Backend &backend, const Table &incoming, const SourceConfig &source,
                              bool lastGroup, UnitResult &result);

    const SyncConfig &config_;
    Logger &log_;
    BackendFactory factory_;
    ReconciliationEngine engine_;
    StoreCache stores_;
};

} // namespace geosync

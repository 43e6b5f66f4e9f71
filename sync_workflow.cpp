#include "sync_workflow.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <map>

#include "errors.h"
#include "extractors.h"
#include "timing.h"

namespace fs = std::filesystem;

namespace geosync {

namespace {

int sort_rank(const SourceConfig &source) {
    return source.spatial() ? 0 : std::max(1, source.file_order);
}

std::string unit_name(const fs::path &root, const fs::path &file) {
    std::error_code ec;
    fs::path rel = fs::relative(file, root, ec);
    if (ec || rel.empty()) rel = file;
    return rel.replace_extension().generic_string();
}

} // namespace

const char *unit_status_name(UnitStatus status) {
    switch (status) {
        case UnitStatus::ok:      return "ok";
        case UnitStatus::no_data: return "no data";
        case UnitStatus::failed:  return "FAILED";
    }
    return "?";
}

size_t RunSummary::failed() const {
    return std::count_if(units.begin(), units.end(),
                         [](const UnitResult &u) { return u.status == UnitStatus::failed; });
}

void print_summary(const RunSummary &summary, std::ostream &out) {
    double total = 0.0;
    out << "\n--- Sync Summary ---\n";
    for (const auto &u : summary.units) {
        out << u.name << ": " << unit_status_name(u.status) << ", "
            << u.extracted << " extracted, "
            << u.dropped << " dropped, "
            << u.inserted << " inserted, "
            << u.updated << " updated, took "
            << std::fixed << std::setprecision(3) << u.duration_seconds << " seconds";
        if (u.promoted) out << " (" << u.promoted << " unmatched occurrences inserted)";
        if (u.skipped) out << " (" << u.skipped << " already stored)";
        if (!u.message.empty()) out << " - " << u.message;
        out << std::endl;
        total += u.duration_seconds;
    }
    out << "Overall: " << summary.units.size() << " files, " << summary.succeeded()
        << " completed, " << summary.failed() << " failed.\n";
    out << "Total sync time: " << total << " seconds" << std::endl;
}

SyncWorkflow::SyncWorkflow(const SyncConfig &config, Logger &log, BackendFactory factory)
    : config_(config), log_(log), factory_(std::move(factory)), engine_(log) {}

RunSummary SyncWorkflow::run() {
    const fs::path root(config_.data_folder);
    if (!fs::is_directory(root))
        throw ConfigurationError("Data folder " + root.string() + " does not exist");

    std::vector<fs::path> dirs{root};
    for (const auto &entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_directory()) dirs.push_back(entry.path());
    }
    std::sort(dirs.begin() + 1, dirs.end());

    RunSummary summary;
    for (const auto &dir : dirs) {
        std::vector<UnitResult> results = run_group(dir, dir == dirs.back());
        summary.units.insert(summary.units.end(), results.begin(), results.end());
    }
    log_.info("sync", "Processed " + std::to_string(summary.units.size()) + " files, " +
                      std::to_string(summary.failed()) + " failed");
    return summary;
}

std::vector<fs::path> SyncWorkflow::plan_group(const fs::path &dir) const {
    // A CSV and its parquet cache share a stem; the extractor picks the file.
    std::map<std::string, fs::path> stems;
    std::set<std::string> unknown;
    for (const auto &entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        const std::string stem = entry.path().stem().string();
        if (stems.count(stem) || unknown.count(stem)) continue;
        if (!config_.find_source(stem)) {
            log_.warning("sync", "No configuration for " + entry.path().string() + ", skipping");
            unknown.insert(stem);
            continue;
        }
        stems[stem] = entry.path();
    }

    std::vector<fs::path> files;
    for (const auto &kv : stems) files.push_back(kv.second);
    std::stable_sort(files.begin(), files.end(), [this](const fs::path &a, const fs::path &b) {
        return sort_rank(*config_.find_source(a.stem().string())) <
               sort_rank(*config_.find_source(b.stem().string()));
    });
    return files;
}

std::vector<UnitResult> SyncWorkflow::run_group(const fs::path &dir, bool last) {
    std::vector<UnitResult> results;
    const std::vector<fs::path> files = plan_group(dir);
    if (files.empty()) return results;

    // Spatial files sort first, so a group led by a plain table has no spatial file at all.
    if (!config_.find_source(files.front().stem().string())->spatial()) {
        log_.debug("sync", "None of the files inside " + dir.string() +
                           " have specified coordinate columns, skipping");
        return results;
    }

    log_.info("sync", "Processing " + std::to_string(files.size()) + " files in " + dir.string());
    GroupState group;
    group.last = last;
    for (const auto &file : files) {
        const SourceConfig &source = *config_.find_source(file.stem().string());
        results.push_back(run_unit(file, source, group));
    }
    return results;
}

UnitResult SyncWorkflow::run_unit(const fs::path &file, const SourceConfig &source, GroupState &group) {
    UnitResult result;
    result.name = unit_name(config_.data_folder, file);

    auto [status, dur] = measure_duration([&]() {
        try {
            std::unique_ptr<Backend> backend = factory_(config_, source, log_, stores_);
            process(*backend, file, source, group, result);
            return result.status;
        } catch (const SchemaError &e) {
            result.message = std::string("schema error: ") + e.what();
        } catch (const ConfigurationError &e) {
            result.message = std::string("configuration error: ") + e.what();
        } catch (const StoreCommitError &e) {
            result.message = std::string("commit failed: ") + e.what();
        } catch (const ExtractError &e) {
            result.message = std::string("extract failed: ") + e.what();
        } catch (const std::exception &e) {
            result.message = e.what();
        }
        log_.warning("sync", "Processing of " + result.name + " failed: " + result.message);
        return UnitStatus::failed;
    });
    result.status = status;
    result.duration_seconds = dur;
    return result;
}

void SyncWorkflow::process(Backend &backend, const fs::path &file, const SourceConfig &source,
                           GroupState &group, UnitResult &result) {
    log_.info("sync", "Processing " + result.name);

    // Keys already stored for a spatial table count as related even when the file brings nothing new.
    std::set<std::string> storedKeys;
    if (source.spatial()) {
        group.gated = true;
        Table stored = backend.store().load_all(source.id_column);
        for (const auto &row : stored.rows) storedKeys.insert(key_text(row.get(source.id_column)));
        group.keys.insert(storedKeys.begin(), storedKeys.end());
    }

    Table table = transform(backend.extract(file), source.extract, log_);
    result.extracted = table.size();
    if (table.empty()) {
        result.status = UnitStatus::no_data;
        result.message = "no new data";
        log_.info("sync", "No new data in " + result.name);
        return;
    }
    if (!table.has_column(source.id_column))
        throw SchemaError("Key column '" + source.id_column + "' not found in " + result.name);

    if (source.spatial()) {
        for (const auto &kv : source.coordinates) {
            if (!table.has_column(kv.first))
                throw SchemaError("Coordinate column '" + kv.first + "' not found");
        }
        rename_columns(table, source.coordinates);

        if (source.skip_existing && !storedKeys.empty()) {
            std::vector<Record> fresh;
            for (auto &row : table.rows) {
                if (!storedKeys.count(key_text(row.get(source.id_column)))) fresh.push_back(std::move(row));
            }
            result.skipped = table.size() - fresh.size();
            table.rows = std::move(fresh);
            log_.info("sync", std::to_string(result.skipped) + " records of " + result.name +
                              " are already stored, skipping them");
        }

        table = spatial_filter(backend, table, result.dropped);
        for (const auto &row : table.rows) group.keys.insert(key_text(row.get(source.id_column)));
    } else if (group.gated) {
        const size_t before = table.size();
        std::vector<Record> related;
        for (auto &row : table.rows) {
            if (group.keys.count(key_text(row.get(source.id_column)))) related.push_back(std::move(row));
        }
        table.rows = std::move(related);
        result.dropped = before - table.size();
        if (result.dropped) {
            log_.debug("sync", "Dropped " + std::to_string(result.dropped) + " records of " + result.name +
                               " without a related spatial record");
        }
    }

    if (table.empty()) {
        result.status = UnitStatus::no_data;
        result.message = "nothing left to store";
        return;
    }
    reconcile_and_commit(backend, table, source, group.last, result);
    result.status = UnitStatus::ok;
}

Table SyncWorkflow::spatial_filter(Backend &backend, const Table &table, size_t &dropped) const {
    if (!config_.polygon_filter) throw ConfigurationError("No polygon_filter configured");
    const std::string &polygonId = config_.polygon_filter->polygon_id;

    const GeometryFactory &geometry = backend.geometry();
    if (!table.has_column(geometry.x_column()) || !table.has_column(geometry.y_column()))
        throw SchemaError("Coordinate columns '" + geometry.x_column() + "' and '" +
                          geometry.y_column() + "' are required");

    GeoValidation first = backend.validate_geometry(geometry.with_geometry(table.rows));
    Table out;
    out.columns = table.columns;
    out.rows = backend.filter_by_polygon(first.valid, polygonId);

    if (!first.invalid.empty()) {
        GeoValidation second = backend.validate_geometry(backend.swap_xy(first.invalid));
        log_.info("sync", "Swapped coordinates of " + std::to_string(first.invalid.size()) +
                          " records, " + std::to_string(second.invalid.size()) + " still invalid");
        std::vector<Record> rescued = backend.filter_by_polygon(second.valid, polygonId);
        for (auto &r : rescued) out.rows.push_back(std::move(r));
    }

    dropped = table.size() - out.size();
    if (dropped) {
        log_.info("sync", "Dropped " + std::to_string(dropped) + " records with invalid coordinates "
                          "or outside polygon " + polygonId);
    }
    return out;
}

void SyncWorkflow::reconcile_and_commit(Backend &backend, const Table &incoming,
                                        const SourceConfig &source, bool lastGroup, UnitResult &result) {
    for (int attempt = 0;; ++attempt) {
        result.attempts = attempt + 1;
        Table persisted = backend.store().load_all(source.id_column);
        ReconciliationPlan plan = engine_.reconcile(persisted, incoming, source.id_column);
        if (!source.flag_column.empty()) set_change_flags(plan, source.flag_column, lastGroup);
        try {
            backend.store().commit(plan);
            result.inserted = plan.insert_set.size();
            result.updated = plan.update_count();
            result.promoted = plan.promoted;
            return;
        } catch (const StoreCommitError &e) {
            if (attempt >= config_.commit_retries) throw;
            log_.warning("sync", std::string("Commit to ") + backend.store().describe() + " failed (" +
                                 e.what() + "), reloading and retrying");
        }
    }
}

} // namespace geosync

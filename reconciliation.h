#pragma once
#include <string>
#include <vector>

#include "column_merger.h"
#include "record.h"
#include "sync_log.h"

namespace geosync {

// What one reconciliation call asks the store to do. Applied all or nothing.
struct ReconciliationPlan {
    std::string key;
    Table insert_set;                // union schema: stored columns, then new ones
    Table update_set;                // incoming rows whose key is already stored
    std::vector<bool> update_mask;   // one entry per stored row
    Table merged;                    // replacement rows, aligned with update_mask
    MergeMode mode = MergeMode::key_only;
    size_t promoted = 0;             // unmatched occurrences moved to insert_set

    size_t update_count() const;
};

// Writes 0/1 into `flag_column` of every inserted and updated row. Outside the
// last group all flags are 0; in the last group a row is flagged 1 when its key
// equals the key of the last row of its set (inserts and updates separately).
void set_change_flags(ReconciliationPlan &plan, const std::string &flag_column, bool last_group);

/*
 * Splits an incoming batch against the stored table:
 *   classify -> merge -> reclassify unmatched occurrences -> emit.
 * Every incoming row ends in exactly one of insert_set / update_set.
 */
class ReconciliationEngine {
public:
    explicit ReconciliationEngine(Logger &log) : log_(log), merger_(log) {}

    // Throws SchemaError when the key column is missing from either table.
    // A stored table without columns and rows means "nothing stored yet".
    ReconciliationPlan reconcile(const Table &persisted, const Table &incoming,
                                 const std::string &key) const;

private:
    Logger &log_;
    ColumnMerger merger_;
};

} // namespace geosync

#pragma once
#include <string>

#include "reconciliation.h"
#include "record.h"

namespace geosync {

// Durable table a reconciliation plan is committed into.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    // Current committed state, or an empty table when nothing is stored yet.
    virtual Table load_all(const std::string &key_column) = 0;

    // Applies inserts, masked updates and new columns as one transaction.
    // Throws StoreCommitError; on failure nothing of the plan is visible.
    virtual void commit(const ReconciliationPlan &plan) = 0;

    virtual std::string describe() const = 0;
};

// State after applying `plan` to `current`. Throws StoreCommitError when the
// plan was computed against a different number of stored rows.
Table apply_plan(const Table &current, const ReconciliationPlan &plan);

// Store held in memory; used for dry runs and tests.
class MemoryRecordStore : public RecordStore {
public:
    MemoryRecordStore() = default;
    explicit MemoryRecordStore(Table initial) : table_(std::move(initial)) {}

    Table load_all(const std::string &key_column) override;
    void commit(const ReconciliationPlan &plan) override;
    std::string describe() const override { return "memory"; }

    const Table &table() const { return table_; }
    size_t commits() const { return commits_; }

private:
    Table table_;
    size_t commits_ = 0;
};

} // namespace geosync

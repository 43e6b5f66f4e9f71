#include "record_store.h"

#include "errors.h"

namespace geosync {

Table apply_plan(const Table &current, const ReconciliationPlan &plan) {
    if (plan.update_mask.size() != current.size()) {
        throw StoreCommitError("Update mask covers " + std::to_string(plan.update_mask.size()) +
                               " rows but the store holds " + std::to_string(current.size()) +
                               "; plan is stale.");
    }
    if (plan.update_count() > 0 && plan.merged.size() != current.size()) {
        throw StoreCommitError("Merged rows do not line up with the stored rows.");
    }

    Table next;
    next.columns = union_columns(current.columns, plan.merged.columns);
    next.columns = union_columns(next.columns, plan.insert_set.columns);
    next.rows.reserve(current.size() + plan.insert_set.size());
    for (size_t i = 0; i < current.size(); ++i)
        next.rows.push_back(plan.update_mask[i] ? plan.merged.rows[i] : current.rows[i]);
    for (const auto &row : plan.insert_set.rows)
        next.rows.push_back(row);
    return next;
}

Table MemoryRecordStore::load_all(const std::string &key_column) {
    if (!table_.columns.empty() && !table_.has_column(key_column))
        throw SchemaError("Key column '" + key_column + "' missing from stored data.");
    return table_;
}

void MemoryRecordStore::commit(const ReconciliationPlan &plan) {
    Table next = apply_plan(table_, plan);
    table_.columns.swap(next.columns);
    table_.rows.swap(next.rows);
    ++commits_;
}

} // namespace geosync

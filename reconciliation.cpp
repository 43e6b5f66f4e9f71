#include "reconciliation.h"
#include <algorithm>
#include <unordered_set>

#include "errors.h"

namespace geosync {

size_t ReconciliationPlan::update_count() const {
    return static_cast<size_t>(std::count(update_mask.begin(), update_mask.end(), true));
}

ReconciliationPlan ReconciliationEngine::reconcile(const Table &persisted, const Table &incoming,
                                                   const std::string &key) const {
    const bool nothingStored = persisted.columns.empty() && persisted.rows.empty();
    if (!incoming.has_column(key))
        throw SchemaError("Key column '" + key + "' missing from incoming data.");
    if (!nothingStored && !persisted.has_column(key))
        throw SchemaError("Key column '" + key + "' missing from stored data.");

    Table in = incoming;
    normalize_nulls(in);

    ReconciliationPlan plan;
    plan.key = key;
    plan.insert_set.columns = union_columns(persisted.columns, in.columns);
    plan.update_set.columns = in.columns;

    // classify
    std::unordered_set<std::string> storedKeys;
    for (const auto &row : persisted.rows) {
        const Value &k = row.get(key);
        if (!is_absent(k)) storedKeys.insert(key_text(k));
    }

    std::vector<bool> toInsert(in.size(), true);
    std::vector<size_t> updateOrigin;   // update_set row -> incoming row
    std::unordered_set<std::string> updateKeys;
    size_t absentKeys = 0;
    for (size_t i = 0; i < in.size(); ++i) {
        const Value &k = in.rows[i].get(key);
        if (is_absent(k)) {
            ++absentKeys;
            continue;
        }
        const std::string kt = key_text(k);
        if (storedKeys.count(kt)) {
            toInsert[i] = false;
            updateOrigin.push_back(i);
            updateKeys.insert(kt);
        }
    }
    if (absentKeys > 0)
        log_.warning("reconcile", std::to_string(absentKeys) + " incoming rows without " + key +
                                  " are treated as new entries");

    Table candidates = in.schema_only();
    for (size_t i : updateOrigin) candidates.rows.push_back(in.rows[i]);

    plan.update_mask.reserve(persisted.size());
    for (const auto &row : persisted.rows) {
        const Value &k = row.get(key);
        plan.update_mask.push_back(!is_absent(k) && updateKeys.count(key_text(k)) != 0);
    }

    // merge
    if (!nothingStored) {
        MergeResult merged = merger_.merge(persisted, candidates, key);
        plan.mode = merged.mode;
        plan.merged = std::move(merged.merged);

        // reclassify unmatched occurrences
        for (size_t j : merged.unmatched) toInsert[updateOrigin[j]] = true;
        plan.promoted = merged.unmatched.size();
        plan.insert_set.columns = union_columns(plan.merged.columns, in.columns);
    }

    // emit, incoming order on both sides
    for (size_t i = 0; i < in.size(); ++i) {
        if (toInsert[i])
            plan.insert_set.rows.push_back(in.rows[i]);
        else
            plan.update_set.rows.push_back(in.rows[i]);
    }

    log_.debug("reconcile", std::to_string(in.size()) + " incoming: " +
                            std::to_string(plan.insert_set.size()) + " to insert (" +
                            std::to_string(plan.promoted) + " promoted), " +
                            std::to_string(plan.update_set.size()) + " updating " +
                            std::to_string(plan.update_count()) + " stored rows, merge by " +
                            merge_mode_name(plan.mode));
    return plan;
}

void set_change_flags(ReconciliationPlan &plan, const std::string &flag_column, bool last_group) {
    const std::string &key = plan.key;
    auto flagger = [&](const Table &set) {
        std::string lastKey;
        if (last_group && !set.empty()) lastKey = key_text(set.rows.back().get(key));
        return [last_group, lastKey, &key](const Record &row) {
            const bool on = last_group && !lastKey.empty() && key_text(row.get(key)) == lastKey;
            return Value{std::int64_t{on ? 1 : 0}};
        };
    };

    const auto insertFlag = flagger(plan.insert_set);
    plan.insert_set.add_column(flag_column);
    for (auto &row : plan.insert_set.rows) row.set(flag_column, insertFlag(row));

    if (plan.update_set.empty()) return;
    const auto updateFlag = flagger(plan.update_set);
    plan.update_set.add_column(flag_column);
    for (auto &row : plan.update_set.rows) row.set(flag_column, updateFlag(row));

    plan.merged.add_column(flag_column);
    for (size_t i = 0; i < plan.merged.size() && i < plan.update_mask.size(); ++i) {
        if (plan.update_mask[i]) plan.merged.rows[i].set(flag_column, updateFlag(plan.merged.rows[i]));
    }
}

} // namespace geosync

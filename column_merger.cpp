#include "column_merger.h"
#include <map>
#include <unordered_map>
#include <unordered_set>

namespace geosync {

namespace {

void overwrite_shared(Record &target, const Record &source, const std::vector<std::string> &shared) {
    for (const auto &col : shared) {
        const Value &v = source.get(col);
        if (!is_absent(v)) target.set(col, v);
    }
    if (source.geometry) target.geometry = source.geometry;
}

} // namespace

const char *merge_mode_name(MergeMode mode) {
    return mode == MergeMode::key_only ? "key" : "key+occurrence";
}

std::vector<size_t> occurrence_indices(const Table &table, const std::string &key) {
    std::unordered_map<std::string, size_t> seen;
    size_t absentRank = 0;
    std::vector<size_t> out;
    out.reserve(table.size());
    for (const auto &row : table.rows) {
        const Value &k = row.get(key);
        if (is_absent(k)) {
            out.push_back(absentRank++);
            continue;
        }
        out.push_back(seen[key_text(k)]++);
    }
    return out;
}

bool keys_unique(const Table &table, const std::string &key) {
    std::unordered_set<std::string> seen;
    for (const auto &row : table.rows) {
        const Value &k = row.get(key);
        if (is_absent(k)) continue;
        if (!seen.insert(key_text(k)).second) return false;
    }
    return true;
}

ColumnSplit ColumnMerger::split_columns(const Table &persisted, const Table &candidates,
                                        const std::string &key) const {
    ColumnSplit split;
    for (const auto &col : candidates.columns) {
        if (col == key) continue;
        if (persisted.has_column(col))
            split.shared.push_back(col);
        else
            split.added.push_back(col);
    }
    return split;
}

MergeResult ColumnMerger::merge(const Table &persisted, const Table &candidates,
                                const std::string &key) const {
    Table base = persisted;
    Table cand = candidates;
    normalize_nulls(base);
    normalize_nulls(cand);

    MergeResult result;
    result.split = split_columns(base, cand, key);
    result.mode = (keys_unique(base, key) && keys_unique(cand, key))
                      ? MergeMode::key_only
                      : MergeMode::key_occurrence;

    // Shared columns.
    if (result.mode == MergeMode::key_only) {
        std::unordered_map<std::string, size_t> rowOf;
        for (size_t i = 0; i < base.size(); ++i) {
            const Value &k = base.rows[i].get(key);
            if (!is_absent(k)) rowOf[key_text(k)] = i;
        }
        for (size_t j = 0; j < cand.size(); ++j) {
            const Value &k = cand.rows[j].get(key);
            auto it = is_absent(k) ? rowOf.end() : rowOf.find(key_text(k));
            if (it == rowOf.end()) {
                result.unmatched.push_back(j);
                continue;
            }
            overwrite_shared(base.rows[it->second], cand.rows[j], result.split.shared);
        }
    } else {
        const std::vector<size_t> baseOcc = occurrence_indices(base, key);
        const std::vector<size_t> candOcc = occurrence_indices(cand, key);

        std::map<std::pair<std::string, size_t>, size_t> rowOf;
        for (size_t i = 0; i < base.size(); ++i) {
            const Value &k = base.rows[i].get(key);
            if (!is_absent(k)) rowOf[{key_text(k), baseOcc[i]}] = i;
        }
        for (size_t j = 0; j < cand.size(); ++j) {
            const Value &k = cand.rows[j].get(key);
            auto it = is_absent(k) ? rowOf.end() : rowOf.find({key_text(k), candOcc[j]});
            if (it == rowOf.end()) {
                result.unmatched.push_back(j);
                continue;
            }
            overwrite_shared(base.rows[it->second], cand.rows[j], result.split.shared);
        }
        if (!result.unmatched.empty()) {
            log_.debug("merge", std::to_string(result.unmatched.size()) +
                                " candidate occurrences have no stored counterpart");
        }
    }

    // New columns are entity level: joined on the key alone, first occurrence wins.
    if (!result.split.added.empty()) {
        std::unordered_map<std::string, size_t> firstOf;
        bool repeated = false;
        for (size_t j = 0; j < cand.size(); ++j) {
            const Value &k = cand.rows[j].get(key);
            if (is_absent(k)) continue;
            if (!firstOf.emplace(key_text(k), j).second) repeated = true;
        }
        if (repeated) {
            log_.warning("merge", "Multiple entries with the same " + key +
                                  " carry new columns; only the first is joined. "
                                  "Consider storing these entries in a separate table.");
        }
        for (auto &row : base.rows) {
            const Value &k = row.get(key);
            auto it = is_absent(k) ? firstOf.end() : firstOf.find(key_text(k));
            for (const auto &col : result.split.added) {
                row.set(col, it == firstOf.end() ? Value{} : cand.rows[it->second].get(col));
            }
        }
        for (const auto &col : result.split.added) base.add_column(col);
    }

    result.merged = std::move(base);
    return result;
}

} // namespace geosync

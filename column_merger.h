#pragma once
#include <string>
#include <vector>

#include "record.h"
#include "sync_log.h"

namespace geosync {

struct ColumnSplit {
    std::vector<std::string> shared;  // in both schemas, key excluded
    std::vector<std::string> added;   // only in the candidates
};

enum class MergeMode {
    key_only,        // every key unique on both sides
    key_occurrence   // keys repeat; rows pair up by (key, occurrence index)
};

struct MergeResult {
    Table merged;                   // every persisted row, in persisted order
    std::vector<size_t> unmatched;  // candidate rows with no persisted counterpart
    MergeMode mode = MergeMode::key_only;
    ColumnSplit split;
};

const char *merge_mode_name(MergeMode mode);

// Rank of each row among the rows sharing its key, in table order.
// Rows with an absent key get their own rank sequence and never match.
std::vector<size_t> occurrence_indices(const Table &table, const std::string &key);

// True when no non-absent key value appears twice.
bool keys_unique(const Table &table, const std::string &key);

/*
 * Folds a batch of update candidates into the persisted rows.
 *
 * Shared columns are overwritten from the candidates (an absent candidate
 * value leaves the persisted value alone). New columns are left-joined on
 * the key. With repeated keys the shared columns pair up by occurrence and
 * any candidate occurrence that has no persisted row is reported back in
 * `unmatched` so the caller can insert it.
 */
class ColumnMerger {
public:
    explicit ColumnMerger(Logger &log) : log_(log) {}

    ColumnSplit split_columns(const Table &persisted, const Table &candidates,
                              const std::string &key) const;

    MergeResult merge(const Table &persisted, const Table &candidates,
                      const std::string &key) const;

private:
    Logger &log_;
};

} // namespace geosync

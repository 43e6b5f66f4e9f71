#pragma once
#include <stdexcept>
#include <string>

namespace geosync {

// Base of every failure raised by the sync core.
struct SyncError : std::runtime_error {
    explicit SyncError(const std::string &what) : std::runtime_error(what) {}
};

// Missing key or coordinate column. Fatal to the current batch.
struct SchemaError : SyncError {
    explicit SchemaError(const std::string &what) : SyncError(what) {}
};

// Ambiguous or invalid setup (polygon lookup, CRS mismatch, config file).
struct ConfigurationError : SyncError {
    explicit ConfigurationError(const std::string &what) : SyncError(what) {}
};

// Atomic commit failed; nothing from the plan was applied.
struct StoreCommitError : SyncError {
    explicit StoreCommitError(const std::string &what) : SyncError(what) {}
};

// Source file could not be read or parsed.
struct ExtractError : SyncError {
    explicit ExtractError(const std::string &what) : SyncError(what) {}
};

} // namespace geosync

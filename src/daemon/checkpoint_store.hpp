#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "common/models.hpp"

namespace contmon {

// CheckpointStore is the SQLite access layer for the monitor's durable state:
// the last seen boot id and the highest ring-buffer timestamp already reported.
class CheckpointStore {
public:
    // Opens (and creates if needed) <stateDir>/checkpoint.db. Throws when the
    // directory cannot be created or the database cannot be opened.
    explicit CheckpointStore(const std::filesystem::path &stateDir = defaultStateDir());
    ~CheckpointStore();

    CheckpointStore(const CheckpointStore &) = delete;
    CheckpointStore &operator=(const CheckpointStore &) = delete;

    // Never throws; missing or unreadable values come back as defaults.
    Checkpoint load() const;

    // Writes both values in one transaction. Throws std::runtime_error on failure.
    void save(const Checkpoint &checkpoint);

    std::filesystem::path databasePath() const;

    // $HOME/.continuous_monitor
    static std::filesystem::path defaultStateDir();

private:
    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace contmon

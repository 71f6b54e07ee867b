#include "daemon/checkpoint_store.hpp"

#include <cstdlib>
#include <stdexcept>

#include <sqlite3.h>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace contmon {

namespace {

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr const char *kBootIdKey = "boot_id";
constexpr const char *kLastLogOffsetKey = "last_log_offset";

// Waits out a concurrent monitor holding the write lock instead of failing at once.
constexpr int kBusyTimeoutMs = 2000;

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ")
                                     + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

} // namespace

struct CheckpointStore::Impl {
    sqlite3 *db = nullptr;
    std::filesystem::path dbPath;
};

CheckpointStore::CheckpointStore(const std::filesystem::path &stateDir)
    : impl(std::make_unique<Impl>())
{
    std::filesystem::create_directories(stateDir);

    impl->dbPath = stateDir / "checkpoint.db";
    if (sqlite3_open(impl->dbPath.string().c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db)
                                             : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw std::runtime_error("failed to open checkpoint database "
                                 + impl->dbPath.string() + ": " + message);
    }

    sqlite3_busy_timeout(impl->db, kBusyTimeoutMs);

    try {
        execOrThrow(impl->db, kCreateMetaTable);
    } catch (const std::exception &) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw;
    }
}

CheckpointStore::~CheckpointStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
    }
}

std::filesystem::path CheckpointStore::defaultStateDir()
{
    const char *home = std::getenv("HOME");
    std::filesystem::path basePath = home ? home : ".";
    return basePath / ".continuous_monitor";
}

std::filesystem::path CheckpointStore::databasePath() const
{
    return impl->dbPath;
}

Checkpoint CheckpointStore::load() const
{
    Checkpoint checkpoint;

    try {
        if (const auto bootId = getMeta(kBootIdKey)) {
            checkpoint.bootId = *bootId;
        }

        if (const auto offsetText = getMeta(kLastLogOffsetKey)) {
            const auto offset = parseBootOffset(*offsetText);
            if (offset.has_value()) {
                checkpoint.lastLogOffset = *offset;
            } else {
                CMLOG_WARN(QStringLiteral("CheckpointStore"),
                           QStringLiteral("load"),
                           QStringLiteral("checkpoint_offset_invalid"),
                           QStringLiteral("unparsable_value"),
                           QString(),
                           (nlohmann::json{{"value", *offsetText}}));
            }
        }
    } catch (const std::exception &ex) {
        CMLOG_WARN(QStringLiteral("CheckpointStore"),
                   QStringLiteral("load"),
                   QStringLiteral("checkpoint_load_failed"),
                   QString::fromUtf8(ex.what()),
                   QString(),
                   (nlohmann::json{{"db", impl->dbPath.string()}}));
        return Checkpoint{};
    }

    return checkpoint;
}

void CheckpointStore::save(const Checkpoint &checkpoint)
{
    execOrThrow(impl->db, "BEGIN IMMEDIATE;");
    try {
        setMeta(kBootIdKey, checkpoint.bootId);
        setMeta(kLastLogOffsetKey, formatBootOffset(checkpoint.lastLogOffset));
        execOrThrow(impl->db, "COMMIT;");
    } catch (const std::exception &) {
        sqlite3_exec(impl->db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }

    CMLOG_DEBUG(QStringLiteral("CheckpointStore"),
                QStringLiteral("save"),
                QStringLiteral("checkpoint_saved"),
                QString(),
                QString(),
                nlohmann::json(checkpoint));
}

std::optional<std::string> CheckpointStore::getMeta(const std::string &key) const
{
    Statement stmt(impl->db,
                   "SELECT value FROM meta WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw std::runtime_error(std::string("failed to read meta value: ")
                                 + sqlite3_errmsg(impl->db));
    }

    return columnText(stmt.get(), 0);
}

void CheckpointStore::setMeta(const std::string &key, const std::string &value)
{
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error(std::string("failed to set meta value: ")
                                 + sqlite3_errmsg(impl->db));
    }
}

} // namespace contmon

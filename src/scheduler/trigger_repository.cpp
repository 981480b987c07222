#include "scheduler/trigger_repository.hpp"

#include <filesystem>
#include <string>

#include <sqlite3.h>

#include "common/errors.hpp"
#include "common/time_of_day.hpp"

namespace reveille {

namespace {

constexpr const char *kCreateAlarmsTable =
    "CREATE TABLE IF NOT EXISTS alarms ("
    "    position INTEGER PRIMARY KEY,"
    "    time TEXT NOT NULL,"
    "    tone TEXT,"
    "    snooze_minutes INTEGER NOT NULL,"
    "    label TEXT NOT NULL,"
    "    enabled INTEGER NOT NULL DEFAULT 1"
    ");";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr int kSchemaVersion = 1;

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
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
        throw StorageError(message);
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

struct TriggerRepository::Impl {
    sqlite3 *db = nullptr;
};

TriggerRepository::TriggerRepository(const std::string &dbPath)
    : impl(std::make_unique<Impl>())
{
    const std::filesystem::path path(dbPath);
    if (path.has_parent_path()) {
        std::error_code error;
        std::filesystem::create_directories(path.parent_path(), error);
    }

    if (sqlite3_open(dbPath.c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw StorageError("failed to open alarm database " + dbPath + ": " + message);
    }

    try {
        execOrThrow(impl->db, kCreateAlarmsTable);
        execOrThrow(impl->db, kCreateMetaTable);

        Statement stmt(impl->db,
                       "INSERT OR REPLACE INTO meta (key, value) VALUES ('schema_version', ?);");
        bindText(stmt.get(), 1, std::to_string(kSchemaVersion));
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw StorageError("failed to write schema version");
        }
    } catch (const StorageError &) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw;
    }
}

TriggerRepository::~TriggerRepository()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

std::vector<Trigger> TriggerRepository::loadAll() const
{
    Statement stmt(impl->db,
                   "SELECT time, tone, snooze_minutes, label, enabled "
                   "FROM alarms ORDER BY position ASC;");

    std::vector<Trigger> triggers;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        const auto time = parseTimeOfDay(columnText(stmt.get(), 0));
        const int snoozeMinutes = sqlite3_column_int(stmt.get(), 2);
        if (!time.has_value() || snoozeMinutes <= 0) {
            // Hand-edited or corrupt row; keep the rest of the list.
            continue;
        }

        Trigger trigger;
        trigger.fireTime = *time;
        trigger.toneRef = columnText(stmt.get(), 1);
        trigger.deferDuration = std::chrono::minutes(snoozeMinutes);
        trigger.label = columnText(stmt.get(), 3);
        trigger.enabled = sqlite3_column_int(stmt.get(), 4) != 0;
        triggers.push_back(trigger);
    }
    if (rc != SQLITE_DONE) {
        throw StorageError(std::string("failed to read alarms: ") + sqlite3_errmsg(impl->db));
    }
    return triggers;
}

void TriggerRepository::saveAll(const std::vector<Trigger> &triggers)
{
    execOrThrow(impl->db, "BEGIN IMMEDIATE;");
    try {
        execOrThrow(impl->db, "DELETE FROM alarms;");

        Statement stmt(impl->db,
                       "INSERT INTO alarms (position, time, tone, snooze_minutes, "
                       "label, enabled) VALUES (?, ?, ?, ?, ?, ?);");
        int position = 0;
        for (const auto &trigger : triggers) {
            sqlite3_reset(stmt.get());
            sqlite3_clear_bindings(stmt.get());
            sqlite3_bind_int(stmt.get(), 1, position++);
            bindText(stmt.get(), 2, formatTimeOfDay(trigger.fireTime));
            bindText(stmt.get(), 3, trigger.toneRef);
            sqlite3_bind_int(stmt.get(), 4, static_cast<int>(trigger.deferDuration.count()));
            bindText(stmt.get(), 5, trigger.label);
            sqlite3_bind_int(stmt.get(), 6, trigger.enabled ? 1 : 0);
            if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                throw StorageError(std::string("failed to insert alarm: ")
                                   + sqlite3_errmsg(impl->db));
            }
        }
        execOrThrow(impl->db, "COMMIT;");
    } catch (const StorageError &) {
        sqlite3_exec(impl->db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

std::string TriggerRepository::defaultDbPath(const QString &dataDir)
{
    return (std::filesystem::path(dataDir.toStdString()) / "reveille.db").string();
}

} // namespace reveille

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <QString>

#include "common/models.hpp"

namespace reveille {

// TriggerRepository is the SQLite access layer for the saved alarm list.
// Saving replaces the whole list in one transaction; snooze state is never
// stored because the watch tasks behind it do not survive a restart.
class TriggerRepository {
public:
    // Opens (creating if needed) the database. Throws StorageError.
    explicit TriggerRepository(const std::string &dbPath);
    ~TriggerRepository();

    TriggerRepository(const TriggerRepository &) = delete;
    TriggerRepository &operator=(const TriggerRepository &) = delete;

    // Saved alarms in list order, with fresh ids left at 0 for TriggerStore.
    std::vector<Trigger> loadAll() const;
    void saveAll(const std::vector<Trigger> &triggers);

    static std::string defaultDbPath(const QString &dataDir);

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace reveille

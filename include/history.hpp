#pragma once
#include <chrono>
#include <string>
#include <vector>
#include "migration.hpp"
#include "model.hpp"

/**
 * MigrationHistory
 *  - Holds finalized migrations in apply order; of_group() narrows it to
 *    the one group a migration is generated for
 *  - Knows the last known snapshot of every table
 *  - Names and anchors the next migration of the group
 *
 * Notes:
 *  - migrations are sorted with sort_migrations(); dependencies on other
 *    groups are not checked here (the apply-time engine does that)
 *  - "latest" == last migration, in apply order, embedding that table
 */
class MigrationHistory {
public:
    MigrationHistory() = default;
    explicit MigrationHistory(std::vector<Migration> migrations);

    const std::vector<Migration>& migrations() const { return migrations_; }

    // The migrations of one group, still in apply order.
    MigrationHistory of_group(const std::string& group) const;
    bool empty() const { return migrations_.empty(); }

    // Last migration in apply order, nullptr if none.
    const Migration* previous() const;

    // Latest descriptor of every table recorded by the migrations, sorted by table name.
    // Tables dropped by a RemoveModel operation are left out.
    std::vector<ModelDescriptor> latest_models() const;

    // m_0001_initial, then m_<seq+1>_auto_<YYYYMMDD_HHMMSS> (UTC of 'now').
    // Throws MigrationError(InvalidName) if the last name has no sequence number.
    std::string next_migration_name(std::chrono::system_clock::time_point now) const;

    // Parses the sequence number ("0007" in "m_0007_auto_...").
    static unsigned int sequence_of(const std::string& migration_name);

private:
    std::vector<Migration> migrations_;
};

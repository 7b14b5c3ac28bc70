#ifndef SCHEMA_MIGRATOR_MIGRATION_HISTORY_HPP
#define SCHEMA_MIGRATOR_MIGRATION_HISTORY_HPP

#include "common/logging.hpp"
#include "schema/change.hpp"
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace diff {

// Tables and columns that migrations already on disk leave dropped
class MigrationHistory {
public:
    MigrationHistory() = default;

    // Scans the up files in directory, in name order. A missing or
    // unreadable directory yields an empty history.
    static MigrationHistory scan(const std::filesystem::path& directory,
                                 const common::logging::Logger& logger = nullptr);

    // Applies the statements of one migration file
    void apply(const std::string& sql);

    bool table_dropped(const std::string& table) const;
    bool column_dropped(const std::string& table, const std::string& column) const;

    const std::set<std::string>& dropped_tables() const { return dropped_tables_; }
    const std::set<std::string>& dropped_columns() const { return dropped_columns_; }

private:
    std::set<std::string> dropped_tables_;   // lowercased
    std::set<std::string> dropped_columns_;  // lowercased "table.column"
};

// Removes changes that would repeat a drop already on disk, or touch a
// table that no longer exists. Returns the number removed.
size_t filter_dropped(std::vector<schema::Change>& changes,
                      const MigrationHistory& history,
                      const common::logging::Logger& logger = nullptr);

} // namespace diff

#endif // SCHEMA_MIGRATOR_MIGRATION_HISTORY_HPP

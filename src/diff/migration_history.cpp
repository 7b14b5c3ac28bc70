#include "diff/migration_history.hpp"
#include "common/string_utils.hpp"
#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace diff {

using common::utils::to_lower;
using schema::Change;
using schema::ChangeType;

namespace {
    // One alternation so statements are applied in file order
    const std::regex HISTORY_PATTERN(
        R"(DROP\s+TABLE\s+IF\s+EXISTS\s+([a-zA-Z0-9_]+))"
        R"(|ALTER\s+TABLE\s+([a-zA-Z0-9_]+)\s+DROP\s+COLUMN\s+IF\s+EXISTS\s+([a-zA-Z0-9_]+))"
        R"(|CREATE\s+TABLE\s+IF\s+NOT\s+EXISTS\s+([a-zA-Z0-9_]+))"
        R"(|ALTER\s+TABLE\s+([a-zA-Z0-9_]+)\s+ADD\s+COLUMN\s+(?:IF\s+NOT\s+EXISTS\s+)?([a-zA-Z0-9_]+))",
        std::regex::ECMAScript | std::regex::icase);

    std::string column_key(const std::string& table, const std::string& column) {
        return to_lower(table) + "." + to_lower(column);
    }

    bool is_up_file(const fs::path& path) {
        const std::string name = path.filename().string();
        return common::utils::ends_with(name, ".sql") && !common::utils::ends_with(name, ".down.sql");
    }
}

MigrationHistory MigrationHistory::scan(const fs::path& directory,
                                        const common::logging::Logger& logger) {
    auto log = common::logging::or_null(logger);
    MigrationHistory history;

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return history;
    }

    std::vector<fs::path> files;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && is_up_file(it->path())) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        log->warn("Could not read migration directory '{}': {}", directory.string(), ec.message());
        return MigrationHistory{};
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        std::ifstream in(file);
        if (!in) {
            log->warn("Could not read migration file '{}'", file.string());
            continue;
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        history.apply(buffer.str());
    }

    log->debug("Migration history: {} dropped tables, {} dropped columns",
               history.dropped_tables_.size(), history.dropped_columns_.size());
    return history;
}

void MigrationHistory::apply(const std::string& sql) {
    for (std::sregex_iterator it(sql.begin(), sql.end(), HISTORY_PATTERN), end; it != end; ++it) {
        const auto& match = *it;
        if (match[1].matched) {
            const std::string table = to_lower(match[1].str());
            dropped_tables_.insert(table);
            // Columns of a dropped table are gone with it
            const std::string prefix = table + ".";
            for (auto col = dropped_columns_.begin(); col != dropped_columns_.end();) {
                if (col->compare(0, prefix.size(), prefix) == 0) {
                    col = dropped_columns_.erase(col);
                } else {
                    ++col;
                }
            }
        } else if (match[2].matched) {
            dropped_columns_.insert(column_key(match[2].str(), match[3].str()));
        } else if (match[4].matched) {
            dropped_tables_.erase(to_lower(match[4].str()));
        } else if (match[5].matched) {
            dropped_columns_.erase(column_key(match[5].str(), match[6].str()));
        }
    }
}

bool MigrationHistory::table_dropped(const std::string& table) const {
    return dropped_tables_.count(to_lower(table)) > 0;
}

bool MigrationHistory::column_dropped(const std::string& table, const std::string& column) const {
    return dropped_columns_.count(column_key(table, column)) > 0;
}

size_t filter_dropped(std::vector<Change>& changes,
                      const MigrationHistory& history,
                      const common::logging::Logger& logger) {
    auto log = common::logging::or_null(logger);

    std::set<std::string> dropped_now;
    for (const auto& change : changes) {
        if (change.type == ChangeType::DropTable) {
            dropped_now.insert(to_lower(change.object_name));
        }
    }

    auto skip = [&](const Change& change) -> bool {
        switch (change.type) {
            case ChangeType::DropTable:
                if (history.table_dropped(change.object_name)) {
                    log->info("Skipping DROP TABLE '{}': already dropped", change.object_name);
                    return true;
                }
                return false;

            case ChangeType::DropColumn:
            case ChangeType::AddColumn:
                if (history.table_dropped(change.parent_name)) {
                    log->info("Skipping {} '{}.{}': table already dropped",
                              schema::to_string(change.type), change.parent_name, change.object_name);
                    return true;
                }
                // A dropped column may be added back
                if (change.type == ChangeType::DropColumn &&
                    history.column_dropped(change.parent_name, change.object_name)) {
                    log->info("Skipping DROP COLUMN '{}.{}': column already dropped",
                              change.parent_name, change.object_name);
                    return true;
                }
                if (change.type == ChangeType::DropColumn &&
                    dropped_now.count(to_lower(change.parent_name)) > 0) {
                    log->debug("Skipping DROP COLUMN '{}.{}': table dropped in this migration",
                               change.parent_name, change.object_name);
                    return true;
                }
                return false;

            default:
                return false;
        }
    };

    const auto before = changes.size();
    changes.erase(std::remove_if(changes.begin(), changes.end(), skip), changes.end());
    return before - changes.size();
}

} // namespace diff

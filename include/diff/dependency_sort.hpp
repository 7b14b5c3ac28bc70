#ifndef SCHEMA_MIGRATOR_DEPENDENCY_SORT_HPP
#define SCHEMA_MIGRATOR_DEPENDENCY_SORT_HPP

#include "common/logging.hpp"
#include "schema/change.hpp"
#include <map>
#include <string>
#include <vector>

namespace diff {

// Table name -> names of the tables it references, lowercased unless
// names are compared case-sensitively
using TableDependencies = std::map<std::string, std::vector<std::string>>;

struct OrderedChanges {
    std::vector<schema::Change> changes;
    TableDependencies dependencies;
    bool cycle_detected{false};
};

// Deduplicates the change list and puts CREATE TABLE changes in foreign-key
// dependency order, followed by every other change in its original relative
// order. On a dependency cycle the CREATE TABLE changes keep their original,
// undeduplicated order. ignore_case must match the policy the changes were
// computed with, or tables differing only in case collapse into one.
OrderedChanges order_changes(const std::vector<schema::Change>& changes,
                             const common::logging::Logger& logger,
                             bool ignore_case = true);

namespace detail {
    // Foreign-key targets of a table, from its columns' referenced_table
    std::vector<std::string> table_references(const schema::Node& table, bool ignore_case = true);

    // Dedup key of a non-CreateTable change
    std::string change_key(const schema::Change& change, bool ignore_case = true);
}

} // namespace diff

#endif // SCHEMA_MIGRATOR_DEPENDENCY_SORT_HPP

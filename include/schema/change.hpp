#ifndef SCHEMA_MIGRATOR_CHANGE_HPP
#define SCHEMA_MIGRATOR_CHANGE_HPP

#include "schema/node.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace schema {

enum class ChangeType {
    CreateTable,
    DropTable,
    AddColumn,
    DropColumn,
    ModifyColumn,
    AddConstraint,
    DropConstraint,
    AddIndex,
    DropIndex,
    ModifyIndex
};

std::string to_string(ChangeType type);

// One detected difference between two schema trees
struct Change {
    ChangeType type{ChangeType::CreateTable};
    NodePtr object;            // new-tree node for additions and modifications, old-tree node for drops
    std::string object_name;
    std::string parent_name;   // owning table, empty for table-level changes
    bool reversible{false};
    std::map<std::string, std::string> metadata;

    // Metadata value, if present
    std::optional<std::string> meta(const std::string& key) const;
};

// Ordered changes; the order is the up-migration execution order
struct ChangeSet {
    std::vector<Change> changes;
    std::map<std::string, std::string> metadata;  // timestamp, version, hash; set by callers

    bool empty() const { return changes.empty(); }
    size_t size() const { return changes.size(); }
};

} // namespace schema

#endif // SCHEMA_MIGRATOR_CHANGE_HPP

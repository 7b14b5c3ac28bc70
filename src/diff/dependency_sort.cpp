#include "diff/dependency_sort.hpp"
#include "common/string_utils.hpp"
#include <functional>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace diff {

using common::utils::to_lower;
using schema::Change;
using schema::ChangeType;

namespace {
    std::string fold(const std::string& name, bool ignore_case) {
        return ignore_case ? to_lower(name) : name;
    }
}

namespace detail {

std::vector<std::string> table_references(const schema::Node& table, bool ignore_case) {
    std::vector<std::string> references;
    std::set<std::string> seen;
    for (const auto& column : table.children_of(schema::NodeType::Column)) {
        const auto* meta = std::get_if<schema::ColumnMeta>(&column->meta());
        if (!meta || !meta->referenced_table || meta->referenced_table->empty()) {
            continue;
        }
        std::string target = fold(*meta->referenced_table, ignore_case);
        if (seen.insert(target).second) {
            references.push_back(std::move(target));
        }
    }
    return references;
}

std::string change_key(const Change& change, bool ignore_case) {
    std::string key = schema::to_string(change.type) + ":";
    switch (change.type) {
        case ChangeType::AddColumn:
        case ChangeType::DropColumn:
        case ChangeType::ModifyColumn:
        case ChangeType::AddConstraint:
        case ChangeType::DropConstraint:
            // Same column name on two tables are two changes
            key += fold(change.parent_name, ignore_case) + ".";
            break;
        default:
            break;
    }
    return key + fold(change.object_name, ignore_case);
}

} // namespace detail

OrderedChanges order_changes(const std::vector<Change>& changes,
                             const common::logging::Logger& logger,
                             bool ignore_case) {
    OrderedChanges result;

    std::vector<const Change*> original_tables;
    std::vector<const Change*> tables;
    std::unordered_map<std::string, const Change*> tables_by_name;
    std::vector<const Change*> others;
    std::unordered_set<std::string> seen_others;

    // CREATE TABLE changes first, one per table
    for (const auto& change : changes) {
        if (change.type != ChangeType::CreateTable) {
            continue;
        }
        original_tables.push_back(&change);

        const std::string name = fold(change.object_name, ignore_case);
        if (tables_by_name.count(name) > 0) {
            logger->debug("Skipping duplicate CREATE TABLE for '{}'", change.object_name);
            continue;
        }
        tables_by_name.emplace(name, &change);
        tables.push_back(&change);

        result.dependencies[name] = change.object
            ? detail::table_references(*change.object, ignore_case)
            : std::vector<std::string>{};
    }

    for (const auto& change : changes) {
        if (change.type == ChangeType::CreateTable) {
            continue;
        }
        if (!seen_others.insert(detail::change_key(change, ignore_case)).second) {
            logger->debug("Skipping duplicate {} for '{}'", schema::to_string(change.type), change.object_name);
            continue;
        }
        others.push_back(&change);
    }

    // Depth-first topological sort with visiting/visited marks
    std::unordered_set<std::string> visiting;
    std::unordered_set<std::string> visited;
    std::vector<const Change*> sorted;

    std::function<bool(const std::string&)> visit = [&](const std::string& name) -> bool {
        if (visited.count(name) > 0) {
            return true;
        }
        if (visiting.count(name) > 0) {
            logger->warn("Circular table dependency involving '{}'", name);
            return false;
        }

        visiting.insert(name);
        for (const auto& dependency : result.dependencies[name]) {
            // Self references and tables created elsewhere impose no order
            if (dependency == name || tables_by_name.count(dependency) == 0) {
                continue;
            }
            if (!visit(dependency)) {
                return false;
            }
        }
        visiting.erase(name);
        visited.insert(name);
        sorted.push_back(tables_by_name.at(name));
        return true;
    };

    bool acyclic = true;
    for (const auto* table : tables) {
        if (!visit(fold(table->object_name, ignore_case))) {
            acyclic = false;
            break;
        }
    }

    if (!acyclic) {
        logger->warn("Table dependencies contain a cycle, keeping original CREATE TABLE order");
        result.cycle_detected = true;
        sorted = original_tables;
    }

    result.changes.reserve(sorted.size() + others.size());
    for (const auto* change : sorted) {
        result.changes.push_back(*change);
    }
    for (const auto* change : others) {
        result.changes.push_back(*change);
    }

    return result;
}

} // namespace diff

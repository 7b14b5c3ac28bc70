#include "diff/analyzer.hpp"
#include "common/string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace diff {

using common::utils::to_lower;
using schema::Change;
using schema::ChangeType;
using schema::Node;
using schema::NodePtr;
using schema::NodeType;

namespace {

    // Nodes in tree order plus a lookup by normalized name
    struct NamedNodes {
        std::vector<NodePtr> ordered;
        std::unordered_map<std::string, NodePtr> by_key;

        NodePtr find(const std::string& key) const {
            auto it = by_key.find(key);
            return it == by_key.end() ? nullptr : it->second;
        }
    };

    std::string column_definition_text(const Node& column) {
        const auto& meta = column.column();
        if (!meta.definition.empty()) {
            return meta.definition;
        }
        std::string text = column.name() + " " + meta.full_type;
        if (!meta.constraints.empty()) {
            text += " " + meta.constraints;
        }
        return text;
    }

} // namespace

namespace detail {

std::string base_type(const std::string& full_type) {
    auto paren = full_type.find('(');
    return common::utils::trim(full_type.substr(0, paren));
}

std::optional<long> type_length(const std::string& full_type) {
    auto open = full_type.find('(');
    if (open == std::string::npos) {
        return std::nullopt;
    }
    auto close = full_type.find(')', open);
    std::string inner = common::utils::trim(full_type.substr(open + 1,
        close == std::string::npos ? std::string::npos : close - open - 1));
    if (inner.empty() || !std::all_of(inner.begin(), inner.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    try {
        return std::stol(inner);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string normalize_constraints(const std::string& constraints) {
    auto tokens = common::utils::split_whitespace(to_lower(common::utils::trim(constraints)));
    std::sort(tokens.begin(), tokens.end());
    return common::utils::join(tokens, " ");
}

std::string index_definition(const Node& index) {
    const auto& meta = index.index();
    if (meta.original_sql && !meta.original_sql->empty()) {
        return *meta.original_sql;
    }
    std::string sql = "CREATE ";
    if (meta.is_unique) {
        sql += "UNIQUE ";
    }
    sql += "INDEX " + index.name() + " ON " + meta.table + " (" + meta.columns + ")";
    return sql;
}

} // namespace detail

bool columns_equal(const Node& old_column, const Node& new_column) {
    const auto& old_meta = old_column.column();
    const auto& new_meta = new_column.column();

    // Any parameterized type change
    if (to_lower(old_meta.full_type) != to_lower(new_meta.full_type)) {
        return false;
    }

    const std::string old_base = to_lower(detail::base_type(old_meta.full_type));
    const std::string new_base = to_lower(detail::base_type(new_meta.full_type));
    if (old_base != new_base) {
        return false;
    }

    if (old_base == "varchar") {
        auto old_length = detail::type_length(old_meta.full_type);
        auto new_length = detail::type_length(new_meta.full_type);
        if (old_length.has_value() != new_length.has_value()) {
            return false;
        }
        if (old_length && new_length && *old_length != *new_length) {
            return false;
        }
    }

    return detail::normalize_constraints(old_meta.constraints) ==
           detail::normalize_constraints(new_meta.constraints);
}

bool indexes_equal(const Node& old_index, const Node& new_index) {
    const auto& old_meta = old_index.index();
    const auto& new_meta = new_index.index();

    if (to_lower(old_meta.table) != to_lower(new_meta.table)) {
        return false;
    }

    if (old_meta.is_unique != new_meta.is_unique) {
        return false;
    }

    // Column order is significant
    return to_lower(common::utils::remove_whitespace(old_meta.columns)) ==
           to_lower(common::utils::remove_whitespace(new_meta.columns));
}

Analyzer::Analyzer(const schema::SchemaTree& old_tree,
                   const schema::SchemaTree& new_tree,
                   AnalyzerOptions options,
                   common::logging::Logger logger)
    : old_tree_(old_tree),
      new_tree_(new_tree),
      options_(options),
      logger_(common::logging::or_null(logger)) {}

AnalyzerResult<schema::ChangeSet> Analyzer::compare() const {
    const auto key = [this](const std::string& name) {
        return options_.ignore_case ? to_lower(name) : name;
    };

    // One pass over each root's direct children
    const auto collect = [&](const schema::SchemaTree& tree, NamedNodes& tables, NamedNodes& indexes) {
        for (const auto& child : tree.root().children()) {
            NamedNodes* target = nullptr;
            switch (child->type()) {
                case NodeType::Table: target = &tables; break;
                case NodeType::Index: target = &indexes; break;
                default: continue;
            }
            if (!target->by_key.emplace(key(child->name()), child).second) {
                logger_->debug("Ignoring duplicate {} '{}'", schema::to_string(child->type()), child->name());
                continue;
            }
            target->ordered.push_back(child);
        }
    };

    NamedNodes old_tables, new_tables, old_indexes, new_indexes;
    collect(old_tree_, old_tables, old_indexes);
    collect(new_tree_, new_tables, new_indexes);

    schema::ChangeSet changes;

    try {
        // Added and modified tables
        for (const auto& new_table : new_tables.ordered) {
            logger_->debug("Processing table '{}' from new schema", new_table->name());

            auto old_table = old_tables.find(key(new_table->name()));
            if (!old_table) {
                logger_->debug("Found new table '{}'", new_table->name());
                Change change;
                change.type = ChangeType::CreateTable;
                change.object = new_table;
                change.object_name = new_table->name();
                change.reversible = true;
                changes.changes.push_back(std::move(change));
                continue;
            }

            auto table_changes = compare_table(*old_table, *new_table);
            for (auto& change : table_changes) {
                changes.changes.push_back(std::move(change));
            }
        }

        // Dropped tables
        for (const auto& old_table : old_tables.ordered) {
            if (new_tables.find(key(old_table->name()))) {
                continue;
            }
            logger_->debug("Found dropped table '{}'", old_table->name());
            Change change;
            change.type = ChangeType::DropTable;
            change.object = old_table;
            change.object_name = old_table->name();
            change.reversible = true;
            changes.changes.push_back(std::move(change));
        }

        // Added and modified indexes
        for (const auto& new_index : new_indexes.ordered) {
            const std::string& table_name = new_index->index().table;
            auto old_index = old_indexes.find(key(new_index->name()));

            if (!old_index) {
                logger_->debug("Found new index '{}' on '{}'", new_index->name(), table_name);
                Change change;
                change.type = ChangeType::AddIndex;
                change.object = new_index;
                change.object_name = new_index->name();
                change.parent_name = table_name;
                change.reversible = true;
                changes.changes.push_back(std::move(change));
                continue;
            }

            if (!indexes_equal(*old_index, *new_index)) {
                logger_->debug("Found modified index '{}' on '{}'", new_index->name(), table_name);
                Change change;
                change.type = ChangeType::ModifyIndex;
                change.object = new_index;
                change.object_name = new_index->name();
                change.parent_name = table_name;
                change.reversible = true;
                change.metadata["old_definition"] = detail::index_definition(*old_index);
                change.metadata["new_definition"] = detail::index_definition(*new_index);
                changes.changes.push_back(std::move(change));
            }
        }

        // Dropped indexes
        for (const auto& old_index : old_indexes.ordered) {
            if (new_indexes.find(key(old_index->name()))) {
                continue;
            }
            logger_->debug("Found dropped index '{}'", old_index->name());
            Change change;
            change.type = ChangeType::DropIndex;
            change.object = old_index;
            change.object_name = old_index->name();
            change.parent_name = old_index->index().table;
            change.reversible = true;
            changes.changes.push_back(std::move(change));
        }
    } catch (const schema::ContractViolation& e) {
        return AnalyzerError{"Malformed schema tree: " + std::string(e.what())};
    }

    logger_->info("Completed schema comparison: {} changes ({} tables, {} indexes in new schema)",
                  changes.changes.size(), new_tables.ordered.size(), new_indexes.ordered.size());
    return changes;
}

std::vector<Change> Analyzer::compare_table(const Node& old_table, const Node& new_table) const {
    std::vector<Change> changes;
    const std::string& table_name = new_table.name();

    const auto key = [this](const std::string& name) {
        return options_.ignore_case ? to_lower(name) : name;
    };

    std::unordered_map<std::string, NodePtr> old_columns;
    for (const auto& column : old_table.children_of(NodeType::Column)) {
        old_columns.emplace(key(column->name()), column);
    }

    std::unordered_map<std::string, NodePtr> new_columns;
    for (const auto& column : new_table.children_of(NodeType::Column)) {
        const std::string column_key = key(column->name());
        if (!new_columns.emplace(column_key, column).second) {
            continue;
        }

        auto old_it = old_columns.find(column_key);
        if (old_it == old_columns.end()) {
            logger_->debug("Found new column '{}.{}'", table_name, column->name());
            Change change;
            change.type = ChangeType::AddColumn;
            change.object = column;
            change.object_name = column->name();
            change.parent_name = table_name;
            change.reversible = true;
            changes.push_back(std::move(change));
            continue;
        }

        const Node& old_column = *old_it->second;
        if (columns_equal(old_column, *column)) {
            continue;
        }

        const auto& old_meta = old_column.column();
        const auto& new_meta = column->column();
        logger_->debug("Found modified column '{}.{}': {} -> {}",
                       table_name, column->name(), old_meta.full_type, new_meta.full_type);

        Change change;
        change.type = ChangeType::ModifyColumn;
        change.object = column;
        change.object_name = column->name();
        change.parent_name = table_name;
        change.reversible = true;
        change.metadata["old_definition"] = column_definition_text(old_column);
        change.metadata["new_definition"] = column_definition_text(*column);
        change.metadata["old_type"] = old_meta.full_type;
        change.metadata["new_type"] = new_meta.full_type;
        change.metadata["old_constraints"] = old_meta.constraints;
        change.metadata["new_constraints"] = new_meta.constraints;
        changes.push_back(std::move(change));
    }

    // Dropped columns, in old-table order
    for (const auto& column : old_table.children_of(NodeType::Column)) {
        if (new_columns.count(key(column->name())) > 0) {
            continue;
        }
        logger_->debug("Found dropped column '{}.{}'", table_name, column->name());
        Change change;
        change.type = ChangeType::DropColumn;
        change.object = column;
        change.object_name = column->name();
        change.parent_name = table_name;
        change.reversible = true;
        changes.push_back(std::move(change));
    }

    auto constraint_changes = compare_constraints(old_table, new_table);
    for (auto& change : constraint_changes) {
        changes.push_back(std::move(change));
    }

    return changes;
}

std::vector<Change> Analyzer::compare_constraints(const Node& old_table, const Node& new_table) const {
    std::vector<Change> changes;
    const std::string& table_name = new_table.name();

    const auto key = [this](const std::string& name) {
        return options_.ignore_case ? to_lower(name) : name;
    };
    const auto make_change = [&](ChangeType type, const NodePtr& node) {
        Change change;
        change.type = type;
        change.object = node;
        change.object_name = node->name();
        change.parent_name = table_name;
        change.reversible = true;
        return change;
    };

    std::unordered_map<std::string, NodePtr> old_constraints;
    for (const auto& constraint : old_table.children_of(NodeType::Constraint)) {
        old_constraints.emplace(key(constraint->name()), constraint);
    }

    std::unordered_map<std::string, NodePtr> new_constraints;
    for (const auto& constraint : new_table.children_of(NodeType::Constraint)) {
        new_constraints.emplace(key(constraint->name()), constraint);
    }

    for (const auto& constraint : old_table.children_of(NodeType::Constraint)) {
        if (new_constraints.count(key(constraint->name())) == 0) {
            logger_->debug("Found dropped constraint '{}.{}'", table_name, constraint->name());
            changes.push_back(make_change(ChangeType::DropConstraint, constraint));
        }
    }

    for (const auto& constraint : new_table.children_of(NodeType::Constraint)) {
        auto old_it = old_constraints.find(key(constraint->name()));
        if (old_it == old_constraints.end()) {
            logger_->debug("Found new constraint '{}.{}'", table_name, constraint->name());
            changes.push_back(make_change(ChangeType::AddConstraint, constraint));
            continue;
        }

        const auto& old_definition = old_it->second->constraint().definition;
        const auto& new_definition = constraint->constraint().definition;
        if (detail::normalize_constraints(old_definition) == detail::normalize_constraints(new_definition)) {
            continue;
        }

        // Constraints cannot be altered in place
        logger_->debug("Found modified constraint '{}.{}'", table_name, constraint->name());
        auto drop = make_change(ChangeType::DropConstraint, old_it->second);
        drop.metadata["old_definition"] = old_definition;
        drop.metadata["new_definition"] = new_definition;
        changes.push_back(std::move(drop));

        auto add = make_change(ChangeType::AddConstraint, constraint);
        add.metadata["old_definition"] = old_definition;
        add.metadata["new_definition"] = new_definition;
        changes.push_back(std::move(add));
    }

    return changes;
}

} // namespace diff

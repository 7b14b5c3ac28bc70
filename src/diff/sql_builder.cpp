#include "diff/sql_builder.hpp"
#include "common/string_utils.hpp"
#include <sstream>

namespace diff {

using common::utils::count_char;
using common::utils::trim;
using schema::Change;
using schema::ChangeType;

namespace detail {

std::string extract_default_value(const std::string& constraints) {
    auto default_pos = common::utils::to_upper(constraints).find("DEFAULT");
    if (default_pos == std::string::npos) {
        return "";
    }

    std::string rest = trim(constraints.substr(default_pos + 7));

    // Quoted literal, through the matching closing quote
    if (!rest.empty() && rest[0] == '\'') {
        auto end_quote = rest.find('\'', 1);
        if (end_quote != std::string::npos) {
            return rest.substr(0, end_quote + 1);
        }
    }

    auto end = rest.find_first_of(" ,");
    return end == std::string::npos ? rest : rest.substr(0, end);
}

std::string balance_parentheses(std::string text) {
    auto open = count_char(text, '(');
    auto close = count_char(text, ')');
    while (open > close) {
        text += ")";
        ++close;
    }
    return text;
}

std::string terminate_statement(const std::string& statement) {
    return common::utils::trim_right(trim(statement), ';') + ";";
}

} // namespace detail

namespace {
    std::string without_semicolons(const std::string& sql) {
        return common::utils::trim_right(trim(sql), ';');
    }

    // Table name a change applies to, or an error naming the missing piece
    StatementResult<std::string> require_parent(const Change& change) {
        if (change.parent_name.empty()) {
            return StatementError{"Missing owning table", change.object_name, change.type};
        }
        return change.parent_name;
    }
}

SqlBuilder::SqlBuilder(std::shared_ptr<const dialect::Dialect> dialect)
    : dialect_(std::move(dialect)) {}

std::string SqlBuilder::column_definition(const schema::Node& column) const {
    const auto* meta = std::get_if<schema::ColumnMeta>(&column.meta());
    if (!meta) {
        return column.name();
    }

    if (!meta->definition.empty()) {
        return detail::balance_parentheses(meta->definition);
    }

    std::string type_text = meta->full_type.empty() ? meta->type : meta->full_type;
    const std::string logical = meta->type.empty() ? type_text : meta->type;
    if (auto mapped = dialect_->map_type(logical)) {
        // Keep type parameters such as a varchar length
        auto paren = type_text.find('(');
        type_text = *mapped + (paren == std::string::npos ? "" : type_text.substr(paren));
    }

    std::string definition = column.name() + " " + detail::balance_parentheses(type_text);
    if (!meta->constraints.empty()) {
        definition += " " + detail::balance_parentheses(meta->constraints);
    }
    return trim(definition);
}

StatementResult<std::string> SqlBuilder::up_statement(const Change& change) const {
    switch (change.type) {
        case ChangeType::CreateTable:
            return create_table(change);

        case ChangeType::DropTable:
            return "DROP TABLE IF EXISTS " + change.object_name + ";";

        case ChangeType::AddColumn:
            return add_column(change);

        case ChangeType::DropColumn: {
            auto table = require_parent(change);
            if (std::holds_alternative<StatementError>(table)) {
                return table;
            }
            return "ALTER TABLE " + std::get<std::string>(table) +
                   " DROP COLUMN IF EXISTS " + change.object_name + ";";
        }

        case ChangeType::ModifyColumn:
            return modify_column(change);

        case ChangeType::AddConstraint:
            return add_constraint(change);

        case ChangeType::DropConstraint: {
            auto table = require_parent(change);
            if (std::holds_alternative<StatementError>(table)) {
                return table;
            }
            return "ALTER TABLE " + std::get<std::string>(table) +
                   " DROP CONSTRAINT IF EXISTS " + change.object_name + ";";
        }

        case ChangeType::AddIndex:
            return add_index(change);

        case ChangeType::ModifyIndex:
            return modify_index(change);

        case ChangeType::DropIndex:
            return "DROP INDEX IF EXISTS " + change.object_name + ";";
    }

    return StatementError{"Unsupported change type", change.object_name, change.type};
}

std::optional<std::string> SqlBuilder::down_statement(const Change& change) const {
    switch (change.type) {
        case ChangeType::CreateTable:
            return "DROP TABLE IF EXISTS " + change.object_name + ";";
        case ChangeType::AddColumn:
            return "ALTER TABLE " + change.parent_name + " DROP COLUMN IF EXISTS " + change.object_name + ";";
        case ChangeType::AddConstraint:
            return "ALTER TABLE " + change.parent_name + " DROP CONSTRAINT IF EXISTS " + change.object_name + ";";
        case ChangeType::AddIndex:
        case ChangeType::ModifyIndex:
            return "DROP INDEX IF EXISTS " + change.object_name + ";";
        default:
            return std::nullopt;
    }
}

StatementResult<std::string> SqlBuilder::create_table(const Change& change) const {
    if (!change.object) {
        return StatementError{"Missing table node", change.object_name, change.type};
    }
    const auto* meta = std::get_if<schema::TableMeta>(&change.object->meta());
    if (!meta) {
        return StatementError{"Missing table metadata", change.object_name, change.type};
    }

    // Exact round trip when the source text is known
    if (meta->original_sql && !trim(*meta->original_sql).empty()) {
        return *meta->original_sql;
    }

    std::vector<std::string> lines;
    for (const auto& column : change.object->children_of(schema::NodeType::Column)) {
        lines.push_back("  " + column_definition(*column));
    }
    for (const auto& constraint : change.object->children_of(schema::NodeType::Constraint)) {
        const auto* constraint_meta = std::get_if<schema::ConstraintMeta>(&constraint->meta());
        if (!constraint_meta || constraint_meta->definition.empty()) {
            continue;
        }
        lines.push_back("  " + detail::balance_parentheses(constraint_meta->definition));
    }

    std::ostringstream ss;
    ss << "CREATE TABLE IF NOT EXISTS " << change.object_name << " (\n"
       << common::utils::join(lines, ",\n")
       << "\n);";
    return ss.str();
}

StatementResult<std::string> SqlBuilder::add_column(const Change& change) const {
    auto table = require_parent(change);
    if (std::holds_alternative<StatementError>(table)) {
        return table;
    }
    if (!change.object) {
        return StatementError{"Missing column node", change.object_name, change.type};
    }
    const auto* meta = std::get_if<schema::ColumnMeta>(&change.object->meta());
    if (!meta) {
        return StatementError{"Missing column metadata", change.object_name, change.type};
    }

    const std::string& table_name = std::get<std::string>(table);
    if (!meta->definition.empty()) {
        return "ALTER TABLE " + table_name + " ADD COLUMN " + without_semicolons(meta->definition) + ";";
    }

    if (!meta->raw_type || trim(*meta->raw_type).empty()) {
        return StatementError{"Missing raw type for column", change.object_name, change.type};
    }
    return "ALTER TABLE " + table_name + " ADD COLUMN " + change.object_name + " " +
           without_semicolons(*meta->raw_type) + ";";
}

StatementResult<std::string> SqlBuilder::modify_column(const Change& change) const {
    auto table = require_parent(change);
    if (std::holds_alternative<StatementError>(table)) {
        return table;
    }

    std::string new_type;
    std::string new_constraints;
    if (change.object) {
        if (const auto* meta = std::get_if<schema::ColumnMeta>(&change.object->meta())) {
            new_type = meta->full_type;
            new_constraints = meta->constraints;
        }
    }
    if (new_type.empty()) {
        new_type = change.meta("new_type").value_or("");
        new_constraints = change.meta("new_constraints").value_or("");
    }
    if (new_type.empty()) {
        return StatementError{"Missing new column type", change.object_name, change.type};
    }
    const std::string old_constraints = change.meta("old_constraints").value_or("");

    std::string stmt = "ALTER TABLE " + std::get<std::string>(table) +
                       " ALTER COLUMN " + change.object_name + " TYPE " + new_type;

    if (common::utils::contains_ci(new_constraints, "NOT NULL")) {
        stmt += " SET NOT NULL";
    } else if (common::utils::contains_ci(old_constraints, "NOT NULL")) {
        stmt += " DROP NOT NULL";
    }

    if (common::utils::contains_ci(new_constraints, "DEFAULT")) {
        auto value = detail::extract_default_value(new_constraints);
        if (!value.empty()) {
            stmt += " SET DEFAULT " + value;
        }
    }

    return stmt;
}

StatementResult<std::string> SqlBuilder::add_index(const Change& change) const {
    if (!change.object) {
        return StatementError{"Missing index node", change.object_name, change.type};
    }
    const auto* meta = std::get_if<schema::IndexMeta>(&change.object->meta());
    if (!meta) {
        return StatementError{"Missing index metadata", change.object_name, change.type};
    }

    if (meta->original_sql && !trim(*meta->original_sql).empty()) {
        return without_semicolons(*meta->original_sql) + ";";
    }

    if (meta->table.empty() || meta->columns.empty()) {
        return StatementError{"Index requires a table and columns", change.object_name, change.type};
    }

    std::ostringstream ss;
    ss << "CREATE ";
    if (meta->is_unique) {
        ss << "UNIQUE ";
    }
    ss << "INDEX " << change.object_name << " ON " << meta->table << " (" << meta->columns << ");";
    return ss.str();
}

StatementResult<std::string> SqlBuilder::modify_index(const Change& change) const {
    auto new_definition = change.meta("new_definition");
    if (!new_definition || trim(*new_definition).empty()) {
        return StatementError{"Missing new index definition", change.object_name, change.type};
    }

    // Indexes are dropped and recreated, never altered in place
    return "DROP INDEX IF EXISTS " + change.object_name + ";\n" +
           without_semicolons(*new_definition) + ";";
}

StatementResult<std::string> SqlBuilder::add_constraint(const Change& change) const {
    auto table = require_parent(change);
    if (std::holds_alternative<StatementError>(table)) {
        return table;
    }
    if (!change.object) {
        return StatementError{"Missing constraint node", change.object_name, change.type};
    }
    const auto* meta = std::get_if<schema::ConstraintMeta>(&change.object->meta());
    if (!meta || meta->definition.empty()) {
        return StatementError{"Missing constraint definition", change.object_name, change.type};
    }

    const std::string definition = without_semicolons(meta->definition);
    const std::string& table_name = std::get<std::string>(table);

    // Definition already names the constraint
    if (common::utils::to_upper(definition).rfind("CONSTRAINT ", 0) == 0) {
        return "ALTER TABLE " + table_name + " ADD " + definition + ";";
    }
    return "ALTER TABLE " + table_name + " ADD CONSTRAINT " + change.object_name + " " + definition + ";";
}

} // namespace diff

#include "parser/validation/schema_validation.hpp"
#include "common/string_utils.hpp"
#include <regex>
#include <unordered_set>

namespace parser::schema::validation {

using common::Success;
using common::utils::to_lower;
using common::utils::trim;

ElementValidation ColumnValidator::validate_column(const ColumnDocument& column) {
    if (!DocumentValidator::is_valid_identifier(column.name)) {
        return ElementValidation::failure("Invalid column name: " + column.name);
    }

    if (trim(column.type).empty() && trim(column.full_type).empty()) {
        return ElementValidation::failure("Column requires 'type' or 'full_type'");
    }

    if (column.references && !DocumentValidator::is_valid_identifier(*column.references)) {
        return ElementValidation::failure("Invalid referenced table: " + *column.references);
    }

    return ElementValidation::success();
}

Result<Success> ColumnValidator::validate_columns(
    const std::vector<ColumnDocument>& columns,
    const ValidationContext& context) {

    std::unordered_set<std::string> column_names;

    for (const auto& column : columns) {
        if (!column_names.insert(to_lower(column.name)).second) {
            return Error{
                "Duplicate column name: " + column.name,
                context.element_name
            };
        }

        auto validation = validate_column(column);
        if (!validation.is_valid) {
            return Error{
                validation.error_message,
                context.element_name + "." + column.name
            };
        }
    }

    return Success{};
}

Result<Success> DocumentValidator::validate(const SchemaDocument& document) {
    std::unordered_set<std::string> table_names;
    for (const auto& table : document.tables) {
        if (!table_names.insert(to_lower(table.name)).second) {
            return Error{"Duplicate table name: " + table.name, table.name};
        }

        auto table_result = validate_table(table);
        if (std::holds_alternative<Error>(table_result)) {
            return std::get<Error>(table_result);
        }
    }

    std::unordered_set<std::string> index_names;
    for (const auto& index : document.indexes) {
        if (!index_names.insert(to_lower(index.name)).second) {
            return Error{"Duplicate index name: " + index.name, index.name};
        }

        auto index_result = validate_index(index, document);
        if (std::holds_alternative<Error>(index_result)) {
            return std::get<Error>(index_result);
        }
    }

    return Success{};
}

Result<Success> DocumentValidator::validate_table(const TableDocument& table) {
    if (table.name.empty()) {
        return Error{"Table name cannot be empty"};
    }

    if (!is_valid_identifier(table.name)) {
        return Error{"Invalid table name: " + table.name, table.name};
    }

    ValidationContext context(table.name, "table");
    auto column_result = ColumnValidator::validate_columns(table.columns, context);
    if (std::holds_alternative<Error>(column_result)) {
        return std::get<Error>(column_result);
    }

    std::unordered_set<std::string> constraint_names;
    for (const auto& constraint : table.constraints) {
        if (!is_valid_identifier(constraint.name)) {
            return Error{"Invalid constraint name: " + constraint.name, table.name};
        }
        if (!constraint_names.insert(to_lower(constraint.name)).second) {
            return Error{"Duplicate constraint name: " + constraint.name, table.name};
        }
        if (trim(constraint.definition).empty()) {
            return Error{"Constraint definition cannot be empty", table.name + "." + constraint.name};
        }
    }

    return Success{};
}

Result<Success> DocumentValidator::validate_index(
    const IndexDocument& index,
    const SchemaDocument& document) {

    if (!is_valid_identifier(index.name)) {
        return Error{"Invalid index name: " + index.name, index.name};
    }

    if (index.table.empty()) {
        return Error{"Index table cannot be empty", index.name};
    }

    if (index.columns.empty()) {
        return Error{"Index must list at least one column", index.name};
    }

    const std::string owner = to_lower(index.table);
    for (const auto& table : document.tables) {
        if (to_lower(table.name) == owner) {
            return Success{};
        }
    }

    return Error{"Index refers to unknown table: " + index.table, index.name};
}

bool DocumentValidator::is_valid_identifier(const std::string& str) {
    static const std::regex identifier_regex(
        R"(^([a-zA-Z_][a-zA-Z0-9_$]*\.)?[a-zA-Z_][a-zA-Z0-9_$]*$)");
    return std::regex_match(str, identifier_regex);
}

} // namespace parser::schema::validation

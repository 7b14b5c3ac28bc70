#include "parser/schema_loader.hpp"
#include "common/string_utils.hpp"
#include "parser/json_parser.hpp"
#include "parser/validation/schema_validation.hpp"
#include "parser/yaml_parser.hpp"
#include <filesystem>

namespace parser::schema {

using common::utils::to_lower;
using common::utils::trim;

namespace {
    std::string location(std::optional<size_t> line, std::optional<size_t> column) {
        if (!line) {
            return "";
        }
        return " (line " + std::to_string(*line) +
               (column ? ", column " + std::to_string(*column) : "") + ")";
    }
}

namespace detail {

::schema::NodePtr column_node(const ColumnDocument& column) {
    ::schema::ColumnMeta meta;
    meta.full_type = trim(column.full_type.empty() ? column.type : column.full_type);
    meta.type = trim(column.type);
    if (meta.type.empty()) {
        meta.type = trim(meta.full_type.substr(0, meta.full_type.find('(')));
    }
    meta.constraints = trim(column.constraints);
    meta.definition = trim(column.definition);
    if (column.references && !trim(*column.references).empty()) {
        meta.referenced_table = trim(*column.references);
    }
    meta.raw_type = trim(meta.full_type + " " + meta.constraints);
    return ::schema::Node::column(column.name, std::move(meta));
}

::schema::NodePtr table_node(const TableDocument& table) {
    std::vector<::schema::NodePtr> children;
    children.reserve(table.columns.size() + table.constraints.size());
    for (const auto& column : table.columns) {
        children.push_back(column_node(column));
    }
    for (const auto& constraint : table.constraints) {
        children.push_back(::schema::Node::constraint(
            constraint.name, ::schema::ConstraintMeta{trim(constraint.definition)}));
    }

    ::schema::TableMeta meta;
    meta.original_sql = table.original_sql;
    return ::schema::Node::table(table.name, std::move(children), std::move(meta));
}

::schema::NodePtr index_node(const IndexDocument& index) {
    ::schema::IndexMeta meta;
    meta.table = index.table;
    meta.is_unique = index.unique;
    meta.columns = common::utils::join(index.columns, ", ");
    meta.original_sql = index.original_sql;
    return ::schema::Node::index(index.name, std::move(meta));
}

} // namespace detail

Result<::schema::SchemaTree> build_tree(const SchemaDocument& document) {
    auto validation = validation::DocumentValidator::validate(document);
    if (std::holds_alternative<Error>(validation)) {
        return std::get<Error>(validation);
    }

    std::vector<::schema::NodePtr> children;
    children.reserve(document.tables.size() + document.indexes.size());
    for (const auto& table : document.tables) {
        children.push_back(detail::table_node(table));
    }
    for (const auto& index : document.indexes) {
        children.push_back(detail::index_node(index));
    }

    auto tree = ::schema::SchemaTree::create(::schema::Node::root(std::move(children)));
    if (std::holds_alternative<::schema::SchemaError>(tree)) {
        const auto& error = std::get<::schema::SchemaError>(tree);
        return Error{error.message, error.context};
    }
    return std::get<::schema::SchemaTree>(std::move(tree));
}

Result<SchemaDocument> load_document(const std::string& file_path) {
    const std::string extension = to_lower(std::filesystem::path(file_path).extension().string());

    if (extension == ".yaml" || extension == ".yml") {
        auto parsed = yaml::parse_file(file_path);
        if (std::holds_alternative<yaml::Error>(parsed)) {
            const auto& error = std::get<yaml::Error>(parsed);
            return Error{error.message + location(error.line, error.column), file_path};
        }
        auto document = yaml::parse_schema(std::get<YAML::Node>(parsed));
        if (std::holds_alternative<yaml::Error>(document)) {
            const auto& error = std::get<yaml::Error>(document);
            return Error{error.message + location(error.line, error.column), file_path};
        }
        return std::get<SchemaDocument>(std::move(document));
    }

    if (extension == ".json") {
        auto parsed = json::parse_file(file_path);
        if (std::holds_alternative<json::Error>(parsed)) {
            const auto& error = std::get<json::Error>(parsed);
            return Error{error.message + location(error.line_number, error.column), file_path};
        }
        auto document = json::parse_schema(std::get<json::JsonDocument>(parsed));
        if (std::holds_alternative<json::Error>(document)) {
            return Error{std::get<json::Error>(document).message, file_path};
        }
        return std::get<SchemaDocument>(std::move(document));
    }

    return Error{"Unsupported schema file extension: '" + extension + "'", file_path};
}

Result<::schema::SchemaTree> load_file(const std::string& file_path) {
    auto document = load_document(file_path);
    if (std::holds_alternative<Error>(document)) {
        return std::get<Error>(document);
    }

    auto tree = build_tree(std::get<SchemaDocument>(document));
    if (std::holds_alternative<Error>(tree)) {
        auto error = std::get<Error>(tree);
        if (!error.context) {
            error.context = file_path;
        }
        return error;
    }
    return tree;
}

} // namespace parser::schema

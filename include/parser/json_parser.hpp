#ifndef SCHEMA_MIGRATOR_JSON_PARSER_HPP
#define SCHEMA_MIGRATOR_JSON_PARSER_HPP

#include "common/result.hpp"
#include "parser/schema_document.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace parser::json {

using JsonDocument = nlohmann::json;

// JSON-specific error type
struct Error : common::Error {
    std::optional<size_t> line_number{std::nullopt};
    std::optional<size_t> column{std::nullopt};

    Error(const std::string& msg,
          std::optional<size_t> line = std::nullopt,
          std::optional<size_t> col = std::nullopt)
        : common::Error(msg), line_number(line), column(col) {}
};

template<typename T>
using Result = common::Result<T, Error>;

// Parser functions
Result<JsonDocument> parse(const std::string& input);
Result<JsonDocument> parse_file(const std::string& file_path);

// Schema document from a parsed JSON value
Result<schema::SchemaDocument> parse_schema(const JsonDocument& j);

} // namespace parser::json

// nlohmann::json conversions, found by argument-dependent lookup
namespace parser::schema {

void from_json(const nlohmann::json& j, ColumnDocument& column);
void from_json(const nlohmann::json& j, ConstraintDocument& constraint);
void from_json(const nlohmann::json& j, TableDocument& table);
void from_json(const nlohmann::json& j, IndexDocument& index);
void from_json(const nlohmann::json& j, SchemaDocument& document);

} // namespace parser::schema

#endif // SCHEMA_MIGRATOR_JSON_PARSER_HPP

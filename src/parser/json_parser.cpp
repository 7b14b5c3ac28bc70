#include "parser/json_parser.hpp"
#include "common/string_utils.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace parser::json {

namespace {
    // Helper function to read file
    std::string read_file(const std::string& file_path) {
        std::ifstream file(file_path);
        if (!file) {
            throw std::runtime_error("Cannot open file: " + file_path);
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    // 1-based line and column of a byte offset reported by the parser
    std::pair<size_t, size_t> locate(const std::string& input, size_t byte) {
        size_t line = 1;
        size_t column = 1;
        const size_t end = std::min(byte > 0 ? byte - 1 : 0, input.size());
        for (size_t i = 0; i < end; ++i) {
            if (input[i] == '\n') {
                ++line;
                column = 1;
            } else {
                ++column;
            }
        }
        return {line, column};
    }
}

Result<JsonDocument> parse(const std::string& input) {
    try {
        return JsonDocument::parse(input);
    } catch (const JsonDocument::parse_error& e) {
        auto [line, column] = locate(input, e.byte);
        return Error{e.what(), line, column};
    } catch (const JsonDocument::exception& e) {
        return Error{e.what()};
    }
}

Result<JsonDocument> parse_file(const std::string& file_path) {
    std::string content;
    try {
        content = read_file(file_path);
    } catch (const std::exception& e) {
        return Error{"File error: " + std::string(e.what())};
    }
    return parse(content);
}

Result<schema::SchemaDocument> parse_schema(const JsonDocument& j) {
    if (!j.is_object()) {
        return Error{"Schema document must be an object"};
    }

    try {
        return j.get<schema::SchemaDocument>();
    } catch (const JsonDocument::exception& e) {
        return Error{"Invalid schema document: " + std::string(e.what())};
    }
}

} // namespace parser::json

namespace parser::schema {

namespace {
    template<typename T>
    void get_optional(const nlohmann::json& j, const char* key, T& out) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            it->get_to(out);
        }
    }

    template<typename T>
    void get_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            out = it->get<T>();
        }
    }
}

void from_json(const nlohmann::json& j, ColumnDocument& column) {
    j.at("name").get_to(column.name);
    get_optional(j, "type", column.type);
    get_optional(j, "full_type", column.full_type);
    get_optional(j, "constraints", column.constraints);
    get_optional(j, "definition", column.definition);
    get_optional(j, "references", column.references);
}

void from_json(const nlohmann::json& j, ConstraintDocument& constraint) {
    j.at("name").get_to(constraint.name);
    j.at("definition").get_to(constraint.definition);
}

void from_json(const nlohmann::json& j, TableDocument& table) {
    j.at("name").get_to(table.name);
    get_optional(j, "original_sql", table.original_sql);
    get_optional(j, "columns", table.columns);
    get_optional(j, "constraints", table.constraints);
}

void from_json(const nlohmann::json& j, IndexDocument& index) {
    j.at("name").get_to(index.name);
    j.at("table").get_to(index.table);
    get_optional(j, "unique", index.unique);
    get_optional(j, "original_sql", index.original_sql);

    // Either an array or a comma-separated string
    const auto& columns = j.at("columns");
    if (columns.is_string()) {
        for (const auto& column : common::utils::split_string(columns.get<std::string>(), ',', true)) {
            auto trimmed = common::utils::trim(column);
            if (!trimmed.empty()) index.columns.push_back(trimmed);
        }
    } else {
        for (const auto& column : columns.get<std::vector<std::string>>()) {
            index.columns.push_back(common::utils::trim(column));
        }
    }
}

void from_json(const nlohmann::json& j, SchemaDocument& document) {
    get_optional(j, "tables", document.tables);
    get_optional(j, "indexes", document.indexes);
}

} // namespace parser::schema

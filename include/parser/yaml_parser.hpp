#ifndef SCHEMA_MIGRATOR_YAML_PARSER_HPP
#define SCHEMA_MIGRATOR_YAML_PARSER_HPP

#include "common/result.hpp"
#include "common/string_utils.hpp"
#include "dialect/dialect.hpp"
#include "parser/schema_document.hpp"
#include <yaml-cpp/yaml.h>
#include <memory>
#include <optional>
#include <string>

namespace parser::yaml {

    // YAML-specific error type
    struct Error : common::Error {
        std::optional<size_t> line{std::nullopt};
        std::optional<size_t> column{std::nullopt};

        Error(const std::string& msg,
              std::optional<size_t> l = std::nullopt,
              std::optional<size_t> col = std::nullopt)
            : common::Error(msg), line(l), column(col) {}
    };

    // Use common Result with YAML Error
    template<typename T>
    using Result = common::Result<T, Error>;

    // Parser functions
    Result<YAML::Node> parse(const std::string& content);
    Result<YAML::Node> parse_file(const std::string& file_path);

    // Schema document from a parsed YAML node
    Result<schema::SchemaDocument> parse_schema(const YAML::Node& node);

    // Dialect from a {name, types} node
    Result<std::shared_ptr<dialect::MappedDialect>> parse_dialect(const YAML::Node& node);
    Result<std::shared_ptr<dialect::MappedDialect>> load_dialect(const std::string& file_path);

} // namespace parser::yaml

// YAML conversion specializations
namespace YAML {

    template<>
    struct convert<parser::schema::ColumnDocument> {
        static bool decode(const Node& node, parser::schema::ColumnDocument& rhs) {
            if (!node.IsMap() || !node["name"]) {
                return false;
            }

            rhs.name = node["name"].as<std::string>();
            if (node["type"]) rhs.type = node["type"].as<std::string>();
            if (node["full_type"]) rhs.full_type = node["full_type"].as<std::string>();
            if (node["constraints"]) rhs.constraints = node["constraints"].as<std::string>();
            if (node["definition"]) rhs.definition = node["definition"].as<std::string>();
            if (node["references"]) rhs.references = node["references"].as<std::string>();

            return true;
        }
    };

    template<>
    struct convert<parser::schema::ConstraintDocument> {
        static bool decode(const Node& node, parser::schema::ConstraintDocument& rhs) {
            if (!node.IsMap()) return false;

            if (!node["name"] || !node["definition"]) return false;

            rhs.name = node["name"].as<std::string>();
            rhs.definition = node["definition"].as<std::string>();

            return true;
        }
    };

    template<>
    struct convert<parser::schema::TableDocument> {
        static bool decode(const Node& node, parser::schema::TableDocument& rhs) {
            if (!node.IsMap() || !node["name"]) {
                return false;
            }

            rhs.name = node["name"].as<std::string>();
            if (node["original_sql"]) {
                rhs.original_sql = node["original_sql"].as<std::string>();
            }

            if (node["columns"]) {
                if (!node["columns"].IsSequence()) return false;
                for (const auto& column : node["columns"]) {
                    rhs.columns.push_back(column.as<parser::schema::ColumnDocument>());
                }
            }

            if (node["constraints"]) {
                if (!node["constraints"].IsSequence()) return false;
                for (const auto& constraint : node["constraints"]) {
                    rhs.constraints.push_back(constraint.as<parser::schema::ConstraintDocument>());
                }
            }

            return true;
        }
    };

    template<>
    struct convert<parser::schema::IndexDocument> {
        static bool decode(const Node& node, parser::schema::IndexDocument& rhs) {
            if (!node.IsMap()) return false;

            if (!node["name"] || !node["table"] || !node["columns"]) return false;

            rhs.name = node["name"].as<std::string>();
            rhs.table = node["table"].as<std::string>();
            if (node["unique"]) {
                rhs.unique = node["unique"].as<bool>();
            }
            if (node["original_sql"]) {
                rhs.original_sql = node["original_sql"].as<std::string>();
            }

            // Either a list or a comma-separated string
            const auto& columns = node["columns"];
            if (columns.IsSequence()) {
                for (const auto& column : columns) {
                    rhs.columns.push_back(common::utils::trim(column.as<std::string>()));
                }
            } else if (columns.IsScalar()) {
                for (const auto& column : common::utils::split_string(columns.as<std::string>(), ',', true)) {
                    auto trimmed = common::utils::trim(column);
                    if (!trimmed.empty()) rhs.columns.push_back(trimmed);
                }
            } else {
                return false;
            }

            return true;
        }
    };

    template<>
    struct convert<parser::schema::SchemaDocument> {
        static bool decode(const Node& node, parser::schema::SchemaDocument& rhs) {
            if (!node.IsMap()) return false;

            if (node["tables"]) {
                if (!node["tables"].IsSequence()) return false;
                for (const auto& table : node["tables"]) {
                    rhs.tables.push_back(table.as<parser::schema::TableDocument>());
                }
            }

            if (node["indexes"]) {
                if (!node["indexes"].IsSequence()) return false;
                for (const auto& index : node["indexes"]) {
                    rhs.indexes.push_back(index.as<parser::schema::IndexDocument>());
                }
            }

            return true;
        }
    };

} // namespace YAML

#endif // SCHEMA_MIGRATOR_YAML_PARSER_HPP

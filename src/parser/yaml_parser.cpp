#include "parser/yaml_parser.hpp"

namespace parser::yaml {

    Result<YAML::Node> parse(const std::string& content) {
        try {
            YAML::Node config = YAML::Load(content);
            return config;
        } catch (const YAML::Exception& e) {
            return Error{
                "Failed to parse YAML content: " + std::string(e.what()),
                e.mark.line,
                e.mark.column
            };
        }
    }

    Result<YAML::Node> parse_file(const std::string& file_path) {
        try {
            YAML::Node config = YAML::LoadFile(file_path);
            return config;
        } catch (const YAML::Exception& e) {
            return Error{
                "Failed to load YAML file: " + std::string(e.what()),
                e.mark.line,
                e.mark.column
            };
        }
    }

    Result<schema::SchemaDocument> parse_schema(const YAML::Node& node) {
        if (!node.IsMap()) {
            return Error{"Schema document must be a mapping"};
        }

        try {
            return node.as<schema::SchemaDocument>();
        } catch (const YAML::Exception& e) {
            return Error{
                "Invalid schema document: " + std::string(e.what()),
                e.mark.line,
                e.mark.column
            };
        }
    }

    Result<std::shared_ptr<dialect::MappedDialect>> parse_dialect(const YAML::Node& node) {
        if (!node.IsMap()) {
            return Error{"Dialect definition must be a mapping"};
        }

        if (!node["name"] || !node["types"]) {
            return Error{"Dialect must have 'name' and 'types'"};
        }

        if (!node["types"].IsMap()) {
            return Error{
                "Dialect 'types' must be a mapping",
                node["types"].Mark().line,
                node["types"].Mark().column
            };
        }

        try {
            const auto name = common::utils::trim(node["name"].as<std::string>());
            if (name.empty()) {
                return Error{"Dialect name cannot be empty"};
            }

            dialect::TypeMapping mapping;
            for (const auto& entry : node["types"]) {
                mapping[entry.first.as<std::string>()] = entry.second.as<std::string>();
            }

            return std::make_shared<dialect::MappedDialect>(name, std::move(mapping));
        } catch (const YAML::Exception& e) {
            return Error{
                "Invalid dialect definition: " + std::string(e.what()),
                e.mark.line,
                e.mark.column
            };
        }
    }

    Result<std::shared_ptr<dialect::MappedDialect>> load_dialect(const std::string& file_path) {
        auto parsed = parse_file(file_path);
        if (std::holds_alternative<Error>(parsed)) {
            return std::get<Error>(parsed);
        }
        return parse_dialect(std::get<YAML::Node>(parsed));
    }

} // namespace parser::yaml

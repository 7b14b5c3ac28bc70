#ifndef SCHEMA_MIGRATOR_SCHEMA_DOCUMENT_HPP
#define SCHEMA_MIGRATOR_SCHEMA_DOCUMENT_HPP

#include "common/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace parser::schema {

    // Error for schema documents that cannot become a tree
    struct Error : common::Error {
        Error(const std::string& msg,
              const std::optional<std::string>& ctx = std::nullopt)
            : common::Error(msg, ctx) {}
    };

    template<typename T>
    using Result = common::Result<T, Error>;

    struct ColumnDocument {
        std::string name;
        std::string type;        // base type; defaults to full_type before '('
        std::string full_type;   // defaults to type
        std::string constraints;
        std::string definition;
        std::optional<std::string> references;
    };

    struct ConstraintDocument {
        std::string name;
        std::string definition;
    };

    struct TableDocument {
        std::string name;
        std::optional<std::string> original_sql;
        std::vector<ColumnDocument> columns;
        std::vector<ConstraintDocument> constraints;
    };

    struct IndexDocument {
        std::string name;
        std::string table;
        bool unique{false};
        std::vector<std::string> columns;
        std::optional<std::string> original_sql;
    };

    // Format-neutral description of one schema, read from YAML or JSON
    struct SchemaDocument {
        std::vector<TableDocument> tables;
        std::vector<IndexDocument> indexes;
    };

} // namespace parser::schema

#endif // SCHEMA_MIGRATOR_SCHEMA_DOCUMENT_HPP

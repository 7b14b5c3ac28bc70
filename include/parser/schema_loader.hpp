#ifndef SCHEMA_MIGRATOR_SCHEMA_LOADER_HPP
#define SCHEMA_MIGRATOR_SCHEMA_LOADER_HPP

#include "parser/schema_document.hpp"
#include "schema/node.hpp"
#include <string>

namespace parser::schema {

    // Validates the document and builds an immutable tree from it
    Result<::schema::SchemaTree> build_tree(const SchemaDocument& document);

    // Reads a .yaml, .yml or .json schema document
    Result<SchemaDocument> load_document(const std::string& file_path);

    Result<::schema::SchemaTree> load_file(const std::string& file_path);

    namespace detail {
        ::schema::NodePtr column_node(const ColumnDocument& column);
        ::schema::NodePtr table_node(const TableDocument& table);
        ::schema::NodePtr index_node(const IndexDocument& index);
    }

} // namespace parser::schema

#endif // SCHEMA_MIGRATOR_SCHEMA_LOADER_HPP

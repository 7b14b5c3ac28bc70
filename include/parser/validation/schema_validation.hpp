#ifndef SCHEMA_MIGRATOR_SCHEMA_VALIDATION_HPP
#define SCHEMA_MIGRATOR_SCHEMA_VALIDATION_HPP

#include "parser/schema_document.hpp"
#include <string>
#include <vector>

namespace parser::schema::validation {

struct ValidationContext {
    std::string element_name;
    std::string element_type;  // "table", "column", "constraint" or "index"

    ValidationContext(const std::string& name, const std::string& type)
        : element_name(name), element_type(type) {}
};

// Single-element validation result
struct ElementValidation {
    bool is_valid;
    std::string error_message;

    static ElementValidation success() {
        return {true, ""};
    }

    static ElementValidation failure(const std::string& message) {
        return {false, message};
    }
};

class ColumnValidator {
public:
    static ElementValidation validate_column(const ColumnDocument& column);

    // Names unique within the table, case-insensitively
    static Result<common::Success> validate_columns(
        const std::vector<ColumnDocument>& columns,
        const ValidationContext& context);
};

class DocumentValidator {
public:
    // Identifiers, duplicate names and index owner tables
    static Result<common::Success> validate(const SchemaDocument& document);

    static Result<common::Success> validate_table(const TableDocument& table);

    static Result<common::Success> validate_index(
        const IndexDocument& index,
        const SchemaDocument& document);

    // Letters, digits, '_' and '$', not starting with a digit; one optional schema qualifier
    static bool is_valid_identifier(const std::string& str);
};

} // namespace parser::schema::validation

#endif // SCHEMA_MIGRATOR_SCHEMA_VALIDATION_HPP

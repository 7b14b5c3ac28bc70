#ifndef SCHEMA_MIGRATOR_SQL_BUILDER_HPP
#define SCHEMA_MIGRATOR_SQL_BUILDER_HPP

#include "common/result.hpp"
#include "dialect/dialect.hpp"
#include "schema/change.hpp"
#include <memory>
#include <optional>
#include <string>

namespace diff {

// Error for a single change that could not be turned into SQL
struct StatementError : common::Error {
    std::optional<schema::ChangeType> change_type{std::nullopt};

    StatementError(const std::string& msg,
                   const std::optional<std::string>& ctx = std::nullopt,
                   std::optional<schema::ChangeType> type = std::nullopt)
        : common::Error(msg, ctx), change_type(type) {}
};

template<typename T>
using StatementResult = common::Result<T, StatementError>;

// Synthesizes dialect-specific SQL for individual changes
class SqlBuilder {
public:
    explicit SqlBuilder(std::shared_ptr<const dialect::Dialect> dialect);

    // Forward ("up") statement for a change
    StatementResult<std::string> up_statement(const schema::Change& change) const;

    // Structural inverse; only additive change types have one
    std::optional<std::string> down_statement(const schema::Change& change) const;

    // Column as it appears inside CREATE TABLE
    std::string column_definition(const schema::Node& column) const;

    const dialect::Dialect& dialect() const { return *dialect_; }

private:
    StatementResult<std::string> create_table(const schema::Change& change) const;
    StatementResult<std::string> add_column(const schema::Change& change) const;
    StatementResult<std::string> modify_column(const schema::Change& change) const;
    StatementResult<std::string> add_index(const schema::Change& change) const;
    StatementResult<std::string> modify_index(const schema::Change& change) const;
    StatementResult<std::string> add_constraint(const schema::Change& change) const;

    std::shared_ptr<const dialect::Dialect> dialect_;
};

namespace detail {
    // Value following DEFAULT: a single-quoted literal or the token up to the next space or comma
    std::string extract_default_value(const std::string& constraints);

    // Appends ')' while the text has more '(' than ')'
    std::string balance_parentheses(std::string text);

    // Strips trailing semicolons and terminates with exactly one
    std::string terminate_statement(const std::string& statement);
}

} // namespace diff

#endif // SCHEMA_MIGRATOR_SQL_BUILDER_HPP

#ifndef SCHEMA_MIGRATOR_ANALYZER_HPP
#define SCHEMA_MIGRATOR_ANALYZER_HPP

#include "common/logging.hpp"
#include "common/result.hpp"
#include "schema/change.hpp"
#include "schema/node.hpp"
#include <string>
#include <vector>

namespace diff {

struct AnalyzerOptions {
    bool ignore_case{true};
    bool ignore_whitespace{false};
    bool detect_renames{false};        // accepted, not wired into comparison
    bool validate_constraints{false};  // accepted, not wired into comparison
};

// Error type for comparisons that could not run at all
struct AnalyzerError : common::Error {
    AnalyzerError(const std::string& msg,
                  const std::optional<std::string>& ctx = std::nullopt)
        : common::Error(msg, ctx) {}
};

template<typename T>
using AnalyzerResult = common::Result<T, AnalyzerError>;

// Compares an old and a new schema tree
class Analyzer {
public:
    Analyzer(const schema::SchemaTree& old_tree,
             const schema::SchemaTree& new_tree,
             AnalyzerOptions options = {},
             common::logging::Logger logger = nullptr);

    // Ordered list of changes turning the old tree into the new one.
    // An empty change set means the trees are equivalent.
    AnalyzerResult<schema::ChangeSet> compare() const;

    const AnalyzerOptions& options() const { return options_; }

private:
    std::vector<schema::Change> compare_table(const schema::Node& old_table,
                                              const schema::Node& new_table) const;

    std::vector<schema::Change> compare_constraints(const schema::Node& old_table,
                                                    const schema::Node& new_table) const;

    schema::SchemaTree old_tree_;
    schema::SchemaTree new_tree_;
    AnalyzerOptions options_;
    common::logging::Logger logger_;
};

// Column equality policy: full type, base type, varchar length, then
// order-insensitive constraint tokens
bool columns_equal(const schema::Node& old_column, const schema::Node& new_column);

// Same owning table, same uniqueness, same column list (order significant)
bool indexes_equal(const schema::Node& old_index, const schema::Node& new_index);

namespace detail {
    // Substring before the first '('
    std::string base_type(const std::string& full_type);

    // Length parameter of a type such as varchar(255); nullopt when absent
    std::optional<long> type_length(const std::string& full_type);

    // Lowercase, trim, sort whitespace-separated tokens, join with single spaces
    std::string normalize_constraints(const std::string& constraints);

    // original_sql when present, otherwise CREATE [UNIQUE] INDEX name ON table (columns)
    std::string index_definition(const schema::Node& index);
}

} // namespace diff

#endif // SCHEMA_MIGRATOR_ANALYZER_HPP

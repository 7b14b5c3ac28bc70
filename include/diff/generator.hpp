#ifndef SCHEMA_MIGRATOR_GENERATOR_HPP
#define SCHEMA_MIGRATOR_GENERATOR_HPP

#include "common/logging.hpp"
#include "common/result.hpp"
#include "dialect/dialect.hpp"
#include "diff/sql_builder.hpp"
#include "schema/change.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace diff {

struct GeneratorOptions {
    std::string dialect{"postgres"};
    std::filesystem::path output_dir{"."};
    std::string file_name_format{"changes-%d.sql"};  // %d is replaced with the Unix timestamp
    bool include_down{false};
    common::logging::Logger logger;
    const dialect::Registry* registry{nullptr};      // not owned; Registry::defaults() when null
    std::optional<std::int64_t> timestamp;           // overrides the wall clock
    bool skip_already_dropped{true};
    bool ignore_case{true};                          // same policy as AnalyzerOptions::ignore_case
};

// Configuration and I/O failures; nothing is left on disk when returned
struct GeneratorError : common::Error {
    GeneratorError(const std::string& msg,
                   const std::optional<std::string>& ctx = std::nullopt)
        : common::Error(msg, ctx) {}
};

template<typename T>
using GeneratorResult = common::Result<T, GeneratorError>;

// Statements synthesized for one change set, before anything is written
struct MigrationStatements {
    std::vector<std::string> up;
    std::vector<std::string> down;
    size_t skipped_changes{0};
};

struct MigrationFiles {
    std::optional<std::filesystem::path> up_file;
    std::optional<std::filesystem::path> down_file;
    size_t up_statements{0};
    size_t down_statements{0};
    size_t skipped_changes{0};
};

// Turns a change set into up and (optionally) down migration files
class Generator {
public:
    // Fails when the configured dialect is not registered
    static GeneratorResult<Generator> create(GeneratorOptions options);

    GeneratorResult<MigrationFiles> generate(const schema::ChangeSet& change_set) const;

    // Orders, filters and synthesizes without touching the output directory
    // beyond reading its migration history
    MigrationStatements build_statements(const schema::ChangeSet& change_set) const;

    const GeneratorOptions& options() const { return options_; }
    const SqlBuilder& builder() const { return builder_; }

private:
    Generator(GeneratorOptions options, std::shared_ptr<const dialect::Dialect> dialect);

    GeneratorResult<std::filesystem::path> next_file_name() const;

    GeneratorOptions options_;
    SqlBuilder builder_;
    common::logging::Logger logger_;
};

namespace detail {
    // Replaces each %d in format with timestamp
    std::string format_file_name(const std::string& format, std::int64_t timestamp);

    // Up file name with its first ".sql" turned into ".down.sql"
    std::string down_file_name(const std::string& up_name);

    // "-- +migrate <direction>" header followed by the terminated statements
    std::string render_migration(const std::string& direction,
                                 const std::vector<std::string>& statements);
}

} // namespace diff

#endif // SCHEMA_MIGRATOR_GENERATOR_HPP

#include "diff/generator.hpp"
#include "common/string_utils.hpp"
#include "diff/dependency_sort.hpp"
#include "diff/migration_history.hpp"
#include <chrono>
#include <fstream>

namespace fs = std::filesystem;

namespace diff {

using schema::Change;
using schema::ChangeSet;

namespace detail {

std::string format_file_name(const std::string& format, std::int64_t timestamp) {
    const std::string value = std::to_string(timestamp);
    std::string out;
    out.reserve(format.size() + value.size());
    for (size_t i = 0; i < format.size(); ++i) {
        if (format[i] == '%' && i + 1 < format.size() && format[i + 1] == 'd') {
            out += value;
            ++i;
        } else {
            out += format[i];
        }
    }
    return out;
}

std::string down_file_name(const std::string& up_name) {
    auto pos = up_name.find(".sql");
    if (pos == std::string::npos) {
        return up_name + ".down.sql";
    }
    return up_name.substr(0, pos) + ".down.sql" + up_name.substr(pos + 4);
}

std::string render_migration(const std::string& direction,
                             const std::vector<std::string>& statements) {
    std::vector<std::string> terminated;
    terminated.reserve(statements.size());
    for (const auto& stmt : statements) {
        terminated.push_back(terminate_statement(stmt));
    }
    return "-- +migrate " + direction + "\n\n" + common::utils::join(terminated, "\n\n");
}

} // namespace detail

namespace {
    std::int64_t now_seconds() {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    std::optional<GeneratorError> write_file(const fs::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return GeneratorError{"Failed to open migration file", path.string()};
        }
        out << content;
        out.close();
        if (!out) {
            return GeneratorError{"Failed to write migration file", path.string()};
        }
        return std::nullopt;
    }
}

Generator::Generator(GeneratorOptions options, std::shared_ptr<const dialect::Dialect> dialect)
    : options_(std::move(options)),
      builder_(std::move(dialect)),
      logger_(common::logging::or_null(options_.logger)) {}

GeneratorResult<Generator> Generator::create(GeneratorOptions options) {
    const dialect::Registry& registry = options.registry ? *options.registry : dialect::Registry::defaults();
    auto dialect = registry.get(options.dialect);
    if (!dialect) {
        return GeneratorError{"unsupported dialect: " + options.dialect};
    }
    if (options.file_name_format.empty()) {
        return GeneratorError{"File name format must not be empty"};
    }
    return Generator(std::move(options), std::move(dialect));
}

MigrationStatements Generator::build_statements(const ChangeSet& change_set) const {
    MigrationStatements result;
    if (change_set.empty()) {
        return result;
    }

    auto ordered = order_changes(change_set.changes, logger_, options_.ignore_case);
    std::vector<Change> changes = std::move(ordered.changes);

    if (options_.skip_already_dropped) {
        auto history = MigrationHistory::scan(options_.output_dir, logger_);
        result.skipped_changes += filter_dropped(changes, history, logger_);
    }

    std::vector<const Change*> synthesized;
    for (const auto& change : changes) {
        auto stmt = builder_.up_statement(change);
        if (std::holds_alternative<StatementError>(stmt)) {
            const auto& error = std::get<StatementError>(stmt);
            logger_->warn("Skipping {} '{}': {}",
                          schema::to_string(change.type), change.object_name, error.message);
            ++result.skipped_changes;
            continue;
        }
        logger_->debug("{} '{}': {}", schema::to_string(change.type), change.object_name,
                       std::get<std::string>(stmt));
        result.up.push_back(std::move(std::get<std::string>(stmt)));
        synthesized.push_back(&change);
    }

    if (options_.include_down) {
        for (auto it = synthesized.rbegin(); it != synthesized.rend(); ++it) {
            if (!(*it)->reversible) {
                continue;
            }
            if (auto down = builder_.down_statement(**it)) {
                result.down.push_back(std::move(*down));
            }
        }
    }

    return result;
}

GeneratorResult<fs::path> Generator::next_file_name() const {
    std::int64_t timestamp = options_.timestamp ? *options_.timestamp : now_seconds();
    const bool has_placeholder = options_.file_name_format.find("%d") != std::string::npos;

    // Two runs within the same second must not overwrite each other
    for (int attempt = 0; attempt < 1000; ++attempt) {
        const std::string name = detail::format_file_name(options_.file_name_format, timestamp);
        const fs::path up = options_.output_dir / name;
        const fs::path down = options_.output_dir / detail::down_file_name(name);

        std::error_code ec;
        const bool taken = fs::exists(up, ec) || (options_.include_down && fs::exists(down, ec));
        if (!taken || !has_placeholder) {
            if (taken) {
                logger_->warn("Overwriting existing migration file '{}'", up.string());
            }
            return up;
        }
        ++timestamp;
    }

    return GeneratorError{"Could not find a free migration file name", options_.output_dir.string()};
}

GeneratorResult<MigrationFiles> Generator::generate(const ChangeSet& change_set) const {
    MigrationFiles files;
    if (change_set.empty()) {
        logger_->info("No changes to generate");
        return files;
    }

    auto statements = build_statements(change_set);
    files.skipped_changes = statements.skipped_changes;

    std::error_code ec;
    fs::create_directories(options_.output_dir, ec);
    if (ec) {
        return GeneratorError{"Failed to create output directory: " + ec.message(),
                              options_.output_dir.string()};
    }

    if (statements.up.empty()) {
        logger_->info("No statements generated from {} changes", change_set.size());
        return files;
    }

    auto up_path = next_file_name();
    if (std::holds_alternative<GeneratorError>(up_path)) {
        return std::get<GeneratorError>(up_path);
    }
    const fs::path up_file = std::get<fs::path>(up_path);

    if (auto error = write_file(up_file, detail::render_migration("Up", statements.up))) {
        return *error;
    }
    files.up_file = up_file;
    files.up_statements = statements.up.size();
    logger_->info("Wrote {} statements to '{}'", files.up_statements, up_file.string());

    if (options_.include_down && !statements.down.empty()) {
        const fs::path down_file = up_file.parent_path() / detail::down_file_name(up_file.filename().string());
        if (auto error = write_file(down_file, detail::render_migration("Down", statements.down))) {
            fs::remove(up_file, ec);
            fs::remove(down_file, ec);
            return *error;
        }
        files.down_file = down_file;
        files.down_statements = statements.down.size();
        logger_->info("Wrote {} statements to '{}'", files.down_statements, down_file.string());
    }

    return files;
}

} // namespace diff

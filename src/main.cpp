#include <iostream>
#include <filesystem>
#include <optional>
#include <string>
#include "common/logging.hpp"
#include "dialect/dialect.hpp"
#include "diff/analyzer.hpp"
#include "diff/generator.hpp"
#include "parser/schema_loader.hpp"
#include "parser/yaml_parser.hpp"

namespace fs = std::filesystem;

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name
              << " <old-schema> <new-schema> [options]\n"
              << "Schemas are .yaml, .yml or .json documents.\n"
              << "Options:\n"
              << "  --dialect NAME      Target SQL dialect (default: postgres)\n"
              << "  --dialect-file PATH Register a dialect from a YAML file\n"
              << "  --out DIR           Output directory (default: current directory)\n"
              << "  --format FMT        File name format, %d is the timestamp (default: changes-%d.sql)\n"
              << "  --down              Also write a down migration\n"
              << "  --dry-run           Print statements instead of writing files\n"
              << "  --log-level LEVEL   trace, debug, info, warn, error, critical or off (default: info)\n";
}

struct ProgramOptions {
    fs::path old_schema;
    fs::path new_schema;
    std::string dialect{"postgres"};
    std::optional<fs::path> dialect_file;
    fs::path output_dir{"."};
    std::string file_name_format{"changes-%d.sql"};
    bool include_down{false};
    bool dry_run{false};
    spdlog::level::level_enum log_level{spdlog::level::info};
};

std::optional<ProgramOptions> parse_arguments(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return std::nullopt;
    }

    ProgramOptions options;
    options.old_schema = argv[1];
    options.new_schema = argv[2];

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--down") {
            options.include_down = true;
        } else if (arg == "--dry-run") {
            options.dry_run = true;
        } else if (arg == "--dialect" && has_value) {
            options.dialect = argv[++i];
        } else if (arg == "--dialect-file" && has_value) {
            options.dialect_file = fs::path(argv[++i]);
        } else if (arg == "--out" && has_value) {
            options.output_dir = argv[++i];
        } else if (arg == "--format" && has_value) {
            options.file_name_format = argv[++i];
        } else if (arg == "--log-level" && has_value) {
            auto level = common::logging::parse_level(argv[++i]);
            if (std::holds_alternative<common::Error>(level)) {
                std::cerr << "Error: " << std::get<common::Error>(level).message << '\n';
                return std::nullopt;
            }
            options.log_level = std::get<spdlog::level::level_enum>(level);
        } else {
            std::cerr << "Error: Unknown option: " << arg << '\n';
            print_usage(argv[0]);
            return std::nullopt;
        }
    }

    return options;
}

template<typename T>
void print_error(const T& error) {
    if constexpr (std::is_same_v<T, parser::yaml::Error>) {
        std::cerr << "YAML Error: " << error.message;
        if (error.line) {
            std::cerr << " at line " << *error.line;
        }
        std::cerr << '\n';
    }
    else if constexpr (std::is_same_v<T, parser::schema::Error>) {
        std::cerr << "Schema Error: " << error.message;
        if (error.context) {
            std::cerr << " in " << *error.context;
        }
        std::cerr << '\n';
    }
    else {
        std::cerr << "Error: " << error.message;
        if (error.context) {
            std::cerr << " (" << *error.context << ")";
        }
        std::cerr << '\n';
    }
}

int main(int argc, char* argv[]) {
    try {
        auto options = parse_arguments(argc, argv);
        if (!options) {
            return 1;
        }

        auto logger = common::logging::make_logger("schema-migrator", options->log_level);

        dialect::Registry registry = dialect::Registry::with_builtins();
        if (options->dialect_file) {
            auto loaded = parser::yaml::load_dialect(options->dialect_file->string());
            if (std::holds_alternative<parser::yaml::Error>(loaded)) {
                print_error(std::get<parser::yaml::Error>(loaded));
                return 1;
            }
            auto added = registry.add(std::get<std::shared_ptr<dialect::MappedDialect>>(loaded));
            if (std::holds_alternative<dialect::DialectError>(added)) {
                print_error(std::get<dialect::DialectError>(added));
                return 1;
            }
        }

        auto old_tree = parser::schema::load_file(options->old_schema.string());
        if (std::holds_alternative<parser::schema::Error>(old_tree)) {
            print_error(std::get<parser::schema::Error>(old_tree));
            return 1;
        }

        auto new_tree = parser::schema::load_file(options->new_schema.string());
        if (std::holds_alternative<parser::schema::Error>(new_tree)) {
            print_error(std::get<parser::schema::Error>(new_tree));
            return 1;
        }

        diff::AnalyzerOptions analyzer_options;
        diff::Analyzer analyzer(std::get<schema::SchemaTree>(old_tree),
                                std::get<schema::SchemaTree>(new_tree),
                                analyzer_options,
                                logger);
        auto changes = analyzer.compare();
        if (std::holds_alternative<diff::AnalyzerError>(changes)) {
            print_error(std::get<diff::AnalyzerError>(changes));
            return 1;
        }
        const auto& change_set = std::get<schema::ChangeSet>(changes);

        diff::GeneratorOptions generator_options;
        generator_options.dialect = options->dialect;
        generator_options.output_dir = options->output_dir;
        generator_options.file_name_format = options->file_name_format;
        generator_options.include_down = options->include_down;
        generator_options.logger = logger;
        generator_options.registry = &registry;
        generator_options.ignore_case = analyzer_options.ignore_case;

        auto generator = diff::Generator::create(generator_options);
        if (std::holds_alternative<diff::GeneratorError>(generator)) {
            print_error(std::get<diff::GeneratorError>(generator));
            return 1;
        }
        const auto& gen = std::get<diff::Generator>(generator);

        if (options->dry_run) {
            auto statements = gen.build_statements(change_set);
            std::cout << diff::detail::render_migration("Up", statements.up) << "\n";
            if (options->include_down && !statements.down.empty()) {
                std::cout << "\n" << diff::detail::render_migration("Down", statements.down) << "\n";
            }
            return 0;
        }

        auto files = gen.generate(change_set);
        if (std::holds_alternative<diff::GeneratorError>(files)) {
            print_error(std::get<diff::GeneratorError>(files));
            return 1;
        }

        const auto& written = std::get<diff::MigrationFiles>(files);
        if (written.up_file) {
            std::cout << written.up_file->string() << "\n";
        }
        if (written.down_file) {
            std::cout << written.down_file->string() << "\n";
        }
        if (!written.up_file) {
            std::cout << "No changes\n";
        }

        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << '\n';
        return 1;
    }
}

#ifndef SCHEMA_MIGRATOR_LOGGING_HPP
#define SCHEMA_MIGRATOR_LOGGING_HPP

#include "common/result.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace common::logging {

using Logger = std::shared_ptr<spdlog::logger>;

// Logger writing to stderr with colors, not registered globally
Logger make_logger(const std::string& name,
                   spdlog::level::level_enum level = spdlog::level::info);

// Logger that discards everything; used when a caller passes none
Logger null_logger();

// Returns logger if set, null_logger() otherwise
inline Logger or_null(const Logger& logger) {
    return logger ? logger : null_logger();
}

// Accepts trace, debug, info, warn, error, critical, off
Result<spdlog::level::level_enum> parse_level(const std::string& text);

} // namespace common::logging

#endif // SCHEMA_MIGRATOR_LOGGING_HPP

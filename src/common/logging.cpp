#include "common/logging.hpp"
#include "common/string_utils.hpp"
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace common::logging {

Logger make_logger(const std::string& name, spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return logger;
}

Logger null_logger() {
    static const Logger logger = std::make_shared<spdlog::logger>(
        "null", std::make_shared<spdlog::sinks::null_sink_mt>());
    return logger;
}

Result<spdlog::level::level_enum> parse_level(const std::string& text) {
    const std::string lowered = utils::to_lower(utils::trim(text));
    if (lowered == "trace") return spdlog::level::trace;
    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "info") return spdlog::level::info;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    if (lowered == "critical") return spdlog::level::critical;
    if (lowered == "off") return spdlog::level::off;
    return Error{"Unknown log level: " + text};
}

} // namespace common::logging

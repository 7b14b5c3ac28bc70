#include "dialect/dialect.hpp"
#include "common/string_utils.hpp"

namespace dialect {

namespace {
    const TypeMapping POSTGRES_TYPES = {
        {"text", "TEXT"},
        {"varchar", "VARCHAR"},
        {"char", "CHAR"},
        {"string", "TEXT"},
        {"int", "INTEGER"},
        {"integer", "INTEGER"},
        {"int4", "INTEGER"},
        {"smallint", "SMALLINT"},
        {"int2", "SMALLINT"},
        {"bigint", "BIGINT"},
        {"int8", "BIGINT"},
        {"serial", "SERIAL"},
        {"bigserial", "BIGSERIAL"},
        {"float", "DOUBLE PRECISION"},
        {"double", "DOUBLE PRECISION"},
        {"real", "REAL"},
        {"decimal", "DECIMAL"},
        {"numeric", "NUMERIC"},
        {"bool", "BOOLEAN"},
        {"boolean", "BOOLEAN"},
        {"date", "DATE"},
        {"time", "TIME"},
        {"timestamp", "TIMESTAMP"},
        {"timestamptz", "TIMESTAMP WITH TIME ZONE"},
        {"interval", "INTERVAL"},
        {"uuid", "UUID"},
        {"json", "JSON"},
        {"jsonb", "JSONB"},
        {"bytea", "BYTEA"},
        {"binary", "BYTEA"},
        {"inet", "INET"}
    };
}

std::optional<std::string> Dialect::map_type(const std::string& logical_type) const {
    const auto& mapping = type_mapping();
    auto it = mapping.find(common::utils::to_lower(logical_type));
    if (it == mapping.end()) {
        return std::nullopt;
    }
    return it->second;
}

const TypeMapping& PostgresDialect::type_mapping() const {
    return POSTGRES_TYPES;
}

MappedDialect::MappedDialect(std::string name, TypeMapping mapping)
    : name_(std::move(name)) {
    // Keys are looked up lowercased
    for (auto& [logical, native] : mapping) {
        mapping_[common::utils::to_lower(logical)] = std::move(native);
    }
}

Registry Registry::with_builtins() {
    Registry registry;
    registry.dialects_["postgres"] = std::make_shared<PostgresDialect>();
    return registry;
}

const Registry& Registry::defaults() {
    static const Registry registry = with_builtins();
    return registry;
}

common::Result<common::Success, DialectError> Registry::add(std::shared_ptr<const Dialect> dialect) {
    if (!dialect) {
        return DialectError{"Cannot register a null dialect"};
    }

    const std::string key = common::utils::to_lower(dialect->name());
    if (key.empty()) {
        return DialectError{"Dialect name cannot be empty"};
    }
    if (dialects_.count(key) > 0) {
        return DialectError{"Dialect already registered", dialect->name()};
    }

    dialects_.emplace(key, std::move(dialect));
    return common::Success{};
}

std::shared_ptr<const Dialect> Registry::get(const std::string& name) const {
    auto it = dialects_.find(common::utils::to_lower(name));
    if (it == dialects_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> Registry::names() const {
    std::vector<std::string> result;
    for (const auto& [key, entry] : dialects_) {
        result.push_back(key);
    }
    return result;
}

} // namespace dialect

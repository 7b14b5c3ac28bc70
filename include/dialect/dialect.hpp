#ifndef SCHEMA_MIGRATOR_DIALECT_HPP
#define SCHEMA_MIGRATOR_DIALECT_HPP

#include "common/result.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dialect {

// Logical lowercase type name -> native type name
using TypeMapping = std::map<std::string, std::string>;

// SQL-syntax specifics of one target database engine
class Dialect {
public:
    virtual ~Dialect() = default;

    virtual std::string name() const = 0;
    virtual const TypeMapping& type_mapping() const = 0;

    // Native type for a logical type; nullopt when the dialect has no mapping
    std::optional<std::string> map_type(const std::string& logical_type) const;
};

// PostgreSQL type names
class PostgresDialect : public Dialect {
public:
    std::string name() const override { return "postgres"; }
    const TypeMapping& type_mapping() const override;
};

// Dialect defined entirely by data, e.g. loaded from a YAML dialect file
class MappedDialect : public Dialect {
public:
    MappedDialect(std::string name, TypeMapping mapping);

    std::string name() const override { return name_; }
    const TypeMapping& type_mapping() const override { return mapping_; }

private:
    std::string name_;
    TypeMapping mapping_;
};

struct DialectError : common::Error {
    DialectError(const std::string& msg,
                 const std::optional<std::string>& ctx = std::nullopt)
        : common::Error(msg, ctx) {}
};

// Dialects looked up by case-insensitive name
class Registry {
public:
    // Registry holding the built-in dialects
    static Registry with_builtins();

    // Process-wide registry with the built-ins; add custom dialects to a local Registry instead
    static const Registry& defaults();

    // Fails when a dialect with the same name is already registered
    common::Result<common::Success, DialectError> add(std::shared_ptr<const Dialect> dialect);

    std::shared_ptr<const Dialect> get(const std::string& name) const;
    bool has(const std::string& name) const { return get(name) != nullptr; }
    std::vector<std::string> names() const;

private:
    std::map<std::string, std::shared_ptr<const Dialect>> dialects_;
};

} // namespace dialect

#endif // SCHEMA_MIGRATOR_DIALECT_HPP

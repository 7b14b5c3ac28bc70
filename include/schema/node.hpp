#ifndef SCHEMA_MIGRATOR_NODE_HPP
#define SCHEMA_MIGRATOR_NODE_HPP

#include "common/result.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace schema {

enum class NodeType {
    Root,
    Table,
    Column,
    Index,
    Constraint
};

std::string to_string(NodeType type);

struct TableMeta {
    std::optional<std::string> original_sql;  // verbatim CREATE TABLE text
};

struct ColumnMeta {
    std::string type;          // base type, e.g. "varchar"
    std::string full_type;     // with parameters, e.g. "varchar(255)"
    std::string constraints;   // raw constraint clause
    std::string definition;    // "name type constraints", used verbatim when set
    std::optional<std::string> referenced_table;
    std::optional<std::string> raw_type;  // text following the column name
    std::optional<std::string> original_sql;
};

struct IndexMeta {
    std::string table;
    bool is_unique{false};
    std::string columns;       // comma-joined
    std::optional<std::string> original_sql;
};

struct ConstraintMeta {
    std::string definition;
};

using NodeMeta = std::variant<std::monostate, TableMeta, ColumnMeta, IndexMeta, ConstraintMeta>;

// Thrown when a node is accessed as a kind it is not
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const std::string& what) : std::logic_error(what) {}
};

class Node;
using NodePtr = std::shared_ptr<const Node>;

class Node {
public:
    static NodePtr root(std::vector<NodePtr> children);
    static NodePtr table(const std::string& name,
                         std::vector<NodePtr> children,
                         TableMeta meta = {});
    static NodePtr column(const std::string& name, ColumnMeta meta);
    static NodePtr index(const std::string& name, IndexMeta meta);
    static NodePtr constraint(const std::string& name, ConstraintMeta meta);

    NodeType type() const { return type_; }
    const std::string& name() const { return name_; }
    const std::vector<NodePtr>& children() const { return children_; }
    const NodeMeta& meta() const { return meta_; }

    // Typed metadata accessors; throw ContractViolation on a kind mismatch
    const TableMeta& table() const;
    const ColumnMeta& column() const;
    const IndexMeta& index() const;
    const ConstraintMeta& constraint() const;

    // Children of the given kind, in tree order
    std::vector<NodePtr> children_of(NodeType type) const;

private:
    Node(NodeType type, std::string name, std::vector<NodePtr> children, NodeMeta meta);

    NodeType type_;
    std::string name_;
    std::vector<NodePtr> children_;
    NodeMeta meta_;
};

struct SchemaError : common::Error {
    SchemaError(const std::string& msg,
                const std::optional<std::string>& ctx = std::nullopt)
        : common::Error(msg, ctx) {}
};

template<typename T>
using Result = common::Result<T, SchemaError>;

// Immutable schema owning a single Root node
class SchemaTree {
public:
    // Validates every node's metadata before accepting the root
    static Result<SchemaTree> create(NodePtr root);

    // Tree with an empty root
    static SchemaTree empty();

    const Node& root() const { return *root_; }
    std::vector<NodePtr> tables() const { return root_->children_of(NodeType::Table); }
    std::vector<NodePtr> indexes() const { return root_->children_of(NodeType::Index); }

private:
    explicit SchemaTree(NodePtr root) : root_(std::move(root)) {}

    NodePtr root_;
};

namespace detail {
    common::Result<common::Success, SchemaError> validate_node(const Node& node, NodeType parent);
}

} // namespace schema

#endif // SCHEMA_MIGRATOR_NODE_HPP

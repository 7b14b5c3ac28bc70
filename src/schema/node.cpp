#include "schema/node.hpp"

namespace schema {

std::string to_string(NodeType type) {
    switch (type) {
        case NodeType::Root: return "root";
        case NodeType::Table: return "table";
        case NodeType::Column: return "column";
        case NodeType::Index: return "index";
        case NodeType::Constraint: return "constraint";
    }
    return "unknown";
}

Node::Node(NodeType type, std::string name, std::vector<NodePtr> children, NodeMeta meta)
    : type_(type), name_(std::move(name)), children_(std::move(children)), meta_(std::move(meta)) {}

NodePtr Node::root(std::vector<NodePtr> children) {
    return NodePtr(new Node(NodeType::Root, "", std::move(children), std::monostate{}));
}

NodePtr Node::table(const std::string& name, std::vector<NodePtr> children, TableMeta meta) {
    return NodePtr(new Node(NodeType::Table, name, std::move(children), std::move(meta)));
}

NodePtr Node::column(const std::string& name, ColumnMeta meta) {
    return NodePtr(new Node(NodeType::Column, name, {}, std::move(meta)));
}

NodePtr Node::index(const std::string& name, IndexMeta meta) {
    return NodePtr(new Node(NodeType::Index, name, {}, std::move(meta)));
}

NodePtr Node::constraint(const std::string& name, ConstraintMeta meta) {
    return NodePtr(new Node(NodeType::Constraint, name, {}, std::move(meta)));
}

namespace {
    template<typename Meta>
    const Meta& typed_meta(const NodeMeta& meta, const std::string& name, const char* expected) {
        if (const auto* typed = std::get_if<Meta>(&meta)) {
            return *typed;
        }
        throw ContractViolation("node '" + name + "' carries no " + expected + " metadata");
    }
}

const TableMeta& Node::table() const {
    return typed_meta<TableMeta>(meta_, name_, "table");
}

const ColumnMeta& Node::column() const {
    return typed_meta<ColumnMeta>(meta_, name_, "column");
}

const IndexMeta& Node::index() const {
    return typed_meta<IndexMeta>(meta_, name_, "index");
}

const ConstraintMeta& Node::constraint() const {
    return typed_meta<ConstraintMeta>(meta_, name_, "constraint");
}

std::vector<NodePtr> Node::children_of(NodeType type) const {
    std::vector<NodePtr> result;
    for (const auto& child : children_) {
        if (child && child->type() == type) {
            result.push_back(child);
        }
    }
    return result;
}

namespace detail {

common::Result<common::Success, SchemaError> validate_node(const Node& node, NodeType parent) {
    const std::string where = to_string(node.type()) + " '" + node.name() + "'";

    if (node.type() != NodeType::Root && node.name().empty()) {
        return SchemaError{to_string(node.type()) + " node without a name", to_string(parent)};
    }

    switch (node.type()) {
        case NodeType::Root:
            return SchemaError{"Root node nested inside " + to_string(parent)};

        case NodeType::Table: {
            if (parent != NodeType::Root) {
                return SchemaError{"Table must be a direct child of the root", where};
            }
            if (!std::holds_alternative<TableMeta>(node.meta())) {
                return SchemaError{"Missing table metadata", where};
            }
            for (const auto& child : node.children()) {
                if (!child) {
                    return SchemaError{"Null child node", where};
                }
                if (child->type() != NodeType::Column && child->type() != NodeType::Constraint) {
                    return SchemaError{"Tables may only own columns and constraints", where};
                }
                auto result = validate_node(*child, NodeType::Table);
                if (std::holds_alternative<SchemaError>(result)) {
                    return result;
                }
            }
            break;
        }

        case NodeType::Column: {
            const auto* meta = std::get_if<ColumnMeta>(&node.meta());
            if (!meta) {
                return SchemaError{"Missing column metadata", where};
            }
            if (meta->type.empty() || meta->full_type.empty()) {
                return SchemaError{"Column requires 'type' and 'full_type'", where};
            }
            break;
        }

        case NodeType::Index: {
            if (parent != NodeType::Root) {
                return SchemaError{"Index must be a direct child of the root", where};
            }
            const auto* meta = std::get_if<IndexMeta>(&node.meta());
            if (!meta) {
                return SchemaError{"Missing index metadata", where};
            }
            if (meta->table.empty() || meta->columns.empty()) {
                return SchemaError{"Index requires 'table' and 'columns'", where};
            }
            break;
        }

        case NodeType::Constraint: {
            const auto* meta = std::get_if<ConstraintMeta>(&node.meta());
            if (!meta) {
                return SchemaError{"Missing constraint metadata", where};
            }
            if (meta->definition.empty()) {
                return SchemaError{"Constraint requires 'definition'", where};
            }
            break;
        }
    }

    return common::Success{};
}

} // namespace detail

Result<SchemaTree> SchemaTree::create(NodePtr root) {
    if (!root || root->type() != NodeType::Root) {
        return SchemaError{"Schema tree requires a root node"};
    }

    for (const auto& child : root->children()) {
        if (!child) {
            return SchemaError{"Null child node", "root"};
        }
        if (child->type() != NodeType::Table && child->type() != NodeType::Index) {
            return SchemaError{"Root may only own tables and indexes",
                               to_string(child->type()) + " '" + child->name() + "'"};
        }
        auto result = detail::validate_node(*child, NodeType::Root);
        if (std::holds_alternative<SchemaError>(result)) {
            return std::get<SchemaError>(result);
        }
    }

    return SchemaTree(std::move(root));
}

SchemaTree SchemaTree::empty() {
    return SchemaTree(Node::root({}));
}

} // namespace schema

#include <gtest/gtest.h>
#include "diff/dependency_sort.hpp"

namespace {

using namespace schema;
using diff::order_changes;

class DependencySortTest : public ::testing::Test {
protected:
    static NodePtr fk_column(const std::string& name, const std::string& target) {
        ColumnMeta meta;
        meta.type = "integer";
        meta.full_type = "integer";
        if (!target.empty()) {
            meta.referenced_table = target;
        }
        return Node::column(name, meta);
    }

    static Change create_table(const std::string& name, const std::string& references = "") {
        Change change;
        change.type = ChangeType::CreateTable;
        change.object = Node::table(name, {fk_column("id", ""), fk_column("ref_id", references)});
        change.object_name = name;
        change.reversible = true;
        return change;
    }

    static Change add_column(const std::string& table, const std::string& column) {
        Change change;
        change.type = ChangeType::AddColumn;
        change.object = fk_column(column, "");
        change.object_name = column;
        change.parent_name = table;
        return change;
    }

    static std::vector<std::string> names(const std::vector<Change>& changes) {
        std::vector<std::string> result;
        for (const auto& change : changes) {
            result.push_back(change.object_name);
        }
        return result;
    }

    common::logging::Logger logger = common::logging::null_logger();
};

// C references B, B references A
TEST_F(DependencySortTest, OrdersTablesByReferences) {
    auto ordered = order_changes({create_table("c", "b"), create_table("b", "a"), create_table("a")}, logger);
    EXPECT_FALSE(ordered.cycle_detected);
    EXPECT_EQ(names(ordered.changes), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(ordered.dependencies["c"], (std::vector<std::string>{"b"}));
    EXPECT_TRUE(ordered.dependencies["a"].empty());
}

TEST_F(DependencySortTest, KeepsOtherChangesAfterTablesInOrder) {
    auto ordered = order_changes({
        add_column("users", "email"),
        create_table("orders", "users"),
        add_column("users", "name"),
        create_table("users")
    }, logger);

    EXPECT_EQ(names(ordered.changes), (std::vector<std::string>{"users", "orders", "email", "name"}));
}

TEST_F(DependencySortTest, IgnoresSelfAndExternalReferences) {
    auto ordered = order_changes({create_table("employees", "employees"), create_table("audit", "users")}, logger);
    EXPECT_FALSE(ordered.cycle_detected);
    EXPECT_EQ(names(ordered.changes), (std::vector<std::string>{"employees", "audit"}));
}

TEST_F(DependencySortTest, FallsBackToInputOrderOnCycle) {
    auto ordered = order_changes({create_table("a", "b"), create_table("b", "a")}, logger);
    EXPECT_TRUE(ordered.cycle_detected);
    EXPECT_EQ(names(ordered.changes), (std::vector<std::string>{"a", "b"}));
}

TEST_F(DependencySortTest, DeduplicatesChanges) {
    auto ordered = order_changes({
        create_table("users"),
        create_table("USERS"),
        add_column("users", "email"),
        add_column("Users", "EMAIL"),
        add_column("orders", "email")
    }, logger);

    ASSERT_EQ(ordered.changes.size(), 3u);
    EXPECT_EQ(ordered.changes[0].object_name, "users");
    EXPECT_EQ(ordered.changes[1].parent_name, "users");
    EXPECT_EQ(ordered.changes[2].parent_name, "orders");
}

TEST_F(DependencySortTest, CaseSensitiveNamesStayDistinct) {
    auto ordered = order_changes({
        create_table("Users"),
        create_table("users"),
        add_column("Users", "email"),
        add_column("users", "email")
    }, logger, false);

    EXPECT_EQ(names(ordered.changes), (std::vector<std::string>{"Users", "users", "email", "email"}));
    EXPECT_EQ(ordered.dependencies.count("Users"), 1u);
    EXPECT_EQ(ordered.dependencies.count("users"), 1u);
    EXPECT_EQ(diff::detail::change_key(add_column("Users", "Email"), false), "AddColumn:Users.Email");
}

TEST_F(DependencySortTest, ChangeKeyIncludesOwningTable) {
    EXPECT_EQ(diff::detail::change_key(add_column("Users", "Email")), "AddColumn:users.email");

    Change drop_index;
    drop_index.type = ChangeType::DropIndex;
    drop_index.object_name = "IDX_A";
    drop_index.parent_name = "users";
    EXPECT_EQ(diff::detail::change_key(drop_index), "DropIndex:idx_a");
}

} // namespace

#include <gtest/gtest.h>
#include "diff/sql_builder.hpp"

namespace {

using namespace schema;
using diff::SqlBuilder;
using diff::StatementError;

class SqlBuilderTest : public ::testing::Test {
protected:
    static NodePtr column(const std::string& name, const std::string& type, const std::string& full_type,
                          const std::string& constraints = "", const std::string& definition = "") {
        ColumnMeta meta;
        meta.type = type;
        meta.full_type = full_type;
        meta.constraints = constraints;
        meta.definition = definition;
        return Node::column(name, meta);
    }

    static Change change(ChangeType type, NodePtr object, const std::string& name,
                         const std::string& parent = "") {
        Change result;
        result.type = type;
        result.object = std::move(object);
        result.object_name = name;
        result.parent_name = parent;
        result.reversible = true;
        return result;
    }

    std::string up(const Change& c) const {
        auto result = builder.up_statement(c);
        if (std::holds_alternative<StatementError>(result)) {
            ADD_FAILURE() << "unexpected error: " << std::get<StatementError>(result).message;
            return "";
        }
        return std::get<std::string>(result);
    }

    SqlBuilder builder{std::make_shared<dialect::PostgresDialect>()};
};

TEST_F(SqlBuilderTest, CreateTablePrefersOriginalSql) {
    TableMeta meta;
    meta.original_sql = "CREATE TABLE users (id serial PRIMARY KEY);";
    auto table = Node::table("users", {column("id", "serial", "serial")}, meta);
    EXPECT_EQ(up(change(ChangeType::CreateTable, table, "users")), "CREATE TABLE users (id serial PRIMARY KEY);");
}

TEST_F(SqlBuilderTest, CreateTableReconstructsColumnsAndConstraints) {
    auto table = Node::table("orders", {
        column("id", "serial", "serial", "PRIMARY KEY"),
        column("total", "numeric", "numeric(10,2"),
        column("note", "text", "text", "", "note text DEFAULT 'n/a'"),
        column("shape", "geometry", "geometry"),
        Node::constraint("orders_total_check", ConstraintMeta{"CHECK (total > 0"})
    });

    EXPECT_EQ(up(change(ChangeType::CreateTable, table, "orders")),
              "CREATE TABLE IF NOT EXISTS orders (\n"
              "  id SERIAL PRIMARY KEY,\n"
              "  total NUMERIC(10,2),\n"
              "  note text DEFAULT 'n/a',\n"
              "  shape geometry,\n"
              "  CHECK (total > 0)\n"
              ");");
}

TEST_F(SqlBuilderTest, AddColumnUsesDefinitionThenRawType) {
    auto with_definition = column("email", "varchar", "varchar(255)", "not null unique",
                                  "email varchar(255) not null unique");
    EXPECT_EQ(up(change(ChangeType::AddColumn, with_definition, "email", "users")),
              "ALTER TABLE users ADD COLUMN email varchar(255) not null unique;");

    ColumnMeta raw;
    raw.type = "integer";
    raw.full_type = "integer";
    raw.raw_type = "integer DEFAULT 0";
    EXPECT_EQ(up(change(ChangeType::AddColumn, Node::column("age", raw), "age", "users")),
              "ALTER TABLE users ADD COLUMN age integer DEFAULT 0;");

    auto bare = column("age", "integer", "integer");
    auto result = builder.up_statement(change(ChangeType::AddColumn, bare, "age", "users"));
    ASSERT_TRUE(std::holds_alternative<StatementError>(result));
    EXPECT_EQ(std::get<StatementError>(result).change_type, std::optional<ChangeType>(ChangeType::AddColumn));
}

TEST_F(SqlBuilderTest, ModifyColumnSetsNullabilityAndDefault) {
    auto tightened = change(ChangeType::ModifyColumn,
                            column("status", "varchar", "varchar(20)", "NOT NULL DEFAULT 'active'"),
                            "status", "users");
    tightened.metadata["old_constraints"] = "";
    EXPECT_EQ(up(tightened),
              "ALTER TABLE users ALTER COLUMN status TYPE varchar(20) SET NOT NULL SET DEFAULT 'active'");

    auto relaxed = change(ChangeType::ModifyColumn, column("age", "bigint", "bigint", "DEFAULT 0, CHECK (age > 0)"),
                          "age", "users");
    relaxed.metadata["old_constraints"] = "NOT NULL";
    EXPECT_EQ(up(relaxed), "ALTER TABLE users ALTER COLUMN age TYPE bigint DROP NOT NULL SET DEFAULT 0");
}

TEST_F(SqlBuilderTest, IndexStatements) {
    IndexMeta meta;
    meta.table = "users";
    meta.columns = "email, name";
    meta.is_unique = true;
    auto index = Node::index("idx_users_email", meta);
    EXPECT_EQ(up(change(ChangeType::AddIndex, index, "idx_users_email", "users")),
              "CREATE UNIQUE INDEX idx_users_email ON users (email, name);");

    meta.original_sql = "CREATE INDEX idx_users_email ON users USING btree (email);";
    auto original = Node::index("idx_users_email", meta);
    EXPECT_EQ(up(change(ChangeType::AddIndex, original, "idx_users_email", "users")),
              "CREATE INDEX idx_users_email ON users USING btree (email);");

    auto modify = change(ChangeType::ModifyIndex, index, "idx_users_email", "users");
    modify.metadata["new_definition"] = "CREATE UNIQUE INDEX idx_users_email ON users (email)";
    EXPECT_EQ(up(modify),
              "DROP INDEX IF EXISTS idx_users_email;\nCREATE UNIQUE INDEX idx_users_email ON users (email);");

    modify.metadata.clear();
    EXPECT_TRUE(std::holds_alternative<StatementError>(builder.up_statement(modify)));

    EXPECT_EQ(up(change(ChangeType::DropIndex, index, "idx_users_email", "users")),
              "DROP INDEX IF EXISTS idx_users_email;");
}

TEST_F(SqlBuilderTest, ConstraintStatements) {
    auto unique = Node::constraint("users_email_key", ConstraintMeta{"UNIQUE (email)"});
    EXPECT_EQ(up(change(ChangeType::AddConstraint, unique, "users_email_key", "users")),
              "ALTER TABLE users ADD CONSTRAINT users_email_key UNIQUE (email);");

    auto named = Node::constraint("users_email_key", ConstraintMeta{"CONSTRAINT users_email_key UNIQUE (email)"});
    EXPECT_EQ(up(change(ChangeType::AddConstraint, named, "users_email_key", "users")),
              "ALTER TABLE users ADD CONSTRAINT users_email_key UNIQUE (email);");

    EXPECT_EQ(up(change(ChangeType::DropConstraint, unique, "users_email_key", "users")),
              "ALTER TABLE users DROP CONSTRAINT IF EXISTS users_email_key;");

    auto orphan = builder.up_statement(change(ChangeType::AddConstraint, unique, "users_email_key"));
    EXPECT_TRUE(std::holds_alternative<StatementError>(orphan));
}

TEST_F(SqlBuilderTest, DropStatements) {
    EXPECT_EQ(up(change(ChangeType::DropTable, nullptr, "legacy")), "DROP TABLE IF EXISTS legacy;");
    EXPECT_EQ(up(change(ChangeType::DropColumn, nullptr, "nickname", "users")),
              "ALTER TABLE users DROP COLUMN IF EXISTS nickname;");
}

TEST_F(SqlBuilderTest, DownStatementsInvertAdditiveChanges) {
    EXPECT_EQ(builder.down_statement(change(ChangeType::CreateTable, nullptr, "users")),
              std::optional<std::string>("DROP TABLE IF EXISTS users;"));
    EXPECT_EQ(builder.down_statement(change(ChangeType::AddColumn, nullptr, "email", "users")),
              std::optional<std::string>("ALTER TABLE users DROP COLUMN IF EXISTS email;"));
    EXPECT_EQ(builder.down_statement(change(ChangeType::AddConstraint, nullptr, "users_email_key", "users")),
              std::optional<std::string>("ALTER TABLE users DROP CONSTRAINT IF EXISTS users_email_key;"));
    EXPECT_EQ(builder.down_statement(change(ChangeType::ModifyIndex, nullptr, "idx", "users")),
              std::optional<std::string>("DROP INDEX IF EXISTS idx;"));

    EXPECT_FALSE(builder.down_statement(change(ChangeType::DropTable, nullptr, "users")).has_value());
    EXPECT_FALSE(builder.down_statement(change(ChangeType::ModifyColumn, nullptr, "age", "users")).has_value());
}

TEST(SqlBuilderDetailTest, ExtractsDefaultValues) {
    EXPECT_EQ(diff::detail::extract_default_value("NOT NULL DEFAULT 'a b' UNIQUE"), "'a b'");
    EXPECT_EQ(diff::detail::extract_default_value("DEFAULT now(), NOT NULL"), "now()");
    EXPECT_EQ(diff::detail::extract_default_value("default 42"), "42");
    EXPECT_EQ(diff::detail::extract_default_value("NOT NULL"), "");
}

TEST(SqlBuilderDetailTest, BalancesAndTerminates) {
    EXPECT_EQ(diff::detail::balance_parentheses("numeric(10,2"), "numeric(10,2)");
    EXPECT_EQ(diff::detail::balance_parentheses("CHECK ((a > 0)"), "CHECK ((a > 0))");
    EXPECT_EQ(diff::detail::terminate_statement("DROP TABLE t;; \n"), "DROP TABLE t;");
    EXPECT_EQ(diff::detail::terminate_statement("DROP TABLE t"), "DROP TABLE t;");
}

} // namespace

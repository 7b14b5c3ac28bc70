#include <gtest/gtest.h>
#include "parser/yaml_parser.hpp"

namespace {

class YamlParserTest : public ::testing::Test {
protected:
    static YAML::Node load(const std::string& content) {
        auto result = parser::yaml::parse(content);
        EXPECT_TRUE(std::holds_alternative<YAML::Node>(result));
        return std::holds_alternative<YAML::Node>(result) ? std::get<YAML::Node>(result) : YAML::Node{};
    }
};

TEST_F(YamlParserTest, ReportsSyntaxErrorPosition) {
    auto result = parser::yaml::parse("tables:\n  - name: [unclosed\n");
    ASSERT_TRUE(std::holds_alternative<parser::yaml::Error>(result));
    EXPECT_TRUE(std::get<parser::yaml::Error>(result).line.has_value());
}

TEST_F(YamlParserTest, DecodesSchemaDocument) {
    auto node = load(R"yaml(
tables:
  - name: users
    original_sql: "CREATE TABLE users (id integer PRIMARY KEY)"
    columns:
      - name: id
        type: integer
        constraints: PRIMARY KEY
      - name: email
        full_type: varchar(255)
        definition: email varchar(255) NOT NULL
    constraints:
      - name: users_email_key
        definition: UNIQUE (email)
  - name: orders
    columns:
      - name: user_id
        type: integer
        references: users
indexes:
  - name: idx_orders_user
    table: orders
    columns: [user_id]
  - name: idx_users_email
    table: users
    unique: true
    columns: "email , id"
)yaml");

    auto result = parser::yaml::parse_schema(node);
    ASSERT_TRUE(std::holds_alternative<parser::schema::SchemaDocument>(result));
    const auto& document = std::get<parser::schema::SchemaDocument>(result);

    ASSERT_EQ(document.tables.size(), 2u);
    EXPECT_EQ(document.tables[0].original_sql,
              std::optional<std::string>("CREATE TABLE users (id integer PRIMARY KEY)"));
    ASSERT_EQ(document.tables[0].columns.size(), 2u);
    EXPECT_EQ(document.tables[0].columns[1].definition, "email varchar(255) NOT NULL");
    EXPECT_EQ(document.tables[1].columns[0].references, std::optional<std::string>("users"));

    ASSERT_EQ(document.indexes.size(), 2u);
    EXPECT_FALSE(document.indexes[0].unique);
    EXPECT_EQ(document.indexes[1].columns, (std::vector<std::string>{"email", "id"}));
}

TEST_F(YamlParserTest, RejectsMalformedSchemaDocument) {
    EXPECT_TRUE(std::holds_alternative<parser::yaml::Error>(parser::yaml::parse_schema(load("- a\n- b\n"))));

    auto missing_table = parser::yaml::parse_schema(load("indexes:\n  - name: idx\n    columns: [a]\n"));
    ASSERT_TRUE(std::holds_alternative<parser::yaml::Error>(missing_table));
    EXPECT_TRUE(std::get<parser::yaml::Error>(missing_table).line.has_value());

    auto scalar_tables = parser::yaml::parse_schema(load("tables: users\n"));
    EXPECT_TRUE(std::holds_alternative<parser::yaml::Error>(scalar_tables));
}

TEST_F(YamlParserTest, ParsesDialectDefinition) {
    auto result = parser::yaml::parse_dialect(load(R"yaml(
name: mysql
types:
  text: LONGTEXT
  Bool: TINYINT(1)
)yaml"));
    ASSERT_TRUE(std::holds_alternative<std::shared_ptr<dialect::MappedDialect>>(result));
    const auto& mysql = std::get<std::shared_ptr<dialect::MappedDialect>>(result);
    EXPECT_EQ(mysql->name(), "mysql");
    EXPECT_EQ(mysql->map_type("bool"), std::optional<std::string>("TINYINT(1)"));
    EXPECT_EQ(mysql->map_type("TEXT"), std::optional<std::string>("LONGTEXT"));
}

TEST_F(YamlParserTest, RejectsIncompleteDialect) {
    EXPECT_TRUE(std::holds_alternative<parser::yaml::Error>(parser::yaml::parse_dialect(load("name: mysql\n"))));
    EXPECT_TRUE(std::holds_alternative<parser::yaml::Error>(
        parser::yaml::parse_dialect(load("name: mysql\ntypes: [text]\n"))));
    EXPECT_TRUE(std::holds_alternative<parser::yaml::Error>(
        parser::yaml::parse_dialect(load("name: ''\ntypes:\n  text: TEXT\n"))));
    EXPECT_TRUE(std::holds_alternative<parser::yaml::Error>(parser::yaml::load_dialect("/nonexistent/dialect.yaml")));
}

} // namespace

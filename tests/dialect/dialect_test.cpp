#include <gtest/gtest.h>
#include "dialect/dialect.hpp"

namespace {

using namespace dialect;

TEST(DialectTest, PostgresMapsLogicalTypes) {
    PostgresDialect postgres;
    EXPECT_EQ(postgres.name(), "postgres");
    EXPECT_EQ(postgres.map_type("varchar"), std::optional<std::string>("VARCHAR"));
    EXPECT_EQ(postgres.map_type("BOOL"), std::optional<std::string>("BOOLEAN"));
    EXPECT_EQ(postgres.map_type("timestamptz"), std::optional<std::string>("TIMESTAMP WITH TIME ZONE"));
    EXPECT_FALSE(postgres.map_type("geometry").has_value());
}

TEST(DialectTest, MappedDialectLowercasesKeys) {
    MappedDialect mysql("mysql", {{"Text", "LONGTEXT"}, {"bool", "TINYINT(1)"}});
    EXPECT_EQ(mysql.name(), "mysql");
    EXPECT_EQ(mysql.map_type("text"), std::optional<std::string>("LONGTEXT"));
    EXPECT_EQ(mysql.map_type("TEXT"), std::optional<std::string>("LONGTEXT"));
    EXPECT_EQ(mysql.type_mapping().size(), 2u);
}

class RegistryTest : public ::testing::Test {
protected:
    Registry registry = Registry::with_builtins();
};

TEST_F(RegistryTest, LooksUpCaseInsensitively) {
    ASSERT_NE(registry.get("postgres"), nullptr);
    ASSERT_NE(registry.get("Postgres"), nullptr);
    EXPECT_FALSE(registry.has("oracle"));
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"postgres"}));
    EXPECT_TRUE(Registry::defaults().has("POSTGRES"));
}

TEST_F(RegistryTest, RegistersCustomDialect) {
    auto added = registry.add(std::make_shared<MappedDialect>("SQLite", TypeMapping{{"text", "TEXT"}}));
    ASSERT_TRUE(std::holds_alternative<common::Success>(added));
    ASSERT_TRUE(registry.has("sqlite"));
    EXPECT_EQ(registry.get("sqlite")->name(), "SQLite");
}

TEST_F(RegistryTest, RejectsDuplicateNullAndUnnamedDialects) {
    auto duplicate = registry.add(std::make_shared<MappedDialect>("POSTGRES", TypeMapping{}));
    ASSERT_TRUE(std::holds_alternative<DialectError>(duplicate));
    EXPECT_EQ(std::get<DialectError>(duplicate).context, std::optional<std::string>("POSTGRES"));

    EXPECT_TRUE(std::holds_alternative<DialectError>(registry.add(nullptr)));
    EXPECT_TRUE(std::holds_alternative<DialectError>(
        registry.add(std::make_shared<MappedDialect>("", TypeMapping{}))));
}

} // namespace

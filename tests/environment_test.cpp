#include <gtest/gtest.h>

#include <stdlib.h>
#include <unistd.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "environment.h"

TEST(Environment, SetGetUnset) {
    Environment env(false);
    EXPECT_FALSE(env.get("ESH_TEST_VALUE").has_value());
    env.set("ESH_TEST_VALUE", "abc");
    EXPECT_EQ(env.get_or_empty("ESH_TEST_VALUE"), "abc");
    EXPECT_TRUE(env.is_set("ESH_TEST_VALUE"));
    env.unset("ESH_TEST_VALUE");
    EXPECT_FALSE(env.is_set("ESH_TEST_VALUE"));
    EXPECT_EQ(env.get_or_empty("ESH_TEST_VALUE"), "");
}

TEST(Environment, ValidNamesReachProcessEnvironment) {
    Environment env(false);
    env.set("ESH_EXPORTED_NAME", "yes");
    const char* exported = getenv("ESH_EXPORTED_NAME");
    ASSERT_NE(exported, nullptr);
    EXPECT_STREQ(exported, "yes");
    env.unset("ESH_EXPORTED_NAME");
    EXPECT_EQ(getenv("ESH_EXPORTED_NAME"), nullptr);
}

TEST(Environment, ImportsProcessEnvironment) {
    setenv("ESH_IMPORTED", "from-parent", 1);
    Environment env;
    EXPECT_EQ(env.get_or_empty("ESH_IMPORTED"), "from-parent");
    unsetenv("ESH_IMPORTED");
}

TEST(Environment, SpecialParameters) {
    Environment env(false);
    EXPECT_EQ(env.get_or_empty("#"), "0");
    EXPECT_EQ(env.get_or_empty("?"), "0");
    EXPECT_EQ(env.get_or_empty("$"), std::to_string(getpid()));
    EXPECT_TRUE(env.get("!").has_value());
    env.set_last_status(42);
    EXPECT_EQ(env.last_status(), 42);
    EXPECT_EQ(env.get_or_empty("?"), "42");
}

TEST(Environment, PositionalParametersAndShift) {
    Environment env(false);
    env.set_positional_parameters({"one", "two", "three"});
    EXPECT_EQ(env.get_or_empty("#"), "3");
    EXPECT_EQ(env.get_or_empty("2"), "two");
    EXPECT_EQ(env.get_or_empty("@"), "one two three");

    EXPECT_TRUE(env.shift(2));
    std::vector<std::string> expected = {"three"};
    EXPECT_EQ(env.positional_parameters(), expected);
    EXPECT_FALSE(env.get("2").has_value());

    EXPECT_FALSE(env.shift(5));
    EXPECT_EQ(env.positional_parameters(), expected);
}

TEST(Environment, ArraysReplaceScalars) {
    Environment env(false);
    env.set("item", "scalar");
    env.set_array("item", {"a", "b"});
    EXPECT_EQ(env.kind_of("item"), VariableKind::ARRAY);
    EXPECT_FALSE(env.get("item").has_value());
    ASSERT_NE(env.get_array("item"), nullptr);
    EXPECT_EQ(env.get_array("item")->size(), 2u);

    env.set("item", "back");
    EXPECT_EQ(env.kind_of("item"), VariableKind::SCALAR);
    EXPECT_EQ(env.get_array("item"), nullptr);
}

TEST(Environment, ElementAssignmentGrowsArray) {
    Environment env(false);
    env.set_array_element("sparse", 3, "d");
    const auto* values = env.get_array("sparse");
    ASSERT_NE(values, nullptr);
    ASSERT_EQ(values->size(), 4u);
    EXPECT_EQ((*values)[3], "d");
    EXPECT_EQ((*values)[0], "");
}

TEST(Environment, ElementIndexAboveLimitIsRejected) {
    Environment env(false);
    EXPECT_THROW(env.set_array_element("big", Environment::kMaxArrayIndex + 1, "x"),
                 std::out_of_range);
    EXPECT_EQ(env.get_array("big"), nullptr);
    env.set_array_element("big", Environment::kMaxArrayIndex, "x");
    ASSERT_NE(env.get_array("big"), nullptr);
    EXPECT_EQ(env.get_array("big")->size(), Environment::kMaxArrayIndex + 1);
}

TEST(Environment, AppendSeedsFromScalar) {
    Environment env(false);
    env.set("s", "first");
    env.append_array("s", {"second"});
    const auto* values = env.get_array("s");
    ASSERT_NE(values, nullptr);
    std::vector<std::string> expected = {"first", "second"};
    EXPECT_EQ(*values, expected);
}

TEST(Environment, AssociativeArrays) {
    Environment env(false);
    env.set_assoc_element("colors", "red", "ff0000");
    env.set_assoc_element("colors", "blue", "0000ff");
    EXPECT_EQ(env.kind_of("colors"), VariableKind::ASSOC);
    const auto* values = env.get_assoc("colors");
    ASSERT_NE(values, nullptr);
    EXPECT_EQ(values->begin()->first, "blue");
    EXPECT_EQ(values->at("red"), "ff0000");

    env.declare_array("list");
    std::vector<std::string> names = {"colors", "list"};
    EXPECT_EQ(env.array_names(), names);
}

TEST(Environment, IdentifierRules) {
    EXPECT_TRUE(Environment::is_valid_identifier("_name1"));
    EXPECT_FALSE(Environment::is_valid_identifier("1name"));
    EXPECT_FALSE(Environment::is_valid_identifier("a-b"));
    EXPECT_TRUE(Environment::is_positional_name("12"));
    EXPECT_FALSE(Environment::is_positional_name("0"));
}

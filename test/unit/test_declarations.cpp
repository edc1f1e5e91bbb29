#include "nomen/core/declarations.hpp"

#include <gtest/gtest.h>

using namespace nomen::decl;

TEST(Declarations, StringLiteralIsQuotedAndEscaped) {
    EXPECT_EQ(to_cpp(string_literal{"prod"}), "\"prod\"");
    EXPECT_EQ(to_cpp(string_literal{""}), "\"\"");
    EXPECT_EQ(to_cpp(string_literal{"say \"hi\"\n"}), "\"say \\\"hi\\\"\\n\"");
    EXPECT_EQ(to_cpp(string_literal{"C:\\path\t1"}), "\"C:\\\\path\\t1\"");
}

TEST(Declarations, ReferenceExpressions) {
    EXPECT_EQ(to_cpp(parameter_ref{"environment"}), "environment");
    EXPECT_EQ(to_cpp(enum_case_ref{"Environment", "Prod"}), "Environment::Prod");
    EXPECT_EQ(to_cpp(raw_value_of{"environment"}), "raw_value(environment)");
}

TEST(Declarations, EscapeLeavesPlainTextAlone) {
    EXPECT_EQ(escape_cpp_string("https://{environment}.example.com/v1"),
              "https://{environment}.example.com/v1");
    EXPECT_EQ(escape_cpp_string("caf\xC3\xA9"), "caf\xC3\xA9");
    EXPECT_EQ(escape_cpp_string("\r"), "\\r");
}

TEST(Declarations, ControlCharactersUseFixedWidthOctal) {
    EXPECT_EQ(escape_cpp_string("a\x01"
                                "1"),
              "a\\0011");
    EXPECT_EQ(escape_cpp_string(std::string_view("\0", 1)), "\\000");
    EXPECT_EQ(to_cpp(string_literal{"\x1B[0m\x7F"}), "\"\\033[0m\\177\"");
}

TEST(Declarations, EnumLookup) {
    enum_decl e;
    e.name = "Environment";
    e.cases = {{"Prod", "prod"}, {"Staging", "staging"}, {"Dev", "dev-1"}};

    const auto* prod = e.find_case("Prod");
    ASSERT_NE(prod, nullptr);
    EXPECT_EQ(prod->raw_value, "prod");

    const auto* dev = e.find_raw_value("dev-1");
    ASSERT_NE(dev, nullptr);
    EXPECT_EQ(dev->name, "Dev");

    EXPECT_EQ(e.find_case("prod"), nullptr);
    EXPECT_EQ(e.find_raw_value("Prod"), nullptr);
    EXPECT_EQ(enum_decl{}.find_case("Prod"), nullptr);
}

TEST(Declarations, AccessAttribute) {
    EXPECT_EQ(access_attribute(access_modifier::internal_access),
              "[[gnu::visibility(\"hidden\")]]");
    EXPECT_TRUE(access_attribute(access_modifier::public_access).empty());
    EXPECT_EQ(enum_decl{}.access, access_modifier::internal_access);
}

TEST(Declarations, FunctionDefaults) {
    function_decl f;
    EXPECT_EQ(f.access, access_modifier::internal_access);
    EXPECT_EQ(f.return_type, "std::string");
    EXPECT_FALSE(f.deprecated);
    EXPECT_TRUE(f.parameters.empty());
    EXPECT_TRUE(f.body.substitutions.empty());
}

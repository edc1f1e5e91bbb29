#include "nomen/core/identifier.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace nomen;

namespace {

class IdiomaticNamingTest : public ::testing::Test {
protected:
    void SetUp() override { config.strategy = naming_strategy::idiomatic; }

    std::string type(std::string_view raw) {
        return project(raw, identifier_role::type_name, config);
    }

    std::string member(std::string_view raw) {
        return project(raw, identifier_role::member_name, config);
    }

    std::string enum_case(std::string_view raw) {
        return project(raw, identifier_role::enum_case_name, config);
    }

    naming_config config;
};

} // namespace

TEST_F(IdiomaticNamingTest, JoinsWordsSeparatedBySpaces) {
    EXPECT_EQ(type("Hello world"), "HelloWorld");
    EXPECT_EQ(member("Hello world"), "helloWorld");
}

TEST_F(IdiomaticNamingTest, TitleCasesShoutedNames) {
    EXPECT_EQ(type("NOT_AVAILABLE"), "NotAvailable");
    EXPECT_EQ(member("NOT_AVAILABLE"), "notAvailable");
    EXPECT_EQ(type("HTTP"), "Http");
    EXPECT_EQ(member("URL2"), "url2");
    EXPECT_EQ(type("URL2"), "Url2");
}

TEST_F(IdiomaticNamingTest, KeepsSeparatorBetweenNumbers) {
    EXPECT_EQ(type("version 2.0"), "Version2_0");
    EXPECT_EQ(member("version 2.0"), "version2_0");
    EXPECT_EQ(type("1.2.3"), "_1_2_3");
}

TEST_F(IdiomaticNamingTest, SoftensLeadingAcronymForMembers) {
    EXPECT_EQ(member("HTTPProxy"), "httpProxy");
    EXPECT_EQ(type("HTTPProxy"), "HTTPProxy");
    EXPECT_EQ(member("XMLHttpRequest"), "xmlHttpRequest");
    EXPECT_EQ(type("XMLHttpRequest"), "XMLHttpRequest");
    EXPECT_EQ(member("iOS"), "ios");
    EXPECT_EQ(type("iOS"), "IOS");
}

TEST_F(IdiomaticNamingTest, EnumCasesUseLeadingCapital) {
    EXPECT_EQ(enum_case("prod"), "Prod");
    EXPECT_EQ(enum_case("us-east-1"), "UsEast1");
    EXPECT_EQ(enum_case("in_progress"), "InProgress");
}

TEST_F(IdiomaticNamingTest, SplitsOnEverySupportedSeparator) {
    EXPECT_EQ(member("snake_case_name"), "snakeCaseName");
    EXPECT_EQ(type("kebab-case-name"), "KebabCaseName");
    EXPECT_EQ(type("dotted.name"), "DottedName");
    EXPECT_EQ(type("path/segment"), "PathSegment");
    EXPECT_EQ(type("a+b"), "AB");
    EXPECT_EQ(type("already camelCase"), "AlreadyCamelCase");
}

TEST_F(IdiomaticNamingTest, StripsBraces) {
    EXPECT_EQ(type("user{id}"), "UserId");
    EXPECT_EQ(type("/users/{id}"), "UsersId");
    EXPECT_EQ(member("{id}"), "id");
}

TEST_F(IdiomaticNamingTest, PreservesLeadingUnderscores) {
    EXPECT_EQ(member("_private_field"), "_privateField");
    EXPECT_EQ(type("_private_field"), "_PrivateField");
    EXPECT_EQ(member("__meta"), "__meta");
}

TEST_F(IdiomaticNamingTest, DigitLeadingResultIsPrefixed) {
    EXPECT_EQ(member("2fa-token"), "_2faToken");
    EXPECT_EQ(type("404"), "_404");
}

TEST_F(IdiomaticNamingTest, UnsupportedCharacterFallsBackToDefensive) {
    EXPECT_EQ(type("order#123"), defensive_name("order#123"));
    EXPECT_EQ(type("order#123"), "order_num_123");
    // The whole name falls back, including the parts idiomatic could handle.
    EXPECT_EQ(member("Hello world!"), "Hello_space_world_excl_");
}

TEST_F(IdiomaticNamingTest, NamesWithoutWordsFallBackToDefensive) {
    EXPECT_EQ(type(""), "_empty");
    EXPECT_EQ(type("_"), "_underscore_");
    EXPECT_EQ(type("__"), "__");
    EXPECT_EQ(type("..."), "_period_period_period_");
}

TEST_F(IdiomaticNamingTest, KeywordsArePrefixed) {
    EXPECT_EQ(member("default"), "_default");
    EXPECT_EQ(type("default"), "Default");
    EXPECT_EQ(member("NEW"), "_new");
}

TEST_F(IdiomaticNamingTest, HandlesUnicodeLetters) {
    // "ÉCOLE_NORMALE" -> "ÉcoleNormale"
    EXPECT_EQ(type("\xC3\x89"
                   "COLE_NORMALE"),
              "\xC3\x89"
              "coleNormale");
    // "über cool" -> "überCool" / "ÜberCool"
    EXPECT_EQ(member("\xC3\xBC"
                     "ber cool"),
              "\xC3\xBC"
              "berCool");
    EXPECT_EQ(type("\xC3\xBC"
                   "ber cool"),
              "\xC3\x9C"
              "berCool");
}

TEST_F(IdiomaticNamingTest, OverrideWinsOverIdiomatic) {
    config.overrides.emplace("NOT_AVAILABLE", "notAvailableYet");
    EXPECT_EQ(type("NOT_AVAILABLE"), "notAvailableYet");
    EXPECT_EQ(member("NOT_AVAILABLE"), "notAvailableYet");
}

TEST(IdiomaticNaming, DirectEntryPointMatchesProject) {
    naming_config config;
    config.strategy = naming_strategy::idiomatic;
    EXPECT_EQ(idiomatic_name("Hello world", identifier_role::member_name),
              project("Hello world", identifier_role::member_name, config));
}

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Declaration model handed to the emission layer. Plain data: the emitter decides spelling,
// these structures only carry names, types and expressions.
namespace nomen::decl {

// Linkage of generated declarations. Internal declarations stay inside the generated library
// (hidden visibility); public ones are part of its exported API.
enum class access_modifier : uint8_t { public_access, internal_access };

struct string_literal {
    std::string value;
};

struct parameter_ref {
    std::string name;
};

struct enum_case_ref {
    std::string enum_name;
    std::string case_name;
};

// Underlying document string of an enum-typed parameter.
struct raw_value_of {
    std::string parameter;
};

using expression = std::variant<string_literal, parameter_ref, enum_case_ref, raw_value_of>;

struct enum_case {
    std::string name;
    std::string raw_value;
};

struct enum_decl {
    std::string name;
    std::vector<enum_case> cases;
    std::string doc;
    access_modifier access = access_modifier::internal_access;

    [[nodiscard]] const enum_case* find_case(std::string_view case_name) const noexcept;
    [[nodiscard]] const enum_case* find_raw_value(std::string_view raw_value) const noexcept;
};

struct parameter_decl {
    std::string name;
    std::string type;
    expression default_value;
    std::string doc;
};

// One "{name}" placeholder of the URL template and the value that replaces it. A non-empty
// allowed_values list is checked by the runtime before substitution.
struct variable_substitution {
    std::string name;
    expression value;
    std::vector<std::string> allowed_values;
};

struct server_url_expr {
    std::string url_template;
    std::vector<variable_substitution> substitutions;
};

struct function_decl {
    std::string name;
    std::vector<parameter_decl> parameters;
    std::string return_type = "std::string";
    server_url_expr body;
    std::string doc;
    bool deprecated = false;
    access_modifier access = access_modifier::internal_access;
};

struct namespace_decl {
    std::string name;
    std::vector<enum_decl> enums;
    function_decl accessor;
    std::string doc;
};

std::string escape_cpp_string(std::string_view sv);

// Attribute spelling for a declaration with the given access, empty for public declarations.
std::string_view access_attribute(access_modifier access) noexcept;

// C++ spelling of an expression, e.g. "\"prod\"" or "Environment::Prod".
std::string to_cpp(const expression& expr);

} // namespace nomen::decl

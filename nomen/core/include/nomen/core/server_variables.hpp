#pragma once

#include "config.hpp"
#include "declarations.hpp"
#include "identifier.hpp"
#include "server_ast.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace nomen {

// Variable without allowed values: a plain std::string parameter.
struct raw_string_variable {
    std::string name;
    std::string parameter_name;
    std::string default_value;
    std::string description;
};

// Variable with allowed values: a generated enum whose cases keep the document strings as
// raw values.
struct generated_enum_variable {
    std::string name;
    std::string parameter_name;
    decl::enum_decl enumeration;
    std::string default_case;
    std::string description;
};

using translated_server_variable = std::variant<raw_string_variable, generated_enum_variable>;

[[nodiscard]] std::optional<decl::enum_decl> declaration_of(const translated_server_variable& v);
[[nodiscard]] decl::parameter_decl parameter_of(const translated_server_variable& v);
[[nodiscard]] decl::expression initializer_of(const translated_server_variable& v);
[[nodiscard]] std::string doc_fragment_of(const translated_server_variable& v);

enum class diagnostic_severity : uint8_t { warning, error };

struct diagnostic {
    diagnostic_severity severity = diagnostic_severity::warning;
    std::error_code code;
    size_t server_index = 0;
    std::string server;
    std::string variable;
    std::string first_value;  // for case collisions: the value that kept the case
    std::string second_value; // for case collisions: the value that was omitted
    std::string identifier;

    [[nodiscard]] std::string message() const;
};

struct translated_server {
    size_t index = 0;
    std::vector<translated_server_variable> variables;
    decl::namespace_decl server_namespace;
    decl::function_decl legacy_accessor;
    std::vector<diagnostic> diagnostics;

    [[nodiscard]] bool has_errors() const noexcept;
};

enum class execution : uint8_t { sequential, parallel };

struct translation_result {
    std::vector<translated_server> servers;
    std::vector<diagnostic> diagnostics; // all servers, in server order

    [[nodiscard]] bool has_errors() const noexcept;
};

std::string server_namespace_name(size_t index);
std::string legacy_accessor_name(size_t index);

translated_server_variable translate_variable(const server_variable& variable,
                                              std::string_view server_name,
                                              size_t server_index,
                                              const naming_config& config,
                                              collision_policy policy,
                                              std::vector<diagnostic>& diagnostics);

// Translates the server at position `index` of the document. Never throws; problems end up in
// translated_server::diagnostics.
translated_server translate_server(const server_definition& server,
                                   size_t index,
                                   const naming_config& config,
                                   collision_policy policy = collision_policy::omit,
                                   decl::access_modifier access = default_access_modifier);

translation_result translate_servers(std::span<const server_definition> servers,
                                     const naming_config& config,
                                     collision_policy policy = collision_policy::omit,
                                     execution mode = execution::sequential,
                                     decl::access_modifier access = default_access_modifier);

translation_result translate_servers(std::span<const server_definition> servers,
                                     const generator_config& config,
                                     execution mode = execution::sequential);

} // namespace nomen

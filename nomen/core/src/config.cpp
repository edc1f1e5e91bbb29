#include "nomen/core/config.hpp"

namespace nomen {

result<naming_strategy> parse_naming_strategy(std::string_view text) {
    if (text.empty() || text == "defensive") {
        return naming_strategy::defensive;
    }
    if (text == "idiomatic") {
        return naming_strategy::idiomatic;
    }
    return std::unexpected(make_error_code(error_code::unknown_naming_strategy));
}

result<identifier_role> parse_identifier_role(std::string_view text) {
    if (text == "type") {
        return identifier_role::type_name;
    }
    if (text == "member") {
        return identifier_role::member_name;
    }
    if (text == "enum-case") {
        return identifier_role::enum_case_name;
    }
    if (text == "content-type") {
        return identifier_role::content_type_token;
    }
    return std::unexpected(make_error_code(error_code::unknown_identifier_role));
}

result<collision_policy> parse_collision_policy(std::string_view text) {
    if (text.empty() || text == "omit") {
        return collision_policy::omit;
    }
    if (text == "fail") {
        return collision_policy::fail;
    }
    return std::unexpected(make_error_code(error_code::unknown_collision_policy));
}

result<generator_mode> parse_generator_mode(std::string_view text) {
    if (text.empty() || text == "types") {
        return generator_mode::types;
    }
    if (text == "client") {
        return generator_mode::client;
    }
    if (text == "server") {
        return generator_mode::server;
    }
    return std::unexpected(make_error_code(error_code::unknown_generator_mode));
}

result<decl::access_modifier> parse_access_modifier(std::string_view text) {
    if (text.empty()) {
        return default_access_modifier;
    }
    if (text == "public") {
        return decl::access_modifier::public_access;
    }
    if (text == "internal") {
        return decl::access_modifier::internal_access;
    }
    return std::unexpected(make_error_code(error_code::unknown_access_modifier));
}

result<std::pair<std::string, std::string>> parse_name_override(std::string_view text) {
    auto eq_pos = text.rfind('=');
    if (eq_pos == std::string_view::npos || eq_pos == 0 || eq_pos + 1 == text.size()) {
        return std::unexpected(make_error_code(error_code::malformed_name_override));
    }
    return std::pair<std::string, std::string>{std::string(text.substr(0, eq_pos)),
                                               std::string(text.substr(eq_pos + 1))};
}

std::string_view to_string(naming_strategy strategy) noexcept {
    switch (strategy) {
    case naming_strategy::defensive:
        return "defensive";
    case naming_strategy::idiomatic:
        return "idiomatic";
    default:
        return "unknown";
    }
}

std::string_view to_string(identifier_role role) noexcept {
    switch (role) {
    case identifier_role::type_name:
        return "type";
    case identifier_role::member_name:
        return "member";
    case identifier_role::enum_case_name:
        return "enum-case";
    case identifier_role::content_type_token:
        return "content-type";
    default:
        return "unknown";
    }
}

std::string_view to_string(collision_policy policy) noexcept {
    switch (policy) {
    case collision_policy::omit:
        return "omit";
    case collision_policy::fail:
        return "fail";
    default:
        return "unknown";
    }
}

std::string_view to_string(generator_mode mode) noexcept {
    switch (mode) {
    case generator_mode::types:
        return "types";
    case generator_mode::client:
        return "client";
    case generator_mode::server:
        return "server";
    default:
        return "unknown";
    }
}

std::string_view to_string(decl::access_modifier access) noexcept {
    switch (access) {
    case decl::access_modifier::public_access:
        return "public";
    case decl::access_modifier::internal_access:
        return "internal";
    default:
        return "unknown";
    }
}

} // namespace nomen

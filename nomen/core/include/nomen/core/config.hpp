#pragma once

#include "declarations.hpp"
#include "identifier.hpp"
#include "result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nomen {

enum class collision_policy : uint8_t {
    omit, // keep the first case, drop the later one, report a warning
    fail, // same output, but the collision is reported as an error
};

// Which file the emission layer generates. Translation output is the same for every mode.
enum class generator_mode : uint8_t { types, client, server };

inline constexpr decl::access_modifier default_access_modifier =
    decl::access_modifier::internal_access;

struct generator_config {
    generator_mode mode = generator_mode::types;
    decl::access_modifier access = default_access_modifier;
    std::vector<std::string> additional_file_comments; // emitted as "// ..." file header lines
    naming_config naming;
    collision_policy collisions = collision_policy::omit;
};

result<naming_strategy> parse_naming_strategy(std::string_view text);
result<identifier_role> parse_identifier_role(std::string_view text);
result<collision_policy> parse_collision_policy(std::string_view text);
result<generator_mode> parse_generator_mode(std::string_view text);
result<decl::access_modifier> parse_access_modifier(std::string_view text);

// "raw=identifier"; the split happens at the last '=' so raw names may contain '='.
result<std::pair<std::string, std::string>> parse_name_override(std::string_view text);

std::string_view to_string(naming_strategy strategy) noexcept;
std::string_view to_string(identifier_role role) noexcept;
std::string_view to_string(collision_policy policy) noexcept;
std::string_view to_string(generator_mode mode) noexcept;
std::string_view to_string(decl::access_modifier access) noexcept;

} // namespace nomen

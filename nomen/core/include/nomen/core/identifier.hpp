#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace nomen {

enum class identifier_role : uint8_t { type_name, member_name, enum_case_name, content_type_token };

enum class naming_strategy : uint8_t { defensive, idiomatic };

struct transparent_string_hash {
    using is_transparent = void;

    size_t operator()(std::string_view sv) const noexcept {
        return std::hash<std::string_view>{}(sv);
    }
};

// Raw document name -> identifier, used verbatim.
using name_overrides =
    std::unordered_map<std::string, std::string, transparent_string_hash, std::equal_to<>>;

struct naming_config {
    naming_strategy strategy = naming_strategy::defensive;
    name_overrides overrides;
};

[[nodiscard]] constexpr bool is_capitalized(identifier_role role) noexcept {
    return role == identifier_role::type_name || role == identifier_role::enum_case_name;
}

// Maps a raw document name to an identifier for the given role. Never fails: names the
// configured strategy cannot handle degrade to the defensive escaping.
std::string project(std::string_view raw, identifier_role role, const naming_config& config);

// Projects a media type such as "application/json; charset=utf-8" with the content-type role.
std::string project_content_type(std::string_view media_type, const naming_config& config);

std::string defensive_name(std::string_view raw);
std::string idiomatic_name(std::string_view raw, identifier_role role);

// Drops parameters and surrounding blanks and lowercases ASCII letters.
std::string normalize_media_type(std::string_view media_type);

[[nodiscard]] bool is_cpp_keyword(std::string_view name) noexcept;

// True for non-empty names that lex as a single identifier and are not keywords.
[[nodiscard]] bool is_valid_identifier(std::string_view name);

} // namespace nomen

#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace nomen {

template <typename T> using result = std::expected<T, std::error_code>;

enum class error_code : int {
    ok = 0,
    unknown_naming_strategy = 1,
    unknown_identifier_role = 2,
    unknown_collision_policy = 3,
    malformed_name_override = 4,
    enum_case_collision = 5,
    enum_name_collision = 6,
    duplicate_allowed_value = 7,
    parameter_name_collision = 8,
    unknown_generator_mode = 9,
    unknown_access_modifier = 10,
};

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "nomen"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::unknown_naming_strategy:
            return "unknown naming strategy (expected: defensive|idiomatic)";
        case ec::unknown_identifier_role:
            return "unknown identifier role (expected: type|member|enum-case|content-type)";
        case ec::unknown_collision_policy:
            return "unknown collision policy (expected: omit|fail)";
        case ec::malformed_name_override:
            return "malformed name override (expected: raw=identifier)";
        case ec::enum_case_collision:
            return "allowed values project to the same enum case name";
        case ec::enum_name_collision:
            return "server variables project to the same enum type name";
        case ec::duplicate_allowed_value:
            return "allowed value listed more than once";
        case ec::parameter_name_collision:
            return "server variables project to the same parameter name";
        case ec::unknown_generator_mode:
            return "unknown generator mode (expected: types|client|server)";
        case ec::unknown_access_modifier:
            return "unknown access modifier (expected: public|internal)";
        default:
            return "unknown error";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

} // namespace nomen

namespace std {
template <> struct is_error_code_enum<nomen::error_code> : true_type {};
} // namespace std

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace nomen {

// Read-only view of the document model's server objects. Empty strings and lists mean "absent".
struct server_variable {
    std::string name;
    std::string default_value;
    std::vector<std::string> enum_values;
    std::string description;

    [[nodiscard]] bool has_enum() const noexcept { return !enum_values.empty(); }
};

struct server_definition {
    std::string url_template; // e.g. "https://{environment}.example.com/{version}"
    std::vector<server_variable> variables;
    std::string description;

    [[nodiscard]] const server_variable* find_variable(std::string_view name) const noexcept {
        for (const auto& v : variables) {
            if (v.name == name) {
                return &v;
            }
        }
        return nullptr;
    }
};

} // namespace nomen

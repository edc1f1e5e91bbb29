#include "nomen/core/declarations.hpp"

namespace nomen::decl {

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

const enum_case* enum_decl::find_case(std::string_view case_name) const noexcept {
    for (const auto& c : cases) {
        if (c.name == case_name) {
            return &c;
        }
    }
    return nullptr;
}

const enum_case* enum_decl::find_raw_value(std::string_view raw_value) const noexcept {
    for (const auto& c : cases) {
        if (c.raw_value == raw_value) {
            return &c;
        }
    }
    return nullptr;
}

std::string escape_cpp_string(std::string_view sv) {
    std::string out;
    out.reserve(sv.size() + 8);
    for (char c : sv) {
        switch (c) {
        case '\"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            // Octal escapes have a fixed width, so a following digit cannot extend them.
            if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
                auto byte = static_cast<unsigned char>(c);
                out.push_back('\\');
                out.push_back(static_cast<char>('0' + ((byte >> 6) & 0x07)));
                out.push_back(static_cast<char>('0' + ((byte >> 3) & 0x07)));
                out.push_back(static_cast<char>('0' + (byte & 0x07)));
            } else {
                out.push_back(c);
            }
            break;
        }
    }
    return out;
}

std::string_view access_attribute(access_modifier access) noexcept {
    switch (access) {
    case access_modifier::internal_access:
        return "[[gnu::visibility(\"hidden\")]]";
    case access_modifier::public_access:
    default:
        return {};
    }
}

std::string to_cpp(const expression& expr) {
    return std::visit(
        overloaded{
            [](const string_literal& e) { return "\"" + escape_cpp_string(e.value) + "\""; },
            [](const parameter_ref& e) { return e.name; },
            [](const enum_case_ref& e) { return e.enum_name + "::" + e.case_name; },
            [](const raw_value_of& e) { return "raw_value(" + e.parameter + ")"; },
        },
        expr);
}

} // namespace nomen::decl

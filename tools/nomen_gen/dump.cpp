#include "dump.hpp"

#include <sstream>
#include <string>

namespace nomen_gen {

namespace {

void dump_parameters(std::ostringstream& os, const nomen::decl::function_decl& fn) {
    os << "\"parameters\":[";
    bool first_param = true;
    for (const auto& p : fn.parameters) {
        if (!first_param) {
            os << ",";
        }
        first_param = false;
        os << "{";
        os << "\"name\":\"" << escape_json(p.name) << "\",";
        os << "\"type\":\"" << escape_json(p.type) << "\",";
        os << "\"default\":\"" << escape_json(nomen::decl::to_cpp(p.default_value)) << "\"";
        os << "}";
    }
    os << "]";
}

std::string signature(const nomen::decl::function_decl& fn) {
    std::ostringstream os;
    if (auto attribute = nomen::decl::access_attribute(fn.access); !attribute.empty()) {
        os << attribute << " ";
    }
    if (fn.deprecated) {
        os << "[[deprecated]] ";
    }
    os << fn.return_type << " " << fn.name << "(";
    for (size_t i = 0; i < fn.parameters.size(); ++i) {
        const auto& p = fn.parameters[i];
        if (i > 0) {
            os << ", ";
        }
        os << p.type << " " << p.name << " = " << nomen::decl::to_cpp(p.default_value);
    }
    os << ")";
    return os.str();
}

} // namespace

std::string escape_json(std::string_view sv) {
    constexpr char hex_digits[] = "0123456789abcdef";
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
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
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
            if (static_cast<unsigned char>(c) < 0x20) {
                auto byte = static_cast<unsigned char>(c);
                out += "\\u00";
                out.push_back(hex_digits[byte >> 4]);
                out.push_back(hex_digits[byte & 0x0F]);
            } else {
                out.push_back(c);
            }
            break;
        }
    }
    return out;
}

std::string dump_server_json(const nomen::translated_server& server) {
    const auto& ns = server.server_namespace;
    std::ostringstream os;
    os << "{";
    os << "\"namespace\":\"" << escape_json(ns.name) << "\",";
    os << "\"enums\":[";
    bool first_enum = true;
    for (const auto& e : ns.enums) {
        if (!first_enum) {
            os << ",";
        }
        first_enum = false;
        os << "{";
        os << "\"name\":\"" << escape_json(e.name) << "\",";
        os << "\"access\":\"" << nomen::to_string(e.access) << "\",";
        os << "\"cases\":[";
        bool first_case = true;
        for (const auto& c : e.cases) {
            if (!first_case) {
                os << ",";
            }
            first_case = false;
            os << "{\"name\":\"" << escape_json(c.name) << "\",\"rawValue\":\""
               << escape_json(c.raw_value) << "\"}";
        }
        os << "]";
        os << "}";
    }
    os << "],";

    os << "\"accessor\":{";
    os << "\"name\":\"" << escape_json(ns.accessor.name) << "\",";
    os << "\"access\":\"" << nomen::to_string(ns.accessor.access) << "\",";
    dump_parameters(os, ns.accessor);
    os << "},";

    os << "\"legacyAccessor\":{";
    os << "\"name\":\"" << escape_json(server.legacy_accessor.name) << "\",";
    os << "\"deprecated\":" << (server.legacy_accessor.deprecated ? "true" : "false") << ",";
    os << "\"access\":\"" << nomen::to_string(server.legacy_accessor.access) << "\",";
    dump_parameters(os, server.legacy_accessor);
    os << "},";

    os << "\"diagnostics\":[";
    bool first_diag = true;
    for (const auto& d : server.diagnostics) {
        if (!first_diag) {
            os << ",";
        }
        first_diag = false;
        os << "\"" << escape_json(d.message()) << "\"";
    }
    os << "]";
    os << "}";
    return os.str();
}

std::string describe_server(const nomen::translated_server& server) {
    const auto& ns = server.server_namespace;
    std::ostringstream os;
    os << "namespace " << ns.name << " {\n";
    for (const auto& e : ns.enums) {
        os << "    enum class " << e.name << " {";
        for (size_t i = 0; i < e.cases.size(); ++i) {
            os << (i > 0 ? ", " : " ") << e.cases[i].name << " = \""
               << nomen::decl::escape_cpp_string(e.cases[i].raw_value) << "\"";
        }
        os << " };\n";
    }
    os << "    " << signature(ns.accessor) << ";\n";
    os << "} // namespace " << ns.name << "\n";
    os << signature(server.legacy_accessor) << ";\n";
    return os.str();
}

std::string file_header(const std::vector<std::string>& comments) {
    std::ostringstream os;
    for (const auto& comment : comments) {
        os << "// " << comment << "\n";
    }
    return os.str();
}

} // namespace nomen_gen

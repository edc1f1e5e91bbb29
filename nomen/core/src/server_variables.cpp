#include "nomen/core/server_variables.hpp"

#include <algorithm>
#include <sstream>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>

namespace nomen {

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};

using name_index =
    std::unordered_map<std::string, std::string, transparent_string_hash, std::equal_to<>>;

diagnostic_severity severity_for(collision_policy policy) noexcept {
    return policy == collision_policy::fail ? diagnostic_severity::error
                                            : diagnostic_severity::warning;
}

decl::enum_decl make_enum(const server_variable& variable,
                          std::string_view server_name,
                          size_t server_index,
                          const naming_config& config,
                          collision_policy policy,
                          std::vector<diagnostic>& diagnostics) {
    decl::enum_decl out;
    out.name = project(variable.name, identifier_role::type_name, config);
    out.doc = variable.description;
    out.cases.reserve(variable.enum_values.size());

    name_index used; // case name -> raw value that claimed it
    for (const auto& value : variable.enum_values) {
        if (out.find_raw_value(value)) {
            diagnostics.push_back(diagnostic{diagnostic_severity::warning,
                                             make_error_code(error_code::duplicate_allowed_value),
                                             server_index,
                                             std::string(server_name),
                                             variable.name,
                                             value,
                                             value,
                                             {}});
            continue;
        }

        auto case_name = project(value, identifier_role::enum_case_name, config);
        if (auto it = used.find(case_name); it != used.end()) {
            std::string kept = it->second;
            std::string omitted = value;
            // The default keeps its case so typed and legacy accessors send the same string.
            if (value == variable.default_value) {
                auto c = std::find_if(out.cases.begin(), out.cases.end(), [&](const auto& ec) {
                    return ec.name == case_name;
                });
                c->raw_value = value;
                it->second = value;
                std::swap(kept, omitted);
            }
            diagnostics.push_back(diagnostic{severity_for(policy),
                                             make_error_code(error_code::enum_case_collision),
                                             server_index,
                                             std::string(server_name),
                                             variable.name,
                                             std::move(kept),
                                             std::move(omitted),
                                             case_name});
            continue;
        }

        used.emplace(case_name, value);
        out.cases.push_back(decl::enum_case{std::move(case_name), value});
    }
    return out;
}

std::string function_doc(std::string_view summary,
                         const std::vector<decl::parameter_decl>& parameters) {
    std::ostringstream oss;
    oss << summary;
    bool header = false;
    for (const auto& p : parameters) {
        if (p.doc.empty()) {
            continue;
        }
        if (!header) {
            oss << "\n\n- Parameters:";
            header = true;
        }
        oss << "\n  - " << p.name << ": " << p.doc;
    }
    return oss.str();
}

void report_duplicate(name_index& seen,
                      const std::string& identifier,
                      const std::string& variable,
                      error_code code,
                      const translated_server& server,
                      collision_policy policy,
                      std::vector<diagnostic>& diagnostics) {
    auto [it, inserted] = seen.emplace(identifier, variable);
    if (inserted) {
        return;
    }
    diagnostics.push_back(diagnostic{severity_for(policy),
                                     make_error_code(code),
                                     server.index,
                                     server.server_namespace.name,
                                     variable,
                                     it->second,
                                     variable,
                                     identifier});
}

} // namespace

std::optional<decl::enum_decl> declaration_of(const translated_server_variable& v) {
    if (const auto* e = std::get_if<generated_enum_variable>(&v)) {
        return e->enumeration;
    }
    return std::nullopt;
}

decl::parameter_decl parameter_of(const translated_server_variable& v) {
    return std::visit(
        overloaded{
            [](const raw_string_variable& r) {
                return decl::parameter_decl{r.parameter_name,
                                            "std::string",
                                            decl::string_literal{r.default_value},
                                            r.description};
            },
            [](const generated_enum_variable& e) {
                return decl::parameter_decl{
                    e.parameter_name,
                    e.enumeration.name,
                    decl::enum_case_ref{e.enumeration.name, e.default_case},
                    e.description};
            },
        },
        v);
}

decl::expression initializer_of(const translated_server_variable& v) {
    return std::visit(overloaded{
                          [](const raw_string_variable& r) -> decl::expression {
                              return decl::parameter_ref{r.parameter_name};
                          },
                          [](const generated_enum_variable& e) -> decl::expression {
                              return decl::raw_value_of{e.parameter_name};
                          },
                      },
                      v);
}

std::string doc_fragment_of(const translated_server_variable& v) {
    return std::visit([](const auto& t) { return t.description; }, v);
}

std::string diagnostic::message() const {
    std::ostringstream oss;
    oss << (severity == diagnostic_severity::error ? "error" : "warning") << ": " << server
        << ": variable '" << variable << "': ";
    switch (static_cast<error_code>(code.value())) {
    case error_code::enum_case_collision:
        oss << "allowed values '" << first_value << "' and '" << second_value
            << "' both project to enum case '" << identifier << "'; '" << second_value
            << "' was omitted, add a name override to keep it";
        break;
    case error_code::duplicate_allowed_value:
        oss << "allowed value '" << first_value << "' is listed more than once";
        break;
    case error_code::enum_name_collision:
        oss << "enum type '" << identifier << "' is already generated for variable '"
            << first_value << "'";
        break;
    case error_code::parameter_name_collision:
        oss << "parameter '" << identifier << "' is already used by variable '" << first_value
            << "'";
        break;
    default:
        oss << code.message();
        break;
    }
    return oss.str();
}

bool translated_server::has_errors() const noexcept {
    return std::any_of(diagnostics.begin(), diagnostics.end(), [](const diagnostic& d) {
        return d.severity == diagnostic_severity::error;
    });
}

bool translation_result::has_errors() const noexcept {
    return std::any_of(diagnostics.begin(), diagnostics.end(), [](const diagnostic& d) {
        return d.severity == diagnostic_severity::error;
    });
}

std::string server_namespace_name(size_t index) {
    return "Server" + std::to_string(index + 1);
}

std::string legacy_accessor_name(size_t index) {
    return "server" + std::to_string(index + 1);
}

translated_server_variable translate_variable(const server_variable& variable,
                                              std::string_view server_name,
                                              size_t server_index,
                                              const naming_config& config,
                                              collision_policy policy,
                                              std::vector<diagnostic>& diagnostics) {
    auto parameter_name = project(variable.name, identifier_role::member_name, config);

    if (!variable.has_enum()) {
        return raw_string_variable{
            variable.name, std::move(parameter_name), variable.default_value, variable.description};
    }

    auto enumeration =
        make_enum(variable, server_name, server_index, config, policy, diagnostics);

    // A listed default always owns a case, collisions included. Only a default missing from
    // the list falls back to the case its projection names.
    std::string default_case;
    if (const auto* c = enumeration.find_raw_value(variable.default_value)) {
        default_case = c->name;
    } else {
        default_case = project(variable.default_value, identifier_role::enum_case_name, config);
    }

    return generated_enum_variable{variable.name,
                                   std::move(parameter_name),
                                   std::move(enumeration),
                                   std::move(default_case),
                                   variable.description};
}

translated_server translate_server(const server_definition& server,
                                   size_t index,
                                   const naming_config& config,
                                   collision_policy policy,
                                   decl::access_modifier access) {
    translated_server out;
    out.index = index;
    out.server_namespace.name = server_namespace_name(index);
    out.server_namespace.doc = server.description;

    const auto& ns_name = out.server_namespace.name;
    name_index enum_names;
    name_index parameter_names;

    auto& accessor = out.server_namespace.accessor;
    accessor.name = "url";
    accessor.access = access;
    accessor.body.url_template = server.url_template;

    auto& legacy = out.legacy_accessor;
    legacy.name = legacy_accessor_name(index);
    legacy.deprecated = true;
    legacy.access = access;
    legacy.body.url_template = server.url_template;

    out.variables.reserve(server.variables.size());
    for (const auto& variable : server.variables) {
        auto translated =
            translate_variable(variable, ns_name, index, config, policy, out.diagnostics);
        if (auto* e = std::get_if<generated_enum_variable>(&translated)) {
            e->enumeration.access = access;
        }

        auto param = parameter_of(translated);
        report_duplicate(parameter_names,
                         param.name,
                         variable.name,
                         error_code::parameter_name_collision,
                         out,
                         policy,
                         out.diagnostics);

        if (auto enumeration = declaration_of(translated)) {
            report_duplicate(enum_names,
                             enumeration->name,
                             variable.name,
                             error_code::enum_name_collision,
                             out,
                             policy,
                             out.diagnostics);
            out.server_namespace.enums.push_back(std::move(*enumeration));
        }

        accessor.body.substitutions.push_back(
            decl::variable_substitution{variable.name, initializer_of(translated), {}});
        accessor.parameters.push_back(std::move(param));

        // Pre-existing flat signature: plain strings, checked against the list at runtime.
        legacy.parameters.push_back(decl::parameter_decl{
            project(variable.name, identifier_role::member_name, config),
            "std::string",
            decl::string_literal{variable.default_value},
            variable.description});
        legacy.body.substitutions.push_back(decl::variable_substitution{
            variable.name,
            decl::parameter_ref{legacy.parameters.back().name},
            variable.enum_values});

        out.variables.push_back(std::move(translated));
    }

    std::string summary = server.description.empty() ? std::string("Server URL")
                                                     : server.description;
    accessor.doc = function_doc(summary, accessor.parameters);
    legacy.doc = function_doc(summary + "\n\nDeprecated: use " + ns_name + "::url() instead.",
                              legacy.parameters);
    return out;
}

translation_result translate_servers(std::span<const server_definition> servers,
                                     const naming_config& config,
                                     collision_policy policy,
                                     execution mode,
                                     decl::access_modifier access) {
    translation_result out;
    out.servers.resize(servers.size());

    auto run = [&](size_t i) {
        out.servers[i] = translate_server(servers[i], i, config, policy, access);
    };

    if (mode == execution::parallel && servers.size() > 1) {
        std::vector<std::thread> workers;
        workers.reserve(servers.size());
        for (size_t i = 0; i < servers.size(); ++i) {
            try {
                workers.emplace_back(run, i);
            } catch (const std::system_error&) {
                // Out of threads: translate this server on the calling thread.
                run(i);
            }
        }
        for (auto& t : workers) {
            t.join();
        }
    } else {
        for (size_t i = 0; i < servers.size(); ++i) {
            run(i);
        }
    }

    for (const auto& server : out.servers) {
        out.diagnostics.insert(
            out.diagnostics.end(), server.diagnostics.begin(), server.diagnostics.end());
    }
    return out;
}

translation_result translate_servers(std::span<const server_definition> servers,
                                     const generator_config& config,
                                     execution mode) {
    return translate_servers(servers, config.naming, config.collisions, mode, config.access);
}

} // namespace nomen

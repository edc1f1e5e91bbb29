#include "nomen/core/config.hpp"
#include "nomen/core/identifier.hpp"
#include "nomen/core/server_variables.hpp"
#include "nomen_gen/dump.hpp"
#include "nomen_gen/options.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace nomen_gen;

namespace {

std::optional<nomen::naming_config> make_config(const options& opts, std::string_view tag) {
    nomen::naming_config config;
    auto strategy = nomen::parse_naming_strategy(opts.strategy);
    if (!strategy) {
        std::cerr << "[" << tag << "] " << strategy.error().message() << ": " << opts.strategy
                  << "\n";
        return std::nullopt;
    }
    config.strategy = *strategy;

    for (const auto& text : opts.overrides) {
        auto entry = nomen::parse_name_override(text);
        if (!entry) {
            std::cerr << "[" << tag << "] " << entry.error().message() << ": " << text << "\n";
            return std::nullopt;
        }
        // Overrides are trusted; flag obvious mistakes without rejecting them.
        if (!nomen::is_valid_identifier(entry->second)) {
            std::cerr << "[" << tag << "] warning: override for '" << entry->first
                      << "' is not a valid identifier: " << entry->second << "\n";
        }
        config.overrides.insert_or_assign(std::move(entry->first), std::move(entry->second));
    }
    return config;
}

// name=default or name=default=a|b|c
std::optional<nomen::server_variable> parse_variable_spec(std::string_view text) {
    auto eq_pos = text.find('=');
    if (eq_pos == std::string_view::npos || eq_pos == 0) {
        return std::nullopt;
    }
    nomen::server_variable v;
    v.name = std::string(text.substr(0, eq_pos));
    auto rest = text.substr(eq_pos + 1);

    auto list_pos = rest.find('=');
    v.default_value = std::string(rest.substr(0, list_pos));
    if (list_pos == std::string_view::npos) {
        return v;
    }

    auto list = rest.substr(list_pos + 1);
    while (!list.empty()) {
        auto bar_pos = list.find('|');
        v.enum_values.emplace_back(list.substr(0, bar_pos));
        if (bar_pos == std::string_view::npos) {
            break;
        }
        list.remove_prefix(bar_pos + 1);
    }
    if (v.enum_values.empty()) {
        return std::nullopt;
    }
    return v;
}

void print_identifiers(const options& opts, const std::vector<std::string>& identifiers) {
    if (!opts.json_output) {
        for (const auto& id : identifiers) {
            std::cout << id << "\n";
        }
        return;
    }
    std::cout << "[";
    for (size_t i = 0; i < identifiers.size(); ++i) {
        if (i > 0) {
            std::cout << ",";
        }
        std::cout << "{\"raw\":\"" << escape_json(opts.names[i]) << "\",\"identifier\":\""
                  << escape_json(identifiers[i]) << "\"}";
    }
    std::cout << "]\n";
}

int run_project(const options& opts) {
    if (opts.names.empty()) {
        std::cerr << "[project] at least one name is required\n";
        return 1;
    }
    auto config = make_config(opts, "project");
    if (!config) {
        return 1;
    }
    auto role = nomen::parse_identifier_role(opts.role);
    if (!role) {
        std::cerr << "[project] " << role.error().message() << ": " << opts.role << "\n";
        return 1;
    }

    std::vector<std::string> identifiers;
    identifiers.reserve(opts.names.size());
    for (const auto& name : opts.names) {
        identifiers.push_back(nomen::project(name, *role, *config));
    }
    print_identifiers(opts, identifiers);
    return 0;
}

int run_content_type(const options& opts) {
    if (opts.names.empty()) {
        std::cerr << "[content-type] at least one media type is required\n";
        return 1;
    }
    auto config = make_config(opts, "content-type");
    if (!config) {
        return 1;
    }

    std::vector<std::string> identifiers;
    identifiers.reserve(opts.names.size());
    for (const auto& media_type : opts.names) {
        identifiers.push_back(nomen::project_content_type(media_type, *config));
    }
    print_identifiers(opts, identifiers);
    return 0;
}

int run_server(const options& opts) {
    if (opts.servers.empty()) {
        std::cerr << "[servers] at least one -u <url> is required\n";
        return 1;
    }
    auto naming = make_config(opts, "servers");
    if (!naming) {
        return 1;
    }
    nomen::generator_config config;
    config.naming = std::move(*naming);
    config.additional_file_comments = opts.file_comments;

    auto policy = nomen::parse_collision_policy(opts.collisions);
    if (!policy) {
        std::cerr << "[servers] " << policy.error().message() << ": " << opts.collisions << "\n";
        return 1;
    }
    config.collisions = *policy;

    auto mode = nomen::parse_generator_mode(opts.mode);
    if (!mode) {
        std::cerr << "[servers] " << mode.error().message() << ": " << opts.mode << "\n";
        return 1;
    }
    config.mode = *mode;

    auto access = nomen::parse_access_modifier(opts.access);
    if (!access) {
        std::cerr << "[servers] " << access.error().message() << ": " << opts.access << "\n";
        return 1;
    }
    config.access = *access;

    std::vector<nomen::server_definition> servers;
    servers.reserve(opts.servers.size());
    for (const auto& args : opts.servers) {
        nomen::server_definition server;
        server.url_template = args.url;
        for (const auto& spec : args.variables) {
            auto variable = parse_variable_spec(spec);
            if (!variable) {
                std::cerr << "[servers] malformed variable (expected name=default[=a|b|c]): "
                          << spec << "\n";
                return 1;
            }
            server.variables.push_back(std::move(*variable));
        }
        servers.push_back(std::move(server));
    }

    auto translated = nomen::translate_servers(
        servers, config, opts.parallel ? nomen::execution::parallel : nomen::execution::sequential);

    if (opts.json_output) {
        std::cout << "[";
        for (size_t i = 0; i < translated.servers.size(); ++i) {
            if (i > 0) {
                std::cout << ",";
            }
            std::cout << dump_server_json(translated.servers[i]);
        }
        std::cout << "]\n";
    } else {
        std::cout << file_header(config.additional_file_comments);
        for (const auto& server : translated.servers) {
            std::cout << describe_server(server);
        }
    }

    for (const auto& d : translated.diagnostics) {
        std::cerr << "[servers] " << d.message() << "\n";
    }
    if (translated.has_errors()) {
        std::cerr << "[servers] translation failed: " << translated.diagnostics.size()
                  << " diagnostic(s)\n";
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    options opts = parse_args(argc, argv);
    if (opts.subcommand == "project") {
        return run_project(opts);
    }
    if (opts.subcommand == "content-type") {
        return run_content_type(opts);
    }
    if (opts.subcommand == "server") {
        return run_server(opts);
    }
    std::cerr << "[nomen_gen] unknown subcommand: " << opts.subcommand << "\n";
    print_usage();
}

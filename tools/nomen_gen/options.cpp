#include "options.hpp"

#include <cstdlib>
#include <iostream>
#include <string_view>

namespace nomen_gen {

[[noreturn]] void print_usage() {
    std::cout << R"(nomen_gen - identifier projection and server variable translation

Usage:
  nomen_gen project [options] <name>...
  nomen_gen content-type [options] <media-type>...
  nomen_gen server -u <url> [--var <name=default[=a|b|c]>]... [-u <url> ...] [options]
  nomen_gen examples

Options:
  -s, --strategy <name>      Naming strategy: defensive,idiomatic (default: defensive)
  -r, --role <role>          Identifier role: type,member,enum-case,content-type (default: type)
  --override <raw=id>        Pin the identifier for a raw name (repeatable)
  -u, --url <template>       Start a server with this URL template (repeatable)
  --var <spec>               Variable of the last server: name=default or name=default=a|b|c
  --collisions <policy>      Enum case collisions: omit,fail (default: omit)
  -m, --mode <mode>          Generated file: types,client,server (default: types)
  -a, --access <modifier>    Access of generated declarations: public,internal (default: internal)
  --file-comment <text>      Extra comment line at the top of the output (repeatable)
  --parallel                 Translate servers on worker threads
  --json                     Output as JSON format
  -h, --help                 Show this help
)";
    std::exit(1);
}

[[noreturn]] void print_examples() {
    std::cout << R"(nomen_gen examples:

  # Idiomatic member names
  nomen_gen project -s idiomatic -r member "Hello world" HTTPProxy

  # Pin a name regardless of strategy
  nomen_gen project -s idiomatic --override "order#123=OrderNumber" "order#123"

  # Content type tokens
  nomen_gen content-type -s idiomatic application/json-seq text/event-stream

  # Server with a generated enum
  nomen_gen server -s idiomatic -u "https://{environment}.example.com/api" \
      --var "environment=prod=prod|staging|dev" --json

  # Exported accessors with a file header
  nomen_gen server -a public --file-comment "clang-format off" -u "https://{region}.example.com" \
      --var "region=eu=eu|us"
)";
    std::exit(0);
}

options parse_args(int argc, char** argv) {
    options opts;
    if (argc < 2) {
        print_usage();
    }
    opts.subcommand = argv[1];
    if (opts.subcommand == "-h" || opts.subcommand == "--help") {
        print_usage();
    }
    if (opts.subcommand == "examples") {
        print_examples();
    }
    for (int i = 2; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage();
        } else if (arg == "-s" || arg == "--strategy") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.strategy = argv[++i];
        } else if (arg == "-r" || arg == "--role") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.role = argv[++i];
        } else if (arg == "--override") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.overrides.emplace_back(argv[++i]);
        } else if (arg == "-u" || arg == "--url") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.servers.push_back(server_args{argv[++i], {}});
        } else if (arg == "--var") {
            if (i + 1 >= argc || opts.servers.empty()) {
                print_usage();
            }
            opts.servers.back().variables.emplace_back(argv[++i]);
        } else if (arg == "--collisions") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.collisions = argv[++i];
        } else if (arg == "-m" || arg == "--mode") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.mode = argv[++i];
        } else if (arg == "-a" || arg == "--access") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.access = argv[++i];
        } else if (arg == "--file-comment") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.file_comments.emplace_back(argv[++i]);
        } else if (arg == "--parallel") {
            opts.parallel = true;
        } else if (arg == "--json") {
            opts.json_output = true;
        } else if (arg == "--") {
            for (++i; i < argc; ++i) {
                opts.names.emplace_back(argv[i]);
            }
        } else if (arg.size() > 1 && arg.front() == '-') {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
        } else {
            opts.names.emplace_back(arg);
        }
    }
    return opts;
}

} // namespace nomen_gen

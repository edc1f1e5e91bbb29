#pragma once

#include <string>
#include <vector>

namespace nomen_gen {

struct server_args {
    std::string url;                    // URL template with {name} placeholders
    std::vector<std::string> variables; // name=default[=a|b|c]
};

struct options {
    std::string subcommand;
    std::string strategy = "defensive";  // defensive,idiomatic
    std::string role = "type";           // type,member,enum-case,content-type
    std::string collisions = "omit";     // omit,fail
    std::string mode = "types";          // types,client,server
    std::string access = "internal";     // public,internal
    std::vector<std::string> file_comments;
    std::vector<server_args> servers;    // one per -u, in order
    std::vector<std::string> overrides;  // raw=identifier
    std::vector<std::string> names;      // positional inputs
    bool json_output = false;
    bool parallel = false;
};

[[noreturn]] void print_usage();
[[noreturn]] void print_examples();
options parse_args(int argc, char** argv);

} // namespace nomen_gen

#pragma once

#include "nomen/core/config.hpp"
#include "nomen/core/server_variables.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace nomen_gen {

std::string escape_json(std::string_view sv);

std::string dump_server_json(const nomen::translated_server& server);
std::string describe_server(const nomen::translated_server& server);

// "// <comment>" line per entry, for the top of a generated file.
std::string file_header(const std::vector<std::string>& comments);

} // namespace nomen_gen

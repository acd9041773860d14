#pragma once
#include <string>
#include "cli/command.hpp"

namespace strata::cli {

// Names are unique; registering one twice throws std::logic_error.
void register_command(const std::string& name, command_fn fn, const std::string& help);
// nullptr for an unknown name.
command_fn find_command(const std::string& name);
// Usage line plus the command table, aligned, on stderr.
void print_usage();

// implemented in register_commands.cpp
void register_all_commands();

} // namespace strata::cli

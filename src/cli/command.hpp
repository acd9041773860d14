#pragma once

namespace strata::cli {

// Flags given before the subcommand name.
struct Options {
  bool verbose = false;
};

// A subcommand receives argv starting at its own name.
using command_fn = int (*)(const Options &opts, int argc, char **argv);

} // namespace strata::cli

#pragma once
#include "cli/command.hpp"
#include "strata/context.hpp"
#include "strata/graph.hpp"
#include "strata/runtime.hpp"

#include <exception>
#include <string>
#include <string_view>

namespace strata::cli {

// Load configuration, initialise logging and open the local repository.
// --verbose raises the configured log level to debug.
auto make_context(const Options &opts) -> Context;

// The configured level unless --verbose was given.
auto effective_log_level(const Options &opts, const Config &cfg) -> std::string;

// The runtime named by --runtime, else the one in STRATA_RUNTIME.
auto pick_runtime(const Context &ctx, const std::string &explicit_id) -> runtime::Runtime;

// Print "<cmd>: <message>" and map the error to an exit code.
int report(std::string_view cmd, const std::exception &e);

// Merged view for a ref: the stack manifest of a layer or platform, or the
// manifest itself.
auto manifest_for_ref(const Repository &repo, std::string_view ref) -> graph::Manifest;

} // namespace strata::cli

#include "cli/common.hpp"
#include "strata/check.hpp"

#include <iostream>

int cmd_check(const strata::cli::Options &opts, int /*argc*/, char ** /*argv*/) {
  try {
    const auto ctx = strata::cli::make_context(opts);
    const auto issues = strata::check_database_integrity(ctx.repo());
    for (const auto &issue : issues) {
      std::cout << strata::to_base32(issue.digest) << ": " << issue.message << "\n";
    }
    if (!issues.empty()) {
      std::cerr << "check: " << issues.size() << " problem(s) found\n";
      return 1;
    }
    std::cout << "repository OK\n";
    return 0;
  } catch (const std::exception &e) {
    return strata::cli::report("check", e);
  }
}

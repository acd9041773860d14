#pragma once
#include "strata/hash.hpp"
#include "strata/repo.hpp"

#include <string>
#include <vector>

namespace strata {

struct IntegrityIssue {
  Digest digest;       // the object (or tag target) the problem was found at
  std::string message;
};

/**
 * Walk every stored object and every tag, collecting each problem found:
 * undecodable objects, children that do not resolve, blobs whose payload
 * is missing and tags whose target is missing. The walk never stops early.
 */
auto check_database_integrity(const Repository &repo) -> std::vector<IntegrityIssue>;

} // namespace strata

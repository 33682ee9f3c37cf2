// Copyright 2026 bburda
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "action_deps_scanner/dependency.hpp"
#include "action_deps_scanner/fork/fork_lookup.hpp"
#include "action_deps_scanner/fork/fork_pattern.hpp"
#include "action_deps_scanner/scan_issue.hpp"

namespace action_deps_scanner {
namespace fork {

/// Which dependencies are forks of interest and how to find their upstream
struct ForkResolverConfig {
  std::vector<std::string> fork_organizations;  // owners eligible for resolution
  std::optional<ForkPattern> fork_pattern;      // tried before the lookup
};

/**
 * @brief Maps forks of interest to the repositories they were forked from
 *
 * Only dependencies whose owner is in the allow-list are examined. For those,
 * the configured pattern is tried first and the lookup capability second. A
 * failed lookup leaves the dependency unresolved and is recorded in issues().
 */
class ForkResolver {
 public:
  /**
   * @param config Allow-list and optional pattern
   * @param lookup Lookup capability (can be nullptr: pattern-only resolution)
   */
  ForkResolver(ForkResolverConfig config, std::shared_ptr<ForkLookup> lookup);

  /// Resolve dependencies, dropping repeated coordinate@version keys (first wins)
  std::vector<ResolvedDependency> resolve(const std::vector<Dependency> & dependencies);
  std::vector<ResolvedDependency> resolve(const DependencySet & dependencies);

  /// Lookup failures recorded by the last resolve() call
  const std::vector<ScanIssue> & issues() const {
    return issues_;
  }

  /// Case-insensitive allow-list check
  bool is_fork_organization(const std::string & owner) const;

 private:
  std::optional<RepositoryName> find_original(const RepositoryName & repository);
  std::optional<RepositoryName> lookup_original(const RepositoryName & repository);

  ForkResolverConfig config_;
  std::shared_ptr<ForkLookup> lookup_;
  std::map<std::string, std::optional<RepositoryName>> resolved_cache_;  // per resolve() call
  std::vector<ScanIssue> issues_;
};

}  // namespace fork
}  // namespace action_deps_scanner

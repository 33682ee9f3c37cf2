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

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "action_deps_scanner/dependency_scanner.hpp"
#include "action_deps_scanner/fork/fork_lookup.hpp"
#include "action_deps_scanner/scan_issue.hpp"
#include "action_deps_submission/action_config.hpp"
#include "action_deps_submission/dependency_submitter.hpp"

namespace action_deps_submission {

/// Outcome of a successful run
struct RunSummary {
  size_t scanned_files{0};
  size_t dependency_count{0};  // aggregated entries, forks and originals included
  size_t submitted_count{0};
  std::vector<action_deps_scanner::ScanIssue> issues;  // scan and lookup problems, non-fatal
};

/**
 * @brief Scan -> resolve forks -> aggregate -> submit
 *
 * Only a failed submission fails the run. Unparsable files, rejected paths and
 * failed lookups end up in RunSummary::issues.
 */
class ActionRunner {
 public:
  /**
   * @param config Validated configuration
   * @param lookup Fork lookup capability (can be nullptr)
   * @param submitter Destination of the aggregated entries
   */
  ActionRunner(ActionConfig config, std::shared_ptr<action_deps_scanner::fork::ForkLookup> lookup,
               std::shared_ptr<DependencySubmitter> submitter);

  tl::expected<RunSummary, std::string> run();

 private:
  ActionConfig config_;
  std::shared_ptr<action_deps_scanner::fork::ForkLookup> lookup_;
  std::shared_ptr<DependencySubmitter> submitter_;
  action_deps_scanner::DependencyScanner scanner_;
};

/// Snapshot metadata derived from the configuration, scanned time left empty
SnapshotMetadata make_snapshot_metadata(const ActionConfig & config);

}  // namespace action_deps_submission

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

#include "action_deps_submission/action_runner.hpp"

#include <rclcpp/rclcpp.hpp>

#include <stdexcept>
#include <utility>

#include "action_deps_scanner/dependency_aggregator.hpp"
#include "action_deps_scanner/fork/fork_resolver.hpp"

namespace action_deps_submission {

using action_deps_scanner::aggregate;
using action_deps_scanner::fork::ForkResolver;
using action_deps_scanner::fork::ForkResolverConfig;

namespace {

rclcpp::Logger logger() {
  return rclcpp::get_logger("action_runner");
}

}  // namespace

ActionRunner::ActionRunner(ActionConfig config, std::shared_ptr<action_deps_scanner::fork::ForkLookup> lookup,
                           std::shared_ptr<DependencySubmitter> submitter)
  : config_(std::move(config)), lookup_(std::move(lookup)), submitter_(std::move(submitter)) {
  if (!submitter_) {
    throw std::invalid_argument("ActionRunner requires a submitter");
  }
}

tl::expected<RunSummary, std::string> ActionRunner::run() {
  RunSummary summary;

  RCLCPP_INFO(logger(), "Scanning workflows in %s", config_.workflow_path.c_str());
  auto scan = scanner_.scan(config_.workflow_path, config_.additional_paths, config_.workspace);
  summary.scanned_files = scan.visited_files.size();
  summary.issues = scan.issues;
  RCLCPP_INFO(logger(), "Found %zu unique dependencies in %zu files", scan.dependencies.size(),
              summary.scanned_files);

  ForkResolverConfig resolver_config;
  resolver_config.fork_organizations = config_.fork_organizations;
  resolver_config.fork_pattern = config_.fork_pattern;
  ForkResolver resolver(std::move(resolver_config), lookup_);
  auto resolved = resolver.resolve(scan.dependencies);
  summary.issues.insert(summary.issues.end(), resolver.issues().begin(), resolver.issues().end());

  auto entries = aggregate(resolved);
  summary.dependency_count = entries.size();

  if (entries.empty()) {
    RCLCPP_WARN(logger(), "No dependencies found, nothing to submit");
    return summary;
  }

  auto submitted = submitter_->submit(entries);
  if (!submitted) {
    return tl::make_unexpected("Failed to submit dependencies: " + submitted.error());
  }
  summary.submitted_count = *submitted;

  if (!summary.issues.empty()) {
    RCLCPP_WARN(logger(), "Completed with %zu issue(s)", summary.issues.size());
  }
  return summary;
}

SnapshotMetadata make_snapshot_metadata(const ActionConfig & config) {
  SnapshotMetadata metadata;
  metadata.sha = config.sha;
  metadata.ref = config.ref;
  metadata.correlator = config.correlator;
  metadata.job_id = config.run_id;
  metadata.source_location = config.workflow_location();
  return metadata;
}

}  // namespace action_deps_submission

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

#include "action_deps_scanner/dependency_aggregator.hpp"
#include "action_deps_submission/github_client.hpp"
#include "action_deps_submission/snapshot.hpp"

namespace action_deps_submission {

/**
 * @brief Abstract sink for aggregated dependencies
 *
 * Returns the number of entries accepted, or an error message.
 */
class DependencySubmitter {
 public:
  virtual ~DependencySubmitter() = default;

  virtual tl::expected<size_t, std::string> submit(const std::vector<action_deps_scanner::SubmissionEntry> & entries) = 0;
};

/// Posts entries as one dependency-graph snapshot
class GitHubSnapshotSubmitter : public DependencySubmitter {
 public:
  GitHubSnapshotSubmitter(std::shared_ptr<GitHubClient> client, std::string owner, std::string repo,
                          SnapshotMetadata metadata);

  tl::expected<size_t, std::string> submit(const std::vector<action_deps_scanner::SubmissionEntry> & entries) override;

 private:
  std::shared_ptr<GitHubClient> client_;
  std::string owner_;
  std::string repo_;
  SnapshotMetadata metadata_;
};

/// Dry-run sink: logs the snapshot it would have posted
class LoggingSubmitter : public DependencySubmitter {
 public:
  explicit LoggingSubmitter(SnapshotMetadata metadata);

  tl::expected<size_t, std::string> submit(const std::vector<action_deps_scanner::SubmissionEntry> & entries) override;

  /// Snapshot built by the last submit() call
  const nlohmann::json & last_snapshot() const {
    return last_snapshot_;
  }

 private:
  SnapshotMetadata metadata_;
  nlohmann::json last_snapshot_;
};

}  // namespace action_deps_submission

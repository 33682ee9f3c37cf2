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

#include "action_deps_submission/dependency_submitter.hpp"

#include <rclcpp/rclcpp.hpp>

#include <stdexcept>
#include <utility>

namespace action_deps_submission {

using action_deps_scanner::SubmissionEntry;

namespace {

rclcpp::Logger logger() {
  return rclcpp::get_logger("dependency_submitter");
}

}  // namespace

GitHubSnapshotSubmitter::GitHubSnapshotSubmitter(std::shared_ptr<GitHubClient> client, std::string owner,
                                                 std::string repo, SnapshotMetadata metadata)
  : client_(std::move(client)), owner_(std::move(owner)), repo_(std::move(repo)), metadata_(std::move(metadata)) {
  if (!client_) {
    throw std::invalid_argument("GitHubSnapshotSubmitter requires a client");
  }
}

tl::expected<size_t, std::string> GitHubSnapshotSubmitter::submit(const std::vector<SubmissionEntry> & entries) {
  auto snapshot = build_snapshot(entries, metadata_);
  auto receipt = client_->submit_snapshot(owner_, repo_, snapshot);
  if (!receipt) {
    return tl::make_unexpected(receipt.error());
  }

  RCLCPP_INFO(logger(), "Submitted %zu dependencies to %s/%s (HTTP %d%s%s)", entries.size(), owner_.c_str(),
              repo_.c_str(), receipt->status, receipt->result.empty() ? "" : ", ", receipt->result.c_str());
  if (receipt->id) {
    RCLCPP_INFO(logger(), "Snapshot id: %lld", static_cast<long long>(*receipt->id));
  }
  return entries.size();
}

LoggingSubmitter::LoggingSubmitter(SnapshotMetadata metadata) : metadata_(std::move(metadata)) {
}

tl::expected<size_t, std::string> LoggingSubmitter::submit(const std::vector<SubmissionEntry> & entries) {
  last_snapshot_ = build_snapshot(entries, metadata_);
  RCLCPP_INFO(logger(), "Dry run, %zu dependencies not submitted", entries.size());
  for (const auto & entry : entries) {
    RCLCPP_INFO(logger(), "  %s (%s)", to_package_url(entry).c_str(),
                action_deps_scanner::to_string(entry.relationship).c_str());
  }
  RCLCPP_DEBUG(logger(), "Snapshot:\n%s", last_snapshot_.dump(2).c_str());
  return entries.size();
}

}  // namespace action_deps_submission

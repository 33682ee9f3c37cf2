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

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "action_deps_scanner/fork/fork_pattern.hpp"

namespace action_deps_submission {

constexpr const char * kDefaultApiUrl = "https://api.github.com";
constexpr const char * kDefaultWorkflowPath = ".github/workflows";

/**
 * @brief Settings for one run of the action
 */
struct ActionConfig {
  std::string token;
  std::string owner;
  std::string repo;
  std::string sha;
  std::string ref;
  std::string workspace;      // repository root
  std::string workflow_path;  // absolute
  std::vector<std::string> additional_paths;
  std::vector<std::string> fork_organizations;
  std::optional<action_deps_scanner::fork::ForkPattern> fork_pattern;
  std::string api_url{kDefaultApiUrl};
  std::string correlator;
  std::string run_id{"0"};
  bool dry_run{false};

  /// Workflow directory relative to the workspace (snapshot source location)
  std::string workflow_location() const;
};

/**
 * @brief Builder for ActionConfig with fluent interface
 *
 * Usage:
 *   auto config = ActionConfigBuilder()
 *       .with_repository("octo/repo")
 *       .with_commit("abc123", "refs/heads/main")
 *       .with_token(token)
 *       .with_fork_organizations({"myorg"})
 *       .build();
 */
class ActionConfigBuilder {
 public:
  ActionConfigBuilder & with_token(std::string token);
  ActionConfigBuilder & with_repository(std::string full_name);
  ActionConfigBuilder & with_commit(std::string sha, std::string ref);
  ActionConfigBuilder & with_sha(std::string sha);
  ActionConfigBuilder & with_ref(std::string ref);
  ActionConfigBuilder & with_workspace(std::string workspace);
  ActionConfigBuilder & with_workflow_path(std::string path);
  ActionConfigBuilder & with_additional_paths(std::vector<std::string> paths);
  ActionConfigBuilder & with_fork_organizations(std::vector<std::string> orgs);
  ActionConfigBuilder & with_fork_regex(std::string regex);
  ActionConfigBuilder & with_api_url(std::string url);
  ActionConfigBuilder & with_job(const std::string & workflow, const std::string & job, std::string run_id);
  ActionConfigBuilder & with_dry_run(bool dry_run);

  /// @throws std::invalid_argument on missing or malformed settings
  ActionConfig build();

 private:
  ActionConfig config_;
  std::string repository_;
  std::string workflow_path_{kDefaultWorkflowPath};
  std::string fork_regex_;
};

/// Returns the value of an environment variable, nullopt if unset
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string &)>;

/// Lookup backed by the process environment
EnvironmentLookup process_environment();

/**
 * @brief Seed a builder from GitHub Actions inputs and context variables
 *
 * Inputs are read from INPUT_<NAME> (hyphen or underscore spelling), context
 * from GITHUB_REPOSITORY, GITHUB_SHA, GITHUB_REF, GITHUB_WORKSPACE,
 * GITHUB_API_URL, GITHUB_WORKFLOW, GITHUB_JOB and GITHUB_RUN_ID.
 */
ActionConfigBuilder builder_from_environment(const EnvironmentLookup & env);

/// Split a comma-separated list, trimming items and dropping empty ones
std::vector<std::string> split_list(const std::string & value);

}  // namespace action_deps_submission

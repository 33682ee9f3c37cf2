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

#include "action_deps_submission/action_config.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace action_deps_submission {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string & value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

/// GitHub exposes input `fork-regex` as INPUT_FORK-REGEX; some runners use underscores
std::optional<std::string> get_input(const EnvironmentLookup & env, const std::string & name) {
  std::string upper;
  for (char c : name) {
    upper += (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
  }
  if (auto value = env("INPUT_" + upper)) {
    return trim(*value);
  }
  std::string underscored = upper;
  for (auto & c : underscored) {
    if (c == '-') {
      c = '_';
    }
  }
  if (underscored != upper) {
    if (auto value = env("INPUT_" + underscored)) {
      return trim(*value);
    }
  }
  return std::nullopt;
}

}  // namespace

std::string ActionConfig::workflow_location() const {
  auto relative = fs::path(workflow_path).lexically_relative(workspace);
  if (relative.empty() || *relative.begin() == "..") {
    return workflow_path;
  }
  auto location = relative.generic_string();
  if (location == ".") {
    return "./";
  }
  return location.back() == '/' ? location : location + "/";
}

ActionConfigBuilder & ActionConfigBuilder::with_token(std::string token) {
  config_.token = std::move(token);
  return *this;
}

ActionConfigBuilder & ActionConfigBuilder::with_repository(std::string full_name) {
  repository_ = std::move(full_name);
  return *this;
}

ActionConfigBuilder & ActionConfigBuilder::with_commit(std::string sha, std::string ref) {
  config_.sha = std::move(sha);
  config_.ref = std::move(ref);
  return *this;
}

ActionConfigBuilder & ActionConfigBuilder::with_sha(std::string sha) {
  config_.sha = std::move(sha);
  return *this;
}

ActionConfigBuilder & ActionConfigBuilder::with_ref(std::string ref) {
  config_.ref = std::move(ref);
  return *this;
}

ActionConfigBuilder & ActionConfigBuilder::with_workspace(std::string workspace) {
  config_.workspace = std::move(workspace);
  return *this;
}

ActionConfigBuilder & ActionConfigBuilder::with_workflow_path(std::string path) {
  workflow_path_ = std::move(path);
  return *this;
}

ActionConfigBuilder & ActionConfigBuilder::with_additional_paths(std::vector<std::string> paths) {
  config_.additional_paths = std::move(paths);
  return *this;
}

ActionConfigBuilder & ActionConfigBuilder::with_fork_organizations(std::vector<std::string> orgs) {
  config_.fork_organizations = std::move(orgs);
  return *this;
}

ActionConfigBuilder & ActionConfigBuilder::with_fork_regex(std::string regex) {
  fork_regex_ = std::move(regex);
  return *this;
}

ActionConfigBuilder & ActionConfigBuilder::with_api_url(std::string url) {
  config_.api_url = std::move(url);
  return *this;
}

ActionConfigBuilder & ActionConfigBuilder::with_job(const std::string & workflow, const std::string & job,
                                                    std::string run_id) {
  config_.correlator = (workflow.empty() ? "workflow" : workflow) + "-" + (job.empty() ? "job" : job);
  config_.run_id = run_id.empty() ? "0" : std::move(run_id);
  return *this;
}

ActionConfigBuilder & ActionConfigBuilder::with_dry_run(bool dry_run) {
  config_.dry_run = dry_run;
  return *this;
}

ActionConfig ActionConfigBuilder::build() {
  if (repository_.empty()) {
    throw std::invalid_argument("GITHUB_REPOSITORY environment variable is not set");
  }
  const auto slash = repository_.find('/');
  if (slash == std::string::npos || slash == 0 || slash + 1 >= repository_.size() ||
      repository_.find('/', slash + 1) != std::string::npos) {
    throw std::invalid_argument("Invalid repository '" + repository_ + "', expected owner/repo");
  }
  config_.owner = repository_.substr(0, slash);
  config_.repo = repository_.substr(slash + 1);

  if (config_.sha.empty()) {
    throw std::invalid_argument("GITHUB_SHA environment variable is not set");
  }
  if (config_.ref.empty()) {
    throw std::invalid_argument("GITHUB_REF environment variable is not set");
  }
  // A dry run never posts, so it can work without credentials
  if (config_.token.empty() && !config_.dry_run) {
    throw std::invalid_argument("Input required and not supplied: token");
  }

  std::error_code ec;
  if (config_.workspace.empty()) {
    auto cwd = fs::current_path(ec);
    if (ec) {
      throw std::invalid_argument("Cannot determine workspace directory: " + ec.message());
    }
    config_.workspace = cwd.string();
  }
  auto workspace = fs::absolute(config_.workspace, ec);
  if (ec) {
    throw std::invalid_argument("Invalid workspace '" + config_.workspace + "': " + ec.message());
  }
  config_.workspace = workspace.lexically_normal().string();

  fs::path workflow_path(workflow_path_.empty() ? kDefaultWorkflowPath : workflow_path_);
  if (workflow_path.is_relative()) {
    workflow_path = fs::path(config_.workspace) / workflow_path;
  }
  config_.workflow_path = workflow_path.lexically_normal().string();

  if (!fork_regex_.empty()) {
    auto pattern = action_deps_scanner::fork::ForkPattern::compile(fork_regex_);
    if (!pattern) {
      throw std::invalid_argument("Invalid fork-regex: " + pattern.error());
    }
    config_.fork_pattern = std::move(*pattern);
  }

  if (config_.api_url.empty()) {
    config_.api_url = kDefaultApiUrl;
  }
  if (config_.correlator.empty()) {
    config_.correlator = "workflow-job";
  }

  return std::move(config_);
}

EnvironmentLookup process_environment() {
  return [](const std::string & name) -> std::optional<std::string> {
    const char * value = std::getenv(name.c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

ActionConfigBuilder builder_from_environment(const EnvironmentLookup & env) {
  auto get = [&env](const std::string & name) {
    return env(name).value_or("");
  };

  ActionConfigBuilder builder;
  builder.with_repository(get("GITHUB_REPOSITORY"))
      .with_commit(get("GITHUB_SHA"), get("GITHUB_REF"))
      .with_workspace(get("GITHUB_WORKSPACE"))
      .with_job(get("GITHUB_WORKFLOW"), get("GITHUB_JOB"), get("GITHUB_RUN_ID"));

  if (auto api_url = env("GITHUB_API_URL")) {
    builder.with_api_url(*api_url);
  }
  if (auto token = get_input(env, "token")) {
    builder.with_token(*token);
  }
  if (auto path = get_input(env, "workflow-path"); path && !path->empty()) {
    builder.with_workflow_path(*path);
  }
  if (auto paths = get_input(env, "additional-paths")) {
    builder.with_additional_paths(split_list(*paths));
  }
  if (auto orgs = get_input(env, "fork-organizations")) {
    builder.with_fork_organizations(split_list(*orgs));
  }
  if (auto regex = get_input(env, "fork-regex")) {
    builder.with_fork_regex(*regex);
  }
  return builder;
}

std::vector<std::string> split_list(const std::string & value) {
  std::vector<std::string> items;
  size_t start = 0;
  while (start <= value.size()) {
    auto comma = value.find(',', start);
    if (comma == std::string::npos) {
      comma = value.size();
    }
    auto item = trim(value.substr(start, comma - start));
    if (!item.empty()) {
      items.push_back(std::move(item));
    }
    start = comma + 1;
  }
  return items;
}

}  // namespace action_deps_submission

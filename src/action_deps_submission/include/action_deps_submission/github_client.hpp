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

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include "action_deps_scanner/fork/fork_lookup.hpp"

namespace httplib {
class Client;
}

namespace action_deps_submission {

/// Response of a successful snapshot submission
struct SubmissionReceipt {
  int status{0};
  std::optional<int64_t> id;
  std::string result;  // e.g. "SUCCESS", "ACCEPTED"
  std::string message;
};

/// Split API URL, e.g. https://ghe.example.com/api/v3 -> origin + /api/v3
struct ApiEndpoint {
  std::string origin;     // scheme://host[:port]
  std::string base_path;  // without trailing '/', may be empty

  static tl::expected<ApiEndpoint, std::string> parse(const std::string & api_url);
};

/**
 * @brief Minimal GitHub REST client
 *
 * Serves as the fork lookup capability (GET /repos/{owner}/{repo}) and posts
 * dependency snapshots. Every call opens its own connection. HTTPS needs
 * CPPHTTPLIB_OPENSSL_SUPPORT.
 */
class GitHubClient : public action_deps_scanner::fork::ForkLookup {
 public:
  /**
   * @param api_url REST API root (https://api.github.com or a GHES /api/v3 URL)
   * @param token Token sent as Bearer credentials; empty means anonymous
   * @throws std::invalid_argument if api_url is malformed
   */
  GitHubClient(const std::string & api_url, std::string token);

  tl::expected<action_deps_scanner::fork::ForkInfo, action_deps_scanner::fork::LookupError> lookup_fork(
      const action_deps_scanner::RepositoryName & repository) override;

  /// POST /repos/{owner}/{repo}/dependency-graph/snapshots
  tl::expected<SubmissionReceipt, std::string> submit_snapshot(const std::string & owner, const std::string & repo,
                                                               const nlohmann::json & snapshot);

  const ApiEndpoint & endpoint() const {
    return endpoint_;
  }

 private:
  std::unique_ptr<httplib::Client> make_client() const;

  ApiEndpoint endpoint_;
  std::string token_;
};

}  // namespace action_deps_submission

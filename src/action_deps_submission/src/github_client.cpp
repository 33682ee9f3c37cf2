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

#include "action_deps_submission/github_client.hpp"

#include <httplib.h>

#include <rclcpp/rclcpp.hpp>

#include <stdexcept>
#include <utility>

namespace action_deps_submission {

using action_deps_scanner::RepositoryName;
using action_deps_scanner::fork::ForkInfo;
using action_deps_scanner::fork::LookupError;
using action_deps_scanner::fork::LookupErrorCode;
using json = nlohmann::json;

namespace {

constexpr time_t kConnectTimeoutSec = 10;
constexpr time_t kReadTimeoutSec = 30;
constexpr const char * kApiVersion = "2022-11-28";
constexpr const char * kUserAgent = "action-deps";

rclcpp::Logger logger() {
  return rclcpp::get_logger("github_client");
}

std::string truncate(const std::string & body, size_t max_len = 200) {
  if (body.size() <= max_len) {
    return body;
  }
  return body.substr(0, max_len) + "...";
}

}  // namespace

tl::expected<ApiEndpoint, std::string> ApiEndpoint::parse(const std::string & api_url) {
  const auto scheme_end = api_url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    return tl::make_unexpected("API URL must include a scheme: " + api_url);
  }
  const std::string scheme = api_url.substr(0, scheme_end);
  if (scheme != "http" && scheme != "https") {
    return tl::make_unexpected("Unsupported API URL scheme: " + scheme);
  }

  const auto host_start = scheme_end + 3;
  const auto path_start = api_url.find('/', host_start);
  if (path_start == host_start || host_start >= api_url.size()) {
    return tl::make_unexpected("API URL has no host: " + api_url);
  }

  ApiEndpoint endpoint;
  if (path_start == std::string::npos) {
    endpoint.origin = api_url;
  } else {
    endpoint.origin = api_url.substr(0, path_start);
    endpoint.base_path = api_url.substr(path_start);
    while (!endpoint.base_path.empty() && endpoint.base_path.back() == '/') {
      endpoint.base_path.pop_back();
    }
  }
  return endpoint;
}

GitHubClient::GitHubClient(const std::string & api_url, std::string token) : token_(std::move(token)) {
  auto endpoint = ApiEndpoint::parse(api_url);
  if (!endpoint) {
    throw std::invalid_argument(endpoint.error());
  }
  endpoint_ = std::move(*endpoint);
}

std::unique_ptr<httplib::Client> GitHubClient::make_client() const {
  auto client = std::make_unique<httplib::Client>(endpoint_.origin);
  client->set_connection_timeout(kConnectTimeoutSec, 0);
  client->set_read_timeout(kReadTimeoutSec, 0);

  httplib::Headers headers = {{"Accept", "application/vnd.github+json"},
                              {"X-GitHub-Api-Version", kApiVersion},
                              {"User-Agent", kUserAgent}};
  if (!token_.empty()) {
    headers.emplace("Authorization", "Bearer " + token_);
  }
  client->set_default_headers(std::move(headers));
  return client;
}

tl::expected<ForkInfo, LookupError> GitHubClient::lookup_fork(const RepositoryName & repository) {
  const std::string path = endpoint_.base_path + "/repos/" + repository.owner + "/" + repository.repo;
  auto client = make_client();

  auto res = client->Get(path);
  if (!res) {
    return tl::make_unexpected(LookupError{LookupErrorCode::Network, "Request to " + endpoint_.origin + path +
                                                                         " failed: " + httplib::to_string(res.error())});
  }

  if (res->status == 404) {
    return tl::make_unexpected(LookupError{LookupErrorCode::NotFound, "Repository not found: " + repository.full_name()});
  }
  if (res->status == 401 || res->status == 403) {
    return tl::make_unexpected(
        LookupError{LookupErrorCode::Unauthorized, "HTTP " + std::to_string(res->status) + ": " + truncate(res->body)});
  }
  if (res->status != 200) {
    return tl::make_unexpected(LookupError{LookupErrorCode::InvalidResponse,
                                           "HTTP " + std::to_string(res->status) + ": " + truncate(res->body)});
  }

  try {
    auto body = json::parse(res->body);
    ForkInfo info;
    info.is_fork = body.value("fork", false);
    if (info.is_fork && body.contains("parent") && body["parent"].is_object()) {
      const auto & parent = body["parent"];
      if (parent.contains("owner") && parent["owner"].is_object() && parent["owner"].contains("login") &&
          parent.contains("name")) {
        info.parent = RepositoryName{parent["owner"]["login"].get<std::string>(), parent["name"].get<std::string>()};
      }
    }
    return info;
  } catch (const json::exception & e) {
    return tl::make_unexpected(LookupError{LookupErrorCode::InvalidResponse, "Malformed JSON: " + std::string(e.what())});
  }
}

tl::expected<SubmissionReceipt, std::string> GitHubClient::submit_snapshot(const std::string & owner,
                                                                           const std::string & repo,
                                                                           const json & snapshot) {
  const std::string path = endpoint_.base_path + "/repos/" + owner + "/" + repo + "/dependency-graph/snapshots";
  auto client = make_client();

  RCLCPP_DEBUG(logger(), "POST %s%s", endpoint_.origin.c_str(), path.c_str());
  auto res = client->Post(path, snapshot.dump(), "application/json");
  if (!res) {
    return tl::make_unexpected("Request to " + endpoint_.origin + path + " failed: " + httplib::to_string(res.error()));
  }
  if (res->status < 200 || res->status >= 300) {
    return tl::make_unexpected("Snapshot submission rejected (HTTP " + std::to_string(res->status) +
                               "): " + truncate(res->body));
  }

  SubmissionReceipt receipt;
  receipt.status = res->status;
  if (!res->body.empty()) {
    try {
      auto body = json::parse(res->body);
      if (body.contains("id") && body["id"].is_number_integer()) {
        receipt.id = body["id"].get<int64_t>();
      }
      receipt.result = body.value("result", "");
      receipt.message = body.value("message", "");
    } catch (const json::exception & e) {
      // Submission went through, the receipt is informational only
      RCLCPP_WARN(logger(), "Could not parse snapshot response: %s", e.what());
    }
  }
  return receipt;
}

}  // namespace action_deps_submission

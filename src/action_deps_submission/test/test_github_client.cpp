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

/**
 * @file test_github_client.cpp
 * @brief GitHubClient against a loopback HTTP server
 */

#include <gtest/gtest.h>
#include <httplib.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "action_deps_submission/github_client.hpp"

using action_deps_scanner::RepositoryName;
using action_deps_scanner::fork::LookupErrorCode;
using namespace action_deps_submission;
using json = nlohmann::json;

// =============================================================================
// ApiEndpoint
// =============================================================================

TEST(ApiEndpointTest, PublicApi) {
  auto endpoint = ApiEndpoint::parse("https://api.github.com");
  ASSERT_TRUE(endpoint.has_value());
  EXPECT_EQ(endpoint->origin, "https://api.github.com");
  EXPECT_EQ(endpoint->base_path, "");
}

TEST(ApiEndpointTest, EnterpriseServerPath) {
  auto endpoint = ApiEndpoint::parse("https://ghe.example.com/api/v3/");
  ASSERT_TRUE(endpoint.has_value());
  EXPECT_EQ(endpoint->origin, "https://ghe.example.com");
  EXPECT_EQ(endpoint->base_path, "/api/v3");
}

TEST(ApiEndpointTest, RejectsMalformedUrls) {
  EXPECT_FALSE(ApiEndpoint::parse("api.github.com").has_value());
  EXPECT_FALSE(ApiEndpoint::parse("ftp://api.github.com").has_value());
  EXPECT_FALSE(ApiEndpoint::parse("https://").has_value());
  EXPECT_FALSE(ApiEndpoint::parse("https:///path").has_value());
  EXPECT_THROW(GitHubClient("not a url", "token"), std::invalid_argument);
}

// =============================================================================
// Loopback server
// =============================================================================

class GitHubClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    server_.Get(R"(/api/v3/repos/([^/]+)/([^/]+))", [this](const httplib::Request & req, httplib::Response & res) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        last_authorization_ = req.get_header_value("Authorization");
        last_api_version_ = req.get_header_value("X-GitHub-Api-Version");
      }
      const std::string name = req.matches[1].str() + "/" + req.matches[2].str();
      if (name == "myorg/checkout") {
        res.set_content(R"({"name":"checkout","fork":true,"parent":{"name":"checkout","owner":{"login":"actions"}}})",
                        "application/json");
      } else if (name == "myorg/tool") {
        res.set_content(R"({"name":"tool","fork":false})", "application/json");
      } else if (name == "myorg/secret") {
        res.status = 403;
        res.set_content(R"({"message":"Resource not accessible"})", "application/json");
      } else if (name == "myorg/garbled") {
        res.set_content("{not json", "application/json");
      } else if (name == "myorg/broken") {
        res.status = 500;
      } else {
        res.status = 404;
        res.set_content(R"({"message":"Not Found"})", "application/json");
      }
    });

    server_.Post("/api/v3/repos/octo/repo/dependency-graph/snapshots",
                 [this](const httplib::Request & req, httplib::Response & res) {
                   {
                     std::lock_guard<std::mutex> lock(mutex_);
                     last_body_ = req.body;
                   }
                   res.status = 201;
                   res.set_content(R"({"id":7,"result":"SUCCESS","message":"Dependencies submitted"})",
                                   "application/json");
                 });

    server_.Post("/api/v3/repos/octo/rejected/dependency-graph/snapshots",
                 [](const httplib::Request &, httplib::Response & res) {
                   res.status = 422;
                   res.set_content(R"({"message":"Invalid request"})", "application/json");
                 });

    port_ = server_.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port_, 0);
    server_thread_ = std::thread([this]() {
      server_.listen_after_bind();
    });
    server_.wait_until_ready();

    client_ = std::make_unique<GitHubClient>(api_url(), "test-token");
  }

  void TearDown() override {
    server_.stop();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  std::string api_url() const {
    return "http://127.0.0.1:" + std::to_string(port_) + "/api/v3";
  }

  httplib::Server server_;
  std::thread server_thread_;
  int port_{0};
  std::unique_ptr<GitHubClient> client_;

  std::mutex mutex_;
  std::string last_authorization_;
  std::string last_api_version_;
  std::string last_body_;
};

TEST_F(GitHubClientTest, LookupReportsForkParent) {
  auto info = client_->lookup_fork(RepositoryName{"myorg", "checkout"});
  ASSERT_TRUE(info.has_value()) << info.error().message;
  EXPECT_TRUE(info->is_fork);
  ASSERT_TRUE(info->parent.has_value());
  EXPECT_EQ(info->parent->full_name(), "actions/checkout");

  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_EQ(last_authorization_, "Bearer test-token");
  EXPECT_EQ(last_api_version_, "2022-11-28");
}

TEST_F(GitHubClientTest, LookupReportsNonFork) {
  auto info = client_->lookup_fork(RepositoryName{"myorg", "tool"});
  ASSERT_TRUE(info.has_value());
  EXPECT_FALSE(info->is_fork);
  EXPECT_FALSE(info->parent.has_value());
}

TEST_F(GitHubClientTest, LookupMapsStatusCodesToErrors) {
  auto missing = client_->lookup_fork(RepositoryName{"myorg", "unknown"});
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code, LookupErrorCode::NotFound);

  auto forbidden = client_->lookup_fork(RepositoryName{"myorg", "secret"});
  ASSERT_FALSE(forbidden.has_value());
  EXPECT_EQ(forbidden.error().code, LookupErrorCode::Unauthorized);

  auto broken = client_->lookup_fork(RepositoryName{"myorg", "broken"});
  ASSERT_FALSE(broken.has_value());
  EXPECT_EQ(broken.error().code, LookupErrorCode::InvalidResponse);

  auto garbled = client_->lookup_fork(RepositoryName{"myorg", "garbled"});
  ASSERT_FALSE(garbled.has_value());
  EXPECT_EQ(garbled.error().code, LookupErrorCode::InvalidResponse);
}

TEST_F(GitHubClientTest, LookupWithoutServerIsNetworkError) {
  server_.stop();
  server_thread_.join();

  auto info = client_->lookup_fork(RepositoryName{"myorg", "checkout"});
  ASSERT_FALSE(info.has_value());
  EXPECT_EQ(info.error().code, LookupErrorCode::Network);
}

TEST_F(GitHubClientTest, AnonymousClientSendsNoAuthorization) {
  GitHubClient anonymous(api_url(), "");
  ASSERT_TRUE(anonymous.lookup_fork(RepositoryName{"myorg", "tool"}).has_value());

  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_TRUE(last_authorization_.empty());
}

TEST_F(GitHubClientTest, SubmitSnapshotReturnsReceipt) {
  json snapshot = {{"version", 0}, {"sha", "abc"}};
  auto receipt = client_->submit_snapshot("octo", "repo", snapshot);
  ASSERT_TRUE(receipt.has_value()) << receipt.error();
  EXPECT_EQ(receipt->status, 201);
  ASSERT_TRUE(receipt->id.has_value());
  EXPECT_EQ(*receipt->id, 7);
  EXPECT_EQ(receipt->result, "SUCCESS");

  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_EQ(json::parse(last_body_), snapshot);
}

TEST_F(GitHubClientTest, SubmitSnapshotRejected) {
  auto receipt = client_->submit_snapshot("octo", "rejected", json::object());
  ASSERT_FALSE(receipt.has_value());
  EXPECT_NE(receipt.error().find("422"), std::string::npos);
}

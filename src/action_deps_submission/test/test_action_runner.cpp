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
 * @file test_action_runner.cpp
 * @brief End-to-end run over a temp repository with fake collaborators
 */

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "action_deps_submission/action_runner.hpp"

using namespace action_deps_submission;
using action_deps_scanner::RepositoryName;
using action_deps_scanner::ScanErrorKind;
using action_deps_scanner::SubmissionEntry;
using action_deps_scanner::fork::ForkInfo;
using action_deps_scanner::fork::ForkLookup;
using action_deps_scanner::fork::LookupError;
using action_deps_scanner::fork::LookupErrorCode;

namespace {

namespace fs = std::filesystem;

class FakeForkLookup : public ForkLookup {
 public:
  tl::expected<ForkInfo, LookupError> lookup_fork(const RepositoryName & repository) override {
    auto it = parents.find(repository.full_name());
    if (it != parents.end()) {
      return ForkInfo{true, it->second};
    }
    if (repository.repo == "unreachable") {
      return tl::make_unexpected(LookupError{LookupErrorCode::Network, "timed out"});
    }
    return ForkInfo{false, std::nullopt};
  }

  std::map<std::string, RepositoryName> parents;
};

class RecordingSubmitter : public DependencySubmitter {
 public:
  tl::expected<size_t, std::string> submit(const std::vector<SubmissionEntry> & entries) override {
    ++calls;
    received = entries;
    if (!fail_with.empty()) {
      return tl::make_unexpected(fail_with);
    }
    return entries.size();
  }

  int calls{0};
  std::vector<SubmissionEntry> received;
  std::string fail_with;
};

class ActionRunnerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    repo_ = fs::temp_directory_path() /
            ("action_runner_test_" + std::to_string(getpid()) + "_" + std::to_string(test_counter_++));
    fs::create_directories(repo_ / ".github" / "workflows");

    lookup_ = std::make_shared<FakeForkLookup>();
    submitter_ = std::make_shared<RecordingSubmitter>();
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(repo_, ec);
  }

  void write(const std::string & relative, const std::string & content) {
    const fs::path path = repo_ / relative;
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
  }

  ActionConfigBuilder builder() {
    ActionConfigBuilder result;
    result.with_repository("octo/repo")
        .with_commit("abc123", "refs/heads/main")
        .with_token("token")
        .with_workspace(repo_.string());
    return result;
  }

  fs::path repo_;
  std::shared_ptr<FakeForkLookup> lookup_;
  std::shared_ptr<RecordingSubmitter> submitter_;
  static int test_counter_;
};

int ActionRunnerTest::test_counter_ = 0;

}  // namespace

TEST_F(ActionRunnerTest, ScansResolvesAndSubmits) {
  write(".github/workflows/ci.yml", R"(
on: push
jobs:
  build:
    steps:
      - uses: myorg/checkout@v4
      - uses: ../actions/setup
)");
  write(".github/actions/setup/action.yml", R"(
runs:
  using: composite
  steps:
    - uses: actions/cache@v4
)");
  lookup_->parents["myorg/checkout"] = RepositoryName{"actions", "checkout"};

  ActionRunner runner(builder().with_fork_organizations({"myorg"}).build(), lookup_, submitter_);
  auto summary = runner.run();
  ASSERT_TRUE(summary.has_value()) << summary.error();

  EXPECT_EQ(summary->scanned_files, 2u);
  EXPECT_EQ(summary->dependency_count, 3u);
  EXPECT_EQ(summary->submitted_count, 3u);
  EXPECT_TRUE(summary->issues.empty());

  ASSERT_EQ(submitter_->received.size(), 3u);
  EXPECT_EQ(submitter_->received[0].package_id(), "myorg/checkout@v4");
  EXPECT_EQ(submitter_->received[1].package_id(), "actions/checkout");
  EXPECT_EQ(submitter_->received[2].package_id(), "actions/cache@v4");
}

TEST_F(ActionRunnerTest, EmptyResultIsNotSubmitted) {
  write(".github/workflows/ci.yml", "on: push\njobs:\n  a:\n    steps:\n      - run: echo\n");

  ActionRunner runner(builder().build(), lookup_, submitter_);
  auto summary = runner.run();
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->dependency_count, 0u);
  EXPECT_EQ(submitter_->calls, 0);
}

TEST_F(ActionRunnerTest, MissingWorkflowDirectoryStillSucceeds) {
  fs::remove_all(repo_ / ".github");

  ActionRunner runner(builder().build(), lookup_, submitter_);
  auto summary = runner.run();
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->scanned_files, 0u);
  EXPECT_EQ(summary->dependency_count, 0u);
}

TEST_F(ActionRunnerTest, ScanAndLookupIssuesAreNotFatal) {
  write(".github/workflows/bad.yml", "jobs: [oops\n");
  write(".github/workflows/ci.yml", "jobs:\n  a:\n    steps:\n      - uses: myorg/unreachable@v1\n");

  ActionRunner runner(builder().with_fork_organizations({"myorg"}).build(), lookup_, submitter_);
  auto summary = runner.run();
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->dependency_count, 1u);
  ASSERT_EQ(summary->issues.size(), 2u);
  EXPECT_EQ(summary->issues[0].kind, ScanErrorKind::ParseFailure);
  EXPECT_EQ(summary->issues[1].kind, ScanErrorKind::LookupFailure);
}

TEST_F(ActionRunnerTest, SubmissionFailureFailsTheRun) {
  write(".github/workflows/ci.yml", "jobs:\n  a:\n    steps:\n      - uses: actions/checkout@v4\n");
  submitter_->fail_with = "HTTP 403";

  ActionRunner runner(builder().build(), lookup_, submitter_);
  auto summary = runner.run();
  ASSERT_FALSE(summary.has_value());
  EXPECT_NE(summary.error().find("HTTP 403"), std::string::npos);
}

TEST_F(ActionRunnerTest, AdditionalPathsAreScanned) {
  write("shared/lint/action.yml", "runs:\n  using: composite\n  steps:\n    - uses: octo/linter@v2\n");

  ActionRunner runner(builder().with_additional_paths({"shared"}).build(), lookup_, submitter_);
  auto summary = runner.run();
  ASSERT_TRUE(summary.has_value());
  ASSERT_EQ(submitter_->received.size(), 1u);
  EXPECT_EQ(submitter_->received[0].package_id(), "octo/linter@v2");
}

TEST_F(ActionRunnerTest, DryRunSubmitterBuildsSnapshotWithoutPosting) {
  write(".github/workflows/ci.yml", "jobs:\n  a:\n    steps:\n      - uses: actions/checkout@v4\n");

  auto config = builder().with_token("").with_dry_run(true).with_job("CI", "deps", "77").build();
  auto dry_run = std::make_shared<LoggingSubmitter>(make_snapshot_metadata(config));
  ActionRunner runner(std::move(config), nullptr, dry_run);

  auto summary = runner.run();
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->submitted_count, 1u);

  const auto & snapshot = dry_run->last_snapshot();
  EXPECT_EQ(snapshot["sha"], "abc123");
  EXPECT_EQ(snapshot["job"]["correlator"], "CI-deps");
  EXPECT_EQ(snapshot["job"]["id"], "77");
  EXPECT_EQ(snapshot["manifests"][kManifestName]["file"]["source_location"], ".github/workflows/");
  EXPECT_TRUE(snapshot["manifests"][kManifestName]["resolved"].contains("actions/checkout@v4"));
}

TEST_F(ActionRunnerTest, SnapshotMetadataFromConfig) {
  auto config = builder().with_job("Deps", "submit", "5").build();
  auto metadata = make_snapshot_metadata(config);
  EXPECT_EQ(metadata.sha, "abc123");
  EXPECT_EQ(metadata.ref, "refs/heads/main");
  EXPECT_EQ(metadata.correlator, "Deps-submit");
  EXPECT_EQ(metadata.job_id, "5");
  EXPECT_EQ(metadata.source_location, ".github/workflows/");
  EXPECT_TRUE(metadata.scanned.empty());
}

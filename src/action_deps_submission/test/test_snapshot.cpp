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

#include <gtest/gtest.h>

#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "action_deps_submission/snapshot.hpp"

using action_deps_scanner::Relationship;
using action_deps_scanner::SubmissionEntry;
using namespace action_deps_submission;

TEST(PackageUrlTest, EncodesSlashesAndAppendsVersion) {
  EXPECT_EQ(to_package_url(SubmissionEntry{"actions/checkout", "v4", Relationship::Direct}),
            "pkg:github/actions%2Fcheckout@v4");
  EXPECT_EQ(to_package_url(SubmissionEntry{"github/codeql-action/init", "v3", Relationship::Direct}),
            "pkg:github/github%2Fcodeql-action%2Finit@v3");
}

TEST(PackageUrlTest, VersionlessEntry) {
  EXPECT_EQ(to_package_url(SubmissionEntry{"actions/checkout", std::nullopt, Relationship::Indirect}),
            "pkg:github/actions%2Fcheckout");
}

TEST(SnapshotTest, CurrentTimestampFormat) {
  EXPECT_TRUE(std::regex_match(current_timestamp_iso8601(),
                               std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)")));
}

TEST(SnapshotTest, BuildsSingleManifestKeyedByPackageId) {
  SnapshotMetadata metadata;
  metadata.sha = "abc123";
  metadata.ref = "refs/heads/main";
  metadata.correlator = "CI-build";
  metadata.job_id = "42";
  metadata.source_location = ".github/workflows/";
  metadata.scanned = "2026-01-15T10:00:00Z";

  std::vector<SubmissionEntry> entries = {{"myorg/checkout", "v4", Relationship::Direct},
                                          {"actions/checkout", std::nullopt, Relationship::Indirect}};
  auto snapshot = build_snapshot(entries, metadata);

  EXPECT_EQ(snapshot["version"], 0);
  EXPECT_EQ(snapshot["sha"], "abc123");
  EXPECT_EQ(snapshot["ref"], "refs/heads/main");
  EXPECT_EQ(snapshot["job"]["correlator"], "CI-build");
  EXPECT_EQ(snapshot["job"]["id"], "42");
  EXPECT_EQ(snapshot["detector"]["name"], kDetectorName);
  EXPECT_EQ(snapshot["detector"]["version"], kDetectorVersion);
  EXPECT_EQ(snapshot["scanned"], "2026-01-15T10:00:00Z");

  ASSERT_TRUE(snapshot["manifests"].contains(kManifestName));
  const auto & manifest = snapshot["manifests"][kManifestName];
  EXPECT_EQ(manifest["name"], kManifestName);
  EXPECT_EQ(manifest["file"]["source_location"], ".github/workflows/");

  const auto & resolved = manifest["resolved"];
  ASSERT_EQ(resolved.size(), 2u);
  EXPECT_EQ(resolved["myorg/checkout@v4"]["package_url"], "pkg:github/myorg%2Fcheckout@v4");
  EXPECT_EQ(resolved["myorg/checkout@v4"]["relationship"], "direct");
  EXPECT_EQ(resolved["myorg/checkout@v4"]["scope"], "runtime");
  EXPECT_TRUE(resolved["myorg/checkout@v4"]["dependencies"].empty());
  EXPECT_EQ(resolved["actions/checkout"]["relationship"], "indirect");
}

TEST(SnapshotTest, ScannedDefaultsToNow) {
  auto snapshot = build_snapshot({}, SnapshotMetadata{});
  EXPECT_FALSE(snapshot["scanned"].get<std::string>().empty());
  EXPECT_TRUE(snapshot["manifests"][kManifestName]["resolved"].is_object());
}

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

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "action_deps_scanner/dependency_aggregator.hpp"

namespace action_deps_submission {

constexpr const char * kDetectorName = "actions-dependency-submission";
constexpr const char * kDetectorVersion = "1.0.0";
constexpr const char * kDetectorUrl = "https://github.com/jessehouwing/actions-dependency-submission";
constexpr const char * kManifestName = "github-actions-workflows";

/// Snapshot fields that do not come from the dependency list
struct SnapshotMetadata {
  std::string sha;
  std::string ref;
  std::string correlator;       // unique per workflow + job
  std::string job_id;           // run id
  std::string source_location;  // workflow directory, relative to the workspace
  std::string scanned;          // ISO-8601 UTC; filled with the current time when empty
};

/// pkg:github/<name with '/' as %2F>[@version]
std::string to_package_url(const action_deps_scanner::SubmissionEntry & entry);

/// Current UTC time as 2026-01-15T10:00:00Z
std::string current_timestamp_iso8601();

/**
 * @brief Build a dependency-submission snapshot
 *
 * All entries go into a single manifest; `resolved` is keyed by package id.
 */
nlohmann::json build_snapshot(const std::vector<action_deps_scanner::SubmissionEntry> & entries,
                              const SnapshotMetadata & metadata);

}  // namespace action_deps_submission

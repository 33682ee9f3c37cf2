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

#include "action_deps_submission/snapshot.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace action_deps_submission {

using action_deps_scanner::SubmissionEntry;
using json = nlohmann::json;

std::string to_package_url(const SubmissionEntry & entry) {
  std::string encoded;
  encoded.reserve(entry.name.size() + 8);
  for (char c : entry.name) {
    if (c == '/') {
      encoded += "%2F";
    } else {
      encoded += c;
    }
  }

  std::string purl = "pkg:github/" + encoded;
  if (entry.version) {
    purl += "@" + *entry.version;
  }
  return purl;
}

std::string current_timestamp_iso8601() {
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&now, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

json build_snapshot(const std::vector<SubmissionEntry> & entries, const SnapshotMetadata & metadata) {
  json resolved = json::object();
  for (const auto & entry : entries) {
    resolved[entry.package_id()] = {{"package_url", to_package_url(entry)},
                                    {"relationship", action_deps_scanner::to_string(entry.relationship)},
                                    {"scope", "runtime"},
                                    {"dependencies", json::array()}};
  }

  json manifest = {
      {"name", kManifestName}, {"file", {{"source_location", metadata.source_location}}}, {"resolved", resolved}};

  json snapshot;
  snapshot["version"] = 0;
  snapshot["sha"] = metadata.sha;
  snapshot["ref"] = metadata.ref;
  snapshot["job"] = {{"correlator", metadata.correlator}, {"id", metadata.job_id}};
  snapshot["detector"] = {{"name", kDetectorName}, {"version", kDetectorVersion}, {"url", kDetectorUrl}};
  snapshot["scanned"] = metadata.scanned.empty() ? current_timestamp_iso8601() : metadata.scanned;
  snapshot["manifests"] = {{kManifestName, manifest}};
  return snapshot;
}

}  // namespace action_deps_submission

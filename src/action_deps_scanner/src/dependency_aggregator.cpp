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

#include "action_deps_scanner/dependency_aggregator.hpp"

#include <unordered_set>
#include <utility>

namespace action_deps_scanner {

std::string to_string(Relationship relationship) {
  return relationship == Relationship::Direct ? "direct" : "indirect";
}

std::vector<SubmissionEntry> aggregate(const std::vector<ResolvedDependency> & resolved) {
  std::vector<SubmissionEntry> entries;
  std::unordered_set<std::string> seen;

  auto add = [&entries, &seen](SubmissionEntry entry) {
    if (seen.insert(entry.package_id()).second) {
      entries.push_back(std::move(entry));
    }
  };

  for (const auto & item : resolved) {
    add(SubmissionEntry{item.dependency.coordinate, item.dependency.version, Relationship::Direct});
    if (item.original) {
      add(SubmissionEntry{item.original->full_name(), std::nullopt, Relationship::Indirect});
    }
  }
  return entries;
}

}  // namespace action_deps_scanner

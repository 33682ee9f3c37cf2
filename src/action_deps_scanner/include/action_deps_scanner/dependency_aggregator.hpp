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

#include <optional>
#include <string>
#include <vector>

#include "action_deps_scanner/dependency.hpp"

namespace action_deps_scanner {

/// How a submission entry relates to the scanned repository
enum class Relationship {
  Direct,   // referenced by a scanned file
  Indirect  // inferred upstream of a fork
};

std::string to_string(Relationship relationship);

/// One dependency ready for the submission collaborator
struct SubmissionEntry {
  std::string name;                    // owner/repo[/subpath]
  std::optional<std::string> version;  // absent for inferred originals
  Relationship relationship{Relationship::Direct};

  /// name@version, or just name when there is no version
  std::string package_id() const {
    return version ? name + "@" + *version : name;
  }
};

/// Flatten resolved dependencies into unique entries, preserving first-seen order.
/// A resolved fork contributes itself and then its original (without version).
std::vector<SubmissionEntry> aggregate(const std::vector<ResolvedDependency> & resolved);

}  // namespace action_deps_scanner

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

namespace action_deps_scanner {

/**
 * @brief Kinds of failure that are recovered locally during a run
 *
 * None of them aborts a scan: the affected file, reference or dependency
 * simply contributes nothing (or stays unresolved).
 */
enum class ScanErrorKind {
  ParseFailure,           ///< malformed YAML document
  PathTraversalRejected,  ///< local reference resolves outside the repository root
  LookupFailure,          ///< fork lookup failed (network, auth, not found)
  IoFailure               ///< missing or unreadable file or directory
};

/// A single recovered failure, kept for the run summary
struct ScanIssue {
  ScanErrorKind kind;
  std::string subject;  ///< file path, reference or owner/repo
  std::string message;

  std::string to_string() const;
};

/// Convert kind to string
std::string to_string(ScanErrorKind kind);

}  // namespace action_deps_scanner

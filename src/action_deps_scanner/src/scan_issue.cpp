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

#include "action_deps_scanner/scan_issue.hpp"

namespace action_deps_scanner {

std::string to_string(ScanErrorKind kind) {
  switch (kind) {
    case ScanErrorKind::ParseFailure:
      return "PARSE_FAILURE";
    case ScanErrorKind::PathTraversalRejected:
      return "PATH_TRAVERSAL_REJECTED";
    case ScanErrorKind::LookupFailure:
      return "LOOKUP_FAILURE";
    case ScanErrorKind::IoFailure:
      return "IO_FAILURE";
  }
  return "UNKNOWN";
}

std::string ScanIssue::to_string() const {
  return "[" + action_deps_scanner::to_string(kind) + "] " + message + " (at " + subject + ")";
}

}  // namespace action_deps_scanner

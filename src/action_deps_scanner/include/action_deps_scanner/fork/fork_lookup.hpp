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

#include <tl/expected.hpp>

#include "action_deps_scanner/dependency.hpp"

namespace action_deps_scanner {
namespace fork {

/// Error codes for fork lookups
enum class LookupErrorCode {
  NotFound,        // Repository does not exist or is not visible
  Unauthorized,    // Missing, invalid or insufficient credentials
  Network,         // No response from the service
  InvalidResponse  // Unexpected status or malformed body
};

/// Typed error for ForkLookup implementations
struct LookupError {
  LookupErrorCode code;
  std::string message;
};

std::string to_string(LookupErrorCode code);

/// Fork status of one repository
struct ForkInfo {
  bool is_fork{false};
  std::optional<RepositoryName> parent;  // Set when is_fork and the service reported it
};

/**
 * @brief Abstract repository-metadata lookup (capability interface)
 *
 * Implementations answer "is owner/repo a fork, and of what". The resolver
 * treats every error code the same way: the dependency stays unresolved.
 */
class ForkLookup {
 public:
  virtual ~ForkLookup() = default;

  virtual tl::expected<ForkInfo, LookupError> lookup_fork(const RepositoryName & repository) = 0;
};

}  // namespace fork
}  // namespace action_deps_scanner

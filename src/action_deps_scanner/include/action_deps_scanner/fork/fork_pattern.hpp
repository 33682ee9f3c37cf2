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

#include <cstddef>
#include <map>
#include <optional>
#include <regex>
#include <string>

#include <tl/expected.hpp>

#include "action_deps_scanner/dependency.hpp"

namespace action_deps_scanner {
namespace fork {

/**
 * @brief Regex mapping a fork's `owner/repo` to its upstream
 *
 * Pattern syntax is ECMAScript plus named groups `(?<name>...)` and `\k<name>`
 * back-references. std::regex has no named groups, so names are rewritten to
 * group numbers at compile time. The pattern must define `org` and `repo`.
 *
 * Example: `^(?<org>[^/]+)/actions-(?<repo>.+)$` maps
 * `enterprise/actions-checkout` to `enterprise/checkout`.
 */
class ForkPattern {
 public:
  /// Compile a pattern; error message on invalid syntax or missing groups
  static tl::expected<ForkPattern, std::string> compile(const std::string & pattern);

  /// Search `owner/repo`; nullopt if no match or a group captured nothing
  std::optional<RepositoryName> match(const std::string & full_name) const;

  const std::string & source() const {
    return source_;
  }

 private:
  ForkPattern() = default;

  std::string source_;
  std::regex regex_;
  size_t org_group_{0};
  size_t repo_group_{0};
};

/// Result of rewriting named groups into numbered ones
struct NamedGroupTranslation {
  std::string pattern;                   // std::regex compatible
  std::map<std::string, size_t> groups;  // name -> group number
};

/// Rewrite `(?<name>` into `(` and `\k<name>` into `\N`
tl::expected<NamedGroupTranslation, std::string> translate_named_groups(const std::string & pattern);

}  // namespace fork
}  // namespace action_deps_scanner

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

namespace action_deps_scanner {

/// What a single `uses:` value points at
enum class ReferenceKind {
  RemoteAction,    ///< owner/repo[/path]@ref in a step
  LocalAction,     ///< ./path or ../path in a step
  RemoteWorkflow,  ///< owner/repo/.github/workflows/x.yml@ref on a job
  LocalWorkflow,   ///< ./path/x.yml on a job
  Container        ///< docker://image in a step, never reported
};

/// Where the `uses:` value was found
enum class UsesSite {
  Job,  ///< jobs.<id>.uses (reusable workflow call)
  Step  ///< jobs.<id>.steps[*].uses or runs.steps[*].uses
};

/**
 * @brief One reference extracted from a `uses:` field
 *
 * Remote kinds populate coordinate + ref, local kinds populate relative_path.
 * Construct through the static factories to keep that pairing intact.
 */
struct Reference {
  std::string raw_text;
  ReferenceKind kind{ReferenceKind::Container};
  std::string coordinate;     ///< owner/repo[/subpath], version stripped
  std::string ref;            ///< tag, branch or SHA
  std::string relative_path;  ///< as written, relative to the referencing file

  static Reference remote(const std::string & raw, UsesSite site, const std::string & coordinate,
                          const std::string & ref);
  static Reference local(const std::string & raw, UsesSite site);
  static Reference container(const std::string & raw);

  bool is_remote() const {
    return kind == ReferenceKind::RemoteAction || kind == ReferenceKind::RemoteWorkflow;
  }

  bool is_local() const {
    return kind == ReferenceKind::LocalAction || kind == ReferenceKind::LocalWorkflow;
  }
};

/// Convert kind to string (for logging)
std::string to_string(ReferenceKind kind);

/**
 * @brief Classify a raw `uses:` string
 *
 * Rules are applied in order: local prefix, docker://, then `<coordinate>@<ref>`.
 * Surrounding whitespace is ignored. docker:// is only meaningful on steps.
 *
 * @return Reference, or nullopt when the string matches no rule
 */
std::optional<Reference> classify_uses(const std::string & uses, UsesSite site);

}  // namespace action_deps_scanner

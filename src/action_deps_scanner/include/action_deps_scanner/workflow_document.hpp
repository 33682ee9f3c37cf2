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
#include <variant>
#include <vector>

namespace action_deps_scanner {

/// Document with nothing to extract (empty file, scalar, unknown shape)
struct EmptyDocument {};

/// A single job of a pipeline
struct JobDefinition {
  std::string id;
  std::optional<std::string> uses;  ///< job-level reusable workflow call
  std::vector<std::string> step_uses;
};

/// Pipeline file with a top-level `jobs` map
struct PipelineDocument {
  std::vector<JobDefinition> jobs;
  bool callable{false};  ///< declares an `on: workflow_call` trigger
};

/// Action manifest with `runs.using: composite`
struct CompositeActionDocument {
  std::string name;
  std::vector<std::string> step_uses;
};

/// Action manifest running something other than composite steps (node20, docker, ...)
struct ActionManifestDocument {
  std::string name;
  std::string using_runtime;
};

/**
 * @brief Parsed workflow or action file, discriminated by document kind
 *
 * Extraction dispatches on the alternative instead of probing optional fields.
 */
using WorkflowDocument = std::variant<EmptyDocument, PipelineDocument, CompositeActionDocument, ActionManifestDocument>;

inline bool is_composite(const WorkflowDocument & doc) {
  return std::holds_alternative<CompositeActionDocument>(doc);
}

inline bool is_callable_pipeline(const WorkflowDocument & doc) {
  const auto * pipeline = std::get_if<PipelineDocument>(&doc);
  return pipeline != nullptr && pipeline->callable;
}

}  // namespace action_deps_scanner

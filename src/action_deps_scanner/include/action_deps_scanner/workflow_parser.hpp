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

#include "action_deps_scanner/workflow_document.hpp"

#include <string>
#include <vector>

// Forward declare YAML::Node to avoid including yaml-cpp in header
namespace YAML {
class Node;
}

namespace action_deps_scanner {

/**
 * @brief Parses workflow and action YAML files into WorkflowDocument
 *
 * Only the fields needed to locate `uses:` references are read. Anything
 * else in the document is ignored, including invalid workflow syntax.
 */
class WorkflowParser {
 public:
  /**
   * @brief Parse document from file
   * @param file_path Path to YAML file
   * @return Parsed document
   * @throws std::runtime_error if file cannot be read or parsed
   */
  WorkflowDocument parse_file(const std::string & file_path) const;

  /**
   * @brief Parse document from YAML string
   * @param yaml_content YAML content as string
   * @return Parsed document (EmptyDocument for empty content)
   * @throws std::runtime_error if YAML is malformed
   */
  WorkflowDocument parse_string(const std::string & yaml_content) const;

  /**
   * @brief Path-only convenience predicates
   *
   * Each call parses the file again. DependencyScanner classifies files from its
   * per-scan document cache with is_composite / is_callable_pipeline instead, so
   * these serve callers that hold just a path. Both return false on unreadable or
   * malformed files and never throw.
   */
  bool is_composite_action(const std::string & file_path) const;
  bool is_callable_workflow(const std::string & file_path) const;

 private:
  PipelineDocument parse_pipeline(const YAML::Node & root) const;
  JobDefinition parse_job(const std::string & id, const YAML::Node & node) const;
  bool has_workflow_call_trigger(const YAML::Node & root) const;

  /// Collect scalar `uses` values from a step sequence, skipping anything else
  std::vector<std::string> get_step_uses(const YAML::Node & steps) const;

  /// Get scalar string value with default
  std::string get_string(const YAML::Node & node, const std::string & key, const std::string & default_val = "") const;
};

}  // namespace action_deps_scanner

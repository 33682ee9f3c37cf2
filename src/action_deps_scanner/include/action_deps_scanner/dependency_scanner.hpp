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

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "action_deps_scanner/dependency.hpp"
#include "action_deps_scanner/scan_issue.hpp"
#include "action_deps_scanner/workflow_parser.hpp"

namespace action_deps_scanner {

/// Output of a single scan
struct ScanResult {
  DependencySet dependencies;
  std::vector<std::string> visited_files;  ///< canonical paths, in processing order
  std::vector<ScanIssue> issues;
};

/**
 * @brief Discovers remote dependencies of a repository's workflows
 *
 * Walks the workflow directory, extracts references from every file and
 * follows local composite actions and reusable workflows through a worklist.
 * Each canonical file path is processed at most once, so reference cycles
 * terminate. Failures on individual files or references are recorded in
 * ScanResult::issues and never abort the scan.
 */
class DependencyScanner {
 public:
  DependencyScanner() = default;
  explicit DependencyScanner(WorkflowParser parser);

  /**
   * @brief Scan workflows and everything they reach locally
   * @param workflow_dir Directory holding pipeline files (walked recursively)
   * @param additional_paths Extra directories, relative to repo_root, searched for
   *        composite actions and callable workflows not reachable from workflow_dir
   * @param repo_root Repository root; local references may not escape it
   */
  ScanResult scan(const std::string & workflow_dir, const std::vector<std::string> & additional_paths,
                  const std::string & repo_root) const;

  /// Recursively list *.yml / *.yaml files, sorted. Missing directory gives an empty list.
  static std::vector<std::string> find_workflow_files(const std::string & dir_path);

  /**
   * @brief Resolve a local `uses:` path against the file that contains it
   * @return Canonical path, or nullopt if it escapes repo_root
   */
  static std::optional<std::filesystem::path> resolve_local_path(const std::filesystem::path & referencing_file,
                                                                 const std::string & relative_path,
                                                                 const std::filesystem::path & repo_root);

  /// Locate action.yml, then action.yaml, in a directory; a .yml/.yaml file is returned as is
  static std::optional<std::filesystem::path> find_action_manifest(const std::filesystem::path & path);

 private:
  WorkflowParser parser_;
};

}  // namespace action_deps_scanner

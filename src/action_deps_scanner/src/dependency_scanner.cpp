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

#include "action_deps_scanner/dependency_scanner.hpp"

#include <rclcpp/rclcpp.hpp>

#include <algorithm>
#include <deque>
#include <map>
#include <set>
#include <utility>

#include "action_deps_scanner/reference_extractor.hpp"

namespace action_deps_scanner {

namespace fs = std::filesystem;

namespace {

rclcpp::Logger logger() {
  return rclcpp::get_logger("dependency_scanner");
}

bool has_yaml_extension(const fs::path & path) {
  const auto ext = path.extension().string();
  return ext == ".yml" || ext == ".yaml";
}

fs::path canonical_path(const fs::path & path) {
  std::error_code ec;
  auto absolute = fs::absolute(path, ec);
  if (ec) {
    absolute = path;
  }
  auto canonical = fs::weakly_canonical(absolute, ec);
  if (ec) {
    return absolute.lexically_normal();
  }
  return canonical;
}

/// Component-wise prefix check (/repo-other is not inside /repo)
bool is_within(const fs::path & path, const fs::path & root) {
  auto path_it = path.begin();
  for (const auto & component : root) {
    if (component.empty()) {
      continue;
    }
    if (path_it == path.end() || *path_it != component) {
      return false;
    }
    ++path_it;
  }
  return true;
}

/// Per-scan working memory: worklist, visited set and parsed-document cache
class Traversal {
 public:
  Traversal(const WorkflowParser & parser, fs::path repo_root) : parser_(parser), repo_root_(std::move(repo_root)) {
  }

  void enqueue(const fs::path & file) {
    worklist_.push_back(file);
  }

  bool is_visited(const fs::path & file) const {
    return visited_.count(file.string()) > 0;
  }

  /// Process queued files until the worklist is empty
  void drain() {
    while (!worklist_.empty()) {
      fs::path file = worklist_.front();
      worklist_.pop_front();
      if (is_visited(file)) {
        continue;
      }
      visited_.insert(file.string());
      result_.visited_files.push_back(file.string());
      process(file);
    }
  }

  /// Parsed document for a canonical path; nullptr if the file failed to load
  const WorkflowDocument * load(const fs::path & file) {
    const auto key = file.string();
    auto cached = documents_.find(key);
    if (cached != documents_.end()) {
      return cached->second ? &*cached->second : nullptr;
    }

    std::optional<WorkflowDocument> document;
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
      add_issue(ScanErrorKind::IoFailure, key, "File does not exist or is not a regular file");
    } else {
      try {
        document = parser_.parse_file(key);
      } catch (const std::exception & e) {
        add_issue(ScanErrorKind::ParseFailure, key, e.what());
      }
    }

    auto inserted = documents_.emplace(key, std::move(document)).first;
    return inserted->second ? &*inserted->second : nullptr;
  }

  void add_issue(ScanErrorKind kind, const std::string & subject, const std::string & message) {
    ScanIssue issue{kind, subject, message};
    RCLCPP_WARN(logger(), "%s", issue.to_string().c_str());
    result_.issues.push_back(std::move(issue));
  }

  ScanResult take_result() {
    return std::move(result_);
  }

 private:
  void process(const fs::path & file) {
    const WorkflowDocument * document = load(file);
    if (document == nullptr) {
      return;
    }

    for (const auto & reference : extract_references(*document)) {
      if (reference.is_remote()) {
        add_dependency(file, reference);
      } else if (reference.kind == ReferenceKind::LocalAction) {
        follow_local_action(file, reference);
      } else if (reference.kind == ReferenceKind::LocalWorkflow) {
        follow_local_workflow(file, reference);
      }
    }
  }

  void add_dependency(const fs::path & file, const Reference & reference) {
    Dependency dependency;
    dependency.coordinate = reference.coordinate;
    dependency.version = reference.ref;
    dependency.source_file = file.string();
    dependency.uses = reference.raw_text;
    if (result_.dependencies.insert(std::move(dependency))) {
      RCLCPP_DEBUG(logger(), "Found %s in %s", reference.raw_text.c_str(), file.string().c_str());
    }
  }

  std::optional<fs::path> resolve(const fs::path & file, const Reference & reference) {
    auto resolved = DependencyScanner::resolve_local_path(file, reference.relative_path, repo_root_);
    if (!resolved) {
      add_issue(ScanErrorKind::PathTraversalRejected, file.string(),
                "Local reference '" + reference.relative_path + "' resolves outside the repository");
    }
    return resolved;
  }

  void follow_local_action(const fs::path & file, const Reference & reference) {
    auto resolved = resolve(file, reference);
    if (!resolved) {
      return;
    }

    auto manifest = DependencyScanner::find_action_manifest(*resolved);
    if (!manifest) {
      add_issue(ScanErrorKind::IoFailure, resolved->string(),
                "No action manifest for local action '" + reference.relative_path + "'");
      return;
    }

    // action.yml may itself be a symlink pointing out of the repository
    const fs::path target = canonical_path(*manifest);
    if (!is_within(target, repo_root_)) {
      add_issue(ScanErrorKind::PathTraversalRejected, file.string(),
                "Action manifest for '" + reference.relative_path + "' resolves outside the repository");
      return;
    }
    if (is_visited(target)) {
      return;
    }

    const WorkflowDocument * document = load(target);
    if (document == nullptr) {
      return;
    }
    if (!is_composite(*document)) {
      RCLCPP_DEBUG(logger(), "Local action %s is not composite, nothing to expand", target.string().c_str());
      return;
    }
    enqueue(target);
  }

  void follow_local_workflow(const fs::path & file, const Reference & reference) {
    auto resolved = resolve(file, reference);
    if (!resolved) {
      return;
    }
    if (!has_yaml_extension(*resolved)) {
      add_issue(ScanErrorKind::IoFailure, file.string(),
                "Local workflow '" + reference.relative_path + "' is not a .yml or .yaml file");
      return;
    }
    if (!is_visited(*resolved)) {
      enqueue(*resolved);
    }
  }

  const WorkflowParser & parser_;
  fs::path repo_root_;
  std::deque<fs::path> worklist_;
  std::set<std::string> visited_;
  std::map<std::string, std::optional<WorkflowDocument>> documents_;
  ScanResult result_;
};

}  // namespace

DependencyScanner::DependencyScanner(WorkflowParser parser) : parser_(std::move(parser)) {
}

ScanResult DependencyScanner::scan(const std::string & workflow_dir, const std::vector<std::string> & additional_paths,
                                   const std::string & repo_root) const {
  const fs::path root = canonical_path(repo_root);
  Traversal traversal(parser_, root);

  const auto workflow_files = find_workflow_files(workflow_dir);
  RCLCPP_INFO(logger(), "Found %zu workflow files in %s", workflow_files.size(), workflow_dir.c_str());
  for (const auto & file : workflow_files) {
    traversal.enqueue(canonical_path(file));
  }
  traversal.drain();

  for (const auto & additional : additional_paths) {
    // Always relative to the repository root, even when written with a leading '/'
    const fs::path dir = canonical_path(root / fs::path(additional).relative_path());
    if (!is_within(dir, root)) {
      RCLCPP_WARN(logger(), "Additional path %s is outside the repository, skipping", additional.c_str());
      continue;
    }
    for (const auto & file : find_workflow_files(dir.string())) {
      const fs::path target = canonical_path(file);
      if (traversal.is_visited(target)) {
        continue;
      }
      const WorkflowDocument * document = traversal.load(target);
      if (document == nullptr) {
        continue;
      }
      if (is_composite(*document)) {
        traversal.enqueue(target);
        traversal.drain();
      }
    }
  }

  ScanResult result = traversal.take_result();
  RCLCPP_INFO(logger(), "Scanned %zu files, found %zu unique dependencies (%zu issues)", result.visited_files.size(),
              result.dependencies.size(), result.issues.size());
  return result;
}

std::vector<std::string> DependencyScanner::find_workflow_files(const std::string & dir_path) {
  std::vector<std::string> files;

  std::error_code ec;
  if (!fs::is_directory(dir_path, ec)) {
    RCLCPP_WARN(logger(), "Directory does not exist or cannot be read: %s", dir_path.c_str());
    return files;
  }

  fs::recursive_directory_iterator it(dir_path, fs::directory_options::skip_permission_denied, ec);
  const fs::recursive_directory_iterator end;
  while (!ec && it != end) {
    std::error_code entry_ec;
    if (it->is_regular_file(entry_ec) && has_yaml_extension(it->path())) {
      files.push_back(it->path().string());
    }
    it.increment(ec);
  }
  if (ec) {
    RCLCPP_WARN(logger(), "Stopped walking %s: %s", dir_path.c_str(), ec.message().c_str());
  }

  std::sort(files.begin(), files.end());
  return files;
}

std::optional<fs::path> DependencyScanner::resolve_local_path(const fs::path & referencing_file,
                                                             const std::string & relative_path,
                                                             const fs::path & repo_root) {
  std::string normalized = relative_path;
  std::replace(normalized.begin(), normalized.end(), '\\', '/');

  const fs::path resolved = canonical_path(referencing_file.parent_path() / normalized);
  if (!is_within(resolved, canonical_path(repo_root))) {
    return std::nullopt;
  }
  return resolved;
}

std::optional<fs::path> DependencyScanner::find_action_manifest(const fs::path & path) {
  std::error_code ec;
  if (fs::is_regular_file(path, ec)) {
    if (has_yaml_extension(path)) {
      return path;
    }
    return std::nullopt;
  }

  if (fs::is_directory(path, ec)) {
    for (const char * name : {"action.yml", "action.yaml"}) {
      const fs::path candidate = path / name;
      if (fs::is_regular_file(candidate, ec)) {
        return candidate;
      }
    }
  }
  return std::nullopt;
}

}  // namespace action_deps_scanner

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
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace action_deps_scanner {

/// owner + repo, no version
struct RepositoryName {
  std::string owner;
  std::string repo;

  std::string full_name() const {
    return owner + "/" + repo;
  }

  bool operator==(const RepositoryName & other) const {
    return owner == other.owner && repo == other.repo;
  }
  bool operator!=(const RepositoryName & other) const {
    return !(*this == other);
  }
};

/// Coordinate split into owner, repo and optional subpath (owner/repo/sub/path)
struct RepositoryCoordinate {
  RepositoryName repository;
  std::string subpath;

  /// Split `owner/repo[/subpath]`; nullopt when owner or repo is missing
  static std::optional<RepositoryCoordinate> parse(const std::string & coordinate);
};

/// A remote action or workflow referenced by some scanned file
struct Dependency {
  std::string coordinate;   ///< owner/repo[/subpath]
  std::string version;      ///< ref as written after '@'
  std::string source_file;  ///< first file that referenced it (diagnostics only)
  std::string uses;         ///< raw `uses:` text that introduced it

  /// Identity: coordinate@version
  std::string key() const {
    return coordinate + "@" + version;
  }
};

/// Dependency plus the upstream repository it was forked from, if known
struct ResolvedDependency {
  Dependency dependency;
  std::optional<RepositoryName> original;
};

/**
 * @brief Insertion-ordered set of dependencies keyed by coordinate@version
 *
 * The first insert for a key wins; later inserts with the same key are no-ops.
 */
class DependencySet {
 public:
  using const_iterator = std::vector<Dependency>::const_iterator;

  /// @return true if the dependency was new
  bool insert(Dependency dependency);

  bool contains(const std::string & key) const;
  const Dependency * find(const std::string & key) const;

  size_t size() const {
    return items_.size();
  }
  bool empty() const {
    return items_.empty();
  }

  const_iterator begin() const {
    return items_.begin();
  }
  const_iterator end() const {
    return items_.end();
  }

  const std::vector<Dependency> & items() const {
    return items_;
  }

 private:
  std::vector<Dependency> items_;
  std::unordered_map<std::string, size_t> index_;
};

}  // namespace action_deps_scanner

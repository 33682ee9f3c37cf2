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

#include "action_deps_scanner/dependency.hpp"

#include <utility>

namespace action_deps_scanner {

std::optional<RepositoryCoordinate> RepositoryCoordinate::parse(const std::string & coordinate) {
  const auto first_slash = coordinate.find('/');
  if (first_slash == std::string::npos || first_slash == 0) {
    return std::nullopt;
  }

  RepositoryCoordinate result;
  result.repository.owner = coordinate.substr(0, first_slash);

  const auto second_slash = coordinate.find('/', first_slash + 1);
  if (second_slash == std::string::npos) {
    result.repository.repo = coordinate.substr(first_slash + 1);
  } else {
    result.repository.repo = coordinate.substr(first_slash + 1, second_slash - first_slash - 1);
    result.subpath = coordinate.substr(second_slash + 1);
  }

  if (result.repository.repo.empty()) {
    return std::nullopt;
  }
  return result;
}

bool DependencySet::insert(Dependency dependency) {
  auto key = dependency.key();
  if (index_.count(key) > 0) {
    return false;
  }
  index_.emplace(std::move(key), items_.size());
  items_.push_back(std::move(dependency));
  return true;
}

bool DependencySet::contains(const std::string & key) const {
  return index_.count(key) > 0;
}

const Dependency * DependencySet::find(const std::string & key) const {
  auto it = index_.find(key);
  if (it == index_.end()) {
    return nullptr;
  }
  return &items_[it->second];
}

}  // namespace action_deps_scanner

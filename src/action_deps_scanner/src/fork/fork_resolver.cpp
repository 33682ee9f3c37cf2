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

#include "action_deps_scanner/fork/fork_resolver.hpp"

#include <rclcpp/rclcpp.hpp>

#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

namespace action_deps_scanner {
namespace fork {

namespace {

rclcpp::Logger logger() {
  return rclcpp::get_logger("fork_resolver");
}

bool iequals(const std::string & a, const std::string & b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
         });
}

}  // namespace

ForkResolver::ForkResolver(ForkResolverConfig config, std::shared_ptr<ForkLookup> lookup)
  : config_(std::move(config)), lookup_(std::move(lookup)) {
}

bool ForkResolver::is_fork_organization(const std::string & owner) const {
  return std::any_of(config_.fork_organizations.begin(), config_.fork_organizations.end(),
                     [&owner](const std::string & org) {
                       return iequals(org, owner);
                     });
}

std::vector<ResolvedDependency> ForkResolver::resolve(const DependencySet & dependencies) {
  return resolve(dependencies.items());
}

std::vector<ResolvedDependency> ForkResolver::resolve(const std::vector<Dependency> & dependencies) {
  resolved_cache_.clear();
  issues_.clear();

  std::vector<ResolvedDependency> result;
  std::set<std::string> seen;

  for (const auto & dependency : dependencies) {
    if (!seen.insert(dependency.key()).second) {
      continue;
    }

    ResolvedDependency resolved{dependency, std::nullopt};
    auto coordinate = RepositoryCoordinate::parse(dependency.coordinate);
    if (coordinate && is_fork_organization(coordinate->repository.owner)) {
      resolved.original = find_original(coordinate->repository);
      if (resolved.original) {
        RCLCPP_INFO(logger(), "%s is a fork of %s", dependency.key().c_str(),
                    resolved.original->full_name().c_str());
      }
    }
    result.push_back(std::move(resolved));
  }

  return result;
}

std::optional<RepositoryName> ForkResolver::find_original(const RepositoryName & repository) {
  const std::string full_name = repository.full_name();
  auto cached = resolved_cache_.find(full_name);
  if (cached != resolved_cache_.end()) {
    return cached->second;
  }

  std::optional<RepositoryName> original;
  if (config_.fork_pattern) {
    original = config_.fork_pattern->match(full_name);
    if (original && *original == repository) {
      RCLCPP_DEBUG(logger(), "Pattern maps %s onto itself, ignoring", full_name.c_str());
      original.reset();
    }
  }
  if (!original) {
    original = lookup_original(repository);
  }

  resolved_cache_[full_name] = original;
  return original;
}

std::optional<RepositoryName> ForkResolver::lookup_original(const RepositoryName & repository) {
  const std::string full_name = repository.full_name();
  if (!lookup_) {
    RCLCPP_DEBUG(logger(), "No fork lookup configured, %s stays unresolved", full_name.c_str());
    return std::nullopt;
  }

  auto info = [&]() -> tl::expected<ForkInfo, LookupError> {
    try {
      return lookup_->lookup_fork(repository);
    } catch (const std::exception & e) {
      return tl::make_unexpected(LookupError{LookupErrorCode::Network, e.what()});
    }
  }();

  if (!info) {
    ScanIssue issue{ScanErrorKind::LookupFailure, full_name,
                    "Fork lookup failed (" + to_string(info.error().code) + "): " + info.error().message};
    RCLCPP_WARN(logger(), "%s", issue.to_string().c_str());
    issues_.push_back(std::move(issue));
    return std::nullopt;
  }

  if (!info->is_fork || !info->parent) {
    RCLCPP_DEBUG(logger(), "%s is not a fork", full_name.c_str());
    return std::nullopt;
  }
  if (*info->parent == repository) {
    RCLCPP_WARN(logger(), "Lookup reports %s as a fork of itself, ignoring", full_name.c_str());
    return std::nullopt;
  }
  return info->parent;
}

}  // namespace fork
}  // namespace action_deps_scanner

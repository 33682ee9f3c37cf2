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

#include "action_deps_scanner/reference.hpp"

#include <array>
#include <regex>

namespace action_deps_scanner {

namespace {

constexpr std::array<const char *, 4> kLocalPrefixes = {"./", "../", ".\\", "..\\"};
constexpr const char * kDockerPrefix = "docker://";

bool starts_with(const std::string & value, const std::string & prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

std::string trim(const std::string & value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

bool is_local_path(const std::string & uses) {
  for (const char * prefix : kLocalPrefixes) {
    if (starts_with(uses, prefix)) {
      return true;
    }
  }
  return false;
}

const std::regex & remote_pattern() {
  // coordinate cannot contain '@', ref is everything after the first '@'
  static const std::regex pattern("^([^@]+)@(.+)$");
  return pattern;
}

}  // namespace

Reference Reference::remote(const std::string & raw, UsesSite site, const std::string & coordinate,
                            const std::string & ref) {
  Reference result;
  result.raw_text = raw;
  result.kind = (site == UsesSite::Job) ? ReferenceKind::RemoteWorkflow : ReferenceKind::RemoteAction;
  result.coordinate = coordinate;
  result.ref = ref;
  return result;
}

Reference Reference::local(const std::string & raw, UsesSite site) {
  Reference result;
  result.raw_text = raw;
  result.kind = (site == UsesSite::Job) ? ReferenceKind::LocalWorkflow : ReferenceKind::LocalAction;
  result.relative_path = raw;
  return result;
}

Reference Reference::container(const std::string & raw) {
  Reference result;
  result.raw_text = raw;
  result.kind = ReferenceKind::Container;
  return result;
}

std::string to_string(ReferenceKind kind) {
  switch (kind) {
    case ReferenceKind::RemoteAction:
      return "remote-action";
    case ReferenceKind::LocalAction:
      return "local-action";
    case ReferenceKind::RemoteWorkflow:
      return "remote-workflow";
    case ReferenceKind::LocalWorkflow:
      return "local-workflow";
    case ReferenceKind::Container:
      return "container";
  }
  return "unknown";
}

std::optional<Reference> classify_uses(const std::string & uses, UsesSite site) {
  const std::string value = trim(uses);
  if (value.empty()) {
    return std::nullopt;
  }

  if (is_local_path(value)) {
    return Reference::local(value, site);
  }

  if (starts_with(value, kDockerPrefix)) {
    // Jobs cannot run a container image as a reusable workflow
    if (site == UsesSite::Job) {
      return std::nullopt;
    }
    return Reference::container(value);
  }

  std::smatch match;
  if (std::regex_match(value, match, remote_pattern())) {
    return Reference::remote(value, site, match[1].str(), match[2].str());
  }

  return std::nullopt;
}

}  // namespace action_deps_scanner

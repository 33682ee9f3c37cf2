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

#include "action_deps_scanner/fork/fork_pattern.hpp"

#include <sstream>

namespace action_deps_scanner {
namespace fork {

namespace {

bool is_name_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

/// Read `name>` starting at pos; returns name and advances pos past '>'
tl::expected<std::string, std::string> read_group_name(const std::string & pattern, size_t & pos) {
  const size_t start = pos;
  while (pos < pattern.size() && is_name_char(pattern[pos])) {
    ++pos;
  }
  if (pos >= pattern.size() || pattern[pos] != '>' || pos == start) {
    return tl::make_unexpected("Invalid group name at offset " + std::to_string(start));
  }
  std::string name = pattern.substr(start, pos - start);
  ++pos;
  return name;
}

}  // namespace

tl::expected<NamedGroupTranslation, std::string> translate_named_groups(const std::string & pattern) {
  NamedGroupTranslation result;
  std::ostringstream out;
  size_t group_count = 0;
  bool in_class = false;

  size_t i = 0;
  while (i < pattern.size()) {
    const char c = pattern[i];

    if (c == '\\') {
      if (i + 1 >= pattern.size()) {
        return tl::make_unexpected("Pattern ends with a dangling escape");
      }
      // \k<name> back-reference
      if (!in_class && pattern[i + 1] == 'k' && i + 2 < pattern.size() && pattern[i + 2] == '<') {
        size_t pos = i + 3;
        auto name = read_group_name(pattern, pos);
        if (!name) {
          return tl::make_unexpected(name.error());
        }
        auto it = result.groups.find(*name);
        if (it == result.groups.end()) {
          return tl::make_unexpected("Back-reference to unknown group '" + *name + "'");
        }
        out << '\\' << it->second;
        i = pos;
        continue;
      }
      out << c << pattern[i + 1];
      i += 2;
      continue;
    }

    if (in_class) {
      if (c == ']') {
        in_class = false;
      }
      out << c;
      ++i;
      continue;
    }

    if (c == '[') {
      in_class = true;
      out << c;
      ++i;
      continue;
    }

    if (c == '(') {
      const bool has_modifier = i + 1 < pattern.size() && pattern[i + 1] == '?';
      if (!has_modifier) {
        ++group_count;
        out << c;
        ++i;
        continue;
      }
      // (?<name> ... ) but not lookbehind (?<= / (?<!
      if (i + 2 < pattern.size() && pattern[i + 2] == '<' && i + 3 < pattern.size() && pattern[i + 3] != '=' &&
          pattern[i + 3] != '!') {
        size_t pos = i + 3;
        auto name = read_group_name(pattern, pos);
        if (!name) {
          return tl::make_unexpected(name.error());
        }
        if (result.groups.count(*name) > 0) {
          return tl::make_unexpected("Duplicate group name '" + *name + "'");
        }
        ++group_count;
        result.groups[*name] = group_count;
        out << '(';
        i = pos;
        continue;
      }
      // (?: (?= (?! are non-capturing
      out << c;
      ++i;
      continue;
    }

    out << c;
    ++i;
  }

  result.pattern = out.str();
  return result;
}

tl::expected<ForkPattern, std::string> ForkPattern::compile(const std::string & pattern) {
  auto translation = translate_named_groups(pattern);
  if (!translation) {
    return tl::make_unexpected(translation.error());
  }

  auto org = translation->groups.find("org");
  auto repo = translation->groups.find("repo");
  if (org == translation->groups.end() || repo == translation->groups.end()) {
    return tl::make_unexpected("Pattern must contain named captures \"org\" and \"repo\"");
  }

  ForkPattern result;
  result.source_ = pattern;
  result.org_group_ = org->second;
  result.repo_group_ = repo->second;
  try {
    result.regex_ = std::regex(translation->pattern, std::regex::ECMAScript);
  } catch (const std::regex_error & e) {
    return tl::make_unexpected("Invalid pattern: " + std::string(e.what()));
  }
  return result;
}

std::optional<RepositoryName> ForkPattern::match(const std::string & full_name) const {
  std::smatch match;
  if (!std::regex_search(full_name, match, regex_)) {
    return std::nullopt;
  }
  if (!match[org_group_].matched || !match[repo_group_].matched) {
    return std::nullopt;
  }

  RepositoryName original{match[org_group_].str(), match[repo_group_].str()};
  if (original.owner.empty() || original.repo.empty()) {
    return std::nullopt;
  }
  return original;
}

}  // namespace fork
}  // namespace action_deps_scanner

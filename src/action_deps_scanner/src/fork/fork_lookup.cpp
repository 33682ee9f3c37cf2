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

#include "action_deps_scanner/fork/fork_lookup.hpp"

namespace action_deps_scanner {
namespace fork {

std::string to_string(LookupErrorCode code) {
  switch (code) {
    case LookupErrorCode::NotFound:
      return "not-found";
    case LookupErrorCode::Unauthorized:
      return "unauthorized";
    case LookupErrorCode::Network:
      return "network";
    case LookupErrorCode::InvalidResponse:
      return "invalid-response";
  }
  return "unknown";
}

}  // namespace fork
}  // namespace action_deps_scanner

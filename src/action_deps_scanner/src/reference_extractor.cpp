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

#include "action_deps_scanner/reference_extractor.hpp"

#include <string>
#include <utility>
#include <variant>

namespace action_deps_scanner {

namespace {

void append_reference(const std::string & uses, UsesSite site, std::vector<Reference> & out) {
  auto reference = classify_uses(uses, site);
  if (!reference || reference->kind == ReferenceKind::Container) {
    return;
  }
  out.push_back(std::move(*reference));
}

void append_steps(const std::vector<std::string> & step_uses, std::vector<Reference> & out) {
  for (const auto & uses : step_uses) {
    append_reference(uses, UsesSite::Step, out);
  }
}

struct ExtractVisitor {
  std::vector<Reference> & out;

  void operator()(const EmptyDocument &) const {
  }

  void operator()(const ActionManifestDocument &) const {
  }

  void operator()(const CompositeActionDocument & action) const {
    append_steps(action.step_uses, out);
  }

  void operator()(const PipelineDocument & pipeline) const {
    for (const auto & job : pipeline.jobs) {
      if (job.uses) {
        append_reference(*job.uses, UsesSite::Job, out);
      }
      append_steps(job.step_uses, out);
    }
  }
};

}  // namespace

std::vector<Reference> extract_references(const WorkflowDocument & document) {
  std::vector<Reference> references;
  std::visit(ExtractVisitor{references}, document);
  return references;
}

}  // namespace action_deps_scanner

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

#include "action_deps_scanner/workflow_parser.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace action_deps_scanner {

WorkflowDocument WorkflowParser::parse_file(const std::string & file_path) const {
  std::ifstream file(file_path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open workflow file: " + file_path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw std::runtime_error("Cannot read workflow file: " + file_path);
  }
  return parse_string(buffer.str());
}

WorkflowDocument WorkflowParser::parse_string(const std::string & yaml_content) const {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_content);
  } catch (const YAML::Exception & e) {
    throw std::runtime_error("YAML parse error: " + std::string(e.what()));
  }

  if (!root || !root.IsMap()) {
    return EmptyDocument{};
  }

  // Composite marker wins over `jobs`, matching how the runner treats action.yml
  const YAML::Node runs = root["runs"];
  if (runs && runs.IsMap()) {
    const std::string using_runtime = get_string(runs, "using");
    if (using_runtime == "composite") {
      CompositeActionDocument action;
      action.name = get_string(root, "name");
      action.step_uses = get_step_uses(runs["steps"]);
      return action;
    }
  }

  if (root["jobs"] && root["jobs"].IsMap()) {
    return parse_pipeline(root);
  }

  if (runs && runs.IsMap()) {
    ActionManifestDocument action;
    action.name = get_string(root, "name");
    action.using_runtime = get_string(runs, "using");
    return action;
  }

  return EmptyDocument{};
}

bool WorkflowParser::is_composite_action(const std::string & file_path) const {
  try {
    return is_composite(parse_file(file_path));
  } catch (const std::exception &) {
    return false;
  }
}

bool WorkflowParser::is_callable_workflow(const std::string & file_path) const {
  try {
    return is_callable_pipeline(parse_file(file_path));
  } catch (const std::exception &) {
    return false;
  }
}

PipelineDocument WorkflowParser::parse_pipeline(const YAML::Node & root) const {
  PipelineDocument pipeline;
  pipeline.callable = has_workflow_call_trigger(root);

  for (const auto & it : root["jobs"]) {
    if (!it.first.IsScalar() || !it.second.IsMap()) {
      continue;
    }
    pipeline.jobs.push_back(parse_job(it.first.as<std::string>(), it.second));
  }
  return pipeline;
}

JobDefinition WorkflowParser::parse_job(const std::string & id, const YAML::Node & node) const {
  JobDefinition job;
  job.id = id;
  if (node["uses"] && node["uses"].IsScalar()) {
    job.uses = node["uses"].as<std::string>();
  }
  job.step_uses = get_step_uses(node["steps"]);
  return job;
}

bool WorkflowParser::has_workflow_call_trigger(const YAML::Node & root) const {
  const YAML::Node on = root["on"];
  if (!on) {
    return false;
  }
  if (on.IsScalar()) {
    return on.as<std::string>() == "workflow_call";
  }
  if (on.IsSequence()) {
    for (const auto & trigger : on) {
      if (trigger.IsScalar() && trigger.as<std::string>() == "workflow_call") {
        return true;
      }
    }
    return false;
  }
  if (on.IsMap()) {
    return static_cast<bool>(on["workflow_call"]);
  }
  return false;
}

std::vector<std::string> WorkflowParser::get_step_uses(const YAML::Node & steps) const {
  std::vector<std::string> result;
  if (!steps || !steps.IsSequence()) {
    return result;
  }
  for (const auto & step : steps) {
    if (!step.IsMap()) {
      continue;
    }
    const YAML::Node uses = step["uses"];
    if (uses && uses.IsScalar()) {
      result.push_back(uses.as<std::string>());
    }
  }
  return result;
}

std::string WorkflowParser::get_string(const YAML::Node & node, const std::string & key,
                                       const std::string & default_val) const {
  if (node.IsMap() && node[key] && node[key].IsScalar()) {
    return node[key].as<std::string>();
  }
  return default_val;
}

}  // namespace action_deps_scanner

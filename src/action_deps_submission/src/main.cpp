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

#include <getopt.h>

#include <rclcpp/rclcpp.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "action_deps_submission/action_config.hpp"
#include "action_deps_submission/action_runner.hpp"
#include "action_deps_submission/dependency_submitter.hpp"
#include "action_deps_submission/github_client.hpp"

using namespace action_deps_submission;

namespace {

enum OptionId {
  kOptToken = 1000,
  kOptRepository,
  kOptSha,
  kOptRef,
  kOptWorkspace,
  kOptWorkflowPath,
  kOptAdditionalPaths,
  kOptForkOrganizations,
  kOptForkRegex,
  kOptApiUrl,
  kOptDryRun,
};

void print_help() {
  std::cout << "Usage: action_deps [options]\n"
            << "\n"
            << "Discovers GitHub Actions dependencies of a repository and submits them\n"
            << "to the dependency graph. Options override INPUT_* / GITHUB_* variables.\n"
            << "\n"
            << "  --token TOKEN                  API token (INPUT_TOKEN)\n"
            << "  --repository OWNER/REPO        Target repository (GITHUB_REPOSITORY)\n"
            << "  --sha SHA                      Commit being scanned (GITHUB_SHA)\n"
            << "  --ref REF                      Git ref being scanned (GITHUB_REF)\n"
            << "  --workspace DIR                Repository root (GITHUB_WORKSPACE)\n"
            << "  --workflow-path DIR            Workflow directory [.github/workflows]\n"
            << "  --additional-paths A,B         Extra action/workflow directories\n"
            << "  --fork-organizations ORG,ORG   Owners whose repositories may be forks\n"
            << "  --fork-regex REGEX             Pattern with (?<org>) and (?<repo>) groups\n"
            << "  --api-url URL                  REST API root (GITHUB_API_URL)\n"
            << "  --dry-run                      Log the snapshot instead of submitting it\n"
            << "  -h, --help                     Show this help\n";
}

/// Apply command-line overrides on top of the environment-seeded builder
bool parse_args(int argc, char * argv[], ActionConfigBuilder & builder) {
  static struct option long_options[] = {{"token", required_argument, 0, kOptToken},
                                         {"repository", required_argument, 0, kOptRepository},
                                         {"sha", required_argument, 0, kOptSha},
                                         {"ref", required_argument, 0, kOptRef},
                                         {"workspace", required_argument, 0, kOptWorkspace},
                                         {"workflow-path", required_argument, 0, kOptWorkflowPath},
                                         {"additional-paths", required_argument, 0, kOptAdditionalPaths},
                                         {"fork-organizations", required_argument, 0, kOptForkOrganizations},
                                         {"fork-regex", required_argument, 0, kOptForkRegex},
                                         {"api-url", required_argument, 0, kOptApiUrl},
                                         {"dry-run", no_argument, 0, kOptDryRun},
                                         {"help", no_argument, 0, 'h'},
                                         {0, 0, 0, 0}};

  int opt;
  int option_index = 0;
  while ((opt = getopt_long(argc, argv, "h", long_options, &option_index)) != -1) {
    switch (opt) {
      case kOptToken:
        builder.with_token(optarg);
        break;
      case kOptRepository:
        builder.with_repository(optarg);
        break;
      case kOptSha:
        builder.with_sha(optarg);
        break;
      case kOptRef:
        builder.with_ref(optarg);
        break;
      case kOptWorkspace:
        builder.with_workspace(optarg);
        break;
      case kOptWorkflowPath:
        builder.with_workflow_path(optarg);
        break;
      case kOptAdditionalPaths:
        builder.with_additional_paths(split_list(optarg));
        break;
      case kOptForkOrganizations:
        builder.with_fork_organizations(split_list(optarg));
        break;
      case kOptForkRegex:
        builder.with_fork_regex(optarg);
        break;
      case kOptApiUrl:
        builder.with_api_url(optarg);
        break;
      case kOptDryRun:
        builder.with_dry_run(true);
        break;
      case 'h':
        print_help();
        exit(0);
      default:
        print_help();
        return false;
    }
  }
  if (optind < argc) {
    std::cerr << "Unexpected argument: " << argv[optind] << "\n";
    return false;
  }
  return true;
}

/// Append name=value to the step output file, if the runner provided one
void write_output(const std::string & name, const std::string & value) {
  const char * output_file = std::getenv("GITHUB_OUTPUT");
  if (output_file == nullptr || *output_file == '\0') {
    return;
  }
  std::ofstream out(output_file, std::ios::app);
  if (!out) {
    RCLCPP_WARN(rclcpp::get_logger("action_deps"), "Cannot write step output to %s", output_file);
    return;
  }
  out << name << "=" << value << "\n";
}

int fail(const std::string & message) {
  std::cout << "::error::" << message << std::endl;
  return 1;
}

}  // namespace

int main(int argc, char * argv[]) {
  auto builder = builder_from_environment(process_environment());
  if (!parse_args(argc, argv, builder)) {
    return 1;
  }

  ActionConfig config;
  std::shared_ptr<GitHubClient> client;
  try {
    config = builder.build();
    client = std::make_shared<GitHubClient>(config.api_url, config.token);
  } catch (const std::invalid_argument & e) {
    return fail(e.what());
  }

  auto metadata = make_snapshot_metadata(config);
  std::shared_ptr<DependencySubmitter> submitter;
  if (config.dry_run) {
    submitter = std::make_shared<LoggingSubmitter>(metadata);
  } else {
    submitter = std::make_shared<GitHubSnapshotSubmitter>(client, config.owner, config.repo, metadata);
  }

  // Fork lookups run anonymously in a dry run without a token
  std::shared_ptr<action_deps_scanner::fork::ForkLookup> lookup = client;
  ActionRunner runner(std::move(config), lookup, submitter);

  auto summary = runner.run();
  if (!summary) {
    return fail(summary.error());
  }

  for (const auto & issue : summary->issues) {
    std::cout << "::warning::" << issue.to_string() << std::endl;
  }
  write_output("dependency-count", std::to_string(summary->dependency_count));
  RCLCPP_INFO(rclcpp::get_logger("action_deps"), "Done: %zu dependencies, %zu submitted",
              summary->dependency_count, summary->submitted_count);
  return 0;
}

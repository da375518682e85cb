#include "guidekit/cli/router.hpp"

#include "config/tool_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/time_utils.hpp"
#include "guides/category.hpp"
#include "guides/index_listing.hpp"
#include "guides/scaffolder.hpp"
#include "pipeline/document_set.hpp"
#include "pipeline/external_tools.hpp"
#include "pipeline/precommit_hook.hpp"
#include "pipeline/validation_pipeline.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace guidekit::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);

// Which stages a pipeline subcommand runs.
enum class PipelineCommand {
  kLint,
  kFormat,
  kCheck,
  kFix,
  kPrecommit,
  kSync,
};

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  guidekit new NAME TYPE            create TYPE/NAME.md (TYPE: "
      << guides::ExpectedCategoryList() << ")\n"
      << "  guidekit lint                     structural lint + prose lint\n"
      << "  guidekit format                   rewrite formatting in place\n"
      << "  guidekit check                    format check + lint (read-only)\n"
      << "  guidekit fix                      format write + lint\n"
      << "  guidekit precommit                check, as run by the git hook\n"
      << "  guidekit sync                     download prose-lint rule packages\n"
      << "  guidekit setup [--force]          install the pre-commit hook\n"
      << "  guidekit index [--category TYPE]  print index table rows per category\n"
      << "  guidekit version\n"
      << "global options: --root <dir> --config <file> --log-level <"
      << core::logging::ExpectedLogLevelList() << ">\n";
}

core::logging::Logger MakeLogger(const GlobalOptions& options) {
  core::logging::Logger logger(options.log_level);
  logger.SetInvocationId(core::MakeInvocationId(std::chrono::system_clock::now()));
  return logger;
}

// Parses global options and reports router-level usage errors. Returns false
// after printing; `exit_code` is then the value to return.
bool ParseCommandArgs(std::string_view command, const std::vector<std::string_view>& args,
                      GlobalOptions& options, std::vector<std::string_view>& positional,
                      int& exit_code) {
  std::string error;
  if (!ParseGlobalOptions(args, options, positional, error)) {
    std::cerr << "error: " << command << ": " << error << '\n';
    exit_code = kExitUsage;
    return false;
  }
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "guidekit 0.1.0\n";
  return kExitSuccess;
}

// `new NAME TYPE`. Every refusal exits 1, including missing arguments, so the
// command behaves the same as the shell script it replaces.
int CommandNew(const std::vector<std::string_view>& args) {
  GlobalOptions options;
  std::vector<std::string_view> positional;
  int exit_code = kExitSuccess;
  if (!ParseCommandArgs("new", args, options, positional, exit_code)) {
    return exit_code;
  }

  core::logging::Logger logger = MakeLogger(options);
  if (positional.size() > 2U) {
    std::cerr << "error: new takes exactly 2 arguments\n" << guides::ScaffoldUsageText();
    return kExitFailure;
  }

  const std::string_view name = positional.size() > 0U ? positional[0] : std::string_view{};
  const std::string_view type = positional.size() > 1U ? positional[1] : std::string_view{};
  const guides::ScaffoldResult result =
      guides::CreateGuideFromArgs(options.root, name, type, &logger);

  if (!result.ok()) {
    logger.Warn("guide not created", {{"kind", guides::ToString(result.error)}});
  }
  switch (result.error) {
  case guides::ScaffoldError::kNone:
    break;
  case guides::ScaffoldError::kUsage:
    std::cerr << "error: " << result.message << '\n' << guides::ScaffoldUsageText();
    return kExitFailure;
  case guides::ScaffoldError::kInvalidCategory:
  case guides::ScaffoldError::kAlreadyExists:
  case guides::ScaffoldError::kWrite:
    std::cerr << "error: " << result.message << '\n';
    return kExitFailure;
  }

  std::cout << "Created " << result.relative_path.generic_string() << '\n'
            << '\n'
            << guides::RenderNextSteps(result.category);
  return kExitSuccess;
}

int RunPipelineCommand(PipelineCommand command, std::string_view command_name,
                       const std::vector<std::string_view>& args) {
  GlobalOptions options;
  std::vector<std::string_view> positional;
  int exit_code = kExitSuccess;
  if (!ParseCommandArgs(command_name, args, options, positional, exit_code)) {
    return exit_code;
  }
  if (!positional.empty()) {
    std::cerr << "error: " << command_name << " does not accept positional arguments\n";
    return kExitUsage;
  }

  core::logging::Logger logger = MakeLogger(options);

  config::ToolConfig tool_config;
  fs::path config_source;
  std::string error;
  if (!config::ResolveToolConfig(options.root, options.config_path, tool_config, config_source,
                                 error)) {
    std::cerr << "error: invalid config: " << error << '\n';
    return kExitConfigInvalid;
  }
  logger.Debug("config resolved",
               {{"source", config_source.empty() ? "defaults" : config_source.string()}});

  pipeline::DocumentSet documents;
  if (command != PipelineCommand::kSync &&
      !pipeline::BuildDocumentSet(options.root, tool_config, documents, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  pipeline::ExternalFormatter formatter(tool_config.formatter, options.root, &logger);
  pipeline::ExternalStructuralLinter structural_linter(tool_config.structural_linter,
                                                       options.root, &logger);
  pipeline::ExternalProseLinter prose_linter(tool_config.prose_linter, options.root, &logger);

  pipeline::StagePolicy policy;
  policy.formatter_advisory = tool_config.formatter.advisory;
  policy.structural_linter_advisory = tool_config.structural_linter.advisory;
  policy.prose_linter_advisory = tool_config.prose_linter.advisory;

  pipeline::ValidationPipeline validation({&formatter, &structural_linter, &prose_linter},
                                          std::move(documents), policy, &logger);

  pipeline::ValidationReport report;
  switch (command) {
  case PipelineCommand::kLint:
    report = validation.RunLint();
    break;
  case PipelineCommand::kFormat:
    report = validation.RunFormat();
    break;
  case PipelineCommand::kCheck:
  case PipelineCommand::kPrecommit:
    report = validation.Run(pipeline::PipelineMode::kCheck);
    break;
  case PipelineCommand::kFix:
    report = validation.Run(pipeline::PipelineMode::kFix);
    break;
  case PipelineCommand::kSync:
    report = validation.RunSync();
    break;
  }

  std::cout << pipeline::RenderReportSummary(report);
  if (command == PipelineCommand::kPrecommit && !report.Passed()) {
    std::cerr << "commit aborted: fix the failures above (`guidekit fix` handles formatting)\n";
  }
  return pipeline::ReportExitCode(report);
}

int CommandSetup(const std::vector<std::string_view>& args, std::string_view invoked_as) {
  GlobalOptions options;
  std::vector<std::string_view> positional;
  int exit_code = kExitSuccess;

  bool force = false;
  std::vector<std::string_view> remaining;
  for (const std::string_view arg : args) {
    if (arg == "--force") {
      force = true;
    } else {
      remaining.push_back(arg);
    }
  }
  if (!ParseCommandArgs("setup", remaining, options, positional, exit_code)) {
    return exit_code;
  }
  if (!positional.empty()) {
    std::cerr << "error: setup accepts only --force\n";
    return kExitUsage;
  }

  core::logging::Logger logger = MakeLogger(options);

  // A hook runs from an unknown PATH; prefer the binary that was invoked.
  std::string guidekit_command = "guidekit";
  if (invoked_as.find('/') != std::string_view::npos) {
    std::error_code ec;
    const fs::path absolute = fs::absolute(fs::path(invoked_as), ec);
    if (!ec) {
      guidekit_command = absolute.lexically_normal().string();
    }
  }

  fs::path hook_path;
  std::string error;
  if (!pipeline::InstallPreCommitHook(options.root, guidekit_command, force, hook_path, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  logger.Info("pre-commit hook installed", {{"path", hook_path.string()}});
  std::cout << "Installed " << hook_path.string() << '\n';
  return kExitSuccess;
}

int CommandIndex(const std::vector<std::string_view>& args) {
  GlobalOptions options;
  std::optional<guides::Category> only_category;
  std::vector<std::string_view> remaining;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] != "--category") {
      remaining.push_back(args[i]);
      continue;
    }
    if (i + 1U >= args.size()) {
      std::cerr << "error: missing value for --category\n";
      return kExitUsage;
    }
    guides::Category parsed = guides::Category::kHow;
    std::string error;
    if (!guides::ParseCategory(args[++i], parsed, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitUsage;
    }
    only_category = parsed;
  }

  std::vector<std::string_view> positional;
  int exit_code = kExitSuccess;
  if (!ParseCommandArgs("index", remaining, options, positional, exit_code)) {
    return exit_code;
  }
  if (!positional.empty()) {
    std::cerr << "error: index does not accept positional arguments\n";
    return kExitUsage;
  }

  bool first = true;
  for (const guides::Category category : guides::kAllCategories) {
    if (only_category.has_value() && *only_category != category) {
      continue;
    }

    std::vector<guides::GuideEntry> entries;
    std::string error;
    if (!guides::ListGuides(options.root, category, entries, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    if (!first) {
      std::cout << '\n';
    }
    first = false;
    std::cout << guides::RenderIndexRows(category, entries);
  }
  return kExitSuccess;
}

} // namespace

bool ParseGlobalOptions(const std::vector<std::string_view>& args, GlobalOptions& options,
                        std::vector<std::string_view>& positional, std::string& error) {
  positional.clear();
  error.clear();

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token.size() < 2U || token.substr(0, 2) != "--") {
      positional.push_back(token);
      continue;
    }

    if (token != "--root" && token != "--config" && token != "--log-level") {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (i + 1U >= args.size()) {
      error = "missing value for " + std::string(token);
      return false;
    }

    const std::string_view value = args[++i];
    if (token == "--root") {
      if (value.empty()) {
        error = "--root cannot be empty";
        return false;
      }
      options.root = fs::path(value);
    } else if (token == "--config") {
      if (value.empty()) {
        error = "--config cannot be empty";
        return false;
      }
      options.config_path = fs::path(value);
    } else if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
      return false;
    }
  }
  return true;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view invoked_as(argv[0]);
  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "new") {
    return CommandNew(args);
  }
  if (command == "lint") {
    return RunPipelineCommand(PipelineCommand::kLint, command, args);
  }
  if (command == "format") {
    return RunPipelineCommand(PipelineCommand::kFormat, command, args);
  }
  if (command == "check") {
    return RunPipelineCommand(PipelineCommand::kCheck, command, args);
  }
  if (command == "fix") {
    return RunPipelineCommand(PipelineCommand::kFix, command, args);
  }
  if (command == "precommit") {
    return RunPipelineCommand(PipelineCommand::kPrecommit, command, args);
  }
  if (command == "sync") {
    return RunPipelineCommand(PipelineCommand::kSync, command, args);
  }
  if (command == "setup") {
    return CommandSetup(args, invoked_as);
  }
  if (command == "index") {
    return CommandIndex(args);
  }
  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace guidekit::cli

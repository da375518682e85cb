#include "pipeline/external_tools.hpp"

#include "pipeline/process_runner.hpp"

#include <utility>

namespace fs = std::filesystem;

namespace guidekit::pipeline {

namespace {

constexpr int kShellCommandNotFound = 127;

std::string ToolName(const config::ToolCommand& command) {
  if (command.argv.empty()) {
    return "<unset>";
  }
  return fs::path(command.argv.front()).filename().string();
}

// A file named `-x.md` must not be read as an option.
void AppendPaths(const std::vector<fs::path>& paths, std::vector<std::string>& argv) {
  for (const auto& path : paths) {
    std::string arg = path.generic_string();
    if (!arg.empty() && arg.front() == '-') {
      arg.insert(0, "./");
    }
    argv.push_back(std::move(arg));
  }
}

std::string DescribeExit(const config::ToolCommand& command, int exit_code) {
  if (exit_code == 0) {
    return "ok";
  }
  if (exit_code == kShellCommandNotFound) {
    return "command not found: " + command.argv.front();
  }
  return "exit code " + std::to_string(exit_code);
}

// Runs each invocation in turn and folds the outcomes into one StageResult.
// Every batch runs even after one fails; the first failure supplies
// `exit_code` and `detail`. The tools' output has already reached the
// terminal, so `detail` only summarizes exit status.
StageResult Execute(std::string stage, const config::ToolCommand& command, const fs::path& root,
                    const std::vector<std::vector<std::string>>& invocations,
                    core::logging::Logger* logger) {
  StageResult result;
  result.stage = std::move(stage);
  result.tool_name = ToolName(command);
  result.passed = true;
  result.exit_code = 0;
  result.detail = "ok";

  if (logger != nullptr) {
    logger->Info("stage started", {{"stage", result.stage},
                                   {"tool", result.tool_name},
                                   {"invocations", std::to_string(invocations.size())}});
  }

  for (const auto& argv : invocations) {
    if (logger != nullptr) {
      logger->Debug("spawning external tool", {{"command", BuildShellCommand(root, argv)}});
    }

    std::string error;
    int exit_code = -1;
    if (!RunProcess(root, argv, exit_code, error)) {
      if (result.passed) {
        result.exit_code = -1;
        result.detail = error;
      }
      result.passed = false;
      continue;
    }
    if (exit_code != 0 && result.passed) {
      result.passed = false;
      result.exit_code = exit_code;
      result.detail = DescribeExit(command, exit_code);
    }
  }

  if (logger != nullptr) {
    logger->Log(result.passed ? core::logging::LogLevel::kInfo : core::logging::LogLevel::kWarn,
                "stage finished", {{"stage", result.stage},
                                   {"tool", result.tool_name},
                                   {"exit_code", std::to_string(result.exit_code)}});
  }
  return result;
}

} // namespace

std::vector<std::vector<fs::path>> BatchPaths(const std::vector<fs::path>& paths,
                                              std::size_t max_bytes) {
  std::vector<std::vector<fs::path>> batches(1);
  std::size_t batch_bytes = 0;
  for (const auto& path : paths) {
    // Quoted argument plus the separating space.
    const std::size_t cost = QuoteShellArg(path.generic_string()).size() + 1U;
    if (!batches.back().empty() && batch_bytes + cost > max_bytes) {
      batches.emplace_back();
      batch_bytes = 0;
    }
    batches.back().push_back(path);
    batch_bytes += cost;
  }
  return batches;
}

std::vector<std::string> BuildFormatterArgv(const config::ToolCommand& command,
                                            const std::vector<fs::path>& paths,
                                            FormatMode mode) {
  std::vector<std::string> argv = command.argv;
  argv.emplace_back(mode == FormatMode::kCheck ? "--check" : "--write");
  AppendPaths(paths, argv);
  return argv;
}

std::vector<std::string> BuildLinterArgv(const config::ToolCommand& command,
                                         const std::vector<fs::path>& paths) {
  std::vector<std::string> argv = command.argv;
  AppendPaths(paths, argv);
  return argv;
}

std::vector<std::string> BuildProseSyncArgv(const config::ToolCommand& command) {
  std::vector<std::string> argv = command.argv;
  argv.emplace_back("sync");
  return argv;
}

namespace {

std::vector<std::vector<std::string>> LinterInvocations(const config::ToolCommand& command,
                                                        const std::vector<fs::path>& paths) {
  std::vector<std::vector<std::string>> invocations;
  for (const auto& batch : BatchPaths(paths)) {
    invocations.push_back(BuildLinterArgv(command, batch));
  }
  return invocations;
}

} // namespace

ExternalFormatter::ExternalFormatter(config::ToolCommand command, fs::path root,
                                     core::logging::Logger* logger)
    : command_(std::move(command)), root_(std::move(root)), logger_(logger) {}

StageResult ExternalFormatter::Run(const std::vector<fs::path>& paths, FormatMode mode) {
  std::vector<std::vector<std::string>> invocations;
  for (const auto& batch : BatchPaths(paths)) {
    invocations.push_back(BuildFormatterArgv(command_, batch, mode));
  }
  return Execute("format", command_, root_, invocations, logger_);
}

ExternalStructuralLinter::ExternalStructuralLinter(config::ToolCommand command, fs::path root,
                                                   core::logging::Logger* logger)
    : command_(std::move(command)), root_(std::move(root)), logger_(logger) {}

StageResult ExternalStructuralLinter::Run(const std::vector<fs::path>& paths) {
  return Execute("structural-lint", command_, root_, LinterInvocations(command_, paths), logger_);
}

ExternalProseLinter::ExternalProseLinter(config::ToolCommand command, fs::path root,
                                         core::logging::Logger* logger)
    : command_(std::move(command)), root_(std::move(root)), logger_(logger) {}

StageResult ExternalProseLinter::Run(const std::vector<fs::path>& paths) {
  return Execute("prose-lint", command_, root_, LinterInvocations(command_, paths), logger_);
}

StageResult ExternalProseLinter::Sync() {
  return Execute("prose-sync", command_, root_, {BuildProseSyncArgv(command_)}, logger_);
}

} // namespace guidekit::pipeline

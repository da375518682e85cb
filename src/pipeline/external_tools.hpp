#pragma once

#include "config/tool_config.hpp"
#include "core/logging/logger.hpp"
#include "pipeline/checkers.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace guidekit::pipeline {

// Upper bound on the quoted path bytes passed to one tool invocation. The
// whole command reaches the kernel as a single `sh -c` argument, which Linux
// caps at 128 KiB.
constexpr std::size_t kMaxBatchArgBytes = 32U * 1024U;

// Splits `paths` into consecutive batches whose quoted length stays within
// `max_bytes`. Order is preserved. A path longer than the limit gets a batch
// of its own. Empty input yields one empty batch so the tool still runs once.
std::vector<std::vector<std::filesystem::path>> BatchPaths(
    const std::vector<std::filesystem::path>& paths, std::size_t max_bytes = kMaxBatchArgBytes);

// argv builders are exposed so command-line shape is testable without
// spawning anything.
std::vector<std::string> BuildFormatterArgv(const config::ToolCommand& command,
                                            const std::vector<std::filesystem::path>& paths,
                                            FormatMode mode);
std::vector<std::string> BuildLinterArgv(const config::ToolCommand& command,
                                         const std::vector<std::filesystem::path>& paths);
std::vector<std::string> BuildProseSyncArgv(const config::ToolCommand& command);

// `prettier --check|--write <paths>` (or whatever `command` names). Large
// path lists run as several invocations; the stage fails if any of them does.
class ExternalFormatter final : public IFormatter {
public:
  ExternalFormatter(config::ToolCommand command, std::filesystem::path root,
                    core::logging::Logger* logger = nullptr);

  StageResult Run(const std::vector<std::filesystem::path>& paths, FormatMode mode) override;

private:
  config::ToolCommand command_;
  std::filesystem::path root_;
  core::logging::Logger* logger_ = nullptr;
};

// `markdownlint <paths>`.
class ExternalStructuralLinter final : public IStructuralLinter {
public:
  ExternalStructuralLinter(config::ToolCommand command, std::filesystem::path root,
                           core::logging::Logger* logger = nullptr);

  StageResult Run(const std::vector<std::filesystem::path>& paths) override;

private:
  config::ToolCommand command_;
  std::filesystem::path root_;
  core::logging::Logger* logger_ = nullptr;
};

// `vale <paths>` and `vale sync`.
class ExternalProseLinter final : public IProseLinter {
public:
  ExternalProseLinter(config::ToolCommand command, std::filesystem::path root,
                      core::logging::Logger* logger = nullptr);

  StageResult Run(const std::vector<std::filesystem::path>& paths) override;
  StageResult Sync() override;

private:
  config::ToolCommand command_;
  std::filesystem::path root_;
  core::logging::Logger* logger_ = nullptr;
};

} // namespace guidekit::pipeline

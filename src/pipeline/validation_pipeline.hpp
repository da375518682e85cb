#pragma once

#include "core/logging/logger.hpp"
#include "pipeline/checkers.hpp"
#include "pipeline/document_set.hpp"

#include <string>
#include <vector>

namespace guidekit::pipeline {

enum class PipelineMode {
  kCheck, // format --check, structural lint, prose lint; read-only
  kFix,   // format --write, then the same lint stages
};

const char* ToString(PipelineMode mode);

// Ordered results of one invocation, in the order the stages ran.
struct ValidationReport {
  std::vector<StageResult> stages;

  // False when any non-advisory stage failed.
  bool Passed() const;
};

// 0 when the report passed, 1 otherwise.
int ReportExitCode(const ValidationReport& report);

// `PASS  format (prettier)  ok` lines, one per stage. Failed advisory stages
// print as WARN.
std::string RenderReportSummary(const ValidationReport& report);

// Non-owning handles to the tool implementations.
struct PipelineTools {
  IFormatter* formatter = nullptr;
  IStructuralLinter* structural_linter = nullptr;
  IProseLinter* prose_linter = nullptr;
};

struct StagePolicy {
  bool formatter_advisory = false;
  bool structural_linter_advisory = false;
  bool prose_linter_advisory = false;
};

// Fixed-order composition of the validation stages.
//
// Invariants:
// - format always runs before structural lint, so whitespace the formatter
//   would fix is never reported as a lint failure
// - no stage is skipped because an earlier one failed; one run reports every
//   category of problem
// - a stage with no files to look at passes without spawning its tool
class ValidationPipeline {
public:
  ValidationPipeline(PipelineTools tools, DocumentSet documents, StagePolicy policy = {},
                     core::logging::Logger* logger = nullptr);

  // `check` / `fix` / `precommit`.
  ValidationReport Run(PipelineMode mode);

  // `format`: format --write only.
  ValidationReport RunFormat();

  // `lint`: structural lint, then prose lint.
  ValidationReport RunLint();

  // `sync`: prose-linter rule download.
  ValidationReport RunSync();

private:
  StageResult RunFormatStage(FormatMode mode);
  StageResult RunStructuralLintStage();
  StageResult RunProseLintStage();
  void Record(ValidationReport& report, StageResult result, bool advisory);

  PipelineTools tools_;
  DocumentSet documents_;
  StagePolicy policy_;
  core::logging::Logger* logger_ = nullptr;
};

} // namespace guidekit::pipeline

#include "pipeline/validation_pipeline.hpp"

#include "core/errors/exit_codes.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace guidekit::pipeline {

namespace {

StageResult SkippedStage(std::string stage) {
  StageResult result;
  result.stage = std::move(stage);
  result.tool_name = "-";
  result.passed = true;
  result.detail = "no files selected";
  return result;
}

const char* StatusLabel(const StageResult& stage) {
  if (stage.passed) {
    return "PASS";
  }
  return stage.advisory ? "WARN" : "FAIL";
}

} // namespace

const char* ToString(PipelineMode mode) {
  switch (mode) {
  case PipelineMode::kCheck:
    return "check";
  case PipelineMode::kFix:
    return "fix";
  }
  return "check";
}

bool ValidationReport::Passed() const {
  return std::none_of(stages.begin(), stages.end(), [](const StageResult& stage) {
    return !stage.passed && !stage.advisory;
  });
}

int ReportExitCode(const ValidationReport& report) {
  return report.Passed() ? core::errors::ToInt(core::errors::ExitCode::kSuccess)
                         : core::errors::ToInt(core::errors::ExitCode::kFailure);
}

std::string RenderReportSummary(const ValidationReport& report) {
  std::size_t label_width = 0;
  std::vector<std::string> labels;
  labels.reserve(report.stages.size());
  for (const auto& stage : report.stages) {
    labels.push_back(stage.stage + " (" + stage.tool_name + ")");
    label_width = std::max(label_width, labels.back().size());
  }

  std::ostringstream out;
  for (std::size_t i = 0; i < report.stages.size(); ++i) {
    out << StatusLabel(report.stages[i]) << "  " << labels[i]
        << std::string(label_width - labels[i].size(), ' ') << "  " << report.stages[i].detail
        << '\n';
  }
  return out.str();
}

ValidationPipeline::ValidationPipeline(PipelineTools tools, DocumentSet documents,
                                       StagePolicy policy, core::logging::Logger* logger)
    : tools_(tools), documents_(std::move(documents)), policy_(policy), logger_(logger) {}

ValidationReport ValidationPipeline::Run(PipelineMode mode) {
  if (logger_ != nullptr) {
    logger_->Info("pipeline started",
                  {{"mode", ToString(mode)},
                   {"documents", std::to_string(documents_.all_documents.size())},
                   {"prose_documents", std::to_string(documents_.prose_documents.size())}});
  }

  ValidationReport report;
  const FormatMode format_mode = mode == PipelineMode::kFix ? FormatMode::kWrite : FormatMode::kCheck;
  Record(report, RunFormatStage(format_mode), policy_.formatter_advisory);
  Record(report, RunStructuralLintStage(), policy_.structural_linter_advisory);
  Record(report, RunProseLintStage(), policy_.prose_linter_advisory);

  if (logger_ != nullptr) {
    logger_->Info("pipeline finished",
                  {{"mode", ToString(mode)}, {"passed", report.Passed() ? "true" : "false"}});
  }
  return report;
}

ValidationReport ValidationPipeline::RunFormat() {
  ValidationReport report;
  Record(report, RunFormatStage(FormatMode::kWrite), policy_.formatter_advisory);
  return report;
}

ValidationReport ValidationPipeline::RunLint() {
  ValidationReport report;
  Record(report, RunStructuralLintStage(), policy_.structural_linter_advisory);
  Record(report, RunProseLintStage(), policy_.prose_linter_advisory);
  return report;
}

ValidationReport ValidationPipeline::RunSync() {
  ValidationReport report;
  // A failed rule download is a setup failure, not a lint finding; the prose
  // linter's advisory flag does not apply to it.
  Record(report, tools_.prose_linter->Sync(), false);
  return report;
}

StageResult ValidationPipeline::RunFormatStage(FormatMode mode) {
  if (documents_.all_documents.empty()) {
    return SkippedStage("format");
  }
  return tools_.formatter->Run(documents_.all_documents, mode);
}

StageResult ValidationPipeline::RunStructuralLintStage() {
  if (documents_.all_documents.empty()) {
    return SkippedStage("structural-lint");
  }
  return tools_.structural_linter->Run(documents_.all_documents);
}

StageResult ValidationPipeline::RunProseLintStage() {
  if (documents_.prose_documents.empty()) {
    return SkippedStage("prose-lint");
  }
  return tools_.prose_linter->Run(documents_.prose_documents);
}

void ValidationPipeline::Record(ValidationReport& report, StageResult result, bool advisory) {
  result.advisory = advisory;
  if (!result.passed && logger_ != nullptr) {
    logger_->Warn(advisory ? "advisory stage failed" : "stage failed",
                  {{"stage", result.stage}, {"detail", result.detail}});
  }
  report.stages.push_back(std::move(result));
}

} // namespace guidekit::pipeline

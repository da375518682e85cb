#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace guidekit::pipeline {

enum class FormatMode {
  kCheck, // verify only; must never modify files
  kWrite, // rewrite files in place
};

// Outcome of one pipeline stage.
struct StageResult {
  std::string stage;     // `format`, `structural-lint`, `prose-lint`, `prose-sync`
  std::string tool_name; // executable name, or a fake's label in tests
  bool passed = false;
  // Set by the pipeline from config, not by the tool.
  bool advisory = false;
  int exit_code = 0;
  std::string detail;
};

// Capability interfaces for the three external tools. The pipeline owns the
// ordering and aggregation; implementations only run their tool over the
// root-relative `paths` they are handed.

class IFormatter {
public:
  virtual ~IFormatter() = default;

  virtual StageResult Run(const std::vector<std::filesystem::path>& paths, FormatMode mode) = 0;
};

class IStructuralLinter {
public:
  virtual ~IStructuralLinter() = default;

  virtual StageResult Run(const std::vector<std::filesystem::path>& paths) = 0;
};

class IProseLinter {
public:
  virtual ~IProseLinter() = default;

  virtual StageResult Run(const std::vector<std::filesystem::path>& paths) = 0;

  // Downloads the rule packages named in the linter's own config.
  virtual StageResult Sync() = 0;
};

} // namespace guidekit::pipeline

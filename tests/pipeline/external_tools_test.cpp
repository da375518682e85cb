#include "pipeline/external_tools.hpp"
#include "pipeline/process_runner.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace gp = guidekit::pipeline;
using guidekit::config::ToolCommand;
using guidekit::tests::common::ScopedTempDir;

TEST_CASE("formatter argv appends the mode flag before the paths", "[pipeline][tools]") {
  const ToolCommand command{{"npx", "prettier"}, false};
  const std::vector<fs::path> paths = {"README.md", "how/git.md"};

  REQUIRE(gp::BuildFormatterArgv(command, paths, gp::FormatMode::kCheck) ==
          std::vector<std::string>{"npx", "prettier", "--check", "README.md", "how/git.md"});
  REQUIRE(gp::BuildFormatterArgv(command, paths, gp::FormatMode::kWrite) ==
          std::vector<std::string>{"npx", "prettier", "--write", "README.md", "how/git.md"});
}

TEST_CASE("linter argv guards dash-prefixed file names", "[pipeline][tools]") {
  const ToolCommand command{{"markdownlint"}, false};

  REQUIRE(gp::BuildLinterArgv(command, {"-weird.md", "why/a.md"}) ==
          std::vector<std::string>{"markdownlint", "./-weird.md", "why/a.md"});
  REQUIRE(gp::BuildProseSyncArgv(ToolCommand{{"vale"}, false}) ==
          std::vector<std::string>{"vale", "sync"});
}

TEST_CASE("QuoteShellArg survives embedded single quotes", "[pipeline][process]") {
  REQUIRE(gp::QuoteShellArg("plain") == "'plain'");
  REQUIRE(gp::QuoteShellArg("it's") == "'it'\\''s'");
  REQUIRE(gp::QuoteShellArg("") == "''");
  REQUIRE(gp::BuildShellCommand("/kb root", {"vale", "a b.md"}) ==
          "cd '/kb root' && 'vale' 'a b.md'");
}

TEST_CASE("RunProcess reports the child's exit code", "[pipeline][process]") {
  const ScopedTempDir temp("guidekit-process-exit");

  int exit_code = -1;
  std::string error;
  REQUIRE(gp::RunProcess(temp.path(), {"sh", "-c", "exit 3"}, exit_code, error));
  REQUIRE(exit_code == 3);

  REQUIRE(gp::RunProcess(temp.path(), {"true"}, exit_code, error));
  REQUIRE(exit_code == 0);
}

TEST_CASE("RunProcess runs inside the knowledge-base root", "[pipeline][process]") {
  const ScopedTempDir temp("guidekit-process-cwd");

  int exit_code = -1;
  std::string error;
  REQUIRE(gp::RunProcess(temp.path(), {"sh", "-c", "touch marker"}, exit_code, error));
  REQUIRE(exit_code == 0);
  REQUIRE(fs::exists(temp.path() / "marker"));
}

TEST_CASE("external linters map exit codes to stage results", "[pipeline][tools]") {
  const ScopedTempDir temp("guidekit-tools-exit");

  gp::ExternalStructuralLinter passing(ToolCommand{{"true"}, false}, temp.path());
  const gp::StageResult ok = passing.Run({"README.md"});
  REQUIRE(ok.passed);
  REQUIRE(ok.stage == "structural-lint");
  REQUIRE(ok.tool_name == "true");
  REQUIRE(ok.detail == "ok");

  gp::ExternalProseLinter failing(ToolCommand{{"false"}, false}, temp.path());
  const gp::StageResult failed = failing.Run({"README.md"});
  REQUIRE_FALSE(failed.passed);
  REQUIRE(failed.exit_code == 1);
  REQUIRE(failed.detail == "exit code 1");

  gp::ExternalFormatter missing(ToolCommand{{"guidekit-no-such-tool-xyz"}, false}, temp.path());
  const gp::StageResult not_found = missing.Run({"README.md"}, gp::FormatMode::kCheck);
  REQUIRE_FALSE(not_found.passed);
  REQUIRE(not_found.exit_code == 127);
  REQUIRE(not_found.detail == "command not found: guidekit-no-such-tool-xyz");
}

namespace {

std::vector<fs::path> ManyGuidePaths(std::size_t count) {
  std::vector<fs::path> paths;
  paths.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    paths.emplace_back("how/a-fairly-descriptive-guide-name-" + std::to_string(i) + ".md");
  }
  return paths;
}

} // namespace

TEST_CASE("BatchPaths keeps every batch under the byte limit in order", "[pipeline][tools]") {
  const std::vector<fs::path> paths = ManyGuidePaths(3000);

  const auto batches = gp::BatchPaths(paths);
  REQUIRE(batches.size() > 1U);

  std::vector<fs::path> rejoined;
  for (const auto& batch : batches) {
    REQUIRE_FALSE(batch.empty());
    std::size_t bytes = 0;
    for (const auto& path : batch) {
      bytes += gp::QuoteShellArg(path.generic_string()).size() + 1U;
      rejoined.push_back(path);
    }
    REQUIRE(bytes <= gp::kMaxBatchArgBytes);
  }
  REQUIRE(rejoined == paths);
}

TEST_CASE("BatchPaths edge cases", "[pipeline][tools]") {
  REQUIRE(gp::BatchPaths({}).size() == 1U);
  REQUIRE(gp::BatchPaths({}).front().empty());

  const auto oversized = gp::BatchPaths({"a.md", "bbbbbbbbbb.md", "c.md"}, 8U);
  REQUIRE(oversized.size() == 3U);
  REQUIRE(oversized[1] == std::vector<fs::path>{"bbbbbbbbbb.md"});
}

TEST_CASE("a stage over thousands of paths runs the tool in batches", "[pipeline][tools]") {
  const ScopedTempDir temp("guidekit-tools-batches");
  const std::vector<fs::path> paths = ManyGuidePaths(3000);

  gp::ExternalFormatter formatter(ToolCommand{{"true"}, false}, temp.path());
  const gp::StageResult formatted = formatter.Run(paths, gp::FormatMode::kCheck);
  REQUIRE(formatted.passed);
  REQUIRE(formatted.detail == "ok");

  // Each batch appends one line, so more than one line proves the split.
  gp::ExternalStructuralLinter counting(
      ToolCommand{{"sh", "-c", "echo batch >> invocations.log; exit 3"}, false}, temp.path());
  const gp::StageResult failed = counting.Run(paths);
  REQUIRE_FALSE(failed.passed);
  REQUIRE(failed.exit_code == 3);
  REQUIRE(failed.detail == "exit code 3");

  const std::string log = guidekit::tests::common::ReadFileToString(temp.path() / "invocations.log");
  std::size_t lines = 0;
  for (const char c : log) {
    lines += c == '\n' ? 1U : 0U;
  }
  REQUIRE(lines == gp::BatchPaths(paths).size());
}

#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/kb_fixtures.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace guidekit::tests::common;

namespace {

// Points every tool at a POSIX builtin-style command so the real process path
// runs without prettier/markdownlint/vale installed.
void WriteToolConfig(const fs::path& root, const std::string& formatter,
                     const std::string& structural, const std::string& prose,
                     bool prose_advisory) {
  WriteFixtureFile(root / ".guidekit.json",
                   "{\n"
                   "  \"formatter\": {\"command\": [\"" + formatter + "\"]},\n"
                   "  \"structural_linter\": {\"command\": [\"" + structural + "\"]},\n"
                   "  \"prose_linter\": {\"command\": [\"" + prose + "\"], \"advisory\": " +
                       (prose_advisory ? "true" : "false") + "}\n"
                   "}\n");
}

} // namespace

int main() {
  const fs::path root = CreateUniqueTempDir("guidekit-pipeline-cli-smoke");
  const std::string root_arg = root.string();
  WriteKnowledgeBaseFixture(root);

  WriteToolConfig(root, "true", "true", "true", false);
  const auto before = SnapshotTree(root);

  DispatchOutput check = DispatchCaptured({"guidekit", "check", "--root", root_arg});
  AssertExitCode(check.exit_code, 0, "check with passing tools");
  AssertContains(check.stdout_text, "PASS  format (true)");
  AssertContains(check.stdout_text, "PASS  structural-lint (true)");
  AssertContains(check.stdout_text, "PASS  prose-lint (true)");
  Assert(SnapshotTree(root) == before, "check modified the tree");

  // The structural linter fails; prose lint still runs and the exit is 1.
  WriteToolConfig(root, "true", "false", "true", false);
  DispatchOutput failing = DispatchCaptured({"guidekit", "check", "--root", root_arg});
  AssertExitCode(failing.exit_code, 1, "check with failing linter");
  AssertContains(failing.stdout_text, "FAIL  structural-lint (false)");
  AssertContains(failing.stdout_text, "PASS  prose-lint (true)");

  DispatchOutput precommit = DispatchCaptured({"guidekit", "precommit", "--root", root_arg});
  AssertExitCode(precommit.exit_code, 1, "precommit with failing linter");
  AssertContains(precommit.stderr_text, "commit aborted");

  // An advisory prose failure is shown as WARN and does not fail the run.
  WriteToolConfig(root, "true", "true", "false", true);
  DispatchOutput advisory = DispatchCaptured({"guidekit", "lint", "--root", root_arg});
  AssertExitCode(advisory.exit_code, 0, "lint with advisory prose failure");
  AssertContains(advisory.stdout_text, "WARN  prose-lint (false)");
  AssertNotContains(advisory.stdout_text, "format");

  WriteToolConfig(root, "true", "true", "true", false);
  DispatchOutput fix_first = DispatchCaptured({"guidekit", "fix", "--root", root_arg});
  DispatchOutput fix_second = DispatchCaptured({"guidekit", "fix", "--root", root_arg});
  AssertExitCode(fix_first.exit_code, 0, "first fix");
  AssertExitCode(fix_second.exit_code, 0, "second fix");

  DispatchOutput format = DispatchCaptured({"guidekit", "format", "--root", root_arg});
  AssertExitCode(format.exit_code, 0, "format");
  AssertNotContains(format.stdout_text, "structural-lint");

  DispatchOutput sync = DispatchCaptured({"guidekit", "sync", "--root", root_arg});
  AssertExitCode(sync.exit_code, 0, "sync");
  AssertContains(sync.stdout_text, "PASS  prose-sync (true)");

  // A tree too large for one command line still checks clean.
  for (int i = 0; i < 3000; ++i) {
    WriteFixtureFile(root / "how" / ("a-fairly-descriptive-guide-name-" + std::to_string(i) + ".md"),
                     "# Guide\n");
  }
  DispatchOutput large = DispatchCaptured({"guidekit", "check", "--root", root_arg});
  AssertExitCode(large.exit_code, 0, "check over a large tree");
  AssertContains(large.stdout_text, "PASS  format (true)");
  AssertContains(large.stdout_text, "PASS  structural-lint (true)");
  AssertNotContains(large.stdout_text, "command not found");

  // Broken config is its own exit code.
  WriteFixtureFile(root / ".guidekit.json", "{\"formatter\": 1}");
  DispatchOutput bad_config = DispatchCaptured({"guidekit", "check", "--root", root_arg});
  AssertExitCode(bad_config.exit_code, 3, "check with invalid config");
  AssertContains(bad_config.stderr_text, "$.formatter: expected object, got number");

  RemovePathBestEffort(root);
  std::cout << "pipeline_cli_smoke: ok\n";
  return 0;
}

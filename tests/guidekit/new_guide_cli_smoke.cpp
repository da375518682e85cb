#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace guidekit::tests::common;

int main() {
  const fs::path root = CreateUniqueTempDir("guidekit-new-guide-smoke");
  const std::string root_arg = root.string();

  // First creation succeeds and prints the follow-up steps.
  DispatchOutput first =
      DispatchCaptured({"guidekit", "new", "rebase-strategies", "how", "--root", root_arg});
  AssertExitCode(first.exit_code, 0, "new rebase-strategies how");
  AssertContains(first.stdout_text, "Created how/rebase-strategies.md");
  AssertContains(first.stdout_text, "Next steps:");
  AssertContains(first.stdout_text, "1. Update CLAUDE.md table in how/ section");
  AssertContains(first.stdout_text, "2. Update README.md table");

  const fs::path guide = root / "how" / "rebase-strategies.md";
  const std::string original = ReadFileToString(guide);
  AssertContains(original, "# Rebase-strategies\n");
  AssertContains(original, "## Quick Reference");

  // The identical command refuses and leaves the file alone.
  DispatchOutput second =
      DispatchCaptured({"guidekit", "new", "rebase-strategies", "how", "--root", root_arg});
  AssertExitCode(second.exit_code, 1, "repeated new");
  AssertContains(second.stderr_text, "how/rebase-strategies.md already exists");
  AssertContains(second.stderr_text, "kind=\"already_exists\"");
  Assert(ReadFileToString(guide) == original, "existing guide was modified");

  // Invalid category: exit 1, allowed values listed, nothing written.
  DispatchOutput bad_type = DispatchCaptured({"guidekit", "new", "grep", "what", "--root", root_arg});
  AssertExitCode(bad_type.exit_code, 1, "new with invalid TYPE");
  AssertContains(bad_type.stderr_text, "TYPE must be 'how' or 'why'");
  AssertContains(bad_type.stderr_text, "kind=\"invalid_category\"");
  Assert(!fs::exists(root / "what"), "invalid category created a directory");

  // Missing TYPE: exit 1 with the usage string.
  DispatchOutput missing = DispatchCaptured({"guidekit", "new", "grep", "--root", root_arg});
  AssertExitCode(missing.exit_code, 1, "new without TYPE");
  AssertContains(missing.stderr_text, "usage: guidekit new NAME TYPE");

  DispatchOutput why = DispatchCaptured({"guidekit", "--root", root_arg, "new", "coupling", "why"});
  // Global options go after the subcommand; this form is an unknown subcommand.
  AssertExitCode(why.exit_code, 2, "option before subcommand");

  DispatchOutput why_ok =
      DispatchCaptured({"guidekit", "new", "--root", root_arg, "coupling", "why"});
  AssertExitCode(why_ok.exit_code, 0, "new coupling why");
  AssertContains(ReadFileToString(root / "why" / "coupling.md"), "## Core Concepts");
  AssertContains(why_ok.stdout_text, "Update CLAUDE.md table in why/ section");

  RemovePathBestEffort(root);
  std::cout << "new_guide_cli_smoke: ok\n";
  return 0;
}

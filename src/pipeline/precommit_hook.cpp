#include "pipeline/precommit_hook.hpp"

#include "core/fs_utils.hpp"
#include "pipeline/process_runner.hpp"

#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace guidekit::pipeline {

std::string RenderPreCommitHook(std::string_view guidekit_command) {
  std::ostringstream out;
  out << "#!/bin/sh\n"
      << kHookMarker << " (installed by `guidekit setup`)\n"
      << "root=\"$(git rev-parse --show-toplevel)\" || exit 1\n"
      << "exec " << QuoteShellArg(guidekit_command) << " precommit --root \"$root\"\n";
  return out.str();
}

bool InstallPreCommitHook(const fs::path& root, std::string_view guidekit_command, bool force,
                          fs::path& hook_path, std::string& error) {
  error.clear();

  const fs::path git_dir = root / ".git";
  std::error_code ec;
  if (!fs::is_directory(git_dir, ec)) {
    error = "not a git repository (no .git directory): " + root.string();
    return false;
  }

  hook_path = git_dir / "hooks" / "pre-commit";
  if (fs::exists(hook_path, ec)) {
    std::string existing;
    if (!core::ReadTextFile(hook_path, existing, error)) {
      return false;
    }
    if (existing.find(kHookMarker) == std::string::npos && !force) {
      error = "refusing to replace existing hook " + hook_path.string() +
              " (rerun with --force to overwrite)";
      return false;
    }
  }

  if (!core::WriteTextFileAtomic(hook_path, RenderPreCommitHook(guidekit_command), error)) {
    return false;
  }

  fs::permissions(hook_path,
                  fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                  fs::perm_options::add, ec);
  if (ec) {
    error = "failed to mark hook executable '" + hook_path.string() + "': " + ec.message();
    return false;
  }
  return true;
}

} // namespace guidekit::pipeline

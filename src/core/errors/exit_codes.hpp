#pragma once

namespace guidekit::core::errors {

// Process-exit contract shared by every subcommand.
//
// - 0 success
// - 1 command failure: a scaffolder precondition was not met, or a mandatory
//   pipeline stage failed
// - 2 router-level usage failure (unknown subcommand, bad global option)
// - 3 `.guidekit.json` could not be loaded
//
// Git hooks and CI only branch on zero/non-zero, but the extra values let
// wrappers tell a broken config apart from a lint failure.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 3,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace guidekit::core::errors

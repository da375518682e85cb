#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace guidekit::pipeline {

// First comment line of every hook script this tool writes. Its presence is
// how `setup` recognizes a hook it may safely replace.
inline constexpr std::string_view kHookMarker = "# guidekit pre-commit gate";

// `#!/bin/sh` script that runs `<guidekit_command> precommit` from the
// repository top level and lets its exit code decide the commit.
std::string RenderPreCommitHook(std::string_view guidekit_command);

// Writes `<root>/.git/hooks/pre-commit` and marks it executable.
//
// Contract:
// - `<root>/.git` must be a directory
// - an existing hook without kHookMarker is left untouched unless `force`
// - rewriting a hook that already carries the marker is always allowed
bool InstallPreCommitHook(const std::filesystem::path& root, std::string_view guidekit_command,
                          bool force, std::filesystem::path& hook_path, std::string& error);

} // namespace guidekit::pipeline

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace guidekit::pipeline {

// POSIX single-quote escaping: `it's` -> `'it'\''s'`.
std::string QuoteShellArg(std::string_view arg);

// `cd '<working_dir>' && '<argv0>' '<argv1>' ...`
std::string BuildShellCommand(const std::filesystem::path& working_dir,
                              const std::vector<std::string>& argv);

// Runs one external command to completion with stdout/stderr inherited, so the
// tool's own diagnostics reach the terminal unmodified.
//
// Contract:
// - returns false only when the shell itself could not be started
// - otherwise returns true and sets `exit_code` (127 means the shell could
//   not find the executable; a signal-terminated child reports 128 + signal)
bool RunProcess(const std::filesystem::path& working_dir, const std::vector<std::string>& argv,
                int& exit_code, std::string& error);

} // namespace guidekit::pipeline

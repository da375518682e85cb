#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace guidekit::config {

inline constexpr std::string_view kDefaultConfigFileName = ".guidekit.json";

// argv prefix for one external tool. Stage-specific arguments (`--check`,
// `--write`, `sync`) and the file list are appended after it.
struct ToolCommand {
  std::vector<std::string> argv;
  // Advisory stages are reported but never change the exit code.
  bool advisory = false;
};

// Directory allow/deny lists for the prose linter. Top-level files are always
// in scope; directories are opted in one at a time as they are migrated to the
// current style rules.
struct ProseLintScope {
  std::vector<std::string> include_dirs;
  std::vector<std::string> exclude_dirs;
};

struct ToolConfig {
  std::vector<std::string> ignore_dirs = {"node_modules"};
  ToolCommand formatter{{"prettier"}, false};
  ToolCommand structural_linter{{"markdownlint"}, false};
  ToolCommand prose_linter{{"vale"}, false};
  ProseLintScope prose_scope;
};

// Parses `.guidekit.json` text on top of the defaults above.
//
// Contract:
// - every key is optional; absent keys keep their default
// - unknown keys and wrong value types are errors, reported with a `$.a.b`
//   style path so the offending entry is easy to find
// - `command` arrays must be non-empty and contain no empty strings
bool ParseToolConfigText(std::string_view json_text, ToolConfig& config, std::string& error);

bool LoadToolConfigFile(const std::filesystem::path& config_path, ToolConfig& config,
                        std::string& error);

// Picks the config source for one invocation:
// - an explicit `--config` path must exist and parse
// - otherwise `<root>/.guidekit.json` is used when present
// - otherwise the built-in defaults apply and `loaded_from` is left empty
bool ResolveToolConfig(const std::filesystem::path& root,
                       const std::optional<std::filesystem::path>& explicit_path,
                       ToolConfig& config, std::filesystem::path& loaded_from,
                       std::string& error);

} // namespace guidekit::config

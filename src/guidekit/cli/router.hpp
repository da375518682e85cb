#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace guidekit::cli {

// Options every subcommand accepts, before or after its own arguments.
struct GlobalOptions {
  std::filesystem::path root = ".";
  std::optional<std::filesystem::path> config_path;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Splits `args` into global options and the subcommand's positional
// arguments. Returns false on an unknown `--flag` or a flag missing its value.
bool ParseGlobalOptions(const std::vector<std::string_view>& args, GlobalOptions& options,
                        std::vector<std::string_view>& positional, std::string& error);

// Routes `guidekit` subcommands. Exit codes:
//   0 => success
//   1 => command failed (scaffold refused, mandatory stage failed)
//   2 => usage error at the router (unknown subcommand / global option)
//   3 => config file invalid
int Dispatch(int argc, char** argv);

} // namespace guidekit::cli

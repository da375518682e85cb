#pragma once

#include "core/logging/logger.hpp"
#include "guides/category.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace guidekit::guides {

// Why a scaffold request was refused. Every kind maps to exit code 1 at the
// CLI; the kind exists so callers and tests can tell them apart without
// matching message text.
enum class ScaffoldError {
  kNone,
  kUsage,           // missing NAME/TYPE, or a NAME that cannot be a file stem
  kInvalidCategory, // TYPE outside the category enumeration
  kAlreadyExists,   // target path is taken; nothing was written
  kWrite,           // file-system failure while publishing the new guide
};

const char* ToString(ScaffoldError error);

struct ScaffoldResult {
  ScaffoldError error = ScaffoldError::kNone;
  Category category = Category::kHow;
  // `<category>/<name>.md`, relative to the knowledge-base root. Set whenever
  // the target was computed, including for kAlreadyExists.
  std::filesystem::path relative_path;
  std::filesystem::path absolute_path;
  std::string message;

  bool ok() const {
    return error == ScaffoldError::kNone;
  }
};

// `usage: guidekit new NAME TYPE` plus the allowed TYPE values.
std::string ScaffoldUsageText();

// Rejects names that would escape the category directory or double the
// extension: empty, `.`/`..`, containing `/` or `\`, or ending in `.md`.
bool ValidateGuideName(std::string_view name, std::string& error);

// `<category>/<name>.md`.
std::filesystem::path GuideRelativePath(Category category, std::string_view name);

// Creates `<root>/<category>/<name>.md` from the category template.
//
// Contract:
// - checks existence first and refuses with kAlreadyExists; the existing file
//   is never opened for writing
// - publishes through a temp file + no-clobber link, so a lost race also
//   reports kAlreadyExists rather than overwriting
// - creates the category directory when it does not exist yet
// - no retries; write failures carry the underlying error text
ScaffoldResult CreateGuide(const std::filesystem::path& root, std::string_view name,
                           Category category, core::logging::Logger* logger = nullptr);

// String-boundary variant used by `guidekit new NAME TYPE`. Empty arguments
// count as missing. The category is parsed before anything touches disk.
ScaffoldResult CreateGuideFromArgs(const std::filesystem::path& root, std::string_view name_arg,
                                   std::string_view type_arg,
                                   core::logging::Logger* logger = nullptr);

// Manual follow-ups printed after a successful scaffold. The index tables are
// free-form prose, so the tool lists the steps instead of editing them.
std::string RenderNextSteps(Category category);

} // namespace guidekit::guides

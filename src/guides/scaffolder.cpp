#include "guides/scaffolder.hpp"

#include "core/fs_utils.hpp"
#include "guides/templates.hpp"

#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace guidekit::guides {

namespace {

constexpr std::string_view kGuideExtension = ".md";

ScaffoldResult MakeFailure(ScaffoldError error, std::string message) {
  ScaffoldResult result;
  result.error = error;
  result.message = std::move(message);
  return result;
}

bool EndsWith(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

bool IsBlank(std::string_view text) {
  for (const char c : text) {
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      return false;
    }
  }
  return true;
}

} // namespace

const char* ToString(ScaffoldError error) {
  switch (error) {
  case ScaffoldError::kNone:
    return "none";
  case ScaffoldError::kUsage:
    return "usage";
  case ScaffoldError::kInvalidCategory:
    return "invalid_category";
  case ScaffoldError::kAlreadyExists:
    return "already_exists";
  case ScaffoldError::kWrite:
    return "write_failed";
  }
  return "unknown";
}

std::string ScaffoldUsageText() {
  return "usage: guidekit new NAME TYPE\n  TYPE must be " + ExpectedCategoryList() + "\n";
}

bool ValidateGuideName(std::string_view name, std::string& error) {
  error.clear();
  if (IsBlank(name)) {
    error = "NAME cannot be empty";
    return false;
  }
  if (name == "." || name == "..") {
    error = "NAME cannot be '" + std::string(name) + "'";
    return false;
  }
  if (name.find('/') != std::string_view::npos || name.find('\\') != std::string_view::npos) {
    error = "NAME cannot contain a path separator: " + std::string(name);
    return false;
  }
  if (EndsWith(name, kGuideExtension)) {
    error = "NAME is the file stem; drop the '.md' extension: " + std::string(name);
    return false;
  }
  return true;
}

fs::path GuideRelativePath(Category category, std::string_view name) {
  return fs::path(DirectoryName(category)) / (std::string(name) + std::string(kGuideExtension));
}

ScaffoldResult CreateGuide(const fs::path& root, std::string_view name, Category category,
                           core::logging::Logger* logger) {
  std::string error;
  if (!ValidateGuideName(name, error)) {
    return MakeFailure(ScaffoldError::kUsage, error);
  }

  ScaffoldResult result;
  result.category = category;
  result.relative_path = GuideRelativePath(category, name);
  result.absolute_path = root / result.relative_path;

  std::error_code status_ec;
  const fs::file_status status = fs::symlink_status(result.absolute_path, status_ec);
  if (fs::exists(status)) {
    result.error = ScaffoldError::kAlreadyExists;
    result.message = result.relative_path.generic_string() + " already exists";
    return result;
  }

  if (logger != nullptr) {
    logger->Debug("writing guide template", {{"path", result.absolute_path.string()},
                                             {"category", ToString(category)}});
  }

  bool already_exists = false;
  const std::string body = RenderGuideTemplate(category, name);
  if (!core::WriteNewTextFile(result.absolute_path, body, already_exists, error)) {
    result.error = already_exists ? ScaffoldError::kAlreadyExists : ScaffoldError::kWrite;
    result.message = already_exists ? result.relative_path.generic_string() + " already exists"
                                    : error;
    return result;
  }

  if (logger != nullptr) {
    logger->Info("guide created", {{"path", result.relative_path.generic_string()},
                                   {"category", ToString(category)}});
  }
  return result;
}

ScaffoldResult CreateGuideFromArgs(const fs::path& root, std::string_view name_arg,
                                   std::string_view type_arg, core::logging::Logger* logger) {
  if (name_arg.empty() || type_arg.empty()) {
    return MakeFailure(ScaffoldError::kUsage, "NAME and TYPE are both required");
  }

  Category category = Category::kHow;
  std::string error;
  if (!ParseCategory(type_arg, category, error)) {
    if (logger != nullptr) {
      logger->Warn("rejected guide category", {{"type", type_arg}});
    }
    return MakeFailure(ScaffoldError::kInvalidCategory, error);
  }

  return CreateGuide(root, name_arg, category, logger);
}

std::string RenderNextSteps(Category category) {
  std::ostringstream out;
  out << "Next steps:\n"
      << "  1. Update CLAUDE.md table in " << DirectoryName(category) << "/ section\n"
      << "  2. Update README.md table\n";
  return out.str();
}

} // namespace guidekit::guides

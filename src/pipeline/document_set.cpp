#include "pipeline/document_set.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace guidekit::pipeline {

namespace {

bool Contains(const std::vector<std::string>& values, const std::string& needle) {
  return std::find(values.begin(), values.end(), needle) != values.end();
}

bool IsHidden(const fs::path& path) {
  const std::string name = path.filename().string();
  return !name.empty() && name.front() == '.';
}

} // namespace

bool CollectDocuments(const fs::path& root, const std::vector<std::string>& ignore_dirs,
                      std::vector<fs::path>& documents, std::string& error) {
  documents.clear();
  error.clear();

  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    error = "knowledge-base root is not a directory: " + root.string();
    return false;
  }

  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    const fs::directory_entry& entry = *it;
    std::error_code type_ec;
    if (entry.is_directory(type_ec)) {
      const std::string name = entry.path().filename().string();
      if (IsHidden(entry.path()) || Contains(ignore_dirs, name)) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!entry.is_regular_file(type_ec) || entry.path().extension() != ".md") {
      continue;
    }
    documents.push_back(entry.path().lexically_relative(root));
  }
  if (ec) {
    error = "failed to scan '" + root.string() + "': " + ec.message();
    documents.clear();
    return false;
  }

  std::sort(documents.begin(), documents.end());
  return true;
}

std::vector<fs::path> SelectProseDocuments(const std::vector<fs::path>& documents,
                                           const config::ProseLintScope& scope) {
  std::vector<fs::path> selected;
  for (const auto& document : documents) {
    const auto first = document.begin();
    if (first == document.end()) {
      continue;
    }

    const bool top_level = !document.has_parent_path();
    const std::string top_component = first->string();
    if (!top_level && !Contains(scope.include_dirs, top_component)) {
      continue;
    }
    if (!top_level && Contains(scope.exclude_dirs, top_component)) {
      continue;
    }
    selected.push_back(document);
  }
  return selected;
}

bool BuildDocumentSet(const fs::path& root, const config::ToolConfig& config,
                      DocumentSet& document_set, std::string& error) {
  if (!CollectDocuments(root, config.ignore_dirs, document_set.all_documents, error)) {
    return false;
  }
  document_set.prose_documents =
      SelectProseDocuments(document_set.all_documents, config.prose_scope);
  return true;
}

} // namespace guidekit::pipeline

#pragma once

#include "config/tool_config.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace guidekit::pipeline {

// File lists for one pipeline run. Paths are relative to the knowledge-base
// root and sorted, so tool invocations are identical from run to run.
struct DocumentSet {
  std::vector<std::filesystem::path> all_documents;
  std::vector<std::filesystem::path> prose_documents;
};

// Collects every `*.md` file under `root`, recursively. Hidden directories
// (`.git`, `.vale`, ...) and any directory whose name is in `ignore_dirs` are
// skipped wherever they occur.
bool CollectDocuments(const std::filesystem::path& root, const std::vector<std::string>& ignore_dirs,
                      std::vector<std::filesystem::path>& documents, std::string& error);

// Narrows `documents` to the prose-lint scope: top-level files, plus files
// whose first path component is listed in `include_dirs`, minus any whose
// first component is in `exclude_dirs`. Exclusion wins over inclusion.
std::vector<std::filesystem::path> SelectProseDocuments(
    const std::vector<std::filesystem::path>& documents, const config::ProseLintScope& scope);

bool BuildDocumentSet(const std::filesystem::path& root, const config::ToolConfig& config,
                      DocumentSet& document_set, std::string& error);

} // namespace guidekit::pipeline

#ifndef GUIDEKIT_TESTS_COMMON_KB_FIXTURES_HPP_
#define GUIDEKIT_TESTS_COMMON_KB_FIXTURES_HPP_

#include "assertions.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <string_view>
#include <system_error>

namespace guidekit::tests::common {

inline void WriteFixtureFile(const std::filesystem::path& file_path, std::string_view content) {
  std::error_code ec;
  if (!file_path.parent_path().empty()) {
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
      Fail("failed to create fixture directory: " + file_path.parent_path().string());
    }
  }

  std::ofstream output(file_path, std::ios::binary | std::ios::trunc);
  if (!output) {
    Fail("failed to open fixture file for writing: " + file_path.string());
  }

  output << content;
  if (!output) {
    Fail("failed while writing fixture file: " + file_path.string());
  }
}

// Small knowledge base shaped like the real one: two index documents at the
// top level, one guide per category, and content that must be ignored.
inline void WriteKnowledgeBaseFixture(const std::filesystem::path& root) {
  WriteFixtureFile(root / "README.md", "# Guides\n\nIndex of guides.\n");
  WriteFixtureFile(root / "CLAUDE.md", "# Root guide\n\nIndex for the assistant.\n");
  WriteFixtureFile(root / "how" / "git-bisect.md", "# Git-bisect\n\n## Quick Reference\n");
  WriteFixtureFile(root / "why" / "naming.md", "# Naming\n\n## Core Concepts\n");
  WriteFixtureFile(root / "node_modules" / "pkg" / "README.md", "# vendored\n");
  WriteFixtureFile(root / ".git" / "HEAD", "ref: refs/heads/main\n");
}

// path -> contents of every regular file under `root`, for before/after
// comparisons that prove a run did not touch the tree.
inline std::map<std::string, std::string> SnapshotTree(const std::filesystem::path& root) {
  std::map<std::string, std::string> snapshot;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    snapshot[entry.path().lexically_relative(root).generic_string()] =
        ReadFileToString(entry.path());
  }
  return snapshot;
}

} // namespace guidekit::tests::common

#endif // GUIDEKIT_TESTS_COMMON_KB_FIXTURES_HPP_

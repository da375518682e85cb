#pragma once

#include "guides/category.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace guidekit::guides {

struct GuideEntry {
  Category category = Category::kHow;
  std::string name; // file stem
  std::filesystem::path relative_path;
};

// Lists `<root>/<category>/*.md` (flat, regular files only), sorted by name.
// A missing category directory yields an empty list, not an error.
bool ListGuides(const std::filesystem::path& root, Category category,
                std::vector<GuideEntry>& entries, std::string& error);

// Markdown fragment for the index documents: a `## <category>/` heading and one
// table row per guide. Printed for a human to paste; never written to disk.
std::string RenderIndexRows(Category category, const std::vector<GuideEntry>& entries);

} // namespace guidekit::guides

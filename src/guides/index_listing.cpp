#include "guides/index_listing.hpp"

#include <algorithm>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace guidekit::guides {

bool ListGuides(const fs::path& root, Category category, std::vector<GuideEntry>& entries,
                std::string& error) {
  entries.clear();
  error.clear();

  const fs::path category_dir = root / DirectoryName(category);
  std::error_code ec;
  if (!fs::exists(category_dir, ec)) {
    return true;
  }
  if (!fs::is_directory(category_dir, ec)) {
    error = "category path is not a directory: " + category_dir.string();
    return false;
  }

  for (fs::directory_iterator it(category_dir, ec); !ec && it != fs::directory_iterator();
       it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || it->path().extension() != ".md") {
      continue;
    }

    GuideEntry entry;
    entry.category = category;
    entry.name = it->path().stem().string();
    entry.relative_path = fs::path(DirectoryName(category)) / it->path().filename();
    entries.push_back(std::move(entry));
  }
  if (ec) {
    error = "failed to list '" + category_dir.string() + "': " + ec.message();
    return false;
  }

  std::sort(entries.begin(), entries.end(),
            [](const GuideEntry& lhs, const GuideEntry& rhs) { return lhs.name < rhs.name; });
  return true;
}

std::string RenderIndexRows(Category category, const std::vector<GuideEntry>& entries) {
  std::ostringstream out;
  out << "## " << DirectoryName(category) << "/\n\n";
  if (entries.empty()) {
    out << "(no guides)\n";
    return out.str();
  }

  out << "| Guide | Description |\n"
      << "| ----- | ----------- |\n";
  for (const auto& entry : entries) {
    out << "| [`" << entry.name << "`](" << entry.relative_path.generic_string() << ") | |\n";
  }
  return out.str();
}

} // namespace guidekit::guides

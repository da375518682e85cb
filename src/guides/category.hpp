#pragma once

#include <array>
#include <string>
#include <string_view>

namespace guidekit::guides {

// Closed set of guide categories. The category decides the destination
// directory, the template, and which section of the index tables a new guide
// belongs to. It is always derived from the directory, never from content.
enum class Category {
  kHow, // mechanics reference: commands, flags, recipes
  kWhy, // mental models: principles with worked examples
};

inline constexpr std::array<Category, 2> kAllCategories = {Category::kHow, Category::kWhy};

// Stable CLI token and directory name (`how` / `why`).
const char* ToString(Category category);

// Directory name relative to the knowledge-base root.
std::string DirectoryName(Category category);

// Human-readable category list for usage and error text: `'how' or 'why'`.
std::string ExpectedCategoryList();

// The single string-to-enum conversion point. Matching is exact; `How` or
// ` how` are rejected so directory names on case-sensitive file systems stay
// unambiguous.
bool ParseCategory(std::string_view raw, Category& category, std::string& error);

} // namespace guidekit::guides

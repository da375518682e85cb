#include "guides/category.hpp"

namespace guidekit::guides {

const char* ToString(Category category) {
  switch (category) {
  case Category::kHow:
    return "how";
  case Category::kWhy:
    return "why";
  }
  return "how";
}

std::string DirectoryName(Category category) {
  return ToString(category);
}

std::string ExpectedCategoryList() {
  std::string list;
  for (std::size_t i = 0; i < kAllCategories.size(); ++i) {
    if (i != 0U) {
      list += (i + 1U == kAllCategories.size()) ? " or " : ", ";
    }
    list += "'" + std::string(ToString(kAllCategories[i])) + "'";
  }
  return list;
}

bool ParseCategory(std::string_view raw, Category& category, std::string& error) {
  error.clear();
  for (const Category candidate : kAllCategories) {
    if (raw == ToString(candidate)) {
      category = candidate;
      return true;
    }
  }

  error = "TYPE must be " + ExpectedCategoryList();
  return false;
}

} // namespace guidekit::guides

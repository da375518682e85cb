#include "guides/templates.hpp"

#include <cctype>
#include <sstream>

namespace guidekit::guides {

namespace {

constexpr std::string_view kQuickReferenceHeading = "## Quick Reference";
constexpr std::string_view kCoreConceptsHeading = "## Core Concepts";

void RenderHowBody(std::ostringstream& out, std::string_view name) {
  out << "Brief description of what " << name << " is and when to use it.\n"
      << '\n'
      << kQuickReferenceHeading << '\n'
      << '\n'
      << "| Command / Pattern | Description |\n"
      << "| ----------------- | ----------- |\n"
      << "| `example`         | What it does |\n"
      << '\n'
      << "## Basic Usage\n"
      << '\n'
      << "```bash\n"
      << "# Example command\n"
      << name << " --help\n"
      << "```\n";
}

void RenderWhyBody(std::ostringstream& out) {
  out << "Why this matters and when to apply these principles.\n"
      << '\n'
      << kCoreConceptsHeading << '\n'
      << '\n'
      << "### First Principle\n"
      << '\n'
      << "Explanation of the fundamental idea.\n"
      << '\n'
      << "**Example:**\n"
      << '\n'
      << "```text\n"
      << "Concrete illustration of the concept\n"
      << "```\n";
}

} // namespace

std::string TitleFromName(std::string_view name) {
  std::string title(name);
  if (!title.empty()) {
    title.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(title.front())));
  }
  return title;
}

std::string RenderGuideTemplate(Category category, std::string_view name) {
  std::ostringstream out;
  out << "# " << TitleFromName(name) << '\n' << '\n';

  switch (category) {
  case Category::kHow:
    RenderHowBody(out, name);
    break;
  case Category::kWhy:
    RenderWhyBody(out);
    break;
  }

  return out.str();
}

std::string_view RequiredHeading(Category category) {
  return category == Category::kHow ? kQuickReferenceHeading : kCoreConceptsHeading;
}

} // namespace guidekit::guides

#include "guides/templates.hpp"

#include <catch2/catch.hpp>

#include <string>

using guidekit::guides::Category;

TEST_CASE("TitleFromName upper-cases only the first character", "[guides][templates]") {
  REQUIRE(guidekit::guides::TitleFromName("rebase-strategies") == "Rebase-strategies");
  REQUIRE(guidekit::guides::TitleFromName("git") == "Git");
  REQUIRE(guidekit::guides::TitleFromName("tmux-Panes") == "Tmux-Panes");
  REQUIRE(guidekit::guides::TitleFromName("2fa") == "2fa");
  REQUIRE(guidekit::guides::TitleFromName("").empty());
}

TEST_CASE("how template carries a quick reference table and basic usage", "[guides][templates]") {
  const std::string body = guidekit::guides::RenderGuideTemplate(Category::kHow, "jq");

  REQUIRE(body.rfind("# Jq\n\n", 0) == 0U);
  REQUIRE(body.find("Brief description of what jq is and when to use it.") != std::string::npos);
  REQUIRE(body.find("## Quick Reference\n") != std::string::npos);
  REQUIRE(body.find("| Command / Pattern | Description |") != std::string::npos);
  REQUIRE(body.find("## Basic Usage\n") != std::string::npos);
  REQUIRE(body.find("```bash\n# Example command\njq --help\n```\n") != std::string::npos);
  REQUIRE(body.find("## Core Concepts") == std::string::npos);
}

TEST_CASE("why template carries core concepts with a worked example", "[guides][templates]") {
  const std::string body = guidekit::guides::RenderGuideTemplate(Category::kWhy, "naming");

  REQUIRE(body.rfind("# Naming\n\n", 0) == 0U);
  REQUIRE(body.find("## Core Concepts\n") != std::string::npos);
  REQUIRE(body.find("### First Principle") != std::string::npos);
  REQUIRE(body.find("**Example:**") != std::string::npos);
  REQUIRE(body.find("```text\nConcrete illustration of the concept\n```\n") != std::string::npos);
  REQUIRE(body.find("## Quick Reference") == std::string::npos);
}

TEST_CASE("templates end with exactly one newline", "[guides][templates]") {
  for (const Category category : guidekit::guides::kAllCategories) {
    const std::string body = guidekit::guides::RenderGuideTemplate(category, "x");
    REQUIRE(body.size() >= 2U);
    REQUIRE(body.back() == '\n');
    REQUIRE(body[body.size() - 2U] != '\n');
    REQUIRE(body.find(guidekit::guides::RequiredHeading(category)) != std::string::npos);
  }
}

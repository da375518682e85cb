#pragma once

#include "guides/category.hpp"

#include <string>
#include <string_view>

namespace guidekit::guides {

// `rebase-strategies` -> `Rebase-strategies`. Only the first character is
// upper-cased (ASCII); the rest of the name is kept verbatim.
std::string TitleFromName(std::string_view name);

// Full markdown body of a new guide.
//
// - `how` guides get a "Quick Reference" table and a "Basic Usage" block whose
//   example command is `<name> --help`.
// - `why` guides get a "Core Concepts" section with one worked example.
//
// Output always ends with a single trailing newline so the formatter has
// nothing to change on a freshly scaffolded file.
std::string RenderGuideTemplate(Category category, std::string_view name);

// Section heading every guide of `category` must carry, e.g.
// `## Quick Reference`.
std::string_view RequiredHeading(Category category);

} // namespace guidekit::guides

#include "config/tool_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <initializer_list>
#include <system_error>

namespace fs = std::filesystem;

namespace guidekit::config {

namespace {

using JsonValue = core::json::Value;

bool ExpectType(const JsonValue& value, JsonValue::Type expected, const std::string& path,
                std::string& error) {
  if (value.type == expected) {
    return true;
  }
  error = path + ": expected " + core::json::TypeName(expected) + ", got " +
          core::json::TypeName(value.type);
  return false;
}

bool RejectUnknownKeys(const JsonValue& object_value, const std::vector<std::string_view>& known,
                       const std::string& path, std::string& error) {
  for (const auto& entry : object_value.object_value) {
    bool is_known = false;
    for (const std::string_view candidate : known) {
      if (entry.first == candidate) {
        is_known = true;
        break;
      }
    }
    if (!is_known) {
      error = path + "." + entry.first + ": unknown key";
      return false;
    }
  }
  return true;
}

bool ReadStringArray(const JsonValue& value, const std::string& path,
                     std::vector<std::string>& output, std::string& error) {
  if (!ExpectType(value, JsonValue::Type::kArray, path, error)) {
    return false;
  }

  std::vector<std::string> parsed;
  parsed.reserve(value.array_value.size());
  for (std::size_t i = 0; i < value.array_value.size(); ++i) {
    const std::string item_path = path + "[" + std::to_string(i) + "]";
    const JsonValue& item = value.array_value[i];
    if (!ExpectType(item, JsonValue::Type::kString, item_path, error)) {
      return false;
    }
    if (item.string_value.empty()) {
      error = item_path + ": must not be empty";
      return false;
    }
    parsed.push_back(item.string_value);
  }

  output = std::move(parsed);
  return true;
}

bool ReadDirectoryList(const JsonValue& value, const std::string& path,
                       std::vector<std::string>& output, std::string& error) {
  if (!ReadStringArray(value, path, output, error)) {
    return false;
  }
  for (std::size_t i = 0; i < output.size(); ++i) {
    if (output[i].find('/') != std::string::npos || output[i].find('\\') != std::string::npos) {
      error = path + "[" + std::to_string(i) + "]: must be a single top-level directory name";
      return false;
    }
  }
  return true;
}

bool ReadToolCommand(const JsonValue& value, const std::string& path,
                     std::initializer_list<std::string_view> extra_keys, ToolCommand& command,
                     std::string& error) {
  if (!ExpectType(value, JsonValue::Type::kObject, path, error)) {
    return false;
  }

  std::vector<std::string_view> known = {"command", "advisory"};
  known.insert(known.end(), extra_keys.begin(), extra_keys.end());
  if (!RejectUnknownKeys(value, known, path, error)) {
    return false;
  }

  if (const JsonValue* argv = core::json::FindMember(value, "command"); argv != nullptr) {
    if (!ReadStringArray(*argv, path + ".command", command.argv, error)) {
      return false;
    }
    if (command.argv.empty()) {
      error = path + ".command: must name at least the executable";
      return false;
    }
  }

  if (const JsonValue* advisory = core::json::FindMember(value, "advisory");
      advisory != nullptr) {
    if (!ExpectType(*advisory, JsonValue::Type::kBool, path + ".advisory", error)) {
      return false;
    }
    command.advisory = advisory->bool_value;
  }
  return true;
}

} // namespace

bool ParseToolConfigText(std::string_view json_text, ToolConfig& config, std::string& error) {
  error.clear();

  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    return false;
  }
  if (!ExpectType(root, JsonValue::Type::kObject, "$", error)) {
    return false;
  }
  if (!RejectUnknownKeys(root, {"ignore_dirs", "formatter", "structural_linter", "prose_linter"},
                         "$", error)) {
    return false;
  }

  ToolConfig parsed = config;
  if (const JsonValue* ignore = core::json::FindMember(root, "ignore_dirs"); ignore != nullptr) {
    if (!ReadDirectoryList(*ignore, "$.ignore_dirs", parsed.ignore_dirs, error)) {
      return false;
    }
  }

  if (const JsonValue* formatter = core::json::FindMember(root, "formatter");
      formatter != nullptr) {
    if (!ReadToolCommand(*formatter, "$.formatter", {}, parsed.formatter, error)) {
      return false;
    }
  }

  if (const JsonValue* linter = core::json::FindMember(root, "structural_linter");
      linter != nullptr) {
    if (!ReadToolCommand(*linter, "$.structural_linter", {}, parsed.structural_linter, error)) {
      return false;
    }
  }

  if (const JsonValue* prose = core::json::FindMember(root, "prose_linter"); prose != nullptr) {
    if (!ReadToolCommand(*prose, "$.prose_linter", {"include_dirs", "exclude_dirs"},
                         parsed.prose_linter, error)) {
      return false;
    }
    if (const JsonValue* include = core::json::FindMember(*prose, "include_dirs");
        include != nullptr &&
        !ReadDirectoryList(*include, "$.prose_linter.include_dirs", parsed.prose_scope.include_dirs,
                           error)) {
      return false;
    }
    if (const JsonValue* exclude = core::json::FindMember(*prose, "exclude_dirs");
        exclude != nullptr &&
        !ReadDirectoryList(*exclude, "$.prose_linter.exclude_dirs", parsed.prose_scope.exclude_dirs,
                           error)) {
      return false;
    }
  }

  config = std::move(parsed);
  return true;
}

bool LoadToolConfigFile(const fs::path& config_path, ToolConfig& config, std::string& error) {
  std::string text;
  if (!core::ReadTextFile(config_path, text, error)) {
    return false;
  }
  if (!ParseToolConfigText(text, config, error)) {
    error = config_path.string() + ": " + error;
    return false;
  }
  return true;
}

bool ResolveToolConfig(const fs::path& root, const std::optional<fs::path>& explicit_path,
                       ToolConfig& config, fs::path& loaded_from, std::string& error) {
  loaded_from.clear();
  error.clear();

  if (explicit_path.has_value()) {
    std::error_code ec;
    if (!fs::is_regular_file(*explicit_path, ec)) {
      error = "config file not found: " + explicit_path->string();
      return false;
    }
    if (!LoadToolConfigFile(*explicit_path, config, error)) {
      return false;
    }
    loaded_from = *explicit_path;
    return true;
  }

  const fs::path default_path = root / std::string(kDefaultConfigFileName);
  std::error_code ec;
  if (!fs::exists(default_path, ec)) {
    return true;
  }
  if (!LoadToolConfigFile(default_path, config, error)) {
    return false;
  }
  loaded_from = default_path;
  return true;
}

} // namespace guidekit::config

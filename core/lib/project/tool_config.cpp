// bird_typefix/project/tool_config.cpp - Tool configuration implementation
//
#include "bird_typefix/project/tool_config.hpp"

#include <yaml-cpp/yaml.h>

#include <system_error>

namespace bird_typefix
{

namespace
{

/// Parse the 'extensions' list; every entry must start with '.'
bool parse_extensions(const YAML::Node & node, std::vector<std::string> & out, std::string & error)
{
  if (!node.IsSequence()) {
    error = "extensions must be a list";
    return false;
  }
  out.clear();
  for (const auto & item : node) {
    auto ext = item.as<std::string>();
    if (ext.empty() || ext.front() != '.') {
      error = "invalid extension '" + ext + "' (must start with '.')";
      return false;
    }
    out.push_back(std::move(ext));
  }
  if (out.empty()) {
    error = "extensions must not be empty";
    return false;
  }
  return true;
}

}  // namespace

std::optional<ReportFormat> parse_report_format(std::string_view text)
{
  if (text == "text") {
    return ReportFormat::Text;
  }
  if (text == "json") {
    return ReportFormat::Json;
  }
  return std::nullopt;
}

ConfigLoadResult load_tool_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ToolConfig config;
  config.source_path = fs::absolute(config_path, ec);
  if (ec) {
    config.source_path = config_path;
  }

  // An empty file is a valid, all-defaults configuration.
  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  try {
    if (root["extensions"]) {
      std::string error;
      if (!parse_extensions(root["extensions"], config.extensions, error)) {
        return ConfigLoadResult::fail(error);
      }
    }

    if (root["recursive"]) {
      config.recursive = root["recursive"].as<bool>();
    }

    if (root["jobs"]) {
      const int jobs = root["jobs"].as<int>();
      if (jobs < 0) {
        return ConfigLoadResult::fail("jobs must not be negative");
      }
      config.jobs = static_cast<uint32_t>(jobs);
    }

    if (root["backup_suffix"]) {
      config.backup_suffix = root["backup_suffix"].as<std::string>();
    }

    if (root["report"]) {
      const auto text = root["report"].as<std::string>();
      const auto format = parse_report_format(text);
      if (!format) {
        return ConfigLoadResult::fail(
          "invalid report: '" + text + "' (must be 'text' or 'json')");
      }
      config.report = *format;
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_tool_config(const std::filesystem::path & start)
{
  namespace fs = std::filesystem;

  // Unreadable or unsearchable directories are skipped, not fatal.
  std::error_code ec;
  fs::path current = fs::absolute(start, ec);
  if (ec) {
    return std::nullopt;
  }

  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_tool_config_file_name;
    if (fs::is_regular_file(candidate, ec)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace bird_typefix

// bird_typefix/project/tool_config.hpp - Tool configuration (bird-typefix.yaml)
//
// Parses and validates the optional bird-typefix.yaml next to (or above) the
// configuration files being migrated.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bird_typefix
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class ReportFormat : uint8_t {
  Text,
  Json,
};

[[nodiscard]] std::optional<ReportFormat> parse_report_format(std::string_view text);

/**
 * Settings for one run. Command-line options are applied on top.
 */
struct ToolConfig
{
  /// File suffixes picked up when a directory is given
  std::vector<std::string> extensions = {".conf"};

  /// Descend into sub-directories
  bool recursive = true;

  /// Worker threads; 0 means hardware concurrency
  uint32_t jobs = 0;

  /// When non-empty, in-place mode keeps a copy as <file><backup_suffix>
  std::string backup_suffix;

  ReportFormat report = ReportFormat::Text;

  /// File this configuration was read from (empty for defaults)
  std::filesystem::path source_path;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ToolConfig config;

  bool success = false;

  std::string error;

  static ConfigLoadResult ok(ToolConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a tool configuration from a bird-typefix.yaml file.
 *
 * Missing keys keep their defaults; keys of the wrong type or with invalid
 * values fail the whole load.
 */
[[nodiscard]] ConfigLoadResult load_tool_config(const std::filesystem::path & config_path);

/**
 * Search for bird-typefix.yaml starting at start (a file's directory, or the
 * directory itself) and moving up to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_tool_config(
  const std::filesystem::path & start);

inline constexpr const char * k_tool_config_file_name = "bird-typefix.yaml";

}  // namespace bird_typefix

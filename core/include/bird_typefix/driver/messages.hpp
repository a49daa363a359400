// bird_typefix/driver/messages.hpp - Localized command-line messages
//
// The CLI speaks English or Chinese, picked from LANG, LC_ALL and
// LC_MESSAGES. Diagnostics and verbose progress lines stay English.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace bird_typefix
{

enum class Language : uint8_t {
  English,
  Chinese,
};

/// One message in every supported language. `{}` marks the argument slot.
struct LocalizedText
{
  std::string_view en;
  std::string_view zh;
};

/**
 * Pick the message language from locale variable values.
 *
 * Any of them mentioning "zh" or "cn" (case-insensitive) selects Chinese;
 * unset variables are passed as empty strings.
 */
[[nodiscard]] Language detect_language(
  std::string_view lang, std::string_view lc_all, std::string_view lc_messages);

/// detect_language() over the process environment.
[[nodiscard]] Language detect_language_from_environment();

class Messages
{
public:
  explicit Messages(Language language) noexcept : language_(language) {}

  [[nodiscard]] std::string_view get(const LocalizedText & text) const noexcept
  {
    return language_ == Language::Chinese ? text.zh : text.en;
  }

  /// get() with its `{}` slot filled by arg.
  [[nodiscard]] std::string format(const LocalizedText & text, std::string_view arg) const;

private:
  Language language_;
};

// ============================================================================
// Message catalog
// ============================================================================

namespace msg
{

// Usage
inline constexpr LocalizedText k_title = {
  "add return type annotations to BIRD functions", "为 BIRD 函数补全返回类型声明"};
inline constexpr LocalizedText k_usage = {"Usage", "用法"};
inline constexpr LocalizedText k_usage_args = {
  "<file-or-directory> [options]", "<配置文件或目录> [选项]"};
inline constexpr LocalizedText k_print_note = {
  "Without -i the rewritten configuration is printed to stdout.",
  "未指定 -i 时, 补全后的配置输出到标准输出."};
inline constexpr LocalizedText k_options = {"Options", "选项"};
inline constexpr LocalizedText k_opt_in_place = {
  "Rewrite files instead of printing them", "直接修改文件"};
inline constexpr LocalizedText k_opt_backup = {
  "Keep the original as <file><suffix> (with -i)", "修改前保留副本 <文件><后缀> (配合 -i)"};
inline constexpr LocalizedText k_opt_jobs = {
  "Worker threads (default: CPU count)", "工作线程数 (默认: CPU 核数)"};
inline constexpr LocalizedText k_opt_no_recursive = {
  "Do not descend into sub-directories", "不处理子目录"};
inline constexpr LocalizedText k_opt_ext = {
  "File suffix to process (repeatable, default .conf)", "要处理的文件后缀 (可重复, 默认 .conf)"};
inline constexpr LocalizedText k_opt_config = {
  "Use this bird-typefix.yaml", "使用指定的 bird-typefix.yaml"};
inline constexpr LocalizedText k_opt_report = {
  "Report format (default: text)", "报告格式 (默认: text)"};
inline constexpr LocalizedText k_opt_no_color = {"Disable colored diagnostics", "关闭彩色输出"};
inline constexpr LocalizedText k_opt_verbose = {"Verbose output", "详细输出"};
inline constexpr LocalizedText k_opt_help = {"Show this help message", "显示帮助"};
inline constexpr LocalizedText k_supported_types = {"Supported types", "支持类型"};
inline constexpr LocalizedText k_void_note = {
  "Note: Void functions remain unchanged", "注: 无返回值函数将保持不变"};
inline constexpr LocalizedText k_exit_status = {
  "Exit status: 0 success, 2 some functions skipped, 1 failure",
  "退出码: 0 成功, 2 有函数被跳过, 1 失败"};

// Errors
inline constexpr LocalizedText k_error = {"error: {}", "错误: {}"};
inline constexpr LocalizedText k_path_not_found = {
  "error: path '{}' not found", "错误: 路径 '{}' 不存在"};
inline constexpr LocalizedText k_missing_input = {"missing input path", "缺少参数: 输入路径"};
inline constexpr LocalizedText k_missing_value = {"missing value for {}", "{} 缺少参数值"};
inline constexpr LocalizedText k_unknown_option = {"unknown option '{}'", "未知选项 '{}'"};
inline constexpr LocalizedText k_unexpected_argument = {
  "unexpected argument '{}'", "多余的参数 '{}'"};
inline constexpr LocalizedText k_invalid_jobs = {"invalid job count '{}'", "无效的线程数 '{}'"};
inline constexpr LocalizedText k_invalid_extension = {
  "invalid extension '{}' (must start with '.')", "无效的后缀 '{}' (必须以 '.' 开头)"};
inline constexpr LocalizedText k_invalid_report = {
  "invalid report format '{}' (must be 'text' or 'json')",
  "无效的报告格式 '{}' (只能是 'text' 或 'json')"};

// Progress
inline constexpr LocalizedText k_using_config = {"Using configuration: {}", "使用配置: {}"};
inline constexpr LocalizedText k_no_matching_files = {
  "No matching files in {}", "目录 {} 中无匹配文件"};
inline constexpr LocalizedText k_done = {"Done: {}", "完成: {}"};

}  // namespace msg

}  // namespace bird_typefix

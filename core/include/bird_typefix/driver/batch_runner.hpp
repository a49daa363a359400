// bird_typefix/driver/batch_runner.hpp - Batch driver
//
// Turns paths into rewritten files (or printed text) and reports.
// Used by the CLI and by integration tests.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "bird_typefix/basic/source_manager.hpp"
#include "bird_typefix/engine.hpp"
#include "bird_typefix/project/tool_config.hpp"

namespace bird_typefix
{

// ============================================================================
// Run Options
// ============================================================================

enum class RunMode : uint8_t {
  Print,    ///< write rewritten text to stdout
  InPlace,  ///< replace files that gained annotations
};

struct RunOptions
{
  RunMode mode = RunMode::Print;

  /// Extensions, recursion, jobs, backup suffix, report format
  ToolConfig config;

  /// Progress lines on stderr
  bool verbose = false;
};

enum class ExitStatus : int {
  Success = 0,
  Failure = 1,
  SuccessWithSkips = 2,
};

// ============================================================================
// Results
// ============================================================================

/**
 * Outcome for one input file.
 *
 * `success` covers I/O only; scan errors live in `report`.
 */
struct FileResult
{
  std::filesystem::path path;

  bool success = false;
  std::string error;

  SourceFile source;
  ScanReport report;
  std::string output;

  /// In-place mode: the file on disk was replaced
  bool written = false;

  [[nodiscard]] bool changed() const { return output != source.content(); }
};

struct CollectResult
{
  std::vector<std::filesystem::path> files;
  bool is_directory = false;
  bool success = false;
  std::string error;

  static CollectResult ok(std::vector<std::filesystem::path> files, bool is_directory)
  {
    CollectResult r;
    r.files = std::move(files);
    r.is_directory = is_directory;
    r.success = true;
    return r;
  }

  static CollectResult fail(std::string msg)
  {
    CollectResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

struct BatchResult
{
  /// In input order, whatever order the workers finished in
  std::vector<FileResult> files;

  [[nodiscard]] ExitStatus exit_status() const;
};

// ============================================================================
// BatchRunner
// ============================================================================

class BatchRunner
{
public:
  /**
   * Expand an input path into the files to process.
   *
   * A regular file is taken as is. A directory is enumerated for files with
   * one of config.extensions (recursively if config.recursive), sorted and
   * without duplicates.
   */
  [[nodiscard]] static CollectResult collect_files(
    const std::filesystem::path & input, const ToolConfig & config);

  /// Read, scan and rewrite one file. Never throws.
  [[nodiscard]] static FileResult process_file(
    const std::filesystem::path & file, const RunOptions & options);

  /// process_file() for every file on min(files, jobs) worker threads.
  [[nodiscard]] static BatchResult run(
    const std::vector<std::filesystem::path> & files, const RunOptions & options);

private:
  static bool read_file(const std::filesystem::path & file, std::string & out, std::string & error);

  /// Temp file + rename next to the file, or next to a symlink's target.
  static bool write_file_atomically(
    const std::filesystem::path & path, std::string_view content, std::string & error);
};

// ============================================================================
// Output
// ============================================================================

/**
 * Print-mode output: the single file's text, or for directories each file
 * behind a `# === File: <path> ===` header.
 */
void write_text_output(const BatchResult & result, bool with_headers, std::ostream & os);

/// Machine-readable form of a whole run.
[[nodiscard]] nlohmann::json batch_to_json(const BatchResult & result);

}  // namespace bird_typefix

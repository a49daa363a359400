// bird_typefix/driver/batch_runner.cpp - Batch driver implementation
//
#include "bird_typefix/driver/batch_runner.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstdio>
#include <exception>
#include <fstream>
#include <ostream>
#include <sstream>
#include <system_error>

#include "bird_typefix/driver/worker_pool.hpp"
#include "bird_typefix/report/json_report.hpp"

namespace bird_typefix
{

namespace fs = std::filesystem;

namespace
{

bool has_extension(const fs::path & file, const std::vector<std::string> & extensions)
{
  const std::string name = file.filename().string();
  return std::any_of(extensions.begin(), extensions.end(), [&](const std::string & ext) {
    return name.size() > ext.size() && name.compare(name.size() - ext.size(), ext.size(), ext) == 0;
  });
}

template <typename Iterator>
bool enumerate(
  Iterator it, const ToolConfig & config, std::vector<fs::path> & out, std::error_code & ec)
{
  for (Iterator end; it != end; it.increment(ec)) {
    if (ec) {
      return false;
    }
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && has_extension(it->path(), config.extensions)) {
      out.push_back(it->path().lexically_normal());
    }
  }
  return !ec;
}

std::string_view file_status(const FileResult & f)
{
  if (!f.success || f.report.has_failures()) {
    return "failed";
  }
  if (f.report.has_skips()) {
    return "skipped";
  }
  return "ok";
}

}  // namespace

ExitStatus BatchResult::exit_status() const
{
  bool skips = false;
  for (const auto & f : files) {
    if (!f.success || f.report.has_failures()) {
      return ExitStatus::Failure;
    }
    skips = skips || f.report.has_skips();
  }
  return skips ? ExitStatus::SuccessWithSkips : ExitStatus::Success;
}

// ============================================================================
// BatchRunner
// ============================================================================

CollectResult BatchRunner::collect_files(const fs::path & input, const ToolConfig & config)
{
  std::error_code ec;
  const fs::file_status st = fs::status(input, ec);
  if (ec || !fs::exists(st)) {
    return CollectResult::fail(fmt::format("path '{}' not found", input.string()));
  }

  if (!fs::is_directory(st)) {
    return CollectResult::ok({input}, false);
  }

  std::vector<fs::path> files;
  const auto options = fs::directory_options::skip_permission_denied;
  const bool listed =
    config.recursive
      ? enumerate(fs::recursive_directory_iterator(input, options, ec), config, files, ec)
      : enumerate(fs::directory_iterator(input, options, ec), config, files, ec);
  if (!listed || ec) {
    return CollectResult::fail(
      fmt::format("cannot list directory '{}': {}", input.string(), ec.message()));
  }

  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());
  return CollectResult::ok(std::move(files), true);
}

FileResult BatchRunner::process_file(const fs::path & file, const RunOptions & options)
{
  FileResult result;
  result.path = file;

  if (options.verbose) {
    fmt::print(stderr, "Processing: {}\n", file.string());
  }

  try {
    std::string content;
    if (!read_file(file, content, result.error)) {
      return result;
    }

    result.source = SourceFile(file, std::move(content));
    result.report = scan_file(result.source.content());
    result.output = rewrite_buffer(result.source.content(), result.report);

    if (options.mode == RunMode::InPlace && result.changed()) {
      const std::string & suffix = options.config.backup_suffix;
      if (!suffix.empty()) {
        fs::path backup = file;
        backup += suffix;
        if (!write_file_atomically(backup, result.source.content(), result.error)) {
          return result;
        }
      }
      if (!write_file_atomically(file, result.output, result.error)) {
        return result;
      }
      result.written = true;
      if (options.verbose) {
        fmt::print(stderr, "Rewrote: {}\n", file.string());
      }
    }

    result.success = true;
  } catch (const std::exception & e) {
    result.error = fmt::format("{}: {}", file.string(), e.what());
  }

  return result;
}

BatchResult BatchRunner::run(const std::vector<fs::path> & files, const RunOptions & options)
{
  BatchResult batch;
  batch.files.resize(files.size());

  parallel_for(files.size(), options.config.jobs, [&](size_t i) {
    batch.files[i] = process_file(files[i], options);
  });

  return batch;
}

bool BatchRunner::read_file(const fs::path & file, std::string & out, std::string & error)
{
  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) {
    error = fmt::format("failed to open file: {}", file.string());
    return false;
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    error = fmt::format("failed to read file: {}", file.string());
    return false;
  }
  out = buffer.str();
  return true;
}

bool BatchRunner::write_file_atomically(
  const fs::path & path, std::string_view content, std::string & error)
{
  // A symlinked config is updated through the link; the link itself stays.
  fs::path file = path;
  std::error_code link_ec;
  if (fs::is_symlink(fs::symlink_status(path, link_ec))) {
    file = fs::canonical(path, link_ec);
    if (link_ec) {
      error = fmt::format("cannot resolve symlink {}: {}", path.string(), link_ec.message());
      return false;
    }
  }

  fs::path tmp = file.parent_path() / ("." + file.filename().string() + ".bird-typefix.tmp");

  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      error = fmt::format("failed to open output file: {}", tmp.string());
      return false;
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
      error = fmt::format("failed to write file: {}", tmp.string());
      std::error_code rm_ec;
      fs::remove(tmp, rm_ec);
      return false;
    }
  }

  // Carry over the permissions of the file being replaced.
  std::error_code ec;
  const fs::file_status st = fs::status(file, ec);
  if (!ec && fs::exists(st)) {
    fs::permissions(tmp, st.permissions(), ec);
  }

  ec.clear();
  fs::rename(tmp, file, ec);
  if (ec) {
    error = fmt::format("failed to replace {}: {}", file.string(), ec.message());
    std::error_code rm_ec;
    fs::remove(tmp, rm_ec);
    return false;
  }
  return true;
}

// ============================================================================
// Output
// ============================================================================

void write_text_output(const BatchResult & result, bool with_headers, std::ostream & os)
{
  for (const auto & f : result.files) {
    if (!f.success) {
      continue;
    }
    if (with_headers) {
      os << "# === File: " << f.path.string() << " ===\n" << f.output << "\n";
    } else {
      os << f.output;
    }
  }
}

nlohmann::json batch_to_json(const BatchResult & result)
{
  nlohmann::json out;
  out["files"] = nlohmann::json::array();
  for (const auto & f : result.files) {
    nlohmann::json j;
    j["path"] = f.path.string();
    j["status"] = std::string(file_status(f));
    if (!f.success) {
      j["error"] = f.error;
    }
    nlohmann::json scan = report_to_json(f.report, f.source);
    j["functions"] = std::move(scan["functions"]);
    j["errors"] = std::move(scan["errors"]);
    j["changed"] = f.success && f.changed();
    j["written"] = f.written;
    out["files"].push_back(std::move(j));
  }
  out["exit_code"] = static_cast<int>(result.exit_status());
  return out;
}

}  // namespace bird_typefix

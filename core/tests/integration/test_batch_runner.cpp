// test_batch_runner.cpp - Batch driver tests on real directories

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "bird_typefix/driver/batch_runner.hpp"
#include "bird_typefix/driver/worker_pool.hpp"
#include "bird_typefix/report/json_report.hpp"

using bird_typefix::BatchRunner;
using bird_typefix::ExitStatus;
using bird_typefix::RunMode;
using bird_typefix::RunOptions;
using bird_typefix::ToolConfig;

namespace fs = std::filesystem;

namespace
{

std::string read_all(const fs::path & p)
{
  std::ifstream in(p, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p, std::ios::binary);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

std::vector<std::string> names(const std::vector<fs::path> & files)
{
  std::vector<std::string> out;
  for (const auto & f : files) {
    out.push_back(f.filename().string());
  }
  return out;
}

}  // namespace

// ============================================================================
// File collection
// ============================================================================

TEST(DriverCollectFiles, SingleFileIsTakenAsIs)
{
  const fs::path dir = make_temp_dir("bird_typefix_collect_single");
  write_all(dir / "bird.txt", "");

  const auto r = BatchRunner::collect_files(dir / "bird.txt", ToolConfig{});
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_FALSE(r.is_directory);
  EXPECT_EQ(names(r.files), (std::vector<std::string>{"bird.txt"}));

  fs::remove_all(dir);
}

TEST(DriverCollectFiles, DirectoryIsFilteredAndSorted)
{
  const fs::path dir = make_temp_dir("bird_typefix_collect_dir");
  fs::create_directories(dir / "sub");
  write_all(dir / "b.conf", "");
  write_all(dir / "a.conf", "");
  write_all(dir / "notes.txt", "");
  write_all(dir / "sub" / "c.conf", "");

  const auto r = BatchRunner::collect_files(dir, ToolConfig{});
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_TRUE(r.is_directory);
  EXPECT_EQ(names(r.files), (std::vector<std::string>{"a.conf", "b.conf", "c.conf"}));

  ToolConfig flat;
  flat.recursive = false;
  const auto r2 = BatchRunner::collect_files(dir, flat);
  ASSERT_TRUE(r2.success) << r2.error;
  EXPECT_EQ(names(r2.files), (std::vector<std::string>{"a.conf", "b.conf"}));

  fs::remove_all(dir);
}

TEST(DriverCollectFiles, MissingPathFails)
{
  const auto r = BatchRunner::collect_files("/nonexistent/bird", ToolConfig{});
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "path '/nonexistent/bird' not found");
}

// ============================================================================
// Running
// ============================================================================

TEST(DriverBatchRunner, PrintModeLeavesFilesUntouched)
{
  const fs::path dir = make_temp_dir("bird_typefix_print");
  write_all(dir / "config1.conf", "function test1() { return 1; }");
  write_all(dir / "config2.conf", "function test2() { return true; }");

  const auto files = BatchRunner::collect_files(dir, ToolConfig{});
  ASSERT_TRUE(files.success);

  RunOptions options;
  options.mode = RunMode::Print;
  const auto result = BatchRunner::run(files.files, options);
  EXPECT_EQ(result.exit_status(), ExitStatus::Success);

  std::ostringstream os;
  bird_typefix::write_text_output(result, true, os);
  const std::string out = os.str();
  EXPECT_NE(out.find("# === File: "), std::string::npos);
  EXPECT_NE(out.find("config1.conf ===\nfunction test1() -> int { return 1; }\n"), std::string::npos);
  EXPECT_NE(
    out.find("config2.conf ===\nfunction test2() -> bool { return true; }\n"), std::string::npos);
  EXPECT_LT(out.find("config1.conf"), out.find("config2.conf"));

  EXPECT_EQ(read_all(dir / "config1.conf"), "function test1() { return 1; }");

  fs::remove_all(dir);
}

TEST(DriverBatchRunner, InPlaceRewritesAndKeepsBackup)
{
  const fs::path dir = make_temp_dir("bird_typefix_inplace");
  const std::string original = "function test()\r\n{\r\n    return 1;\r\n}";
  write_all(dir / "test.conf", original);
  write_all(dir / "void.conf", "function v() { print 1; }");

  RunOptions options;
  options.mode = RunMode::InPlace;
  options.config.backup_suffix = ".orig";

  const auto result =
    BatchRunner::run({dir / "test.conf", dir / "void.conf"}, options);
  ASSERT_EQ(result.files.size(), 2U);
  EXPECT_TRUE(result.files[0].written);
  EXPECT_FALSE(result.files[1].written);

  EXPECT_EQ(read_all(dir / "test.conf"), "function test() -> int\r\n{\r\n    return 1;\r\n}");
  EXPECT_EQ(read_all(dir / "test.conf.orig"), original);
  EXPECT_FALSE(fs::exists(dir / "void.conf.orig"));

  // A second run has nothing left to do.
  const auto again = BatchRunner::run({dir / "test.conf"}, options);
  EXPECT_FALSE(again.files[0].written);

  // A symlinked config is rewritten through the link.
  fs::create_directories(dir / "real");
  write_all(dir / "real" / "bird.conf", "function s() { return \"x\"; }");
  fs::create_symlink(dir / "real" / "bird.conf", dir / "bird.conf");

  const auto linked = BatchRunner::run({dir / "bird.conf"}, options);
  ASSERT_TRUE(linked.files[0].success) << linked.files[0].error;
  EXPECT_TRUE(linked.files[0].written);
  EXPECT_TRUE(fs::is_symlink(dir / "bird.conf"));
  EXPECT_EQ(read_all(dir / "real" / "bird.conf"), "function s() -> string { return \"x\"; }");
  EXPECT_EQ(read_all(dir / "bird.conf.orig"), "function s() { return \"x\"; }");
  EXPECT_FALSE(fs::is_symlink(dir / "bird.conf.orig"));

  fs::remove_all(dir);
}

TEST(DriverBatchRunner, ResultsFollowInputOrderAcrossWorkers)
{
  const fs::path dir = make_temp_dir("bird_typefix_order");
  std::vector<fs::path> files;
  for (int i = 0; i < 24; ++i) {
    const fs::path p = dir / ("f" + std::to_string(100 + i) + ".conf");
    write_all(p, "function f" + std::to_string(i) + "() { return " + std::to_string(i) + "; }");
    files.push_back(p);
  }

  RunOptions options;
  options.config.jobs = 4;
  const auto result = BatchRunner::run(files, options);
  ASSERT_EQ(result.files.size(), files.size());
  for (size_t i = 0; i < files.size(); ++i) {
    EXPECT_EQ(result.files[i].path.string(), files[i].string());
    ASSERT_EQ(result.files[i].report.decisions.size(), 1U);
    EXPECT_EQ(result.files[i].report.decisions[0].function.name, "f" + std::to_string(i));
  }

  fs::remove_all(dir);
}

TEST(DriverBatchRunner, ExitStatusReflectsWorstFile)
{
  const fs::path dir = make_temp_dir("bird_typefix_exit");
  write_all(dir / "ok.conf", "function a() { return 1; }");
  write_all(dir / "skip.conf", "function b() { return x; }");
  write_all(dir / "bad.conf", "function c() { return \"unterminated; }");

  RunOptions options;
  EXPECT_EQ(BatchRunner::run({dir / "ok.conf"}, options).exit_status(), ExitStatus::Success);
  EXPECT_EQ(
    BatchRunner::run({dir / "ok.conf", dir / "skip.conf"}, options).exit_status(),
    ExitStatus::SuccessWithSkips);

  const auto failed = BatchRunner::run({dir / "bad.conf", dir / "ok.conf"}, options);
  EXPECT_EQ(failed.exit_status(), ExitStatus::Failure);
  // The failing file does not stop the rest of the batch.
  EXPECT_EQ(failed.files[1].output, "function a() -> int { return 1; }");

  fs::remove_all(dir);
}

TEST(DriverBatchRunner, UnreadableFileIsReportedNotThrown)
{
  RunOptions options;
  const auto result = BatchRunner::run({"/nonexistent/x.conf"}, options);
  ASSERT_EQ(result.files.size(), 1U);
  EXPECT_FALSE(result.files[0].success);
  EXPECT_FALSE(result.files[0].error.empty());
  EXPECT_EQ(result.exit_status(), ExitStatus::Failure);
}

TEST(DriverBatchRunner, JsonSummary)
{
  const fs::path dir = make_temp_dir("bird_typefix_json");
  write_all(dir / "a.conf", "function a() { return 1; }\nfunction b() { return x; }\n");

  RunOptions options;
  const auto result = BatchRunner::run({dir / "a.conf"}, options);
  const auto j = bird_typefix::batch_to_json(result);

  ASSERT_EQ(j["files"].size(), 1U);
  EXPECT_EQ(j["files"][0]["status"], "skipped");
  EXPECT_EQ(j["files"][0]["changed"], true);
  EXPECT_EQ(j["files"][0]["written"], false);
  EXPECT_EQ(j["files"][0]["functions"].size(), 2U);
  EXPECT_EQ(j["exit_code"], 2);

  fs::remove_all(dir);
}

TEST(DriverBatchRunner, JsonSummaryWithLatin1FileName)
{
  const fs::path dir = make_temp_dir("bird_typefix_json_latin1");
  const fs::path file = dir / std::string("r\xe9seau.conf");
  write_all(file, "function a() { return 1; }\n");

  const auto files = BatchRunner::collect_files(dir, ToolConfig{});
  ASSERT_TRUE(files.success) << files.error;
  ASSERT_EQ(files.files.size(), 1U);

  RunOptions options;
  const auto result = BatchRunner::run(files.files, options);
  std::string text;
  EXPECT_NO_THROW(text = bird_typefix::dump_json(bird_typefix::batch_to_json(result)));
  EXPECT_NE(text.find("r\xef\xbf\xbdseau.conf"), std::string::npos);
  EXPECT_NE(text.find("\"exit_code\": 0"), std::string::npos);

  fs::remove_all(dir);
}

// ============================================================================
// Worker pool
// ============================================================================

TEST(DriverWorkerPool, VisitsEveryIndexOnce)
{
  std::vector<int> hits(100, 0);
  bird_typefix::parallel_for(hits.size(), 8, [&](size_t i) { hits[i] += 1; });
  for (const int h : hits) {
    EXPECT_EQ(h, 1);
  }
}

TEST(DriverWorkerPool, WorkerCountIsBounded)
{
  EXPECT_EQ(bird_typefix::worker_count(3, 8), 3U);
  EXPECT_EQ(bird_typefix::worker_count(10, 2), 2U);
  EXPECT_GE(bird_typefix::worker_count(10, 0), 1U);
  EXPECT_EQ(bird_typefix::worker_count(0, 4), 1U);
}

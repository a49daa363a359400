// test_cli.cpp - End-to-end tests of the bird-typefix executable

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/wait.h>
#endif

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

std::string shell_quote(const std::string & s)
{
  // POSIX shell single-quote escaping.
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

/// Run the CLI with `args` (already quoted) under `env` assignments.
/// stdout goes to `stdout_file`, stderr to `stderr_file` (or is dropped).
int run_cli_with_env(
  const std::string & env, const std::string & args, const fs::path & stdout_file,
  const fs::path & stderr_file = fs::path())
{
#ifndef BIRD_TYPEFIX_CLI_PATH
  (void)env;
  (void)args;
  (void)stdout_file;
  (void)stderr_file;
  return 0;
#else
  const std::string cli = BIRD_TYPEFIX_CLI_PATH;
  const std::string err =
    stderr_file.empty() ? std::string("/dev/null") : shell_quote(stderr_file.string());
  const std::string cmd = "env " + env + " " + shell_quote(cli) + " " + args + " > " +
                          shell_quote(stdout_file.string()) + " 2>" + err;

  const int rc = std::system(cmd.c_str());

#if defined(__unix__) || defined(__APPLE__)
  if (rc == -1) {
    return 127;
  }
  if (WIFEXITED(rc)) {
    return WEXITSTATUS(rc);
  }
  return 128;
#else
  // Best-effort fallback.
  return rc;
#endif
#endif
}

/// English messages regardless of the test runner's locale.
int run_cli(const std::string & args, const fs::path & stdout_file)
{
  return run_cli_with_env("LANG=C LC_ALL=C LC_MESSAGES=C", args, stdout_file);
}

}  // namespace

#ifndef BIRD_TYPEFIX_CLI_PATH
#define SKIP_WITHOUT_CLI() \
  GTEST_SKIP() << "BIRD_TYPEFIX_CLI_PATH is not configured (bird-typefix target missing?)"
#else
#define SKIP_WITHOUT_CLI() (void)0
#endif

TEST(CliTest, NoArgumentsShowsHelp)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("bird_typefix_cli_help");
  EXPECT_EQ(run_cli("", dir / "out.txt"), 0);
  fs::remove_all(dir);
}

TEST(CliTest, UnknownOptionFails)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("bird_typefix_cli_badopt");
  write_all(dir / "a.conf", "");
  EXPECT_EQ(run_cli("--frobnicate " + shell_quote((dir / "a.conf").string()), dir / "out.txt"), 1);
  fs::remove_all(dir);
}

TEST(CliTest, MissingPathFails)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("bird_typefix_cli_missing");
  EXPECT_EQ(run_cli(shell_quote((dir / "nope.conf").string()), dir / "out.txt"), 1);
  fs::remove_all(dir);
}

TEST(CliTest, PrintsRewrittenFile)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("bird_typefix_cli_print");
  const fs::path conf = dir / "bird.conf";
  const std::string original =
    "function test_int() {\n    return 42;\n}\n\nfunction test_bool() {\n    return true;\n}\n";
  write_all(conf, original);

  EXPECT_EQ(run_cli(shell_quote(conf.string()), dir / "out.txt"), 0);
  EXPECT_EQ(
    read_all(dir / "out.txt"),
    "function test_int() -> int {\n    return 42;\n}\n\n"
    "function test_bool() -> bool {\n    return true;\n}\n");
  EXPECT_EQ(read_all(conf), original);

  fs::remove_all(dir);
}

TEST(CliTest, InPlaceWithBackup)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("bird_typefix_cli_inplace");
  const fs::path conf = dir / "bird.conf";
  write_all(conf, "function p() { return 10.0.0.0/8; }\n");

  EXPECT_EQ(
    run_cli("-i -b .bak " + shell_quote(conf.string()), dir / "out.txt"), 0);
  EXPECT_EQ(read_all(conf), "function p() -> prefix { return 10.0.0.0/8; }\n");
  EXPECT_EQ(read_all(dir / "bird.conf.bak"), "function p() { return 10.0.0.0/8; }\n");
  EXPECT_EQ(read_all(dir / "out.txt"), "");

  fs::remove_all(dir);
}

TEST(CliTest, DirectoryOutputHasFileHeaders)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("bird_typefix_cli_dir");
  fs::create_directories(dir / "in");
  write_all(dir / "in" / "one.conf", "function a() { return 1; }");
  write_all(dir / "in" / "two.conf", "function b() { return \"x\"; }");
  write_all(dir / "in" / "skip.txt", "function c() { return 1; }");

  EXPECT_EQ(run_cli(shell_quote((dir / "in").string()), dir / "out.txt"), 0);
  const std::string out = read_all(dir / "out.txt");
  EXPECT_NE(out.find("# === File: "), std::string::npos);
  EXPECT_NE(out.find("function a() -> int { return 1; }"), std::string::npos);
  EXPECT_NE(out.find("function b() -> string { return \"x\"; }"), std::string::npos);
  EXPECT_EQ(out.find("function c()"), std::string::npos);

  fs::remove_all(dir);
}

TEST(CliTest, SkippedFunctionsExitWithTwo)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("bird_typefix_cli_skip");
  const fs::path conf = dir / "bird.conf";
  write_all(conf, "function f(int x) { if x > 0 then return 1; return false; }\n");

  EXPECT_EQ(run_cli(shell_quote(conf.string()), dir / "out.txt"), 2);
  EXPECT_EQ(read_all(dir / "out.txt"), read_all(conf));

  fs::remove_all(dir);
}

TEST(CliTest, MalformedDeclarationExitsWithOne)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("bird_typefix_cli_malformed");
  const fs::path conf = dir / "bird.conf";
  write_all(conf, "function { return 1; }\nfunction ok() { return 2; }\n");

  EXPECT_EQ(run_cli(shell_quote(conf.string()), dir / "out.txt"), 1);
  // The well-formed function is still annotated.
  EXPECT_NE(read_all(dir / "out.txt").find("function ok() -> int"), std::string::npos);

  fs::remove_all(dir);
}

TEST(CliTest, JsonReport)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("bird_typefix_cli_json");
  const fs::path conf = dir / "bird.conf";
  write_all(conf, "function a() { return 1; }\n");

  EXPECT_EQ(run_cli("--report json " + shell_quote(conf.string()), dir / "out.txt"), 0);
  const std::string out = read_all(dir / "out.txt");
  EXPECT_NE(out.find("\"exit_code\": 0"), std::string::npos);
  EXPECT_NE(out.find("\"type\": \"int\""), std::string::npos);
  EXPECT_EQ(read_all(conf), "function a() { return 1; }\n");

  fs::remove_all(dir);
}

TEST(CliTest, HelpIsEnglishByDefault)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("bird_typefix_cli_help_en");
  EXPECT_EQ(
    run_cli_with_env("LANG=C LC_ALL=C LC_MESSAGES=C", "--help", dir / "out.txt", dir / "err.txt"),
    0);
  const std::string err = read_all(dir / "err.txt");
  EXPECT_NE(err.find("Supported types:"), std::string::npos);
  EXPECT_NE(err.find("pair (int, int)"), std::string::npos);
  EXPECT_NE(err.find("Note: Void functions remain unchanged"), std::string::npos);
  fs::remove_all(dir);
}

TEST(CliTest, HelpFollowsChineseLocale)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("bird_typefix_cli_help_zh");
  EXPECT_EQ(
    run_cli_with_env("LANG=zh_CN.UTF-8 LC_ALL= LC_MESSAGES=", "--help", dir / "out.txt",
                     dir / "err.txt"),
    0);
  const std::string err = read_all(dir / "err.txt");
  EXPECT_NE(err.find("用法"), std::string::npos);
  EXPECT_NE(err.find("支持类型:"), std::string::npos);
  EXPECT_NE(err.find("注: 无返回值函数将保持不变"), std::string::npos);
  EXPECT_NE(err.find("  int:     return 1;"), std::string::npos);
  EXPECT_EQ(err.find("Supported types"), std::string::npos);
  fs::remove_all(dir);
}

TEST(CliTest, ErrorsFollowChineseLocale)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("bird_typefix_cli_error_zh");
  const std::string missing = (dir / "nope.conf").string();
  EXPECT_EQ(
    run_cli_with_env("LC_ALL=zh_CN.UTF-8", shell_quote(missing), dir / "out.txt", dir / "err.txt"),
    1);
  EXPECT_NE(
    read_all(dir / "err.txt").find("错误: 路径 '" + missing + "' 不存在"), std::string::npos);
  fs::remove_all(dir);
}

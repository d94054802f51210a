// Child process runner unit tests

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "smart_cut/process.hpp"

namespace smart_cut {
namespace {

constexpr auto kGenerous = std::chrono::seconds(10);

TEST(RunProcessTest, CapturesStdout) {
  auto res = run_process("echo", {"hello", "world"}, kGenerous);
  EXPECT_TRUE(res.ok());
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_EQ(res.stdout_text, "hello world\n");
  EXPECT_TRUE(res.stderr_text.empty());
}

TEST(RunProcessTest, CapturesStderrAndExitCode) {
  auto res = run_process("sh", {"-c", "echo boom >&2; exit 3"}, kGenerous);
  EXPECT_FALSE(res.ok());
  EXPECT_FALSE(res.timed_out);
  EXPECT_FALSE(res.spawn_failed);
  EXPECT_EQ(res.exit_code, 3);
  EXPECT_EQ(res.stderr_text, "boom\n");
}

TEST(RunProcessTest, ArgumentsAreNotShellExpanded) {
  auto res = run_process("echo", {"$HOME; ls"}, kGenerous);
  EXPECT_EQ(res.stdout_text, "$HOME; ls\n");
}

TEST(RunProcessTest, LargeOutputDoesNotDeadlock) {
  // Well past a pipe buffer on both streams
  auto res = run_process(
      "sh", {"-c", "head -c 200000 /dev/zero; head -c 200000 /dev/zero >&2"},
      kGenerous);
  EXPECT_TRUE(res.ok());
  EXPECT_EQ(res.stdout_text.size(), 200000u);
  EXPECT_EQ(res.stderr_text.size(), 200000u);
}

TEST(RunProcessTest, TimeoutKillsChild) {
  auto start = std::chrono::steady_clock::now();
  auto res = run_process("sleep", {"10"}, std::chrono::milliseconds(200));
  EXPECT_TRUE(res.timed_out);
  EXPECT_FALSE(res.ok());
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(RunProcessTest, TimeoutHoldsAfterChildClosesItsOutput) {
  auto start = std::chrono::steady_clock::now();
  auto res = run_process("sh", {"-c", "exec >&- 2>&-; sleep 10"},
                         std::chrono::milliseconds(300));
  EXPECT_TRUE(res.timed_out);
  EXPECT_FALSE(res.ok());
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(RunProcessTest, ChildExitingAfterClosingOutputIsReaped) {
  auto res = run_process("sh", {"-c", "exec >&- 2>&-; sleep 0.2; exit 4"},
                         kGenerous);
  EXPECT_FALSE(res.timed_out);
  EXPECT_EQ(res.exit_code, 4);
}

TEST(RunProcessTest, MissingProgramIsSpawnFailure) {
  auto res = run_process("/nonexistent/smart_cut/tool", {}, kGenerous);
  EXPECT_TRUE(res.spawn_failed);
  EXPECT_FALSE(res.ok());
  EXPECT_FALSE(res.error.empty());
}

TEST(RenderCommandLineTest, QuotesOnlyWhenNeeded) {
  EXPECT_EQ(render_command_line("ffmpeg", {"-i", "a.mp4"}), "ffmpeg -i a.mp4");
  EXPECT_EQ(render_command_line("ffmpeg", {"my file.mp4"}),
            "ffmpeg 'my file.mp4'");
  EXPECT_EQ(render_command_line("ffmpeg", {"it's"}), "ffmpeg 'it'\\''s'");
  EXPECT_EQ(render_command_line("ffmpeg", {""}), "ffmpeg ''");
}

} // namespace
} // namespace smart_cut

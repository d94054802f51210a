// Encode invocation synthesis unit tests

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <string>
#include <vector>

#include "smart_cut/encode_command.hpp"
#include "smart_cut/errors.hpp"

namespace smart_cut {
namespace {

bool HasPair(const std::vector<std::string> &args, const std::string &flag,
             const std::string &value) {
  for (size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag && args[i + 1] == value)
      return true;
  }
  return false;
}

bool Has(const std::vector<std::string> &args, const std::string &flag) {
  return std::find(args.begin(), args.end(), flag) != args.end();
}

// -----------------------------------------------------------------------------
// Single keep segment: seek + duration trim, re-encoded
// -----------------------------------------------------------------------------
TEST(EncodeInvocationTest, SingleSegmentIsDirectTrim) {
  EncodeProfile profile;
  auto inv = build_encode_invocation("/media/in.mp4", {{10, 90}},
                                     "/out/cut.mp4", profile);

  EXPECT_EQ(inv.mode, EncodeMode::SingleTrim);
  ASSERT_EQ(inv.segments.size(), 1u);
  EXPECT_TRUE(inv.graph.trims().empty());

  auto args = inv.args();
  EXPECT_TRUE(HasPair(args, "-ss", "10.000"));
  EXPECT_TRUE(HasPair(args, "-t", "80.000"));
  EXPECT_TRUE(HasPair(args, "-i", "/media/in.mp4"));
  EXPECT_TRUE(HasPair(args, "-c:v", "libx264"));
  EXPECT_TRUE(HasPair(args, "-preset", "fast"));
  EXPECT_TRUE(HasPair(args, "-crf", "23"));
  EXPECT_TRUE(HasPair(args, "-c:a", "aac"));
  EXPECT_TRUE(HasPair(args, "-b:a", "128k"));
  EXPECT_TRUE(HasPair(args, "-avoid_negative_ts", "make_zero"));
  EXPECT_TRUE(HasPair(args, "-movflags", "+faststart"));
  EXPECT_FALSE(Has(args, "-filter_complex"));
  EXPECT_FALSE(HasPair(args, "-c", "copy"));
  EXPECT_FALSE(Has(args, "-threads"));
  EXPECT_EQ(args.back(), "/out/cut.mp4");

  // -ss precedes -i (input seeking)
  auto ss = std::find(args.begin(), args.end(), "-ss");
  auto in = std::find(args.begin(), args.end(), "-i");
  EXPECT_TRUE(ss < in);
}

TEST(EncodeInvocationTest, SingleSegmentBelowEncodeFloorIsStillEncoded) {
  auto inv = build_encode_invocation("in.mp4", {{1.0, 1.2}}, "out.mp4", {});
  EXPECT_EQ(inv.mode, EncodeMode::SingleTrim);
  EXPECT_EQ(inv.segments.size(), 1u);
}

TEST(EncodeInvocationTest, ProfileThreadsAreForwarded) {
  EncodeProfile profile;
  profile.preset = "veryfast";
  profile.crf = 28;
  profile.audio_bitrate = "96k";
  profile.threads = 4;
  auto args =
      build_encode_invocation("in.mp4", {{0, 5}}, "out.mp4", profile).args();
  EXPECT_TRUE(HasPair(args, "-preset", "veryfast"));
  EXPECT_TRUE(HasPair(args, "-crf", "28"));
  EXPECT_TRUE(HasPair(args, "-b:a", "96k"));
  EXPECT_TRUE(HasPair(args, "-threads", "4"));
}

// -----------------------------------------------------------------------------
// Several keep segments: trim/atrim pairs feeding two concats
// -----------------------------------------------------------------------------
TEST(EncodeInvocationTest, MultiSegmentBuildsConcatGraph) {
  auto inv = build_encode_invocation("in.mp4", {{30, 100}, {0, 10}},
                                     "out.mp4", {});
  EXPECT_EQ(inv.mode, EncodeMode::Concat);
  ASSERT_EQ(inv.segments.size(), 2u);
  // Sorted by start before lowering
  EXPECT_EQ(inv.segments[0], (Segment{0, 10}));
  EXPECT_EQ(inv.segments[1], (Segment{30, 100}));

  const std::string expected =
      "[0:v]trim=start=0.000:end=10.000,setpts=PTS-STARTPTS[v0];"
      "[0:a]atrim=start=0.000:end=10.000,asetpts=PTS-STARTPTS[a0];"
      "[0:v]trim=start=30.000:end=100.000,setpts=PTS-STARTPTS[v1];"
      "[0:a]atrim=start=30.000:end=100.000,asetpts=PTS-STARTPTS[a1];"
      "[v0][v1]concat=n=2:v=1:a=0[outv];"
      "[a0][a1]concat=n=2:v=0:a=1[outa]";
  EXPECT_EQ(inv.graph.lower(), expected);

  auto args = inv.args();
  EXPECT_TRUE(HasPair(args, "-filter_complex", expected));
  EXPECT_TRUE(HasPair(args, "-map", "[outv]"));
  EXPECT_TRUE(HasPair(args, "-map", "[outa]"));
  EXPECT_EQ(std::count(args.begin(), args.end(), "-map"), 2);
  EXPECT_FALSE(Has(args, "-ss"));
  EXPECT_EQ(args.back(), "out.mp4");
}

TEST(EncodeInvocationTest, SegmentsBelowEncodeFloorAreSkipped) {
  auto inv = build_encode_invocation(
      "in.mp4", {{0, 5}, {6, 6.2}, {8, 10}}, "out.mp4", {});
  ASSERT_EQ(inv.segments.size(), 2u);
  EXPECT_EQ(inv.segments[0], (Segment{0, 5}));
  EXPECT_EQ(inv.segments[1], (Segment{8, 10}));
  EXPECT_EQ(inv.graph.trims().size(), 4u);
  ASSERT_EQ(inv.graph.concats().size(), 2u);
  EXPECT_EQ(inv.graph.concats()[0].inputs.size(), 2u);
}

TEST(EncodeInvocationTest, AllSegmentsBelowFloorFail) {
  EXPECT_THROW(build_encode_invocation("in.mp4", {{0, 0.2}, {5, 5.25}},
                                       "out.mp4", {}),
               NoValidSegmentsError);
}

TEST(EncodeInvocationTest, EmptyKeepSetFails) {
  EXPECT_THROW(build_encode_invocation("in.mp4", {}, "out.mp4", {}),
               NoValidSegmentsError);
}

TEST(EncodeInvocationTest, CommandLineQuotesPaths) {
  auto inv = build_encode_invocation("/media/my clip.mp4", {{1, 2}},
                                     "/out/x.mp4", {});
  std::string cmd = inv.command_line("ffmpeg");
  EXPECT_EQ(cmd.rfind("ffmpeg ", 0), 0u);
  EXPECT_NE(cmd.find("'/media/my clip.mp4'"), std::string::npos);
}

// -----------------------------------------------------------------------------
// Output naming
// -----------------------------------------------------------------------------
TEST(OutputPathTest, NameCarriesStemJobPrefixAndTimestamp) {
  std::tm tm{};
  tm.tm_year = 2024 - 1900;
  tm.tm_mon = 0;
  tm.tm_mday = 31;
  tm.tm_hour = 23;
  tm.tm_min = 59;
  tm.tm_sec = 58;
  tm.tm_isdst = -1;
  auto now = std::chrono::system_clock::from_time_t(std::mktime(&tm));

  std::string out = make_output_path("/tmp/smart_cut_in/lecture.mkv",
                                     "/tmp/smart_cut_out",
                                     "1a2b3c4d-0000-4000-8000-000000000000",
                                     now);
  EXPECT_EQ(out, "/tmp/smart_cut_out/lecture_1a2b3c4d_20240131_235958.mp4");
}

TEST(OutputPathTest, OutputDirectoryMustDifferFromInputDirectory) {
  EXPECT_THROW(make_output_path("/tmp/smart_cut_same/a.mp4",
                                "/tmp/smart_cut_same", "abcdefgh",
                                std::chrono::system_clock::now()),
               EncodeSetupError);
  EXPECT_THROW(make_output_path("/tmp/smart_cut_same/a.mp4",
                                "/tmp/smart_cut_same/", "abcdefgh",
                                std::chrono::system_clock::now()),
               EncodeSetupError);
}

TEST(FormatSecondsTest, MillisecondPrecision) {
  EXPECT_EQ(format_seconds(12.5), "12.500");
  EXPECT_EQ(format_seconds(0), "0.000");
  EXPECT_EQ(format_seconds(3.14159), "3.142");
}

} // namespace
} // namespace smart_cut

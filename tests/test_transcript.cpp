// Transcript and word-selection unit tests

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "smart_cut/errors.hpp"
#include "smart_cut/transcript.hpp"
#include "test_helpers.hpp"

namespace smart_cut {
namespace {

const char *kWords = R"([
  {"conf": 1.0, "end": 0.69, "start": 0.33, "word": "hello"},
  {"conf": 1.0, "end": 0.9, "start": 0.69, "word": "um"},
  {"conf": 0.9, "end": 1.23, "start": 0.9, "word": "uh"},
  {"conf": 1.0, "end": 2.0, "start": 1.5, "word": "world"},
  {"confidence": 0.5, "end": 3.0, "start": 2.2, "word": "again"}
])";

std::vector<TranscriptWord> Words() {
  return parse_transcript(nlohmann::json::parse(kWords));
}

TEST(ParseTranscriptTest, ReadsWordsAndConfidenceAliases) {
  auto words = Words();
  ASSERT_EQ(words.size(), 5u);
  EXPECT_EQ(words[0].word, "hello");
  EXPECT_DOUBLE_EQ(words[0].start, 0.33);
  EXPECT_DOUBLE_EQ(words[2].confidence, 0.9);
  EXPECT_DOUBLE_EQ(words[4].confidence, 0.5);
}

TEST(ParseTranscriptTest, WrappedFormAndBadWords) {
  auto words = parse_transcript(nlohmann::json::parse(
      R"({"words": [{"word": "a", "start": 0, "end": 1}]})"));
  ASSERT_EQ(words.size(), 1u);
  EXPECT_DOUBLE_EQ(words[0].confidence, 1.0);

  EXPECT_THROW(parse_transcript(nlohmann::json::parse(R"([{"word": "a"}])")),
               ValidationError);
  EXPECT_THROW(parse_transcript(nlohmann::json::parse(R"({"text": "a"})")),
               ValidationError);
}

// -----------------------------------------------------------------------------
// Selection -> delete ranges
// -----------------------------------------------------------------------------
TEST(DeleteSegmentsForWordsTest, ConsecutiveWordsFormOneRange) {
  auto segs = delete_segments_for_words(Words(), {2, 1});
  ASSERT_EQ(segs.size(), 1u);
  EXPECT_DOUBLE_EQ(*segs[0].start, 0.69);
  EXPECT_DOUBLE_EQ(*segs[0].end, 1.23);
}

TEST(DeleteSegmentsForWordsTest, GapsSplitRangesAndDuplicatesCollapse) {
  auto segs = delete_segments_for_words(Words(), {4, 0, 1, 1, 4});
  ASSERT_EQ(segs.size(), 2u);
  EXPECT_DOUBLE_EQ(*segs[0].start, 0.33);
  EXPECT_DOUBLE_EQ(*segs[0].end, 0.9);
  EXPECT_DOUBLE_EQ(*segs[1].start, 2.2);
  EXPECT_DOUBLE_EQ(*segs[1].end, 3.0);
}

TEST(DeleteSegmentsForWordsTest, BadSelections) {
  try {
    delete_segments_for_words(Words(), {1, 5});
    FAIL() << "expected ValidationError";
  } catch (const ValidationError &e) {
    EXPECT_EQ(e.rule(), ValidationRule::BadSelection);
  }
  EXPECT_THROW(delete_segments_for_words(Words(), {}), ValidationError);
}

TEST(ParseWordSelectionTest, ListsAndRanges) {
  EXPECT_EQ(parse_word_selection("3", 20), (std::vector<std::size_t>{3}));
  EXPECT_EQ(parse_word_selection("3,7-9,12", 20),
            (std::vector<std::size_t>{3, 7, 8, 9, 12}));
  for (const char *bad : {"", "1,", "a", "4-2", "1--2", "-3"}) {
    EXPECT_THROW(parse_word_selection(bad, 20), ValidationError) << bad;
  }
}

TEST(ParseWordSelectionTest, IndicesPastTranscriptRejectedBeforeExpansion) {
  EXPECT_EQ(parse_word_selection("0-4", 5),
            (std::vector<std::size_t>{0, 1, 2, 3, 4}));
  for (const char *bad : {"5", "0-5", "0-4000000000", "0-18446744073709551615",
                          "99999999999999999999999"}) {
    try {
      parse_word_selection(bad, 5);
      FAIL() << "expected ValidationError for " << bad;
    } catch (const ValidationError &e) {
      EXPECT_EQ(e.rule(), ValidationRule::BadSelection) << bad;
    }
  }
  EXPECT_THROW(parse_word_selection("0", 0), ValidationError);
}

// -----------------------------------------------------------------------------
// JsonTranscriptSource
// -----------------------------------------------------------------------------
TEST(JsonTranscriptSourceTest, SidecarAndExplicitPath) {
  testing_util::TempDir dir("transcript");
  const std::string media = (dir.path() / "talk.mp4").string();
  dir.file("talk.mp4.words.json", kWords);
  auto other = dir.file("other.json", R"([{"word":"x","start":0,"end":1}])");

  EXPECT_EQ(JsonTranscriptSource::sidecar_path(media), media + ".words.json");
  EXPECT_EQ(JsonTranscriptSource().transcribe(media).size(), 5u);
  EXPECT_EQ(JsonTranscriptSource(other).transcribe(media).size(), 1u);
  EXPECT_THROW(JsonTranscriptSource().transcribe(media + ".missing"),
               FileNotFoundError);
}

} // namespace
} // namespace smart_cut

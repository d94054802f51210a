/**
 * @file transcript.hpp
 * @brief Transcript words and word-selection cuts
 *
 * @details A transcript is a list of timed words. Selecting words in an
 *          editor and deleting them is the same as deleting the time ranges
 *          they cover; delete_segments_for_words() performs that conversion.
 *
 *          Persisted transcripts are JSON arrays of
 *          {"word", "start", "end", "conf"} objects, optionally wrapped in
 *          {"words": [...]}. A transcript for media.mp4 is looked up next to
 *          it as media.mp4.words.json unless a path is given.
 */

#ifndef SMART_CUT_TRANSCRIPT_HPP
#define SMART_CUT_TRANSCRIPT_HPP

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace smart_cut {

struct TranscriptWord {
  std::string word;
  double start = 0;
  double end = 0;
  double confidence = 1.0;
};

/**
 * @class TranscriptSource
 * @brief Produces the timed words of a media file.
 */
class TranscriptSource {
public:
  virtual ~TranscriptSource() = default;

  virtual std::vector<TranscriptWord>
  transcribe(const std::string &media_path) = 0;
};

/**
 * @class JsonTranscriptSource
 * @brief Reads an already computed transcript from disk.
 */
class JsonTranscriptSource : public TranscriptSource {
public:
  /// @param transcript_path Explicit file; empty = "<media>.words.json"
  explicit JsonTranscriptSource(std::string transcript_path = "");

  /**
   * @throws FileNotFoundError when the transcript file cannot be opened
   * @throws ValidationError (Malformed) on invalid content
   */
  std::vector<TranscriptWord>
  transcribe(const std::string &media_path) override;

  static std::string sidecar_path(const std::string &media_path);

private:
  std::string transcript_path_;
};

/**
 * @brief Decode transcript words ("confidence" is accepted for "conf").
 * @throws ValidationError (Malformed)
 */
std::vector<TranscriptWord> parse_transcript(const nlohmann::json &j);

/**
 * @brief Time ranges covered by the selected words.
 *
 * @param words Transcript, in time order
 * @param indices Selected word indices (0-based, any order, duplicates
 *        ignored)
 * @return One range per run of consecutive indices, from the first word's
 *         start to the last word's end
 * @throws ValidationError (BadSelection) for an empty selection or an index
 *         past the end of the transcript
 */
std::vector<SegmentInput>
delete_segments_for_words(const std::vector<TranscriptWord> &words,
                          std::vector<std::size_t> indices);

/**
 * @brief Parse a selection such as "3,7-9,12" into indices.
 *
 * @param text Comma-separated indices and inclusive ranges
 * @param word_count Transcript length; every index must be below it
 * @throws ValidationError (BadSelection) on malformed text or an index out of
 *         range, checked before any range is expanded
 */
std::vector<std::size_t> parse_word_selection(const std::string &text,
                                              std::size_t word_count);

} // namespace smart_cut

#endif // SMART_CUT_TRANSCRIPT_HPP

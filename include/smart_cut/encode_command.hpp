/**
 * @file encode_command.hpp
 * @brief Synthesis of ffmpeg invocations from keep segments
 *
 * @details Two shapes of invocation:
 *
 *          - Single keep segment: seek + duration trim of the input,
 *            re-encoded (never stream-copied, so cuts are frame accurate)
 *
 *          - Several keep segments: one trim/atrim pair per segment feeding a
 *            video concat and an audio concat; only the two concat outputs
 *            are mapped
 *
 *          The filter graph is held as typed stage descriptors and lowered to
 *          the -filter_complex string only when args() is called.
 */

#ifndef SMART_CUT_ENCODE_COMMAND_HPP
#define SMART_CUT_ENCODE_COMMAND_HPP

#include <chrono>
#include <string>
#include <vector>

#include "types.hpp"

namespace smart_cut {

/**
 * @struct EncodeProfile
 * @brief Fixed quality settings shared by every re-encode.
 */
struct EncodeProfile {
  std::string preset = "fast";
  int crf = 23;
  std::string audio_bitrate = "128k";
  int threads = 0; //< 0 = let the encoder decide
};

enum class StreamKind { Video, Audio };

/**
 * @struct TrimStage
 * @brief Cut [start, end] out of input 0 and restart its timestamps at zero.
 */
struct TrimStage {
  StreamKind kind;
  double start;
  double end;
  std::string output; //< Output pad label, without brackets
};

/**
 * @struct ConcatStage
 * @brief Join labelled streams of one kind, in order.
 */
struct ConcatStage {
  StreamKind kind;
  std::vector<std::string> inputs; //< Input pad labels, in join order
  std::string output;
};

/**
 * @class FilterGraph
 * @brief Ordered list of filter stages, lowered to ffmpeg syntax on demand.
 */
class FilterGraph {
public:
  void add_trim(TrimStage stage);
  void add_concat(ConcatStage stage);

  const std::vector<TrimStage> &trims() const { return trims_; }
  const std::vector<ConcatStage> &concats() const { return concats_; }

  /// Labels of the concat outputs, i.e. the streams to map
  std::vector<std::string> mapped_outputs() const;

  /**
   * @brief Render the -filter_complex argument.
   * @note Trims first, in insertion order, then concats.
   */
  std::string lower() const;

private:
  std::vector<TrimStage> trims_;
  std::vector<ConcatStage> concats_;
};

enum class EncodeMode { SingleTrim, Concat };

/**
 * @class EncodeInvocation
 * @brief Everything needed to run one encode, independent of ffmpeg syntax
 *        until args() is called.
 */
class EncodeInvocation {
public:
  EncodeMode mode = EncodeMode::SingleTrim;
  std::string input_path;
  std::string output_path;
  std::vector<Segment> segments; //< Segments actually encoded, ascending
  FilterGraph graph;             //< Empty in SingleTrim mode
  EncodeProfile profile;

  /// ffmpeg arguments, excluding the program name
  std::vector<std::string> args() const;

  /// Printable command line for logs
  std::string command_line(const std::string &program) const;
};

/**
 * @brief Build the encode for a set of keep segments.
 *
 * @param input_path Source media
 * @param keep Keep segments (any order; they are sorted by start)
 * @param output_path Destination file
 * @param profile Quality settings
 * @throws NoValidSegmentsError when nothing is left to encode, i.e. keep is
 *         empty or, with several segments, all fall below
 *         MIN_ENCODE_SEGMENT_DURATION
 */
EncodeInvocation build_encode_invocation(const std::string &input_path,
                                         std::vector<Segment> keep,
                                         const std::string &output_path,
                                         const EncodeProfile &profile);

/**
 * @brief Output file name for a job.
 *
 * @return <output_dir>/<input stem>_<job id prefix>_<YYYYmmdd_HHMMSS>.mp4
 * @throws EncodeSetupError when output_dir is the input's own directory
 */
std::string make_output_path(const std::string &input_path,
                             const std::string &output_dir,
                             const std::string &job_id,
                             std::chrono::system_clock::time_point now);

/// Seconds with millisecond precision, as passed to ffmpeg ("12.500")
std::string format_seconds(double seconds);

} // namespace smart_cut

#endif // SMART_CUT_ENCODE_COMMAND_HPP

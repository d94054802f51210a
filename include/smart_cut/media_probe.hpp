/**
 * @file media_probe.hpp
 * @brief Media duration probing
 *
 * @details MediaProber is the seam between the job worker and whatever tool
 *          inspects media files. Two backends:
 *
 *          - FfprobeProber: runs the external ffprobe binary (default)
 *
 *          - LibavProber: opens the file in-process with libavformat
 *
 *          Both fail with ProbeError, whose kind() tells a timeout from a
 *          tool failure from unusable output.
 */

#ifndef SMART_CUT_MEDIA_PROBE_HPP
#define SMART_CUT_MEDIA_PROBE_HPP

#include <chrono>
#include <memory>
#include <string>

namespace smart_cut {

/**
 * @class MediaProber
 * @brief Returns the duration of a media file in seconds.
 */
class MediaProber {
public:
  virtual ~MediaProber() = default;

  /**
   * @brief Probe the total duration of a media file.
   *
   * @param path Media file path
   * @param timeout Upper bound on the probe
   * @return Duration in seconds (finite, > 0)
   * @throws ProbeError
   */
  virtual double probe_duration(const std::string &path,
                                std::chrono::milliseconds timeout) = 0;
};

/**
 * @class FfprobeProber
 * @brief Runs `ffprobe -show_entries format=duration` and parses its output.
 */
class FfprobeProber : public MediaProber {
public:
  explicit FfprobeProber(std::string ffprobe_path = "ffprobe");

  double probe_duration(const std::string &path,
                        std::chrono::milliseconds timeout) override;

private:
  std::string ffprobe_path_;
};

/**
 * @class LibavProber
 * @brief Reads the container duration with libavformat.
 *
 * @attention The timeout is enforced through the AVIO interrupt callback, so
 *            it bounds blocking reads inside libavformat, not CPU time.
 */
class LibavProber : public MediaProber {
public:
  LibavProber();

  double probe_duration(const std::string &path,
                        std::chrono::milliseconds timeout) override;
};

/**
 * @brief Parse the single numeric field printed by ffprobe.
 * @throws ProbeError (ParseError) unless the text is a finite positive number
 */
double parse_duration(const std::string &text);

/**
 * @brief Build the prober named by backend ("ffprobe" or "libav").
 * @throws ConfigError for an unknown backend
 */
std::unique_ptr<MediaProber> make_prober(const std::string &backend,
                                         const std::string &ffprobe_path);

} // namespace smart_cut

#endif // SMART_CUT_MEDIA_PROBE_HPP

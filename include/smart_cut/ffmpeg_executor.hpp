/**
 * @file ffmpeg_executor.hpp
 * @brief FFmpeg execution for cut operations
 *
 * @details Separate module for running encode invocations. Split in two:
 *
 *          - EncodeRunner: the process boundary (runs the tool, reports the
 *            raw outcome). Tests substitute a fake.
 *
 *          - execute_ffmpeg_cut(): maps the outcome onto the encode error
 *            taxonomy and checks the output file.
 */

#ifndef SMART_CUT_FFMPEG_EXECUTOR_HPP
#define SMART_CUT_FFMPEG_EXECUTOR_HPP

#include <chrono>
#include <string>

#include "encode_command.hpp"
#include "process.hpp"

namespace smart_cut {

/**
 * @class EncodeRunner
 * @brief Runs one encode invocation to completion or timeout.
 */
class EncodeRunner {
public:
  virtual ~EncodeRunner() = default;

  virtual ProcessResult run(const EncodeInvocation &invocation,
                            std::chrono::milliseconds timeout) = 0;
};

/**
 * @class FfmpegRunner
 * @brief EncodeRunner backed by the ffmpeg binary.
 */
class FfmpegRunner : public EncodeRunner {
public:
  explicit FfmpegRunner(std::string ffmpeg_path = "ffmpeg");

  ProcessResult run(const EncodeInvocation &invocation,
                    std::chrono::milliseconds timeout) override;

  const std::string &program() const { return ffmpeg_path_; }

private:
  std::string ffmpeg_path_;
};

/**
 * @brief Execute an encode and verify it produced a file.
 *
 * @param runner Process boundary
 * @param invocation The encode to run
 * @param timeout Bound on the encode
 * @param job_id Job ID for logging (empty = no prefix)
 * @throws EncodeTimeoutError when the encoder was killed on timeout
 * @throws EncodeError on spawn failure or non-zero exit (stderr attached)
 * @throws OutputMissingError when the encoder exited 0 but the output file is
 *         absent or empty
 */
void execute_ffmpeg_cut(EncodeRunner &runner,
                        const EncodeInvocation &invocation,
                        std::chrono::milliseconds timeout,
                        const std::string &job_id = "");

} // namespace smart_cut

#endif // SMART_CUT_FFMPEG_EXECUTOR_HPP

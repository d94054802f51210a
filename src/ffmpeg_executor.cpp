/**
 * @file ffmpeg_executor.cpp
 * @brief FFmpeg execution implementation
 */

#include "smart_cut/ffmpeg_executor.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "smart_cut/errors.hpp"
#include "smart_cut/logging.hpp"

namespace smart_cut {

namespace fs = std::filesystem;

FfmpegRunner::FfmpegRunner(std::string ffmpeg_path)
    : ffmpeg_path_(std::move(ffmpeg_path)) {}

ProcessResult FfmpegRunner::run(const EncodeInvocation &invocation,
                                std::chrono::milliseconds timeout) {
  return run_process(ffmpeg_path_, invocation.args(), timeout);
}

void execute_ffmpeg_cut(EncodeRunner &runner,
                        const EncodeInvocation &invocation,
                        std::chrono::milliseconds timeout,
                        const std::string &job_id) {
  const std::string prefix = job_id.empty() ? "" : job_tag(job_id) + " ";
  const std::string out_name =
      fs::path(invocation.output_path).filename().string();

  LOG_INFO("{}[FFmpeg] Encoding {} segment(s) -> {}", prefix,
           invocation.segments.size(), out_name);

  ProcessResult res = runner.run(invocation, timeout);

  if (res.timed_out) {
    LOG_ERROR("{}FFmpeg killed after {}s", prefix, timeout.count() / 1000);
    throw EncodeTimeoutError(
        fmt::format("Encoding timed out after {}s", timeout.count() / 1000));
  }
  if (res.spawn_failed) {
    LOG_ERROR("{}Failed to start FFmpeg: {}", prefix, res.error);
    throw EncodeError(fmt::format("Failed to start encoder: {}", res.error),
                      -1, res.error);
  }
  if (res.exit_code != 0) {
    LOG_ERROR("{}FFmpeg exited with error code: {}", prefix, res.exit_code);
    throw EncodeError(fmt::format("FFmpeg error: {}", res.stderr_text),
                      res.exit_code, res.stderr_text);
  }

  std::error_code ec;
  const bool exists = fs::exists(invocation.output_path, ec);
  const auto size = exists ? fs::file_size(invocation.output_path, ec) : 0;
  if (!exists || ec || size == 0) {
    LOG_ERROR("{}FFmpeg exited cleanly but produced no output: {}", prefix,
              invocation.output_path);
    throw OutputMissingError(fmt::format("Output file was not created: {}",
                                         invocation.output_path));
  }

  LOG_SUCCESS("{}Output saved to: {}", prefix, invocation.output_path);
}

} // namespace smart_cut

/**
 * @file media_probe.cpp
 * @brief Duration probing implementation
 */

#include "smart_cut/media_probe.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <utility>
#include <vector>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
}

#include <fmt/core.h>

#include "smart_cut/errors.hpp"
#include "smart_cut/process.hpp"

namespace smart_cut {

// **---- Parsing ----**

double parse_duration(const std::string &text) {
  /// Trim surrounding whitespace (ffprobe ends the value with a newline)
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
    --end;
  std::string value = text.substr(begin, end - begin);

  if (value.empty()) {
    throw ProbeError("Duration probe returned no output",
                     ProbeFailure::ParseError);
  }

  errno = 0;
  char *parse_end = nullptr;
  double duration = std::strtod(value.c_str(), &parse_end);
  if (errno != 0 || parse_end != value.c_str() + value.size()) {
    throw ProbeError(fmt::format("Unparsable duration: '{}'", value),
                     ProbeFailure::ParseError);
  }
  if (!std::isfinite(duration) || duration <= 0) {
    throw ProbeError(fmt::format("Invalid duration: {}", value),
                     ProbeFailure::ParseError);
  }
  return duration;
}

// **---- ffprobe ----**

FfprobeProber::FfprobeProber(std::string ffprobe_path)
    : ffprobe_path_(std::move(ffprobe_path)) {}

double FfprobeProber::probe_duration(const std::string &path,
                                     std::chrono::milliseconds timeout) {
  const std::vector<std::string> args = {
      "-v", "error", "-show_entries", "format=duration",
      "-of", "default=noprint_wrappers=1:nokey=1", path};

  ProcessResult res = run_process(ffprobe_path_, args, timeout);

  if (res.timed_out) {
    throw ProbeError(fmt::format("Duration probe timed out after {}s: {}",
                                 timeout.count() / 1000, path),
                     ProbeFailure::Timeout);
  }
  if (res.spawn_failed) {
    throw ProbeError(res.error, ProbeFailure::ToolFailure);
  }
  if (res.exit_code != 0) {
    throw ProbeError(fmt::format("ffprobe exited with code {}: {}",
                                 res.exit_code, res.stderr_text),
                     ProbeFailure::ToolFailure);
  }

  /// ffprobe prints "N/A" for streams without a container duration
  return parse_duration(res.stdout_text);
}

// **---- libavformat ----**

namespace {

using SteadyPoint = std::chrono::steady_clock::time_point;

/// AVIO interrupt callback: non-zero aborts the blocking call
int interrupt_on_deadline(void *opaque) {
  const auto *deadline = static_cast<const SteadyPoint *>(opaque);
  return std::chrono::steady_clock::now() >= *deadline ? 1 : 0;
}

std::string av_error_string(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

/// Longest stream duration, used when the container reports none
double longest_stream_duration(const AVFormatContext *fmt_ctx) {
  double best = 0.0;
  for (unsigned i = 0; i < fmt_ctx->nb_streams; ++i) {
    const AVStream *st = fmt_ctx->streams[i];
    if (st->duration == AV_NOPTS_VALUE)
      continue;
    double d = st->duration * av_q2d(st->time_base);
    if (d > best)
      best = d;
  }
  return best;
}

} // anonymous namespace

LibavProber::LibavProber() { av_log_set_level(AV_LOG_ERROR); }

double LibavProber::probe_duration(const std::string &path,
                                   std::chrono::milliseconds timeout) {
  SteadyPoint deadline = std::chrono::steady_clock::now() + timeout;

  AVFormatContext *fmt_ctx = avformat_alloc_context();
  if (!fmt_ctx) {
    throw ProbeError("Failed to allocate AVFormatContext",
                     ProbeFailure::ToolFailure);
  }
  fmt_ctx->interrupt_callback.callback = interrupt_on_deadline;
  fmt_ctx->interrupt_callback.opaque = &deadline;

  /// On failure avformat_open_input frees the context itself
  int ret = avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    if (ret == AVERROR_EXIT) {
      throw ProbeError(fmt::format("Duration probe timed out: {}", path),
                       ProbeFailure::Timeout);
    }
    throw ProbeError(
        fmt::format("Failed to open {}: {}", path, av_error_string(ret)),
        ProbeFailure::ToolFailure);
  }

  ret = avformat_find_stream_info(fmt_ctx, nullptr);
  if (ret < 0) {
    avformat_close_input(&fmt_ctx);
    if (ret == AVERROR_EXIT) {
      throw ProbeError(fmt::format("Duration probe timed out: {}", path),
                       ProbeFailure::Timeout);
    }
    throw ProbeError(fmt::format("Failed to read stream info of {}: {}", path,
                                 av_error_string(ret)),
                     ProbeFailure::ToolFailure);
  }

  double duration = (fmt_ctx->duration != AV_NOPTS_VALUE)
                        ? fmt_ctx->duration / static_cast<double>(AV_TIME_BASE)
                        : longest_stream_duration(fmt_ctx);
  avformat_close_input(&fmt_ctx);

  if (!std::isfinite(duration) || duration <= 0) {
    throw ProbeError(fmt::format("No usable duration in {}", path),
                     ProbeFailure::ParseError);
  }
  return duration;
}

// **---- Factory ----**

std::unique_ptr<MediaProber> make_prober(const std::string &backend,
                                         const std::string &ffprobe_path) {
  if (backend == "ffprobe") {
    return std::make_unique<FfprobeProber>(ffprobe_path);
  }
  if (backend == "libav") {
    return std::make_unique<LibavProber>();
  }
  throw ConfigError(fmt::format(
      "Unknown PROBE_BACKEND '{}' (expected ffprobe or libav)", backend));
}

} // namespace smart_cut

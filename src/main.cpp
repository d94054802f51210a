/**
 * @file main.cpp
 * @brief Entry point for the Smart Cut command-line tool
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Delete ranges from the command line, a JSON file, or a
 *            transcript word selection
 *
 *          - Submitting one job and polling it to a terminal state
 *
 * @note Settings come from the environment (see config/smart_cut.env). The
 *       output directory must already exist and differ from the input's.
 */

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "smart_cut/config.hpp"
#include "smart_cut/cut_pipeline.hpp"
#include "smart_cut/errors.hpp"
#include "smart_cut/ffmpeg_executor.hpp"
#include "smart_cut/job_json.hpp"
#include "smart_cut/job_orchestrator.hpp"
#include "smart_cut/logging.hpp"
#include "smart_cut/media_probe.hpp"
#include "smart_cut/transcript.hpp"

using namespace smart_cut;

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(500);

void print_usage() {
  LOG_WARN("Usage: ./smart_cut <input> <start-end> [<start-end> ...]");
  LOG_WARN("       ./smart_cut <input> --segments <file.json>");
  LOG_WARN("       ./smart_cut <input> --words <i,j-k,...> "
           "[--transcript <file.json>]");
  LOG_WARN("Options: --json  print the final job record as JSON");
}

/// "12.5-20" -> {12.5, 20}
SegmentInput parse_range(const std::string &text) {
  const char *begin = text.c_str();
  char *mid = nullptr;
  errno = 0;
  double start = std::strtod(begin, &mid);
  if (mid == begin || *mid != '-' || errno != 0) {
    throw ValidationError(fmt::format("Invalid range '{}' (expected start-end)",
                                      text),
                          0, ValidationRule::Malformed);
  }
  char *end_ptr = nullptr;
  double end = std::strtod(mid + 1, &end_ptr);
  if (end_ptr == mid + 1 || *end_ptr != '\0' || errno != 0) {
    throw ValidationError(fmt::format("Invalid range '{}' (expected start-end)",
                                      text),
                          0, ValidationRule::Malformed);
  }
  return {start, end};
}

struct CliArgs {
  std::string input;
  std::vector<std::string> ranges;
  std::string segments_file;
  std::string word_selection;
  std::string transcript_file;
  bool json = false;
};

bool parse_args(int argc, char *argv[], CliArgs &args) {
  if (argc < 3)
    return false;
  args.input = argv[1];
  for (int i = 2; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--json") {
      args.json = true;
    } else if (a == "--segments" && i + 1 < argc) {
      args.segments_file = argv[++i];
    } else if (a == "--words" && i + 1 < argc) {
      args.word_selection = argv[++i];
    } else if (a == "--transcript" && i + 1 < argc) {
      args.transcript_file = argv[++i];
    } else if (a.rfind("--", 0) == 0) {
      return false;
    } else {
      args.ranges.push_back(a);
    }
  }
  const int sources = (!args.ranges.empty() ? 1 : 0) +
                      (!args.segments_file.empty() ? 1 : 0) +
                      (!args.word_selection.empty() ? 1 : 0);
  return sources == 1;
}

std::vector<SegmentInput> collect_deletes(const CliArgs &args) {
  if (!args.segments_file.empty()) {
    return load_segment_inputs(args.segments_file);
  }
  if (!args.word_selection.empty()) {
    JsonTranscriptSource source(args.transcript_file);
    std::vector<TranscriptWord> words = source.transcribe(args.input);
    LOG_INFO("Transcript: {} words", words.size());
    return delete_segments_for_words(
        words, parse_word_selection(args.word_selection, words.size()));
  }
  std::vector<SegmentInput> out;
  for (const auto &r : args.ranges)
    out.push_back(parse_range(r));
  return out;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  CliArgs args;
  if (!parse_args(argc, argv, args)) {
    print_usage();
    return 1;
  }

  try {
    std::vector<SegmentInput> deletes = collect_deletes(args);

    OrchestratorOptions options = OrchestratorOptions::from_config();
    auto prober = make_prober(Config::probe_backend(), Config::ffprobe_path());
    auto runner = std::make_unique<FfmpegRunner>(Config::ffmpeg_path());

    LOG_INFO("Smart Cut");
    LOG_INFO("Input: {}", args.input);
    LOG_INFO("Output directory: {}", options.pipeline.output_dir);
    LOG_INFO("Delete ranges: {}", deletes.size());

    JobOrchestrator orchestrator(options, std::move(prober), std::move(runner));
    const std::string job_id = orchestrator.submit(args.input, deletes);

    Job job = orchestrator.get_status(job_id);
    int last_progress = -1;
    while (true) {
      if (job.progress != last_progress) {
        LOG_INFO("{} Progress: {}%", job_tag(job_id), job.progress);
        last_progress = job.progress;
      }
      if (job.is_terminal())
        break;
      std::this_thread::sleep_for(POLL_INTERVAL);
      job = orchestrator.get_status(job_id);
    }

    /// With --json, stdout carries only the job record
    std::FILE *report = args.json ? stderr : stdout;
    if (job.status == JobStatus::Completed && job.result) {
      TimingCollector::print_summary(report);
      print_cut_summary(*job.result, report);
      TimingCollector::clear();
    } else {
      LOG_ERROR("{} {}", job_tag(job_id),
                job.error_message.value_or("Unknown error"));
    }

    if (args.json) {
      nlohmann::json j = job;
      fmt::print("{}\n", j.dump(2));
    }
    return job.status == JobStatus::Completed ? 0 : 1;

  } catch (const Error &e) {
    LOG_ERROR("{}", e.what());
    return 1;
  } catch (const std::exception &e) {
    LOG_ERROR("Unexpected error: {}", e.what());
    return 1;
  }
}

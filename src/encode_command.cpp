/**
 * @file encode_command.cpp
 * @brief ffmpeg invocation synthesis implementation
 */

#include "smart_cut/encode_command.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "smart_cut/errors.hpp"
#include "smart_cut/process.hpp"
#include "smart_cut/system.hpp"

namespace smart_cut {

namespace fs = std::filesystem;

// **---- Filter Graph ----**

void FilterGraph::add_trim(TrimStage stage) {
  trims_.push_back(std::move(stage));
}

void FilterGraph::add_concat(ConcatStage stage) {
  concats_.push_back(std::move(stage));
}

std::vector<std::string> FilterGraph::mapped_outputs() const {
  std::vector<std::string> out;
  out.reserve(concats_.size());
  for (const auto &c : concats_)
    out.push_back(c.output);
  return out;
}

std::string FilterGraph::lower() const {
  std::vector<std::string> chains;
  chains.reserve(trims_.size() + concats_.size());

  for (const auto &t : trims_) {
    if (t.kind == StreamKind::Video) {
      chains.push_back(
          fmt::format("[0:v]trim=start={}:end={},setpts=PTS-STARTPTS[{}]",
                      format_seconds(t.start), format_seconds(t.end),
                      t.output));
    } else {
      chains.push_back(
          fmt::format("[0:a]atrim=start={}:end={},asetpts=PTS-STARTPTS[{}]",
                      format_seconds(t.start), format_seconds(t.end),
                      t.output));
    }
  }

  for (const auto &c : concats_) {
    std::string inputs;
    for (const auto &label : c.inputs)
      inputs += fmt::format("[{}]", label);
    const bool video = c.kind == StreamKind::Video;
    chains.push_back(fmt::format("{}concat=n={}:v={}:a={}[{}]", inputs,
                                 c.inputs.size(), video ? 1 : 0,
                                 video ? 0 : 1, c.output));
  }

  std::string graph;
  for (size_t i = 0; i < chains.size(); ++i) {
    if (i > 0)
      graph += ';';
    graph += chains[i];
  }
  return graph;
}

// **---- Invocation ----**

std::vector<std::string> EncodeInvocation::args() const {
  std::vector<std::string> a = {"-y", "-hide_banner", "-nostdin", "-loglevel",
                                "error"};

  if (mode == EncodeMode::SingleTrim) {
    const Segment &s = segments.front();
    /// Input seeking is frame accurate when re-encoding
    a.insert(a.end(), {"-ss", format_seconds(s.start), "-i", input_path, "-t",
                       format_seconds(s.length())});
  } else {
    a.insert(a.end(), {"-i", input_path, "-filter_complex", graph.lower()});
    for (const auto &label : graph.mapped_outputs()) {
      a.push_back("-map");
      a.push_back(fmt::format("[{}]", label));
    }
  }

  a.insert(a.end(), {"-c:v", "libx264", "-preset", profile.preset, "-crf",
                     std::to_string(profile.crf), "-c:a", "aac", "-b:a",
                     profile.audio_bitrate});
  if (profile.threads > 0) {
    a.push_back("-threads");
    a.push_back(std::to_string(profile.threads));
  }
  if (mode == EncodeMode::SingleTrim) {
    a.push_back("-avoid_negative_ts");
    a.push_back("make_zero");
  }
  a.insert(a.end(), {"-movflags", "+faststart", output_path});
  return a;
}

std::string EncodeInvocation::command_line(const std::string &program) const {
  return render_command_line(program, args());
}

EncodeInvocation build_encode_invocation(const std::string &input_path,
                                         std::vector<Segment> keep,
                                         const std::string &output_path,
                                         const EncodeProfile &profile) {
  if (keep.empty()) {
    throw NoValidSegmentsError("No segments to encode");
  }

  std::sort(keep.begin(), keep.end(), [](const Segment &a, const Segment &b) {
    return a.start < b.start;
  });

  EncodeInvocation inv;
  inv.input_path = input_path;
  inv.output_path = output_path;
  inv.profile = profile;

  if (keep.size() == 1) {
    inv.mode = EncodeMode::SingleTrim;
    inv.segments = std::move(keep);
    return inv;
  }

  inv.mode = EncodeMode::Concat;
  for (const auto &s : keep) {
    if (s.length() >= MIN_ENCODE_SEGMENT_DURATION)
      inv.segments.push_back(s);
  }
  if (inv.segments.empty()) {
    throw NoValidSegmentsError(fmt::format(
        "No valid segments: all {} keep segments are shorter than {}s",
        keep.size(), MIN_ENCODE_SEGMENT_DURATION));
  }

  ConcatStage vconcat{StreamKind::Video, {}, "outv"};
  ConcatStage aconcat{StreamKind::Audio, {}, "outa"};
  for (size_t i = 0; i < inv.segments.size(); ++i) {
    const Segment &s = inv.segments[i];
    std::string v = fmt::format("v{}", i);
    std::string a = fmt::format("a{}", i);
    inv.graph.add_trim({StreamKind::Video, s.start, s.end, v});
    inv.graph.add_trim({StreamKind::Audio, s.start, s.end, a});
    vconcat.inputs.push_back(v);
    aconcat.inputs.push_back(a);
  }
  inv.graph.add_concat(std::move(vconcat));
  inv.graph.add_concat(std::move(aconcat));

  return inv;
}

// **---- Output Naming ----**

std::string make_output_path(const std::string &input_path,
                             const std::string &output_dir,
                             const std::string &job_id,
                             std::chrono::system_clock::time_point now) {
  fs::path input(input_path);
  fs::path out_dir(output_dir);

  std::error_code in_ec, out_ec;
  fs::path in_parent =
      fs::weakly_canonical(fs::absolute(input).parent_path(), in_ec);
  fs::path out_abs = fs::weakly_canonical(fs::absolute(out_dir), out_ec);
  if (out_abs.filename().empty())
    out_abs = out_abs.parent_path();
  if (!in_ec && !out_ec && in_parent == out_abs) {
    throw EncodeSetupError(
        fmt::format("Output directory {} must differ from the input directory",
                    output_dir));
  }

  std::string name = fmt::format("{}_{}_{}.mp4", input.stem().string(),
                                 job_id.substr(0, 8), format_timestamp(now));
  return (out_dir / name).string();
}

std::string format_seconds(double seconds) {
  return fmt::format("{:.3f}", seconds);
}

} // namespace smart_cut

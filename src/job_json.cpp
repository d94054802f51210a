/**
 * @file job_json.cpp
 * @brief Job JSON implementation
 */

#include "smart_cut/job_json.hpp"

#include <fstream>
#include <optional>

#include <fmt/core.h>

#include "smart_cut/errors.hpp"
#include "smart_cut/system.hpp"

namespace smart_cut {

using json = nlohmann::json;

const char *status_name(JobStatus status) {
  switch (status) {
  case JobStatus::Processing:
    return "processing";
  case JobStatus::Completed:
    return "completed";
  case JobStatus::Failed:
    return "failed";
  }
  return "unknown";
}

// **---- Encoding ----**

void to_json(json &j, const Segment &s) {
  j = json{{"start", s.start}, {"end", s.end}};
}

void to_json(json &j, const JobResult &r) {
  j = json{{"output_path", r.output_path},
           {"keep_segments", r.keep_segments},
           {"delete_segments", r.delete_segments},
           {"original_duration", r.original_duration},
           {"new_duration", r.new_duration},
           {"compression_ratio", r.compression_ratio}};
}

void to_json(json &j, const Job &job) {
  j = json{{"id", job.id},
           {"status", status_name(job.status)},
           {"progress", job.progress},
           {"created_at", format_iso8601(job.created_at)},
           {"updated_at", format_iso8601(job.updated_at)}};
  if (job.result)
    j["result"] = *job.result;
  if (job.error_message)
    j["error"] = *job.error_message;
}

// **---- Decoding ----**

namespace {

std::optional<double> read_bound(const json &entry, const char *key,
                                 size_t n) {
  auto it = entry.find(key);
  if (it == entry.end() || it->is_null())
    return std::nullopt;
  if (!it->is_number()) {
    throw ValidationError(
        fmt::format("Segment {}: {} time must be a number", n, key), n,
        ValidationRule::Malformed);
  }
  return it->get<double>();
}

} // anonymous namespace

std::vector<SegmentInput> parse_segment_inputs(const json &j) {
  const json *list = &j;
  if (j.is_object()) {
    auto it = j.find("segments");
    if (it == j.end()) {
      throw ValidationError("Request has no \"segments\" field", 0,
                            ValidationRule::Malformed);
    }
    list = &*it;
  }
  if (!list->is_array()) {
    throw ValidationError("Segments must be a JSON array", 0,
                          ValidationRule::Malformed);
  }

  std::vector<SegmentInput> out;
  out.reserve(list->size());
  size_t n = 0;
  for (const auto &entry : *list) {
    ++n;
    if (!entry.is_object()) {
      throw ValidationError(
          fmt::format("Segment {}: expected an object with start and end", n),
          n, ValidationRule::Malformed);
    }
    out.push_back({read_bound(entry, "start", n), read_bound(entry, "end", n)});
  }
  return out;
}

std::vector<SegmentInput> load_segment_inputs(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    throw FileNotFoundError(fmt::format("Cannot open segment file: {}", path));
  }
  json root = json::parse(in, nullptr, false);
  if (root.is_discarded()) {
    throw ValidationError(fmt::format("Invalid JSON in {}", path), 0,
                          ValidationRule::Malformed);
  }
  return parse_segment_inputs(root);
}

} // namespace smart_cut

/**
 * @file transcript.cpp
 * @brief Transcript implementation
 */

#include "smart_cut/transcript.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <utility>

#include <fmt/core.h>

#include "smart_cut/errors.hpp"

namespace smart_cut {

using json = nlohmann::json;

// **---- Loading ----**

JsonTranscriptSource::JsonTranscriptSource(std::string transcript_path)
    : transcript_path_(std::move(transcript_path)) {}

std::string JsonTranscriptSource::sidecar_path(const std::string &media_path) {
  return media_path + ".words.json";
}

std::vector<TranscriptWord>
JsonTranscriptSource::transcribe(const std::string &media_path) {
  const std::string path =
      transcript_path_.empty() ? sidecar_path(media_path) : transcript_path_;

  std::ifstream in(path);
  if (!in) {
    throw FileNotFoundError(fmt::format("Transcript not found: {}", path));
  }
  json root = json::parse(in, nullptr, false);
  if (root.is_discarded()) {
    throw ValidationError(fmt::format("Invalid JSON in {}", path), 0,
                          ValidationRule::Malformed);
  }
  return parse_transcript(root);
}

std::vector<TranscriptWord> parse_transcript(const json &j) {
  const json *list = &j;
  if (j.is_object() && j.contains("words"))
    list = &j.at("words");
  if (!list->is_array()) {
    throw ValidationError("Transcript must be an array of words", 0,
                          ValidationRule::Malformed);
  }

  std::vector<TranscriptWord> words;
  words.reserve(list->size());
  size_t n = 0;
  for (const auto &w : *list) {
    ++n;
    if (!w.is_object() || !w.contains("start") || !w.contains("end") ||
        !w["start"].is_number() || !w["end"].is_number()) {
      throw ValidationError(
          fmt::format("Transcript word {}: missing numeric start/end", n), n,
          ValidationRule::Malformed);
    }
    TranscriptWord tw;
    tw.word = w.value("word", "");
    tw.start = w["start"].get<double>();
    tw.end = w["end"].get<double>();
    if (w.contains("conf") && w["conf"].is_number())
      tw.confidence = w["conf"].get<double>();
    else if (w.contains("confidence") && w["confidence"].is_number())
      tw.confidence = w["confidence"].get<double>();
    words.push_back(std::move(tw));
  }
  return words;
}

// **---- Selection ----**

std::vector<SegmentInput>
delete_segments_for_words(const std::vector<TranscriptWord> &words,
                          std::vector<std::size_t> indices) {
  if (indices.empty()) {
    throw ValidationError("No words selected", 0, ValidationRule::BadSelection);
  }

  std::sort(indices.begin(), indices.end());
  indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

  if (indices.back() >= words.size()) {
    throw ValidationError(
        fmt::format("Word index {} out of range (transcript has {} words)",
                    indices.back(), words.size()),
        0, ValidationRule::BadSelection);
  }

  std::vector<SegmentInput> out;
  size_t run_first = indices[0];
  size_t run_last = indices[0];
  for (size_t i = 1; i <= indices.size(); ++i) {
    if (i < indices.size() && indices[i] == run_last + 1) {
      run_last = indices[i];
      continue;
    }
    out.push_back({words[run_first].start, words[run_last].end});
    if (i < indices.size()) {
      run_first = indices[i];
      run_last = indices[i];
    }
  }
  return out;
}

namespace {

std::size_t parse_index(const std::string &token, const std::string &text,
                        std::size_t word_count) {
  if (token.empty() ||
      !std::all_of(token.begin(), token.end(),
                   [](unsigned char c) { return std::isdigit(c); })) {
    throw ValidationError(fmt::format("Invalid word selection: '{}'", text), 0,
                          ValidationRule::BadSelection);
  }
  /// Overflow saturates to ULLONG_MAX, which the range check rejects
  const unsigned long long value = std::strtoull(token.c_str(), nullptr, 10);
  if (value >= word_count) {
    throw ValidationError(
        fmt::format("Word index {} out of range (transcript has {} words)",
                    token, word_count),
        0, ValidationRule::BadSelection);
  }
  return static_cast<std::size_t>(value);
}

} // anonymous namespace

std::vector<std::size_t> parse_word_selection(const std::string &text,
                                              std::size_t word_count) {
  std::vector<std::size_t> out;
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t comma = text.find(',', pos);
    if (comma == std::string::npos)
      comma = text.size();
    const std::string item = text.substr(pos, comma - pos);

    const size_t dash = item.find('-');
    if (dash == std::string::npos) {
      out.push_back(parse_index(item, text, word_count));
    } else {
      const size_t first = parse_index(item.substr(0, dash), text, word_count);
      const size_t last = parse_index(item.substr(dash + 1), text, word_count);
      if (last < first) {
        throw ValidationError(
            fmt::format("Invalid word range '{}': end before start", item), 0,
            ValidationRule::BadSelection);
      }
      for (size_t i = first; i <= last; ++i)
        out.push_back(i);
    }
    pos = comma + 1;
  }
  return out;
}

} // namespace smart_cut

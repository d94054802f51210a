/**
 * @file segments.cpp
 * @brief Interval algebra implementation
 */

#include "smart_cut/segments.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/core.h>

#include "smart_cut/errors.hpp"

namespace smart_cut {

// **---- Validation ----**

std::vector<Segment> validate_segments(const std::vector<SegmentInput> &inputs,
                                       double duration) {
  if (inputs.empty()) {
    throw ValidationError("No segments to delete", 0, ValidationRule::Empty);
  }

  std::vector<Segment> segments;
  segments.reserve(inputs.size());

  for (size_t i = 0; i < inputs.size(); ++i) {
    const size_t n = i + 1;
    const auto &in = inputs[i];

    if (!in.start || !in.end) {
      throw ValidationError(
          fmt::format("Segment {}: missing start or end time", n), n,
          ValidationRule::MissingBound);
    }

    const double start = *in.start;
    const double end = *in.end;

    /// NaN fails every ordered comparison below, so reject it first
    if (!std::isfinite(start) || !std::isfinite(end)) {
      throw ValidationError(
          fmt::format("Segment {}: times must be finite numbers", n), n,
          ValidationRule::NonFiniteBound);
    }
    if (start < 0 || end < 0) {
      throw ValidationError(
          fmt::format("Segment {}: times cannot be negative", n), n,
          ValidationRule::NegativeBound);
    }
    if (start >= end) {
      throw ValidationError(
          fmt::format("Segment {}: start time ({}) must be less than end "
                      "time ({})",
                      n, start, end),
          n, ValidationRule::StartNotBeforeEnd);
    }
    if (start > duration || end > duration) {
      throw ValidationError(
          fmt::format("Segment {}: time exceeds media duration ({:.2f}s)", n,
                      duration),
          n, ValidationRule::ExceedsDuration);
    }

    segments.push_back({start, end});
  }

  return segments;
}

// **---- Merge ----**

std::vector<Segment> merge_overlapping(std::vector<Segment> segments) {
  if (segments.empty())
    return segments;

  std::sort(segments.begin(), segments.end(),
            [](const Segment &a, const Segment &b) {
              return a.start < b.start;
            });

  std::vector<Segment> merged;
  merged.reserve(segments.size());

  Segment acc = segments[0];
  for (size_t i = 1; i < segments.size(); ++i) {
    const Segment &next = segments[i];
    /// Touching ranges (next.start == acc.end) merge as well
    if (next.start <= acc.end) {
      acc.end = std::max(acc.end, next.end);
    } else {
      merged.push_back(acc);
      acc = next;
    }
  }
  merged.push_back(acc);

  return merged;
}

// **---- Complement ----**

std::vector<Segment> compute_keep_segments(double duration,
                                           const std::vector<Segment> &deletes,
                                           double min_segment) {
  std::vector<Segment> keep;

  if (deletes.empty()) {
    keep.push_back({0.0, duration});
    return keep;
  }

  std::vector<Segment> merged = merge_overlapping(deletes);
  keep.reserve(merged.size() + 1);

  double cursor = 0.0;
  for (const auto &d : merged) {
    if (cursor < d.start) {
      keep.push_back({cursor, d.start});
    }
    cursor = std::max(cursor, d.end);
  }
  if (cursor < duration) {
    keep.push_back({cursor, duration});
  }

  keep.erase(std::remove_if(keep.begin(), keep.end(),
                            [min_segment](const Segment &s) {
                              return s.length() <= min_segment;
                            }),
             keep.end());
  return keep;
}

std::vector<Segment> plan_keep_segments(const std::vector<Segment> &deletes,
                                        double duration,
                                        double min_segment) {
  std::vector<Segment> keep =
      compute_keep_segments(duration, deletes, min_segment);
  if (keep.empty()) {
    throw NoRemainingContentError(
        "No content remaining after deletions: the segments cover the whole "
        "file");
  }
  return keep;
}

double total_length(const std::vector<Segment> &segments) {
  double total = 0;
  for (const auto &s : segments)
    total += s.length();
  return total;
}

} // namespace smart_cut

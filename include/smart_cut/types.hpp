/**
 * @file types.hpp
 * @brief Core data types and constants for Smart Cut
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Segment duration thresholds
 *
 *          - Segment for time ranges
 *
 *          - SegmentInput for unchecked request entries
 */

#ifndef SMART_CUT_TYPES_HPP
#define SMART_CUT_TYPES_HPP

#include <optional>

namespace smart_cut {

// **----- CONSTANTS -----**

/**
 * @brief Keep segments at or below this length are discarded.
 * @note Overridable through MIN_SEGMENT_DURATION (see config.hpp).
 */
constexpr double MIN_SEGMENT_DURATION = 0.1;

/**
 * @brief Hard floor for segments entering a multi-segment filter graph.
 * @note Shorter trims do not re-encode reliably, so they are excluded from the
 *       concat graph even when they survived MIN_SEGMENT_DURATION.
 */
constexpr double MIN_ENCODE_SEGMENT_DURATION = 0.3;

// **----- DATA STRUCTURES -----**

/**
 * @struct Segment
 * @brief Represents a time range [start, end) in seconds.
 * @note Used for both delete ranges and keep ranges.
 *       Aligned to 16 bytes like the rest of the time range types.
 */
struct alignas(16) Segment {
  double start; //< Start time in seconds
  double end;   //< End time in seconds

  double length() const { return end - start; }
};

inline bool operator==(const Segment &a, const Segment &b) {
  return a.start == b.start && a.end == b.end;
}

inline bool operator!=(const Segment &a, const Segment &b) { return !(a == b); }

/**
 * @struct SegmentInput
 * @brief A delete range as received from a caller, before validation.
 * @note A bound may be missing; validate_segments() rejects such entries.
 */
struct SegmentInput {
  std::optional<double> start;
  std::optional<double> end;
};

} // namespace smart_cut

#endif // SMART_CUT_TYPES_HPP

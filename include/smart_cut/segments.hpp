/**
 * @file segments.hpp
 * @brief Interval algebra over delete and keep segments
 *
 * @details Pure functions that turn a caller's delete ranges into the ranges
 *          that survive the cut:
 *
 *          1. validate_segments: reject malformed or out-of-range entries
 *
 *          2. merge_overlapping: collapse overlapping and touching ranges
 *
 *          3. compute_keep_segments: complement within [0, duration]
 *
 * @note Boundary comparisons are exact (no epsilon). Two delete ranges that
 *       touch only up to floating-point noise are not merged.
 */

#ifndef SMART_CUT_SEGMENTS_HPP
#define SMART_CUT_SEGMENTS_HPP

#include <vector>

#include "types.hpp"

namespace smart_cut {

/**
 * @brief Check delete ranges against the media duration.
 *
 * @param inputs Delete ranges as received from the caller
 * @param duration Total media duration in seconds
 * @return The same ranges, in request order, as Segments
 * @throws ValidationError naming the 1-based index of the first bad entry
 */
std::vector<Segment> validate_segments(const std::vector<SegmentInput> &inputs,
                                       double duration);

/**
 * @brief Sort and merge overlapping or touching ranges.
 * @return Sorted ranges with no two overlapping or touching
 */
std::vector<Segment> merge_overlapping(std::vector<Segment> segments);

/**
 * @brief Complement of the merged delete ranges within [0, duration].
 *
 * @param duration Total media duration in seconds
 * @param deletes Validated delete ranges (any order)
 * @param min_segment Emitted ranges of this length or shorter are dropped
 * @return Sorted, non-overlapping keep ranges. Empty when nothing survives.
 */
std::vector<Segment>
compute_keep_segments(double duration, const std::vector<Segment> &deletes,
                      double min_segment = MIN_SEGMENT_DURATION);

/**
 * @brief compute_keep_segments() for a job: an empty result is an error.
 * @throws NoRemainingContentError when nothing survives the deletions
 */
std::vector<Segment> plan_keep_segments(const std::vector<Segment> &deletes,
                                        double duration,
                                        double min_segment);

/// Sum of segment lengths
double total_length(const std::vector<Segment> &segments);

} // namespace smart_cut

#endif // SMART_CUT_SEGMENTS_HPP

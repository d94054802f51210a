// Interval algebra unit tests

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "smart_cut/errors.hpp"
#include "smart_cut/segments.hpp"

namespace smart_cut {
namespace {

std::vector<SegmentInput> Inputs(std::vector<std::pair<double, double>> v) {
  std::vector<SegmentInput> out;
  for (const auto &p : v)
    out.push_back({p.first, p.second});
  return out;
}

// -----------------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------------
TEST(ValidateSegmentsTest, EmptySetIsRejected) {
  try {
    validate_segments({}, 10.0);
    FAIL() << "expected ValidationError";
  } catch (const ValidationError &e) {
    EXPECT_EQ(e.rule(), ValidationRule::Empty);
    EXPECT_EQ(e.index(), 0u);
  }
}

TEST(ValidateSegmentsTest, StartAfterEndCitesSegmentOne) {
  try {
    validate_segments(Inputs({{5, 3}}), 10.0);
    FAIL() << "expected ValidationError";
  } catch (const ValidationError &e) {
    EXPECT_EQ(e.rule(), ValidationRule::StartNotBeforeEnd);
    EXPECT_EQ(e.index(), 1u);
    EXPECT_NE(std::string(e.what()).find("Segment 1"), std::string::npos);
  }
}

TEST(ValidateSegmentsTest, EqualBoundsAreRejected) {
  EXPECT_THROW(validate_segments(Inputs({{4, 4}}), 10.0), ValidationError);
}

TEST(ValidateSegmentsTest, ExceedingDurationIsRejected) {
  try {
    validate_segments(Inputs({{0, 20}}), 10.0);
    FAIL() << "expected ValidationError";
  } catch (const ValidationError &e) {
    EXPECT_EQ(e.rule(), ValidationRule::ExceedsDuration);
    EXPECT_NE(std::string(e.what()).find("10.00s"), std::string::npos);
  }
}

TEST(ValidateSegmentsTest, NegativeBoundIsRejected) {
  try {
    validate_segments(Inputs({{1, 2}, {-1, 3}}), 10.0);
    FAIL() << "expected ValidationError";
  } catch (const ValidationError &e) {
    EXPECT_EQ(e.rule(), ValidationRule::NegativeBound);
    EXPECT_EQ(e.index(), 2u);
  }
}

TEST(ValidateSegmentsTest, MissingBoundIsRejected) {
  std::vector<SegmentInput> in = {{1.0, 2.0}, {3.0, std::nullopt}};
  try {
    validate_segments(in, 10.0);
    FAIL() << "expected ValidationError";
  } catch (const ValidationError &e) {
    EXPECT_EQ(e.rule(), ValidationRule::MissingBound);
    EXPECT_EQ(e.index(), 2u);
  }
}

TEST(ValidateSegmentsTest, NonFiniteBoundsAreRejected) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();
  std::vector<std::vector<SegmentInput>> cases;
  cases.push_back({SegmentInput{nan, 5.0}});
  cases.push_back({SegmentInput{1.0, nan}});
  cases.push_back({SegmentInput{nan, nan}});
  cases.push_back({SegmentInput{1.0, inf}});
  cases.push_back({SegmentInput{-inf, 5.0}});
  cases.push_back({SegmentInput{1.0, 2.0}, SegmentInput{nan, 5.0}});
  for (const auto &in : cases) {
    try {
      validate_segments(in, 100.0);
      FAIL() << "expected ValidationError";
    } catch (const ValidationError &e) {
      EXPECT_EQ(e.rule(), ValidationRule::NonFiniteBound);
      EXPECT_EQ(e.index(), in.size());
    }
  }
}

TEST(ValidateSegmentsTest, BoundsEqualToDurationAreAccepted) {
  auto out = validate_segments(Inputs({{9, 10}, {0, 1}}), 10.0);
  ASSERT_EQ(out.size(), 2u);
  // Request order is preserved
  EXPECT_EQ(out[0], (Segment{9, 10}));
  EXPECT_EQ(out[1], (Segment{0, 1}));
}

// -----------------------------------------------------------------------------
// Merge
// -----------------------------------------------------------------------------
TEST(MergeOverlappingTest, OverlappingAndTouchingMerge) {
  auto merged = merge_overlapping({{18, 30}, {10, 20}, {30, 35}, {50, 60}});
  ASSERT_EQ(merged.size(), 2u);
  EXPECT_EQ(merged[0], (Segment{10, 35}));
  EXPECT_EQ(merged[1], (Segment{50, 60}));
}

TEST(MergeOverlappingTest, ContainedSegmentIsAbsorbed) {
  auto merged = merge_overlapping({{0, 50}, {10, 20}});
  ASSERT_EQ(merged.size(), 1u);
  EXPECT_EQ(merged[0], (Segment{0, 50}));
}

TEST(MergeOverlappingTest, Idempotent) {
  std::vector<Segment> in = {{5, 7}, {1, 3}, {2, 4}, {7, 8}, {20, 21}};
  auto once = merge_overlapping(in);
  EXPECT_EQ(merge_overlapping(once), once);
}

TEST(MergeOverlappingTest, EmptyInput) {
  EXPECT_TRUE(merge_overlapping({}).empty());
}

// -----------------------------------------------------------------------------
// Keep set
// -----------------------------------------------------------------------------
TEST(ComputeKeepSegmentsTest, NoDeletesKeepsEverything) {
  auto keep = compute_keep_segments(42.0, {});
  ASSERT_EQ(keep.size(), 1u);
  EXPECT_EQ(keep[0], (Segment{0, 42}));
}

TEST(ComputeKeepSegmentsTest, OverlappingDeletesOnHundredSeconds) {
  auto deletes = validate_segments(Inputs({{10, 20}, {18, 30}}), 100.0);
  auto merged = merge_overlapping(deletes);
  ASSERT_EQ(merged.size(), 1u);
  EXPECT_EQ(merged[0], (Segment{10, 30}));

  auto keep = compute_keep_segments(100.0, deletes);
  ASSERT_EQ(keep.size(), 2u);
  EXPECT_EQ(keep[0], (Segment{0, 10}));
  EXPECT_EQ(keep[1], (Segment{30, 100}));
}

TEST(ComputeKeepSegmentsTest, HeadAndTailDeletesLeaveMiddle) {
  auto keep = compute_keep_segments(100.0, {{0, 10}, {90, 100}});
  ASSERT_EQ(keep.size(), 1u);
  EXPECT_EQ(keep[0], (Segment{10, 90}));
}

TEST(ComputeKeepSegmentsTest, TinyGapsAreDropped) {
  // 0.05 s gap is dropped, 0.25 s gap survives
  auto keep = compute_keep_segments(10.0, {{0, 1}, {1.05, 5}, {5.25, 10}});
  ASSERT_EQ(keep.size(), 1u);
  EXPECT_EQ(keep[0], (Segment{5, 5.25}));
}

TEST(ComputeKeepSegmentsTest, CustomMinimumIsHonoured) {
  auto keep = compute_keep_segments(10.0, {{2, 8}}, 2.0);
  // [0,2] and [8,10] are both exactly 2.0 long
  EXPECT_TRUE(keep.empty());
}

TEST(ComputeKeepSegmentsTest, KeepAndMergedDeletesCoverDuration) {
  std::vector<Segment> deletes = {{3, 7}, {1, 2}, {6, 9}, {15, 18}};
  const double duration = 20.0;
  auto keep = compute_keep_segments(duration, deletes);
  auto merged = merge_overlapping(deletes);

  EXPECT_DOUBLE_EQ(total_length(keep) + total_length(merged), duration);

  for (size_t i = 1; i < keep.size(); ++i) {
    EXPECT_LT(keep[i - 1].end, keep[i].start);
  }
  for (const auto &k : keep) {
    for (const auto &d : merged) {
      EXPECT_TRUE(k.end <= d.start || k.start >= d.end);
    }
  }
}

TEST(PlanKeepSegmentsTest, WholeFileDeletedIsNoRemainingContent) {
  EXPECT_THROW(plan_keep_segments({{0, 100}}, 100.0, MIN_SEGMENT_DURATION),
               NoRemainingContentError);
  // Leftovers at or below the minimum count as nothing
  EXPECT_THROW(plan_keep_segments({{0.05, 100}}, 100.0, MIN_SEGMENT_DURATION),
               NoRemainingContentError);
}

TEST(PlanKeepSegmentsTest, NoRemainingContentIsAValidationError) {
  try {
    plan_keep_segments({{0, 5}}, 5.0, MIN_SEGMENT_DURATION);
    FAIL() << "expected NoRemainingContentError";
  } catch (const ValidationError &e) {
    EXPECT_EQ(e.rule(), ValidationRule::NoRemainingContent);
  }
}

} // namespace
} // namespace smart_cut

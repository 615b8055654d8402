/**
 * @file test_input_detector.cpp
 * @brief Unit tests for the Morse-vs-speech input policy
 */

#include <vector>

#include "gtest/gtest.h"
#include "input_detector.hpp"
#include "support/timing_helpers.hpp"
#include "unit_estimator.hpp"

using namespace rune::device;
using rune::device::test_support::Jitter;
using rune::device::test_support::SegmentsForMorse;

namespace {

class InputDetectorTest : public ::testing::Test {
 protected:
  InputVerdict Classify(const std::vector<TimingSegment>& segments, double likelihood) const {
    return detector_.classify(segments, estimator_.estimate(segments), likelihood);
  }

  UnitEstimator estimator_;
  InputDetector detector_;
};

TEST_F(InputDetectorTest, KeyedSignalIsMorse) {
  auto verdict = Classify(SegmentsForMorse("... --- ...", 0.06), 0.0);
  EXPECT_EQ(InputKind::Morse, verdict.kind);
  EXPECT_FALSE(verdict.ambiguous);
  EXPECT_EQ(9u, verdict.tones);
  EXPECT_EQ(9u, verdict.well_formed);
}

TEST_F(InputDetectorTest, JitteredKeyingIsStillMorse) {
  auto verdict = Classify(Jitter(SegmentsForMorse("-.-. --.-", 0.07), 0.1, 7), 0.1);
  EXPECT_EQ(InputKind::Morse, verdict.kind);
  EXPECT_FALSE(verdict.ambiguous);
}

TEST_F(InputDetectorTest, SilenceIsAmbiguousAndGoesToSpeech) {
  auto verdict = Classify({{SegmentKind::Silence, 3.0}}, 0.0);
  EXPECT_EQ(InputKind::Speech, verdict.kind);
  EXPECT_TRUE(verdict.ambiguous);
  EXPECT_EQ(0u, verdict.tones);
}

TEST_F(InputDetectorTest, ConfidentSpeechWins) {
  std::vector<TimingSegment> syllables = {
      {SegmentKind::Tone, 0.1}, {SegmentKind::Silence, 0.05}, {SegmentKind::Tone, 0.6},
      {SegmentKind::Silence, 0.05}, {SegmentKind::Tone, 1.1}, {SegmentKind::Silence, 0.2},
      {SegmentKind::Tone, 1.7}, {SegmentKind::Silence, 0.1}, {SegmentKind::Tone, 2.5}};

  auto verdict = Classify(syllables, 0.9);
  EXPECT_EQ(InputKind::Speech, verdict.kind);
  EXPECT_FALSE(verdict.ambiguous);
}

TEST_F(InputDetectorTest, IrregularBurstsWithoutSpeechSignalAreAmbiguous) {
  std::vector<TimingSegment> bursts = {
      {SegmentKind::Tone, 0.1}, {SegmentKind::Silence, 0.3}, {SegmentKind::Tone, 0.6},
      {SegmentKind::Silence, 0.3}, {SegmentKind::Tone, 1.1}, {SegmentKind::Silence, 0.3},
      {SegmentKind::Tone, 1.7}, {SegmentKind::Silence, 0.3}, {SegmentKind::Tone, 2.5}};

  auto verdict = Classify(bursts, 0.0);
  EXPECT_EQ(InputKind::Speech, verdict.kind);
  EXPECT_TRUE(verdict.ambiguous);
  EXPECT_EQ(5u, verdict.tones);
  EXPECT_EQ(1u, verdict.well_formed);
}

TEST_F(InputDetectorTest, KeyingThatSoundsLikeSpeechIsAmbiguous) {
  auto verdict = Classify(SegmentsForMorse("... --- ...", 0.06), 0.75);
  EXPECT_EQ(InputKind::Speech, verdict.kind);
  EXPECT_TRUE(verdict.ambiguous);
}

TEST_F(InputDetectorTest, TooFewTonesIsNotMorse) {
  auto verdict = Classify(SegmentsForMorse(".", 0.06), 0.0);
  EXPECT_EQ(InputKind::Speech, verdict.kind);
  EXPECT_TRUE(verdict.ambiguous);
  EXPECT_EQ(1u, verdict.tones);
}

TEST_F(InputDetectorTest, UnsettledUnitIsNotMorse) {
  UnitEstimate unit;
  unit.valid = true;
  unit.unit = 0.06;
  unit.stable = false;
  auto segments = SegmentsForMorse("... --- ...", 0.06);
  auto verdict = detector_.classify(segments, unit, 0.0);
  EXPECT_EQ(InputKind::Speech, verdict.kind);
  EXPECT_TRUE(verdict.ambiguous);
}

TEST_F(InputDetectorTest, WellFormedWindow) {
  EXPECT_TRUE(detector_.well_formed(1.0, 1.0));
  EXPECT_TRUE(detector_.well_formed(1.35, 1.0));
  EXPECT_TRUE(detector_.well_formed(3.0, 1.0));
  EXPECT_TRUE(detector_.well_formed(4.1, 1.0));
  EXPECT_FALSE(detector_.well_formed(1.6, 1.0));
  EXPECT_FALSE(detector_.well_formed(5.0, 1.0));
  EXPECT_FALSE(detector_.well_formed(1.0, 0.0));
}

}  // namespace

#include <gtest/gtest.h>
#include "compensation_analyzer.hpp"
#include "synthetic_session.hpp"

namespace insidemotion {

TEST(SyntheticSessionTest, CoversTwentyFourSecondsEverySecondFrame) {
    auto frames = SyntheticSession::frames();

    ASSERT_EQ(frames.size(), 360u);
    EXPECT_EQ(frames.front().frame_index, 0);
    EXPECT_EQ(frames.back().frame_index, 718);
    EXPECT_DOUBLE_EQ(frames[15].timestamp, 1.0);
    EXPECT_DOUBLE_EQ(SyntheticSession::kDuration, 24.0);

    for (const auto& frame : frames) {
        EXPECT_EQ(frame.keypoints.size(), kLandmarkCount);
    }
}

TEST(SyntheticSessionTest, IsDeterministic) {
    auto first = SyntheticSession::frames();
    auto second = SyntheticSession::frames();

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        for (size_t k = 0; k < kLandmarkCount; ++k) {
            EXPECT_EQ(first[i].keypoints[k].x, second[i].keypoints[k].x);
            EXPECT_EQ(first[i].keypoints[k].y, second[i].keypoints[k].y);
        }
    }
}

TEST(SyntheticSessionTest, LeftHipCarriesTheDrift) {
    auto frames = SyntheticSession::frames();

    // Frame 30 is the first drift peak
    const auto& peak = frames[15];
    ASSERT_EQ(peak.frame_index, 30);
    EXPECT_NEAR(peak.find(Landmark::LeftHip)->x, 0.53, 1e-9);
    EXPECT_NEAR(peak.find(Landmark::RightHip)->x, 0.595, 1e-9);
}

TEST(SyntheticSessionTest, SixFullCycles) {
    auto frames = SyntheticSession::frames();

    // One upward pass through half the drift amplitude per cycle
    int cycles = 0;
    for (size_t i = 1; i < frames.size(); ++i) {
        double prev = frames[i - 1].find(Landmark::Nose)->x - 0.5;
        double curr = frames[i].find(Landmark::Nose)->x - 0.5;
        if (prev < 0.025 && curr >= 0.025) {
            ++cycles;
        }
    }
    EXPECT_EQ(cycles, 6);
}

TEST(SyntheticSessionTest, AnalyzerDetectsCompensation) {
    CompensationAnalyzer analyzer;
    auto analysis = analyzer.analyze(SyntheticSession::frames());

    ASSERT_EQ(analysis.outcome, AnalysisOutcome::Analyzed);
    EXPECT_TRUE(analysis.compensation_detected);
    EXPECT_GT(analysis.metrics->max_hip_shift, 0.05);
    EXPECT_NEAR(analysis.metrics->max_hip_shift, 0.0625, 1e-9);
}

TEST(SyntheticSessionTest, CannedAnalysis) {
    auto analysis = SyntheticSession::analysis();

    EXPECT_TRUE(analysis.compensation_detected);
    EXPECT_EQ(analysis.knee_flexion_angle, 32);
    EXPECT_EQ(analysis.message, "Load shifts to healthy leg at 32° knee flexion (mock analysis)");
    EXPECT_EQ(analysis.recommendation, "Focus on slow, symmetrical knee loading.");
    ASSERT_TRUE(analysis.metrics.has_value());
    EXPECT_EQ(analysis.metrics->compensating_side, Side::Right);
    EXPECT_EQ(analysis.metrics->shift_direction, Side::Left);

    CompensationAnalyzer analyzer;
    EXPECT_TRUE(analyzer.exceeds_thresholds(*analysis.metrics));
}

TEST(SyntheticSessionTest, CannedSidesAgreeWithMeasuredSession) {
    const auto canned = *SyntheticSession::analysis().metrics;
    auto measured = CompensationAnalyzer().analyze(SyntheticSession::frames());
    ASSERT_TRUE(measured.metrics.has_value());

    // Whole cycles cancel both signed means; only rounding noise is left
    EXPECT_NEAR(measured.metrics->avg_hip_shift_direction, canned.avg_hip_shift_direction, 1e-12);
    EXPECT_NEAR(measured.metrics->avg_knee_depth_diff, canned.avg_knee_depth_diff, 1e-12);

    // The canned sides follow the analyzer's rule applied to the canned means
    Side expected_side = canned.avg_knee_depth_diff > 0.0 ? Side::Left : Side::Right;
    Side expected_shift = canned.avg_hip_shift_direction > 0.0 ? Side::Right : Side::Left;
    EXPECT_EQ(canned.compensating_side, expected_side);
    EXPECT_EQ(canned.shift_direction, expected_shift);
}

} // namespace insidemotion

#include <gtest/gtest.h>
#include "key_moment_selector.hpp"
#include "test_helpers.hpp"
#include <cmath>

namespace insidemotion {

using testing_support::FakeVideoSource;
using testing_support::make_empty_record;
using testing_support::make_record;

class KeyMomentSelectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 50 sampled frames, stride 2 at 10 fps: timestamps 0.0, 0.2, ..., 9.8
        for (int i = 0; i < 50; ++i) {
            records_.push_back(make_record(i * 2, 10.0));
        }
    }

    std::vector<FrameRecord> records_;
};

TEST_F(KeyMomentSelectorTest, DurationFromSampledFrames) {
    KeyMomentSelector selector(2, 10.0);
    EXPECT_DOUBLE_EQ(selector.session_duration(50), 10.0);

    KeyMomentSelector no_fps(2, 0.0);
    EXPECT_DOUBLE_EQ(no_fps.session_duration(50), 0.0);
}

TEST_F(KeyMomentSelectorTest, ThreeNamedTargets) {
    const auto& targets = KeyMomentSelector::targets();

    ASSERT_EQ(targets.size(), 3u);
    EXPECT_EQ(targets[0].label, "Neutral");
    EXPECT_EQ(targets[0].type, MomentType::Neutral);
    EXPECT_DOUBLE_EQ(targets[0].fraction, 0.2);
    EXPECT_EQ(targets[1].label, "Compensation peak");
    EXPECT_EQ(targets[1].type, MomentType::Peak);
    EXPECT_DOUBLE_EQ(targets[1].fraction, 0.5);
    EXPECT_EQ(targets[2].label, "Recovery phase");
    EXPECT_EQ(targets[2].type, MomentType::Recovery);
    EXPECT_DOUBLE_EQ(targets[2].fraction, 0.8);
}

TEST_F(KeyMomentSelectorTest, SelectsTimestampNearestFrames) {
    KeyMomentSelector selector(2, 10.0);
    auto selections = selector.select(records_);

    ASSERT_EQ(selections.size(), 3u);
    // Targets at 2.0 s, 5.0 s and 8.0 s
    EXPECT_EQ(selections[0].moment.frame_index, 20);
    EXPECT_EQ(selections[1].moment.frame_index, 50);
    EXPECT_EQ(selections[2].moment.frame_index, 80);

    double duration = selector.session_duration(records_.size());
    const auto& targets = KeyMomentSelector::targets();
    for (size_t i = 0; i < selections.size(); ++i) {
        double target = duration * targets[i].fraction;
        double chosen = std::abs(selections[i].moment.time - target);
        for (const auto& record : records_) {
            EXPECT_LE(chosen, std::abs(record.timestamp - target) + 1e-12);
        }
        EXPECT_EQ(records_[selections[i].record_index].frame_index, selections[i].moment.frame_index);
    }
}

TEST_F(KeyMomentSelectorTest, DurationCountsUndetectedRecords) {
    // Ten frames at 10 fps, stride 1; the person leaves after frame 4
    std::vector<FrameRecord> records;
    for (int i = 0; i < 10; ++i) {
        records.push_back(i < 5 ? make_record(i, 10.0) : make_empty_record(i, 10.0));
    }
    KeyMomentSelector selector(1, 10.0);

    auto selections = selector.select(records);

    // Targets at 0.2 s, 0.5 s and 0.8 s of the full 1.0 s, snapped to detected frames
    ASSERT_EQ(selections.size(), 3u);
    EXPECT_EQ(selections[0].moment.frame_index, 2);
    EXPECT_EQ(selections[1].moment.frame_index, 4);
    EXPECT_EQ(selections[2].moment.frame_index, 4);
}

TEST_F(KeyMomentSelectorTest, TiesGoToEarlierRecord) {
    // Two records equidistant from the 20% target of 1.0 s
    std::vector<FrameRecord> records = {
        make_record(2, 4.0),   // 0.5 s
        make_record(6, 4.0)    // 1.5 s
    };
    KeyMomentSelector selector(10, 4.0);  // duration = 2 * 10 / 4 = 5 s

    auto selections = selector.select(records);

    ASSERT_FALSE(selections.empty());
    EXPECT_EQ(selections[0].moment.frame_index, 2);
}

TEST_F(KeyMomentSelectorTest, SkipsUndetectedRecords) {
    for (auto& record : records_) {
        if (record.frame_index >= 40 && record.frame_index <= 58) {
            record = make_empty_record(record.frame_index, 10.0);
        }
    }
    KeyMomentSelector selector(2, 10.0);

    auto selections = selector.select(records_);

    ASSERT_EQ(selections.size(), 3u);
    // 5.0 s target falls in the gap; 6.0 s is closer than 3.8 s
    EXPECT_EQ(selections[1].moment.frame_index, 60);
    for (const auto& selection : selections) {
        EXPECT_TRUE(records_[selection.record_index].has_detection());
    }
}

TEST_F(KeyMomentSelectorTest, NoDetectionsNoMoments) {
    std::vector<FrameRecord> records = {make_empty_record(0, 10.0), make_empty_record(2, 10.0)};
    KeyMomentSelector selector(2, 10.0);

    EXPECT_TRUE(selector.select(records).empty());
    EXPECT_TRUE(selector.select({}).empty());
}

TEST_F(KeyMomentSelectorTest, ExtractReadsFullResolutionFrames) {
    FakeVideoSource source(100, 10.0, cv::Size(640, 360));
    KeyMomentSelector selector(2, 10.0);

    auto moments = selector.extract(records_, source);

    ASSERT_EQ(moments.size(), 3u);
    EXPECT_EQ(moments[0].moment.type, MomentType::Neutral);
    EXPECT_EQ(moments[1].moment.type, MomentType::Peak);
    EXPECT_EQ(moments[2].moment.type, MomentType::Recovery);
    for (const auto& moment : moments) {
        EXPECT_EQ(moment.frame.size(), cv::Size(640, 360));
        // FakeVideoSource encodes the frame index as the gray level
        EXPECT_EQ(moment.frame.at<cv::Vec3b>(0, 0)[0], moment.moment.frame_index % 256);
    }
}

TEST_F(KeyMomentSelectorTest, FailedSeekDropsOnlyThatMoment) {
    FakeVideoSource source(100, 10.0);
    source.make_unseekable(50);
    KeyMomentSelector selector(2, 10.0);

    auto moments = selector.extract(records_, source);

    ASSERT_EQ(moments.size(), 2u);
    EXPECT_EQ(moments[0].moment.type, MomentType::Neutral);
    EXPECT_EQ(moments[1].moment.type, MomentType::Recovery);
}

TEST_F(KeyMomentSelectorTest, NeverMoreThanThreeMoments) {
    std::vector<FrameRecord> many;
    for (int i = 0; i < 1000; ++i) {
        many.push_back(make_record(i * 2, 30.0));
    }
    KeyMomentSelector selector(2, 30.0);

    EXPECT_LE(selector.select(many).size(), 3u);
}

TEST(MomentTypeTest, Names) {
    EXPECT_EQ(moment_type_name(MomentType::Neutral), "neutral");
    EXPECT_EQ(moment_type_name(MomentType::Peak), "peak");
    EXPECT_EQ(moment_type_name(MomentType::Recovery), "recovery");
}

} // namespace insidemotion

#include <gtest/gtest.h>
#include "frame_sampler.hpp"
#include "test_helpers.hpp"
#include "video_source.hpp"
#include <opencv2/opencv.hpp>
#include <cstdio>

namespace insidemotion {

using testing_support::FakeVideoSource;

class FrameSamplerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 20 blue frames at 10 fps
        video_ = testing_support::test_artifact("sampler_video.avi");
        testing_support::write_test_video(video_, 20, cv::Size(320, 240), 10.0);
    }

    void TearDown() override {
        std::remove(video_.c_str());
    }

    std::string video_;
};

TEST_F(FrameSamplerTest, VideoInfoFromMetadata) {
    OpenCVVideoSource source(video_);
    auto info = source.info();

    EXPECT_EQ(info.total_frames, 20);
    EXPECT_DOUBLE_EQ(info.fps, 10.0);
    EXPECT_DOUBLE_EQ(info.duration, 2.0);
    EXPECT_EQ(info.frame_size, cv::Size(320, 240));
    EXPECT_FALSE(info.codec.empty());
}

TEST_F(FrameSamplerTest, YieldsEverySecondFrame) {
    OpenCVVideoSource source(video_);
    FrameSampler sampler(source, 2);

    std::vector<int> indices;
    while (auto sampled = sampler.next()) {
        indices.push_back(sampled->frame_index);
        EXPECT_DOUBLE_EQ(sampled->timestamp, sampled->frame_index / 10.0);
        EXPECT_EQ(sampled->frame.size(), cv::Size(320, 240));
        EXPECT_EQ(sampled->frame.channels(), 3);
    }

    std::vector<int> expected = {0, 2, 4, 6, 8, 10, 12, 14, 16, 18};
    EXPECT_EQ(indices, expected);
    EXPECT_EQ(sampler.frames_read(), 20);

    // Exhausted sequences stay exhausted
    EXPECT_FALSE(sampler.next().has_value());
}

TEST_F(FrameSamplerTest, SampledFramesAreRGB) {
    OpenCVVideoSource source(video_);
    FrameSampler sampler(source, 2);

    auto sampled = sampler.next();
    ASSERT_TRUE(sampled.has_value());

    // Blue in BGR lands in the last channel once converted
    cv::Scalar mean = cv::mean(sampled->frame);
    EXPECT_LT(mean[0], 60.0);
    EXPECT_GT(mean[2], 190.0);
}

TEST_F(FrameSamplerTest, DownscalesWideFrames) {
    OpenCVVideoSource source(video_);
    FrameSampler sampler(source, 2, 160);

    auto sampled = sampler.next();
    ASSERT_TRUE(sampled.has_value());
    EXPECT_EQ(sampled->frame.size(), cv::Size(160, 120));
}

TEST_F(FrameSamplerTest, InvalidVideoPath) {
    EXPECT_THROW({
        OpenCVVideoSource source("nonexistent_video.avi");
    }, VideoOpenError);
}

TEST_F(FrameSamplerTest, UnreadableFileIsVideoOpenError) {
    std::string bogus = testing_support::test_artifact("not_a_video.avi");
    {
        std::FILE* f = std::fopen(bogus.c_str(), "w");
        ASSERT_NE(f, nullptr);
        std::fputs("this is not a video container", f);
        std::fclose(f);
    }

    EXPECT_THROW({
        OpenCVVideoSource source(bogus);
    }, VideoOpenError);

    std::remove(bogus.c_str());
}

TEST(FrameSamplerFakeSourceTest, DecodeFailureEndsStreamEarly) {
    FakeVideoSource source(30, 30.0);
    source.fail_at(7);
    FrameSampler sampler(source, 2);

    std::vector<int> indices;
    while (auto sampled = sampler.next()) {
        indices.push_back(sampled->frame_index);
    }

    std::vector<int> expected = {0, 2, 4, 6};
    EXPECT_EQ(indices, expected);
}

TEST(FrameSamplerFakeSourceTest, ZeroFpsGivesZeroTimestamps) {
    FakeVideoSource source(6, 0.0);
    FrameSampler sampler(source, 2);

    int count = 0;
    while (auto sampled = sampler.next()) {
        EXPECT_DOUBLE_EQ(sampled->timestamp, 0.0);
        ++count;
    }
    EXPECT_EQ(count, 3);
}

TEST(FrameSamplerFakeSourceTest, CustomStride) {
    FakeVideoSource source(10, 25.0);
    FrameSampler sampler(source, 3);

    std::vector<int> indices;
    while (auto sampled = sampler.next()) {
        indices.push_back(sampled->frame_index);
    }

    std::vector<int> expected = {0, 3, 6, 9};
    EXPECT_EQ(indices, expected);
}

TEST(FrameSamplerFakeSourceTest, RejectsNonPositiveStride) {
    FakeVideoSource source(10, 25.0);
    EXPECT_THROW({
        FrameSampler sampler(source, 0);
    }, std::invalid_argument);
}

} // namespace insidemotion

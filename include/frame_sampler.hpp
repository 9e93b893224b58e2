#pragma once

#include "video_source.hpp"
#include <opencv2/opencv.hpp>
#include <optional>

namespace insidemotion {

struct SampledFrame {
    int frame_index = 0;
    double timestamp = 0.0;
    cv::Mat frame;  // RGB, possibly downscaled for detection
};

// Lazily walks a source once, yielding every `stride`-th frame
class FrameSampler {
public:
    FrameSampler(VideoSource& source, int stride, int max_width = 0);

    std::optional<SampledFrame> next();

    // Frames decoded so far, sampled or not
    int frames_read() const { return frames_read_; }

private:
    cv::Mat prepare(const cv::Mat& bgr) const;

    VideoSource& source_;
    int stride_;
    int max_width_;
    double fps_;
    int frames_read_ = 0;
    bool finished_ = false;
};

} // namespace insidemotion

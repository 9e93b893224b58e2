#pragma once

#include "pose_detector.hpp"
#include "pose_types.hpp"
#include <opencv2/opencv.hpp>
#include <memory>

namespace insidemotion {

// Shields the session from detector failures: any exception on a frame
// becomes NotDetected for that frame only.
class PoseExtractor {
public:
    explicit PoseExtractor(std::shared_ptr<PoseDetector> detector);

    DetectionResult extract(const cv::Mat& rgb_frame, int frame_index);

    int failed_frames() const { return failed_frames_; }

private:
    std::shared_ptr<PoseDetector> detector_;
    int failed_frames_ = 0;
};

} // namespace insidemotion

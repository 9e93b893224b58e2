#include "pose_extractor.hpp"
#include <iostream>
#include <stdexcept>

namespace insidemotion {

PoseExtractor::PoseExtractor(std::shared_ptr<PoseDetector> detector)
    : detector_(std::move(detector)) {
    if (!detector_) {
        throw std::invalid_argument("PoseExtractor requires a detector");
    }
}

DetectionResult PoseExtractor::extract(const cv::Mat& rgb_frame, int frame_index) {
    try {
        auto landmarks = detector_->detect(rgb_frame);
        if (landmarks) {
            return Detected{*landmarks};
        }
    } catch (const std::exception& e) {
        ++failed_frames_;
        std::cerr << "Failed to process frame " << frame_index << ": " << e.what() << std::endl;
    }
    return NotDetected{};
}

} // namespace insidemotion

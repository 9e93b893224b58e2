#pragma once

#include "analysis_config.hpp"
#include "pose_types.hpp"
#include <opencv2/opencv.hpp>
#include <memory>
#include <optional>

namespace insidemotion {

// Single-person landmark detection on one RGB frame
class PoseDetector {
public:
    virtual ~PoseDetector() = default;

    // Empty when no person is found; may throw on backend failure
    virtual std::optional<Landmarks> detect(const cv::Mat& rgb_frame) = 0;

    virtual std::string get_name() const = 0;
};

// MoveNet single-pose model run through ONNX Runtime.
// Expects a [1, H, W, 3] input and a [1, 1, 17, 3] (y, x, score) output.
class MoveNetPoseDetector : public PoseDetector {
public:
    explicit MoveNetPoseDetector(const PoseDetectorConfig& config);
    ~MoveNetPoseDetector() override;

    MoveNetPoseDetector(const MoveNetPoseDetector&) = delete;
    MoveNetPoseDetector& operator=(const MoveNetPoseDetector&) = delete;

    std::optional<Landmarks> detect(const cv::Mat& rgb_frame) override;
    std::string get_name() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

// Returns nullptr when the model cannot be loaded; callers fall back to degraded mode
std::shared_ptr<PoseDetector> create_pose_detector(const PoseDetectorConfig& config);

} // namespace insidemotion

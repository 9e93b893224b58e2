#pragma once

#include "analysis_config.hpp"
#include "compensation_analyzer.hpp"
#include "pose_types.hpp"
#include <opencv2/opencv.hpp>
#include <optional>
#include <vector>

namespace insidemotion {

enum class SeverityTier { Ok, Attention, Problem };

std::string severity_tier_name(SeverityTier tier);

// Tier of max(avg_hip_shift, avg_knee_asymmetry)
SeverityTier severity_tier(const SessionMetrics& metrics, const Thresholds& thresholds);

// Draws the color-coded skeleton onto a copy of a BGR frame
class OverlayRenderer {
public:
    explicit OverlayRenderer(const Thresholds& thresholds = {});

    cv::Mat render(const cv::Mat& frame,
                   const std::vector<Keypoint>& keypoints,
                   const std::optional<SessionMetrics>& metrics = std::nullopt) const;

    static cv::Scalar tier_color(SeverityTier tier);

    static constexpr int kJointRadius = 8;
    static constexpr int kOutlineRadius = 10;
    static constexpr int kLimbThickness = 4;

private:
    Thresholds thresholds_;
};

} // namespace insidemotion

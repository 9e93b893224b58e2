#include "overlay_renderer.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>

namespace insidemotion {

namespace {

// BGR
const cv::Scalar kOkColor(136, 255, 0);
const cv::Scalar kAttentionColor(0, 165, 255);
const cv::Scalar kProblemColor(68, 68, 255);
const cv::Scalar kWhite(255, 255, 255);
const cv::Scalar kReferenceLineColor(200, 200, 200);

enum class Part { Left, Right, Center };

Part landmark_part(Landmark landmark) {
    switch (landmark) {
        case Landmark::LeftShoulder:
        case Landmark::LeftHip:
        case Landmark::LeftKnee:
        case Landmark::LeftAnkle:
            return Part::Left;
        case Landmark::RightShoulder:
        case Landmark::RightHip:
        case Landmark::RightKnee:
        case Landmark::RightAnkle:
            return Part::Right;
        case Landmark::Nose:
            break;
    }
    return Part::Center;
}

struct Segment {
    Landmark from;
    Landmark to;
    Part part;
};

const std::vector<Segment>& skeleton() {
    static const std::vector<Segment> segments = {
        {Landmark::LeftShoulder, Landmark::LeftHip, Part::Left},
        {Landmark::RightShoulder, Landmark::RightHip, Part::Right},
        {Landmark::LeftHip, Landmark::LeftKnee, Part::Left},
        {Landmark::RightHip, Landmark::RightKnee, Part::Right},
        {Landmark::LeftKnee, Landmark::LeftAnkle, Part::Left},
        {Landmark::RightKnee, Landmark::RightAnkle, Part::Right},
        {Landmark::LeftHip, Landmark::RightHip, Part::Center}
    };
    return segments;
}

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // namespace

std::string severity_tier_name(SeverityTier tier) {
    switch (tier) {
        case SeverityTier::Ok: return "ok";
        case SeverityTier::Attention: return "attention";
        case SeverityTier::Problem: return "problem";
    }
    return "unknown";
}

SeverityTier severity_tier(const SessionMetrics& metrics, const Thresholds& thresholds) {
    double severity = std::max(metrics.avg_hip_shift, metrics.avg_knee_asymmetry);
    if (severity > thresholds.problem_severity) {
        return SeverityTier::Problem;
    }
    if (severity > thresholds.attention_severity) {
        return SeverityTier::Attention;
    }
    return SeverityTier::Ok;
}

OverlayRenderer::OverlayRenderer(const Thresholds& thresholds)
    : thresholds_(thresholds) {}

cv::Scalar OverlayRenderer::tier_color(SeverityTier tier) {
    switch (tier) {
        case SeverityTier::Ok: return kOkColor;
        case SeverityTier::Attention: return kAttentionColor;
        case SeverityTier::Problem: return kProblemColor;
    }
    return kOkColor;
}

cv::Mat OverlayRenderer::render(const cv::Mat& frame,
                                const std::vector<Keypoint>& keypoints,
                                const std::optional<SessionMetrics>& metrics) const {
    cv::Mat annotated = frame.clone();
    const int w = annotated.cols;
    const int h = annotated.rows;

    std::map<Landmark, cv::Point> points;
    for (const auto& kp : keypoints) {
        points[kp.name] = cv::Point(static_cast<int>(kp.x * w), static_cast<int>(kp.y * h));
    }

    SeverityTier tier = SeverityTier::Ok;
    cv::Scalar left_color = kOkColor;
    cv::Scalar right_color = kOkColor;
    cv::Scalar center_color = kOkColor;
    if (metrics) {
        tier = severity_tier(*metrics, thresholds_);
        if (metrics->compensating_side == Side::Left) {
            left_color = tier_color(tier);
        } else {
            right_color = tier_color(tier);
        }
        if (metrics->avg_hip_shift > thresholds_.hip_attention) {
            center_color = kAttentionColor;
        }
    }

    auto part_color = [&](Part part) {
        switch (part) {
            case Part::Left: return left_color;
            case Part::Right: return right_color;
            case Part::Center: break;
        }
        return center_color;
    };

    bool has_hips = points.count(Landmark::LeftHip) && points.count(Landmark::RightHip);
    int hip_center_x = 0;
    if (has_hips) {
        hip_center_x = (points[Landmark::LeftHip].x + points[Landmark::RightHip].x) / 2;
        cv::line(annotated, cv::Point(hip_center_x, 0), cv::Point(hip_center_x, h),
                 kReferenceLineColor, 2, cv::LINE_AA);
    }

    for (const auto& segment : skeleton()) {
        auto from = points.find(segment.from);
        auto to = points.find(segment.to);
        if (from == points.end() || to == points.end()) {
            continue;
        }
        cv::line(annotated, from->second, to->second, part_color(segment.part),
                 kLimbThickness, cv::LINE_AA);
    }

    for (const auto& [landmark, point] : points) {
        cv::circle(annotated, point, kJointRadius, part_color(landmark_part(landmark)), -1, cv::LINE_AA);
        cv::circle(annotated, point, kOutlineRadius, kWhite, 2, cv::LINE_AA);
    }

    if (metrics && tier != SeverityTier::Ok) {
        std::string label = "Compensating: " + to_upper(side_name(metrics->compensating_side)) + " side";
        int baseline = 0;
        cv::Size text_size = cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX, 0.8, 2, &baseline);
        cv::Point origin(20, 20);
        cv::rectangle(annotated, origin,
                      cv::Point(origin.x + text_size.width + 20, origin.y + text_size.height + baseline + 20),
                      tier_color(tier), cv::FILLED);
        cv::putText(annotated, label, cv::Point(origin.x + 10, origin.y + 10 + text_size.height),
                    cv::FONT_HERSHEY_SIMPLEX, 0.8, kWhite, 2, cv::LINE_AA);
    }

    if (has_hips) {
        int shift_px = hip_center_x - w / 2;
        if (std::abs(shift_px) > w * thresholds_.shift_arrow_fraction) {
            Side direction = shift_px > 0 ? Side::Right : Side::Left;
            if (metrics) {
                direction = metrics->shift_direction;
            }
            int arrow_y = std::min(h - 1, 100);
            int arrow_len = std::max(20, w / 10);
            cv::Point start(w / 2, arrow_y);
            cv::Point end(direction == Side::Right ? start.x + arrow_len : start.x - arrow_len, arrow_y);
            cv::arrowedLine(annotated, start, end, kProblemColor, 4, cv::LINE_AA, 0, 0.3);

            std::string caption = "Shift " + side_name(direction);
            int caption_x = direction == Side::Right ? start.x : end.x;
            cv::putText(annotated, caption, cv::Point(caption_x, std::max(20, arrow_y - 20)),
                        cv::FONT_HERSHEY_SIMPLEX, 0.9, kProblemColor, 2, cv::LINE_AA);
        }
    }

    return annotated;
}

} // namespace insidemotion

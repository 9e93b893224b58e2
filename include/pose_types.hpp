#pragma once

#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace insidemotion {

// The fixed subset of body landmarks the analysis reads
enum class Landmark {
    Nose = 0,
    LeftShoulder,
    RightShoulder,
    LeftHip,
    RightHip,
    LeftKnee,
    RightKnee,
    LeftAnkle,
    RightAnkle
};

constexpr size_t kLandmarkCount = 9;

const std::array<Landmark, kLandmarkCount>& all_landmarks();
std::string landmark_name(Landmark landmark);
std::optional<Landmark> landmark_from_name(const std::string& name);

enum class Side { Left, Right };

std::string side_name(Side side);

struct Keypoint {
    Landmark name = Landmark::Nose;
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    double visibility = 0.0;
};

// A complete detection: one keypoint per landmark, in all_landmarks() order
using Landmarks = std::array<Keypoint, kLandmarkCount>;

struct Detected {
    Landmarks landmarks;
};

struct NotDetected {};

using DetectionResult = std::variant<NotDetected, Detected>;

struct FrameRecord {
    int frame_index = 0;
    double timestamp = 0.0;
    // Either empty (no person) or one entry per landmark
    std::vector<Keypoint> keypoints;

    bool has_detection() const { return !keypoints.empty(); }
    const Keypoint* find(Landmark landmark) const;
};

FrameRecord make_frame_record(int frame_index, double fps, const DetectionResult& result);

} // namespace insidemotion

#include "pose_types.hpp"

namespace insidemotion {

const std::array<Landmark, kLandmarkCount>& all_landmarks() {
    static const std::array<Landmark, kLandmarkCount> landmarks = {
        Landmark::Nose,
        Landmark::LeftShoulder, Landmark::RightShoulder,
        Landmark::LeftHip, Landmark::RightHip,
        Landmark::LeftKnee, Landmark::RightKnee,
        Landmark::LeftAnkle, Landmark::RightAnkle
    };
    return landmarks;
}

std::string landmark_name(Landmark landmark) {
    switch (landmark) {
        case Landmark::Nose: return "nose";
        case Landmark::LeftShoulder: return "left_shoulder";
        case Landmark::RightShoulder: return "right_shoulder";
        case Landmark::LeftHip: return "left_hip";
        case Landmark::RightHip: return "right_hip";
        case Landmark::LeftKnee: return "left_knee";
        case Landmark::RightKnee: return "right_knee";
        case Landmark::LeftAnkle: return "left_ankle";
        case Landmark::RightAnkle: return "right_ankle";
    }
    return "unknown";
}

std::optional<Landmark> landmark_from_name(const std::string& name) {
    for (Landmark landmark : all_landmarks()) {
        if (landmark_name(landmark) == name) {
            return landmark;
        }
    }
    return std::nullopt;
}

std::string side_name(Side side) {
    return side == Side::Left ? "left" : "right";
}

const Keypoint* FrameRecord::find(Landmark landmark) const {
    for (const auto& kp : keypoints) {
        if (kp.name == landmark) {
            return &kp;
        }
    }
    return nullptr;
}

FrameRecord make_frame_record(int frame_index, double fps, const DetectionResult& result) {
    FrameRecord record;
    record.frame_index = frame_index;
    record.timestamp = fps > 0.0 ? frame_index / fps : 0.0;

    if (const auto* detected = std::get_if<Detected>(&result)) {
        record.keypoints.assign(detected->landmarks.begin(), detected->landmarks.end());
    }
    return record;
}

} // namespace insidemotion

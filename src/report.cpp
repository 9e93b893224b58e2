#include "report.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace insidemotion {

void to_json(json& j, const Keypoint& kp) {
    j = json{
        {"name", landmark_name(kp.name)},
        {"x", kp.x},
        {"y", kp.y},
        {"z", kp.z},
        {"visibility", kp.visibility}
    };
}

void from_json(const json& j, Keypoint& kp) {
    std::string name = j.at("name").get<std::string>();
    auto landmark = landmark_from_name(name);
    if (!landmark) {
        throw std::runtime_error("Unknown landmark name: " + name);
    }
    kp.name = *landmark;
    kp.x = j.at("x").get<double>();
    kp.y = j.at("y").get<double>();
    kp.z = j.value("z", 0.0);
    kp.visibility = j.value("visibility", 0.0);
}

void to_json(json& j, const FrameRecord& record) {
    j = json{
        {"frame", record.frame_index},
        {"time", record.timestamp},
        {"keypoints", record.keypoints}
    };
}

void from_json(const json& j, FrameRecord& record) {
    record.frame_index = j.at("frame").get<int>();
    record.timestamp = j.at("time").get<double>();
    record.keypoints.clear();
    for (const auto& item : j.at("keypoints")) {
        // Points this analysis does not track are skipped
        if (!landmark_from_name(item.at("name").get<std::string>())) {
            continue;
        }
        record.keypoints.push_back(item.get<Keypoint>());
    }
}

void to_json(json& j, const SessionMetrics& metrics) {
    j = json{
        {"avg_hip_shift", metrics.avg_hip_shift},
        {"max_hip_shift", metrics.max_hip_shift},
        {"avg_knee_asymmetry", metrics.avg_knee_asymmetry},
        {"max_knee_asymmetry", metrics.max_knee_asymmetry},
        {"compensating_side", side_name(metrics.compensating_side)},
        {"shift_direction", side_name(metrics.shift_direction)}
    };
}

void to_json(json& j, const CompensationAnalysis& analysis) {
    j = json{
        {"compensation_detected", analysis.compensation_detected},
        {"message", analysis.message}
    };
    if (!analysis.metrics) {
        return;
    }
    j["knee_flexion_angle"] = analysis.knee_flexion_angle;
    j["recommendation"] = analysis.recommendation;
    j["compensating_side"] = side_name(analysis.metrics->compensating_side);
    j["shift_direction"] = side_name(analysis.metrics->shift_direction);
    j["metrics"] = *analysis.metrics;
}

void to_json(json& j, const KeyMoment& moment) {
    j = json{
        {"time", moment.time},
        {"frame", moment.frame_index},
        {"label", moment.label},
        {"type", moment_type_name(moment.type)},
        {"image", moment.image}
    };
}

void to_json(json& j, const AnalysisReport& report) {
    j = json{
        {"fps", report.fps},
        {"total_frames", report.total_frames},
        {"duration", report.duration},
        {"keypoints_data", report.keypoints_data},
        {"analysis", report.analysis},
        {"key_moments", report.key_moments},
        {"degraded", report.degraded}
    };
}

std::vector<FrameRecord> load_keypoints(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open keypoints file: " + path);
    }

    json j = json::parse(file);
    const json& data = j.is_object() ? j.at("keypoints_data") : j;
    return data.get<std::vector<FrameRecord>>();
}

} // namespace insidemotion

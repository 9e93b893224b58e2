#pragma once

#include "compensation_analyzer.hpp"
#include "key_moment_selector.hpp"
#include "pose_types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace insidemotion {

struct AnalysisReport {
    double fps = 0.0;
    int total_frames = 0;
    double duration = 0.0;
    std::vector<FrameRecord> keypoints_data;  // detected frames only
    CompensationAnalysis analysis;
    std::vector<KeyMoment> key_moments;
    bool degraded = false;
};

void to_json(nlohmann::json& j, const Keypoint& kp);
void from_json(const nlohmann::json& j, Keypoint& kp);

void to_json(nlohmann::json& j, const FrameRecord& record);
void from_json(const nlohmann::json& j, FrameRecord& record);

void to_json(nlohmann::json& j, const SessionMetrics& metrics);
void to_json(nlohmann::json& j, const CompensationAnalysis& analysis);
void to_json(nlohmann::json& j, const KeyMoment& moment);
void to_json(nlohmann::json& j, const AnalysisReport& report);

// Reads a persisted keypoints_data array (or a full report holding one)
std::vector<FrameRecord> load_keypoints(const std::string& path);

} // namespace insidemotion

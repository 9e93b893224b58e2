#pragma once

#include "analysis_config.hpp"
#include "pose_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace insidemotion {

struct FrameAsymmetry {
    double hip_shift_direction = 0.0;  // hip center x minus 0.5, positive = right of center
    double hip_shift = 0.0;
    double left_knee_flexion = 0.0;
    double right_knee_flexion = 0.0;
    double knee_depth_diff = 0.0;      // left minus right flexion distance
    double knee_asymmetry = 0.0;
};

struct SessionMetrics {
    double avg_hip_shift = 0.0;
    double max_hip_shift = 0.0;
    double avg_knee_asymmetry = 0.0;
    double max_knee_asymmetry = 0.0;
    double avg_hip_shift_direction = 0.0;
    double avg_knee_depth_diff = 0.0;
    Side compensating_side = Side::Right;
    Side shift_direction = Side::Left;
};

enum class AnalysisOutcome {
    NoPoseData,        // no frame had a detection
    InsufficientData,  // detections, but none with all hip/knee/ankle landmarks
    Analyzed
};

struct CompensationAnalysis {
    AnalysisOutcome outcome = AnalysisOutcome::NoPoseData;
    bool compensation_detected = false;
    int knee_flexion_angle = 32;  // fixed placeholder, not measured
    std::string message;
    std::string recommendation;
    std::optional<SessionMetrics> metrics;
};

// Measures one frame; empty if any hip, knee or ankle landmark is missing
std::optional<FrameAsymmetry> measure_frame(const FrameRecord& record);

class CompensationAnalyzer {
public:
    explicit CompensationAnalyzer(const Thresholds& thresholds = {}, int knee_flexion_angle = 32);

    CompensationAnalysis analyze(const std::vector<FrameRecord>& records) const;

    bool exceeds_thresholds(const SessionMetrics& metrics) const;

private:
    Thresholds thresholds_;
    int knee_flexion_angle_;
};

} // namespace insidemotion

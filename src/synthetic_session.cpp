#include "synthetic_session.hpp"
#include <cmath>
#include <sstream>

namespace insidemotion {

namespace {

constexpr double kPi = 3.14159265358979323846;

Keypoint point(Landmark name, double x, double y) {
    Keypoint kp;
    kp.name = name;
    kp.x = x;
    kp.y = y;
    kp.z = 0.0;
    kp.visibility = 1.0;
    return kp;
}

} // namespace

std::vector<FrameRecord> SyntheticSession::frames() {
    std::vector<FrameRecord> records;
    records.reserve(kTotalFrames / kStride);

    for (int frame = 0; frame < kTotalFrames; frame += kStride) {
        double time = frame / kFps;
        double t = time / kDuration;

        double squat_phase = std::sin(2.0 * kPi * kCycles * t);
        double compensation = 0.05 * squat_phase;

        FrameRecord record;
        record.frame_index = frame;
        record.timestamp = time;
        record.keypoints = {
            point(Landmark::Nose, 0.5 + compensation, 0.15),
            point(Landmark::LeftShoulder, 0.45 + compensation, 0.25),
            point(Landmark::RightShoulder, 0.55 + compensation, 0.25),
            point(Landmark::LeftHip, 0.43 + compensation * 2, 0.5 + squat_phase * 0.1),
            point(Landmark::RightHip, 0.57 + compensation * 0.5, 0.5 + squat_phase * 0.15),
            point(Landmark::LeftKnee, 0.42 + compensation * 2, 0.65 + squat_phase * 0.15),
            point(Landmark::RightKnee, 0.58 + compensation * 0.5, 0.65 + squat_phase * 0.1),
            point(Landmark::LeftAnkle, 0.42 + compensation * 1.5, 0.85),
            point(Landmark::RightAnkle, 0.58 + compensation * 0.3, 0.85)
        };
        records.push_back(std::move(record));
    }
    return records;
}

CompensationAnalysis SyntheticSession::analysis(int knee_flexion_angle) {
    SessionMetrics metrics;
    metrics.avg_hip_shift = 0.0398;
    metrics.max_hip_shift = 0.0625;
    metrics.avg_knee_asymmetry = 0.0318;
    metrics.max_knee_asymmetry = 0.05;
    metrics.avg_hip_shift_direction = 0.0;
    metrics.avg_knee_depth_diff = 0.0;
    // Zero means, resolved the way CompensationAnalyzer resolves them
    metrics.compensating_side = Side::Right;
    metrics.shift_direction = Side::Left;

    std::ostringstream message;
    message << "Load shifts to healthy leg at " << knee_flexion_angle
            << "° knee flexion (mock analysis)";

    CompensationAnalysis result;
    result.outcome = AnalysisOutcome::Analyzed;
    result.compensation_detected = true;
    result.knee_flexion_angle = knee_flexion_angle;
    result.message = message.str();
    result.recommendation = "Focus on slow, symmetrical knee loading.";
    result.metrics = metrics;
    return result;
}

} // namespace insidemotion

#include "compensation_analyzer.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace insidemotion {

std::optional<FrameAsymmetry> measure_frame(const FrameRecord& record) {
    // Partial landmark sets are never aggregated
    if (record.keypoints.size() != kLandmarkCount) {
        return std::nullopt;
    }

    const Keypoint* left_hip = record.find(Landmark::LeftHip);
    const Keypoint* right_hip = record.find(Landmark::RightHip);
    const Keypoint* left_knee = record.find(Landmark::LeftKnee);
    const Keypoint* right_knee = record.find(Landmark::RightKnee);
    const Keypoint* left_ankle = record.find(Landmark::LeftAnkle);
    const Keypoint* right_ankle = record.find(Landmark::RightAnkle);
    if (!left_hip || !right_hip || !left_knee || !right_knee || !left_ankle || !right_ankle) {
        return std::nullopt;
    }

    FrameAsymmetry m;
    m.hip_shift_direction = (left_hip->x + right_hip->x) / 2.0 - 0.5;
    m.hip_shift = std::abs(m.hip_shift_direction);
    m.left_knee_flexion = std::abs(left_knee->y - left_ankle->y);
    m.right_knee_flexion = std::abs(right_knee->y - right_ankle->y);
    m.knee_depth_diff = m.left_knee_flexion - m.right_knee_flexion;
    m.knee_asymmetry = std::abs(m.knee_depth_diff);
    return m;
}

CompensationAnalyzer::CompensationAnalyzer(const Thresholds& thresholds, int knee_flexion_angle)
    : thresholds_(thresholds)
    , knee_flexion_angle_(knee_flexion_angle) {}

bool CompensationAnalyzer::exceeds_thresholds(const SessionMetrics& metrics) const {
    return metrics.max_hip_shift > thresholds_.hip_shift ||
           metrics.max_knee_asymmetry > thresholds_.knee_asymmetry;
}

CompensationAnalysis CompensationAnalyzer::analyze(const std::vector<FrameRecord>& records) const {
    std::cout << "Analyzing compensation patterns..." << std::endl;

    CompensationAnalysis analysis;
    analysis.knee_flexion_angle = knee_flexion_angle_;

    bool any_detection = std::any_of(records.begin(), records.end(),
        [](const FrameRecord& r) { return r.has_detection(); });
    if (!any_detection) {
        analysis.outcome = AnalysisOutcome::NoPoseData;
        analysis.message = "No pose data available for analysis";
        return analysis;
    }

    SessionMetrics metrics;
    double hip_shift_sum = 0.0;
    double knee_asymmetry_sum = 0.0;
    double direction_sum = 0.0;
    double depth_diff_sum = 0.0;
    size_t qualifying = 0;

    for (const auto& record : records) {
        auto m = measure_frame(record);
        if (!m) {
            continue;
        }
        ++qualifying;
        hip_shift_sum += m->hip_shift;
        knee_asymmetry_sum += m->knee_asymmetry;
        direction_sum += m->hip_shift_direction;
        depth_diff_sum += m->knee_depth_diff;
        metrics.max_hip_shift = std::max(metrics.max_hip_shift, m->hip_shift);
        metrics.max_knee_asymmetry = std::max(metrics.max_knee_asymmetry, m->knee_asymmetry);
    }

    if (qualifying == 0) {
        analysis.outcome = AnalysisOutcome::InsufficientData;
        analysis.message = "Insufficient data for analysis";
        return analysis;
    }

    double n = static_cast<double>(qualifying);
    metrics.avg_hip_shift = hip_shift_sum / n;
    metrics.avg_knee_asymmetry = knee_asymmetry_sum / n;
    metrics.avg_hip_shift_direction = direction_sum / n;
    metrics.avg_knee_depth_diff = depth_diff_sum / n;

    // A zero knee depth mean resolves to the right side
    metrics.compensating_side = metrics.avg_knee_depth_diff > 0.0 ? Side::Left : Side::Right;
    metrics.shift_direction = metrics.avg_hip_shift_direction > 0.0 ? Side::Right : Side::Left;

    analysis.outcome = AnalysisOutcome::Analyzed;
    analysis.compensation_detected = exceeds_thresholds(metrics);
    analysis.metrics = metrics;

    if (analysis.compensation_detected) {
        std::ostringstream message;
        message << "Load shifts to healthy leg at " << knee_flexion_angle_ << "° knee flexion";
        analysis.message = message.str();
        analysis.recommendation = "Focus on slow, symmetrical knee loading.";
    } else {
        analysis.message = "No significant compensation detected";
        analysis.recommendation = "Continue current rehabilitation protocol.";
    }

    std::ostringstream summary;
    summary << std::fixed << std::setprecision(3)
            << "Metrics - Hip shift: " << metrics.avg_hip_shift
            << " (max: " << metrics.max_hip_shift << "), "
            << "Knee asymmetry: " << metrics.avg_knee_asymmetry
            << " (max: " << metrics.max_knee_asymmetry << ") over "
            << qualifying << " frames";
    std::cout << summary.str() << std::endl;

    return analysis;
}

} // namespace insidemotion

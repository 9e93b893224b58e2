#pragma once

#include <stdexcept>
#include <string>

namespace insidemotion {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Uncalibrated decision constants; every one can be overridden from the config file
struct Thresholds {
    double hip_shift = 0.05;             // compensation if max hip shift exceeds this
    double knee_asymmetry = 0.08;        // compensation if max knee asymmetry exceeds this
    double attention_severity = 0.01;    // overlay tier boundary ok -> attention
    double problem_severity = 0.02;      // overlay tier boundary attention -> problem
    double hip_attention = 0.015;        // hip segment / head marker highlight
    double shift_arrow_fraction = 0.05;  // pixel hip shift, as a fraction of frame width
};

struct PoseDetectorConfig {
    std::string model_path = "models/movenet_thunder.onnx";
    int input_size = 256;
    double min_pose_confidence = 0.5;
    int intra_op_threads = 1;
};

struct AnalysisConfig {
    int frame_stride = 2;
    int analysis_max_width = 960;  // 0 keeps sampled frames at full resolution
    std::string output_dir;        // empty writes images beside the video
    std::string image_extension = ".png";
    int knee_flexion_angle = 32;
    Thresholds thresholds;
    PoseDetectorConfig detector;
};

// Reads a JSON file whose keys mirror AnalysisConfig; absent keys keep their defaults
AnalysisConfig load_config(const std::string& path);

} // namespace insidemotion

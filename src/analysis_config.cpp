#include "analysis_config.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace insidemotion {

namespace {

template <typename T>
void read_field(const json& j, const char* key, T& field) {
    auto it = j.find(key);
    if (it != j.end()) {
        field = it->get<T>();
    }
}

} // namespace

AnalysisConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    AnalysisConfig config;
    try {
        json j = json::parse(file);

        read_field(j, "frame_stride", config.frame_stride);
        read_field(j, "analysis_max_width", config.analysis_max_width);
        read_field(j, "output_dir", config.output_dir);
        read_field(j, "image_extension", config.image_extension);
        read_field(j, "knee_flexion_angle", config.knee_flexion_angle);

        if (j.contains("thresholds")) {
            const json& t = j.at("thresholds");
            read_field(t, "hip_shift", config.thresholds.hip_shift);
            read_field(t, "knee_asymmetry", config.thresholds.knee_asymmetry);
            read_field(t, "attention_severity", config.thresholds.attention_severity);
            read_field(t, "problem_severity", config.thresholds.problem_severity);
            read_field(t, "hip_attention", config.thresholds.hip_attention);
            read_field(t, "shift_arrow_fraction", config.thresholds.shift_arrow_fraction);
        }

        if (j.contains("detector")) {
            const json& d = j.at("detector");
            read_field(d, "model_path", config.detector.model_path);
            read_field(d, "input_size", config.detector.input_size);
            read_field(d, "min_pose_confidence", config.detector.min_pose_confidence);
            read_field(d, "intra_op_threads", config.detector.intra_op_threads);
        }
    } catch (const json::exception& e) {
        throw ConfigError("Invalid config file " + path + ": " + e.what());
    }

    if (config.frame_stride < 1) {
        throw ConfigError("frame_stride must be at least 1");
    }

    std::cout << "Loaded configuration from " << path << std::endl;
    return config;
}

} // namespace insidemotion

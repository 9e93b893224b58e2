#include "video_processor.hpp"
#include "analysis_config.hpp"
#include "report.hpp"
#include <iostream>
#include <chrono>
#include <nlohmann/json.hpp>
#include <fstream>

using json = nlohmann::json;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] VIDEO_PATH\n"
              << "Options:\n"
              << "  -c, --config FILE    JSON configuration file\n"
              << "  -m, --model FILE     Pose model (ONNX, MoveNet single-pose)\n"
              << "  -s, --stride NUM     Analyze every NUM-th frame (default: 2)\n"
              << "  --output FILE        Write the JSON report to FILE\n"
              << "  --output-dir DIR     Directory for key moment images (default: beside the video)\n"
              << "  --keypoints FILE     Re-analyze saved keypoints_data instead of a video\n"
              << "  --info               Show video information only\n"
              << "  -h, --help           Show this help\n";
}

int write_output(const json& output_json, const std::string& output_file) {
    if (output_file.empty()) {
        std::cout << output_json.dump(2) << std::endl;
        return 0;
    }

    std::ofstream file(output_file);
    if (!file.is_open()) {
        std::cerr << "Error: cannot write " << output_file << std::endl;
        return 1;
    }
    file << output_json.dump(2);
    std::cout << "Results saved to: " << output_file << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string config_file;
    std::string model_path;
    std::string output_file;
    std::string output_dir;
    std::string keypoints_file;
    std::string video_path;
    std::string stride_arg;
    bool info_only = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-c" || arg == "--config") {
            if (++i < argc) config_file = argv[i];
        } else if (arg == "-m" || arg == "--model") {
            if (++i < argc) model_path = argv[i];
        } else if (arg == "-s" || arg == "--stride") {
            if (++i < argc) stride_arg = argv[i];
        } else if (arg == "--output") {
            if (++i < argc) output_file = argv[i];
        } else if (arg == "--output-dir") {
            if (++i < argc) output_dir = argv[i];
        } else if (arg == "--keypoints") {
            if (++i < argc) keypoints_file = argv[i];
        } else if (arg == "--info") {
            info_only = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (video_path.empty()) {
            video_path = arg;
        }
    }

    try {
        insidemotion::AnalysisConfig config;
        if (!config_file.empty()) {
            config = insidemotion::load_config(config_file);
        }
        if (!model_path.empty()) config.detector.model_path = model_path;
        if (!output_dir.empty()) config.output_dir = output_dir;
        if (!stride_arg.empty()) {
            int stride = std::stoi(stride_arg);
            if (stride < 1) {
                throw insidemotion::ConfigError("--stride must be at least 1");
            }
            config.frame_stride = stride;
        }

        if (!keypoints_file.empty()) {
            // Pure re-analysis, no detector needed
            auto records = insidemotion::load_keypoints(keypoints_file);
            insidemotion::CompensationAnalyzer analyzer(config.thresholds, config.knee_flexion_angle);
            json analysis_json = analyzer.analyze(records);
            return write_output(analysis_json, output_file);
        }

        if (video_path.empty()) {
            std::cerr << "Error: No video path provided\n";
            return 1;
        }

        if (info_only) {
            insidemotion::OpenCVVideoSource source(video_path);
            auto info = source.info();

            json info_json;
            info_json["video_path"] = video_path;
            info_json["total_frames"] = info.total_frames;
            info_json["fps"] = info.fps;
            info_json["duration"] = info.duration;
            info_json["frame_size"] = {info.frame_size.width, info.frame_size.height};
            info_json["codec"] = info.codec;

            std::cout << info_json.dump(2) << std::endl;
            return 0;
        }

        auto start_time = std::chrono::high_resolution_clock::now();

        insidemotion::VideoProcessor processor(config);
        auto report = processor.analyze_video(video_path);

        auto end_time = std::chrono::high_resolution_clock::now();
        auto total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);
        std::cout << "Total time: " << total_time.count() << " ms" << std::endl;

        json output_json = report;
        return write_output(output_json, output_file);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

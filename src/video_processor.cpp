#include "video_processor.hpp"
#include "frame_sampler.hpp"
#include "key_moment_selector.hpp"
#include "overlay_renderer.hpp"
#include "pose_extractor.hpp"
#include "synthetic_session.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace fs = std::filesystem;

namespace insidemotion {

class VideoProcessor::Impl {
public:
    Impl(const AnalysisConfig& config, std::shared_ptr<PoseDetector> detector)
        : config_(config)
        , detector_(std::move(detector))
        , analyzer_(config.thresholds, config.knee_flexion_angle)
        , renderer_(config.thresholds) {

        if (detector_) {
            std::cout << "VideoProcessor initialized with:" << std::endl;
            std::cout << "  Pose detector: " << detector_->get_name() << std::endl;
        } else {
            std::cout << "VideoProcessor initialized without a pose detector (degraded mode)" << std::endl;
        }
        std::cout << "  Frame stride: " << config_.frame_stride << std::endl;
        std::cout << "  Analysis width: " << config_.analysis_max_width << std::endl;
    }

    VideoInfo get_video_info(const std::string& video_path) {
        OpenCVVideoSource source(video_path);
        return source.info();
    }

    AnalysisReport analyze_video(const std::string& video_path) {
        std::cout << "Starting video analysis: " << video_path << std::endl;

        fs::path path(video_path);
        if (!fs::exists(path)) {
            throw VideoOpenError("Video file not found: " + video_path);
        }

        if (!detector_) {
            std::cerr << "Pose detection not available, returning mock data" << std::endl;
            return degraded_report();
        }

        std::string output_dir = config_.output_dir.empty()
            ? path.parent_path().string()
            : config_.output_dir;

        // Released on every exit path, including exceptions from the pipeline
        OpenCVVideoSource source(video_path);
        return analyze_source(source, path.stem().string(), output_dir);
    }

    AnalysisReport analyze_source(VideoSource& source,
                                  const std::string& base_name,
                                  const std::string& output_dir) {
        if (!detector_) {
            return degraded_report();
        }

        VideoInfo info = source.info();
        std::cout << "Video info: " << info.total_frames << " frames, " << info.fps << " fps, "
                  << std::fixed << std::setprecision(2) << info.duration << "s"
                  << std::defaultfloat << std::setprecision(6) << std::endl;

        auto records = extract_keypoints(source, info);
        auto analysis = analyzer_.analyze(records);

        AnalysisReport report;
        report.fps = info.fps;
        report.total_frames = info.total_frames;
        report.duration = info.duration;
        report.analysis = analysis;
        for (const auto& record : records) {
            if (record.has_detection()) {
                report.keypoints_data.push_back(record);
            }
        }
        report.key_moments = render_key_moments(records, analysis, source, info.fps,
                                                base_name, output_dir);

        std::cout << "Analysis complete: " << report.keypoints_data.size() << " keypoint frames, "
                  << report.key_moments.size() << " key moments" << std::endl;
        return report;
    }

    CompensationAnalysis analyze_keypoints(const std::vector<FrameRecord>& records) const {
        return analyzer_.analyze(records);
    }

    bool is_degraded() const {
        return detector_ == nullptr;
    }

private:
    std::vector<FrameRecord> extract_keypoints(VideoSource& source, const VideoInfo& info) {
        FrameSampler sampler(source, config_.frame_stride, config_.analysis_max_width);
        PoseExtractor extractor(detector_);

        std::vector<FrameRecord> records;
        int next_progress = 100;
        while (auto sampled = sampler.next()) {
            auto result = extractor.extract(sampled->frame, sampled->frame_index);
            records.push_back(make_frame_record(sampled->frame_index, info.fps, result));

            if (sampler.frames_read() >= next_progress) {
                std::cout << "Processed " << sampler.frames_read() << "/" << info.total_frames
                          << " frames" << std::endl;
                next_progress += 100;
            }
        }

        if (extractor.failed_frames() > 0) {
            std::cerr << extractor.failed_frames() << " frames failed pose detection" << std::endl;
        }
        return records;
    }

    std::vector<KeyMoment> render_key_moments(const std::vector<FrameRecord>& records,
                                              const CompensationAnalysis& analysis,
                                              VideoSource& source,
                                              double fps,
                                              const std::string& base_name,
                                              const std::string& output_dir) {
        KeyMomentSelector selector(config_.frame_stride, fps);
        auto moment_frames = selector.extract(records, source);

        std::error_code ec;
        if (!output_dir.empty()) {
            fs::create_directories(output_dir, ec);
            if (ec) {
                std::cerr << "Cannot create output directory " << output_dir << ": "
                          << ec.message() << std::endl;
            }
        }

        std::vector<KeyMoment> moments;
        for (auto& moment_frame : moment_frames) {
            const FrameRecord& record = records[moment_frame.record_index];
            cv::Mat annotated = renderer_.render(moment_frame.frame, record.keypoints, analysis.metrics);

            std::string filename = base_name + "_" + moment_type_name(moment_frame.moment.type)
                                 + config_.image_extension;
            fs::path output_path = output_dir.empty() ? fs::path(filename) : fs::path(output_dir) / filename;

            bool written = false;
            try {
                written = cv::imwrite(output_path.string(), annotated);
            } catch (const cv::Exception& e) {
                std::cerr << "Failed to write " << output_path << ": " << e.what() << std::endl;
            }
            if (!written) {
                std::cerr << "Dropping key moment " << moment_frame.moment.label
                          << ", image could not be saved" << std::endl;
                continue;
            }

            std::cout << "Saved key moment: " << filename << std::endl;
            KeyMoment moment = moment_frame.moment;
            moment.image = filename;
            moments.push_back(moment);
        }
        return moments;
    }

    AnalysisReport degraded_report() const {
        std::cout << "Generating mock analysis data" << std::endl;

        AnalysisReport report;
        report.fps = SyntheticSession::kFps;
        report.total_frames = SyntheticSession::kTotalFrames;
        report.duration = SyntheticSession::kDuration;
        report.keypoints_data = SyntheticSession::frames();
        report.analysis = SyntheticSession::analysis(config_.knee_flexion_angle);
        report.degraded = true;
        return report;
    }

    AnalysisConfig config_;
    std::shared_ptr<PoseDetector> detector_;
    CompensationAnalyzer analyzer_;
    OverlayRenderer renderer_;
};

VideoProcessor::VideoProcessor(const AnalysisConfig& config)
    : pimpl_(std::make_unique<Impl>(config, create_pose_detector(config.detector))) {}

VideoProcessor::VideoProcessor(const AnalysisConfig& config, std::shared_ptr<PoseDetector> detector)
    : pimpl_(std::make_unique<Impl>(config, std::move(detector))) {}

VideoProcessor::~VideoProcessor() = default;

VideoInfo VideoProcessor::get_video_info(const std::string& video_path) {
    return pimpl_->get_video_info(video_path);
}

AnalysisReport VideoProcessor::analyze_video(const std::string& video_path) {
    return pimpl_->analyze_video(video_path);
}

AnalysisReport VideoProcessor::analyze_source(VideoSource& source,
                                              const std::string& base_name,
                                              const std::string& output_dir) {
    return pimpl_->analyze_source(source, base_name, output_dir);
}

CompensationAnalysis VideoProcessor::analyze_keypoints(const std::vector<FrameRecord>& records) const {
    return pimpl_->analyze_keypoints(records);
}

bool VideoProcessor::is_degraded() const {
    return pimpl_->is_degraded();
}

} // namespace insidemotion

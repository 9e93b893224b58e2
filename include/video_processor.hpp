#pragma once

#include "analysis_config.hpp"
#include "compensation_analyzer.hpp"
#include "pose_detector.hpp"
#include "report.hpp"
#include "video_source.hpp"
#include <memory>
#include <string>
#include <vector>

namespace insidemotion {

// Runs one synchronous analysis per call: sample, detect, analyze, pick key
// moments and render them. The detector may be shared between processors but
// is not guarded; concurrent analyses must not share a detector that is not
// itself safe for concurrent use.
class VideoProcessor {
public:
    // Loads the pose model named in the config; without one the processor runs degraded
    explicit VideoProcessor(const AnalysisConfig& config = {});

    // Uses the given detector; nullptr selects degraded mode
    VideoProcessor(const AnalysisConfig& config, std::shared_ptr<PoseDetector> detector);

    ~VideoProcessor();

    VideoInfo get_video_info(const std::string& video_path);

    // Throws VideoOpenError when the video is missing or unreadable
    AnalysisReport analyze_video(const std::string& video_path);

    // Same pipeline over an already opened source; images are written as
    // <output_dir>/<base_name>_<type><ext>
    AnalysisReport analyze_source(VideoSource& source,
                                  const std::string& base_name,
                                  const std::string& output_dir);

    CompensationAnalysis analyze_keypoints(const std::vector<FrameRecord>& records) const;

    bool is_degraded() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace insidemotion

#pragma once

#include "pose_types.hpp"
#include "video_source.hpp"
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

namespace insidemotion {

enum class MomentType { Neutral, Peak, Recovery };

std::string moment_type_name(MomentType type);

struct KeyMoment {
    std::string label;
    MomentType type = MomentType::Neutral;
    double time = 0.0;
    int frame_index = 0;
    std::string image;  // artifact file name, filled once rendered
};

struct MomentTarget {
    std::string label;
    MomentType type;
    double fraction;  // position within the session duration
};

struct MomentSelection {
    KeyMoment moment;
    size_t record_index = 0;
};

struct MomentFrame {
    KeyMoment moment;
    size_t record_index = 0;
    cv::Mat frame;  // full-resolution BGR frame re-read from the source
};

class KeyMomentSelector {
public:
    KeyMomentSelector(int stride, double fps);

    // Neutral at 20%, compensation peak at 50%, recovery at 80%
    static const std::vector<MomentTarget>& targets();

    // Approximate duration covered by `sampled_frames` sampled records
    double session_duration(size_t sampled_frames) const;

    // Timestamp-nearest detected record for each target; first record wins ties
    std::vector<MomentSelection> select(const std::vector<FrameRecord>& records) const;

    // select() followed by a re-seek of the source; moments whose frame cannot
    // be read back are dropped
    std::vector<MomentFrame> extract(const std::vector<FrameRecord>& records,
                                     VideoSource& source) const;

private:
    int stride_;
    double fps_;
};

} // namespace insidemotion

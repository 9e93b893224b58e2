#include "frame_sampler.hpp"
#include <algorithm>
#include <stdexcept>

namespace insidemotion {

FrameSampler::FrameSampler(VideoSource& source, int stride, int max_width)
    : source_(source)
    , stride_(stride)
    , max_width_(max_width)
    , fps_(source.info().fps) {
    if (stride_ < 1) {
        throw std::invalid_argument("Frame stride must be at least 1");
    }
}

std::optional<SampledFrame> FrameSampler::next() {
    while (!finished_) {
        auto frame = source_.next_frame();
        if (!frame) {
            finished_ = true;
            break;
        }

        int index = frames_read_++;
        if (index % stride_ != 0) {
            continue;
        }

        SampledFrame sampled;
        sampled.frame_index = index;
        sampled.timestamp = fps_ > 0.0 ? index / fps_ : 0.0;
        sampled.frame = prepare(*frame);
        return sampled;
    }
    return std::nullopt;
}

cv::Mat FrameSampler::prepare(const cv::Mat& bgr) const {
    cv::Mat rgb;
    if (max_width_ > 0 && bgr.cols > max_width_) {
        double scale = static_cast<double>(max_width_) / bgr.cols;
        cv::Size target(max_width_, std::max(1, static_cast<int>(bgr.rows * scale)));
        cv::resize(bgr, rgb, target, 0, 0, cv::INTER_AREA);
        cv::cvtColor(rgb, rgb, cv::COLOR_BGR2RGB);
    } else {
        cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
    }
    return rgb;
}

} // namespace insidemotion

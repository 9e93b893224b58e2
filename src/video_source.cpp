#include "video_source.hpp"
#include <filesystem>
#include <iostream>

namespace insidemotion {

std::string fourcc_to_string(int fourcc) {
    char codec_chars[5];
    codec_chars[0] = static_cast<char>(fourcc & 0xFF);
    codec_chars[1] = static_cast<char>((fourcc >> 8) & 0xFF);
    codec_chars[2] = static_cast<char>((fourcc >> 16) & 0xFF);
    codec_chars[3] = static_cast<char>((fourcc >> 24) & 0xFF);
    codec_chars[4] = '\0';
    return std::string(codec_chars);
}

OpenCVVideoSource::OpenCVVideoSource(const std::string& video_path)
    : path_(video_path) {
    if (!std::filesystem::exists(video_path)) {
        throw VideoOpenError("Video file not found: " + video_path);
    }

    try {
        cap_.open(video_path);
    } catch (const cv::Exception& e) {
        throw VideoOpenError("Failed to open video: " + video_path + " (" + e.what() + ")");
    }
    if (!cap_.isOpened()) {
        throw VideoOpenError("Failed to open video: " + video_path);
    }

    info_.total_frames = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_COUNT));
    info_.fps = cap_.get(cv::CAP_PROP_FPS);
    info_.duration = info_.fps > 0.0 ? info_.total_frames / info_.fps : 0.0;
    info_.frame_size = cv::Size(
        static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH)),
        static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT))
    );
    info_.codec = fourcc_to_string(static_cast<int>(cap_.get(cv::CAP_PROP_FOURCC)));
}

OpenCVVideoSource::~OpenCVVideoSource() {
    cap_.release();
}

std::optional<cv::Mat> OpenCVVideoSource::next_frame() {
    cv::Mat frame;
    try {
        if (!cap_.read(frame) || frame.empty()) {
            return std::nullopt;
        }
    } catch (const cv::Exception& e) {
        // A corrupt packet ends the stream early instead of failing the session
        std::cerr << "Decode error in " << path_ << ": " << e.what()
                  << ", treating as end of stream" << std::endl;
        return std::nullopt;
    }
    return frame;
}

bool OpenCVVideoSource::seek(int index) {
    if (index < 0) {
        return false;
    }
    try {
        return cap_.set(cv::CAP_PROP_POS_FRAMES, index);
    } catch (const cv::Exception& e) {
        std::cerr << "Seek to frame " << index << " failed: " << e.what() << std::endl;
        return false;
    }
}

VideoInfo OpenCVVideoSource::info() const {
    return info_;
}

} // namespace insidemotion

#pragma once

#include <opencv2/opencv.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace insidemotion {

class VideoOpenError : public std::runtime_error {
public:
    explicit VideoOpenError(const std::string& what) : std::runtime_error(what) {}
};

struct VideoInfo {
    int total_frames = 0;
    double fps = 0.0;
    double duration = 0.0;
    cv::Size frame_size;
    std::string codec;
};

// Sequential decode plus random re-seek, in the decoder's native BGR
class VideoSource {
public:
    virtual ~VideoSource() = default;

    // Empty at end of stream or on a decode failure
    virtual std::optional<cv::Mat> next_frame() = 0;

    // Positions the stream so the next next_frame() returns frame `index`
    virtual bool seek(int index) = 0;

    virtual VideoInfo info() const = 0;
};

class OpenCVVideoSource : public VideoSource {
public:
    // Throws VideoOpenError when the file is missing or cannot be decoded
    explicit OpenCVVideoSource(const std::string& video_path);
    ~OpenCVVideoSource() override;

    OpenCVVideoSource(const OpenCVVideoSource&) = delete;
    OpenCVVideoSource& operator=(const OpenCVVideoSource&) = delete;

    std::optional<cv::Mat> next_frame() override;
    bool seek(int index) override;
    VideoInfo info() const override;

private:
    std::string path_;
    cv::VideoCapture cap_;
    VideoInfo info_;
};

std::string fourcc_to_string(int fourcc);

} // namespace insidemotion

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "ppeguard/config.hpp"

namespace ppeguard {

class FrameSource {
public:
    virtual ~FrameSource() = default;
    // std::nullopt once the source is exhausted or can no longer be read.
    virtual std::optional<cv::Mat> readFrame() = 0;
    // Frames per second reported by the source, 0 when unknown.
    virtual double frameRateHint() const = 0;
};

bool isStillImage(const std::string& uri);

// Camera index ("0"), video file, network stream or still image. A still image
// is delivered once and the source then reports exhaustion.
class VideoFrameSource : public FrameSource {
public:
    explicit VideoFrameSource(SourceConfig config);
    ~VideoFrameSource() override;

    VideoFrameSource(const VideoFrameSource&) = delete;
    VideoFrameSource& operator=(const VideoFrameSource&) = delete;

    // Throws std::runtime_error when the source cannot be opened.
    void open();
    void close();
    bool isOpen() const;

    std::optional<cv::Mat> readFrame() override;
    double frameRateHint() const override;

    const SourceConfig& config() const { return config_; }

private:
    SourceConfig config_;
    std::unique_ptr<cv::VideoCapture> capture_;
    cv::Mat still_;
    bool still_delivered_ = false;
    double fps_ = 0.0;
};

}  // namespace ppeguard

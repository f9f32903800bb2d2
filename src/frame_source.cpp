#include "ppeguard/frame_source.hpp"
#include "ppeguard/common.hpp"
#include "ppeguard/vision.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <opencv2/imgcodecs.hpp>

namespace ppeguard {

namespace {

bool isCameraIndex(const std::string& uri)
{
    return !uri.empty() && std::all_of(uri.begin(), uri.end(), [](unsigned char c) { return std::isdigit(c); });
}

}  // namespace

bool isStillImage(const std::string& uri)
{
    static const char* kExtensions[] = {".png", ".jpg", ".jpeg", ".bmp", ".tiff", ".webp"};
    std::string ext = toLower(std::filesystem::path(uri).extension().string());
    for (const char* candidate : kExtensions) {
        if (ext == candidate) {
            return true;
        }
    }
    return false;
}

VideoFrameSource::VideoFrameSource(SourceConfig config) : config_(std::move(config)) {}

VideoFrameSource::~VideoFrameSource()
{
    close();
}

void VideoFrameSource::open()
{
    close();
    const std::string& uri = config_.uri;

    if (isStillImage(uri)) {
        still_ = cv::imread(uri, cv::IMREAD_COLOR);
        if (still_.empty()) {
            throw std::runtime_error("Unable to read image: " + uri);
        }
        still_delivered_ = false;
        fps_ = 0.0;
        std::cout << "[Source] Opened still image " << uri << std::endl;
        return;
    }

    capture_ = std::make_unique<cv::VideoCapture>();
    bool opened = isCameraIndex(uri) ? capture_->open(std::stoi(uri)) : capture_->open(uri);
    if (!opened || !capture_->isOpened()) {
        capture_.reset();
        throw std::runtime_error("Unable to open video source: " + uri);
    }
    fps_ = capture_->get(cv::CAP_PROP_FPS);
    if (!(fps_ > 0.0)) {
        fps_ = 0.0;
    }
    std::cout << "[Source] Opened " << uri << " (fps " << fps_ << ")" << std::endl;
}

void VideoFrameSource::close()
{
    if (capture_) {
        capture_->release();
        capture_.reset();
        std::cout << "[Source] Released " << config_.uri << std::endl;
    }
    still_.release();
}

bool VideoFrameSource::isOpen() const
{
    return (capture_ && capture_->isOpened()) || (!still_.empty() && !still_delivered_);
}

std::optional<cv::Mat> VideoFrameSource::readFrame()
{
    cv::Mat frame;
    if (!still_.empty()) {
        if (still_delivered_) {
            return std::nullopt;
        }
        still_delivered_ = true;
        frame = still_.clone();
    } else if (capture_ && capture_->isOpened()) {
        if (!capture_->read(frame) || frame.empty()) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }
    return resizeForDisplay(frame, config_.display_width, config_.display_height);
}

double VideoFrameSource::frameRateHint() const
{
    return fps_;
}

}  // namespace ppeguard

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ppeguard/config.hpp"
#include "ppeguard/detector.hpp"

namespace ppeguard {

// One class name per line; blank lines are skipped.
std::vector<std::string> loadClassNames(const std::string& path);

// YOLOv8-style detector (output [1, 4 + classes, N]) running on ONNX Runtime.
class YoloDetector : public Detector {
public:
    explicit YoloDetector(DetectorConfig config);
    ~YoloDetector() override;

    // Throws std::runtime_error when the model cannot be loaded.
    void load();
    void release();

    bool isLoaded() const noexcept { return loaded_; }
    const std::vector<std::string>& classNames() const noexcept { return class_names_; }

    std::vector<Detection> detect(const cv::Mat& frame) override;

private:
    struct Impl;

    DetectorConfig config_;
    std::vector<std::string> class_names_;
    bool loaded_ = false;
    std::unique_ptr<Impl> impl_;
};

}  // namespace ppeguard

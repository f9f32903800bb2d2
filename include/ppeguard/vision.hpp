#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "ppeguard/common.hpp"
#include "ppeguard/frame_analyzer.hpp"

namespace ppeguard {

struct PreprocessInfo {
    std::vector<float> input_tensor;  // CHW, RGB order, scaled to [0, 1]
    float scale;
    int pad_x;
    int pad_y;
    cv::Mat letterboxed;
};

// Fits the image into input_w x input_h keeping its aspect ratio; padding is grey.
PreprocessInfo preprocessLetterbox(const cv::Mat& img, int input_w, int input_h);

// Indices of the boxes kept, highest score first.
std::vector<int> NMS(const std::vector<cv::Rect2f>& boxes,
                     const std::vector<float>& scores,
                     float iouThreshold = 0.45f);
float IoU(const cv::Rect2f& a, const cv::Rect2f& b);

// Scales to width x height; a non-positive dimension keeps the frame as is.
cv::Mat resizeForDisplay(const cv::Mat& frame, int width, int height);

// Draws every detection (violations red, others green) and a status banner.
void annotateFrame(cv::Mat& frame, const std::vector<Detection>& detections,
                   const FrameAnalyzer& analyzer, const ComplianceMetrics& metrics);

}  // namespace ppeguard

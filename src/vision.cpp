#include "ppeguard/vision.hpp"

#include <algorithm>
#include <cstdio>
#include <numeric>
#include <string>

#include <opencv2/imgproc.hpp>

namespace ppeguard {

PreprocessInfo preprocessLetterbox(const cv::Mat& img, int input_w, int input_h)
{
    int img_w = img.cols;
    int img_h = img.rows;

    float scale = std::min((float)input_w / img_w, (float)input_h / img_h);

    int new_w = static_cast<int>(img_w * scale);
    int new_h = static_cast<int>(img_h * scale);

    cv::Mat resized;
    cv::resize(img, resized, cv::Size(new_w, new_h));

    int pad_x = (input_w - new_w) / 2;
    int pad_y = (input_h - new_h) / 2;

    cv::Mat letterbox(input_h, input_w, img.type(), cv::Scalar(114, 114, 114));
    resized.copyTo(letterbox(cv::Rect(pad_x, pad_y, new_w, new_h)));

    // Models are exported for RGB input; frames arrive as BGR.
    cv::Mat rgb;
    cv::cvtColor(letterbox, rgb, cv::COLOR_BGR2RGB);

    cv::Mat float_img;
    rgb.convertTo(float_img, CV_32F, 1.0 / 255.0);
    std::vector<cv::Mat> chw(3);
    cv::split(float_img, chw);

    std::vector<float> input_tensor;
    input_tensor.reserve(static_cast<std::size_t>(input_w) * input_h * 3);
    for (int c = 0; c < 3; ++c) {
        input_tensor.insert(input_tensor.end(),
                            (float*)chw[c].datastart,
                            (float*)chw[c].dataend);
    }

    return {input_tensor, scale, pad_x, pad_y, letterbox};
}

std::vector<int> NMS(const std::vector<cv::Rect2f>& boxes,
                     const std::vector<float>& scores,
                     float iouThreshold) {
    std::vector<int> indices;
    std::vector<int> order(boxes.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(),
              [&](int i, int j) { return scores[i] > scores[j]; });

    std::vector<bool> suppressed(boxes.size(), false);
    for (size_t i = 0; i < order.size(); i++) {
        int idx = order[i];
        if (suppressed[idx]) continue;
        indices.push_back(idx);
        for (size_t j = i + 1; j < order.size(); j++) {
            int idx2 = order[j];
            if (IoU(boxes[idx], boxes[idx2]) > iouThreshold)
                suppressed[idx2] = true;
        }
    }
    return indices;
}

float IoU(const cv::Rect2f& a, const cv::Rect2f& b) {
    float interArea = (a & b).area();
    float unionArea = a.area() + b.area() - interArea;
    if (unionArea <= 0.0f) {
        return 0.0f;
    }
    return interArea / unionArea;
}

cv::Mat resizeForDisplay(const cv::Mat& frame, int width, int height)
{
    if (frame.empty() || width <= 0 || height <= 0 ||
        (frame.cols == width && frame.rows == height)) {
        return frame;
    }
    cv::Mat resized;
    cv::resize(frame, resized, cv::Size(width, height), 0, 0, cv::INTER_LINEAR);
    return resized;
}

void annotateFrame(cv::Mat& frame, const std::vector<Detection>& detections,
                   const FrameAnalyzer& analyzer, const ComplianceMetrics& metrics)
{
    if (frame.empty()) {
        return;
    }
    const cv::Scalar red(0, 0, 255);
    const cv::Scalar green(0, 200, 0);

    for (const auto& det : detections) {
        const cv::Scalar& color = analyzer.isViolation(det.class_name) ? red : green;
        cv::Rect rect(cv::Point(det.box.x1, det.box.y1), cv::Point(det.box.x2, det.box.y2));
        cv::rectangle(frame, rect, color, 2);

        char label[128];
        std::snprintf(label, sizeof(label), "%s %.2f", det.class_name.c_str(), det.confidence);
        int baseline = 0;
        cv::Size text = cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX, 0.5, 1, &baseline);
        int top = std::max(det.box.y1, text.height + 4);
        cv::rectangle(frame, cv::Point(det.box.x1, top - text.height - 4),
                      cv::Point(det.box.x1 + text.width, top), color, cv::FILLED);
        cv::putText(frame, label, cv::Point(det.box.x1, top - 2), cv::FONT_HERSHEY_SIMPLEX, 0.5,
                    cv::Scalar(255, 255, 255), 1, cv::LINE_AA);
    }

    std::string banner = std::string(statusToString(metrics.status)) +
                         " | persons: " + std::to_string(metrics.person_count) +
                         " | ppe: " + std::to_string(metrics.ppe_worn_count) +
                         " | violations: " + std::to_string(metrics.violation_count);
    const cv::Scalar& banner_color = metrics.status == ComplianceStatus::ViolationsDetected ? red : green;
    cv::rectangle(frame, cv::Point(0, 0), cv::Point(frame.cols, 28), cv::Scalar(0, 0, 0), cv::FILLED);
    cv::putText(frame, banner, cv::Point(8, 20), cv::FONT_HERSHEY_SIMPLEX, 0.6, banner_color, 2, cv::LINE_AA);
}

}  // namespace ppeguard

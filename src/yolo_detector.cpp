#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "ppeguard/yolo_detector.hpp"
#include "ppeguard/vision.hpp"

#ifdef PPEGUARD_HAS_ONNXRUNTIME
#include <onnxruntime_cxx_api.h>
#endif

namespace ppeguard {

struct YoloDetector::Impl {
#if defined(PPEGUARD_HAS_ONNXRUNTIME)
    explicit Impl(int threads) : env(ORT_LOGGING_LEVEL_WARNING, "ppeguard") {
        session_options.SetIntraOpNumThreads(threads > 0 ? threads : 1);
        session_options.SetGraphOptimizationLevel(ORT_ENABLE_EXTENDED);
    }
    Ort::Env env;
    Ort::SessionOptions session_options;
    std::unique_ptr<Ort::Session> session;
    std::vector<std::string> input_names;
    std::vector<const char*> input_name_ptrs;
    std::vector<std::string> output_names;
    std::vector<const char*> output_name_ptrs;
#else
    explicit Impl(int) {}
#endif
    std::vector<int64_t> input_shape{1, 3, 640, 640};
};

std::vector<std::string> loadClassNames(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Unable to open class names file: " + path);
    }
    std::vector<std::string> names;
    std::string line;
    while (std::getline(in, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
            line.pop_back();
        }
        if (!line.empty()) {
            names.push_back(line);
        }
    }
    return names;
}

YoloDetector::YoloDetector(DetectorConfig config)
    : config_(std::move(config)), impl_(std::make_unique<Impl>(config_.intra_op_threads)) {}

YoloDetector::~YoloDetector() = default;

void YoloDetector::load()
{
    if (loaded_) {
        return;
    }
    const std::string& model_path = config_.model_path;
    if (!std::filesystem::exists(model_path)) {
        throw std::runtime_error("Model file not found: " + model_path);
    }
    class_names_ = loadClassNames(config_.class_names_path);

#if defined(PPEGUARD_HAS_ONNXRUNTIME)
    try {
        impl_->session = std::make_unique<Ort::Session>(impl_->env, model_path.c_str(), impl_->session_options);

        impl_->input_names = impl_->session->GetInputNames();
        impl_->input_name_ptrs.clear();
        for (const auto& name : impl_->input_names) {
            impl_->input_name_ptrs.push_back(name.c_str());
        }

        impl_->output_names = impl_->session->GetOutputNames();
        impl_->output_name_ptrs.clear();
        for (const auto& name : impl_->output_names) {
            impl_->output_name_ptrs.push_back(name.c_str());
        }

        if (!impl_->input_names.empty()) {
            Ort::TypeInfo type_info = impl_->session->GetInputTypeInfo(0);
            auto tensor_info = type_info.GetTensorTypeAndShapeInfo();
            impl_->input_shape = tensor_info.GetShape();
            // Dynamic axes come back as -1; fall back to the usual 640 square.
            for (std::size_t i = 0; i < impl_->input_shape.size(); ++i) {
                if (impl_->input_shape[i] <= 0) {
                    impl_->input_shape[i] = i >= 2 ? 640 : 1;
                }
            }
        }
    } catch (const Ort::Exception& ex) {
        impl_->session.reset();
        throw std::runtime_error(std::string("Failed to load YOLO model: ") + ex.what());
    }
#else
    throw std::runtime_error("ONNX Runtime backend is not available in this build");
#endif

    loaded_ = true;
    std::cout << "[YoloDetector] Loaded " << model_path << " with " << class_names_.size()
              << " classes" << std::endl;
}

void YoloDetector::release()
{
#if defined(PPEGUARD_HAS_ONNXRUNTIME)
    impl_->input_names.clear();
    impl_->input_name_ptrs.clear();
    impl_->output_names.clear();
    impl_->output_name_ptrs.clear();
    impl_->session.reset();
#endif
    loaded_ = false;
}

std::vector<Detection> YoloDetector::detect(const cv::Mat& frame)
{
    std::vector<Detection> detections;
    if (frame.empty()) {
        return detections;
    }
    if (!loaded_) {
        throw std::runtime_error("YOLO model is not loaded");
    }

#if defined(PPEGUARD_HAS_ONNXRUNTIME)
    if (impl_->input_shape.size() < 4) {
        throw std::runtime_error("Unexpected model input rank");
    }
    const int input_h = static_cast<int>(impl_->input_shape[2]);
    const int input_w = static_cast<int>(impl_->input_shape[3]);

    auto prep = preprocessLetterbox(frame, input_w, input_h);

    std::array<int64_t, 4> input_shape{1, 3, input_h, input_w};
    Ort::MemoryInfo mem_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeCPU);
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        mem_info, prep.input_tensor.data(), prep.input_tensor.size(),
        input_shape.data(), input_shape.size()
    );

    std::vector<Ort::Value> outputs;
    try {
        outputs = impl_->session->Run(
            Ort::RunOptions{},
            impl_->input_name_ptrs.data(), &input_tensor, 1,
            impl_->output_name_ptrs.data(), impl_->output_name_ptrs.size()
        );
    } catch (const Ort::Exception& ex) {
        throw std::runtime_error(std::string("YOLO inference failed: ") + ex.what());
    }

    if (outputs.empty() || !outputs.front().IsTensor()) {
        throw std::runtime_error("YOLO model produced no tensor output");
    }
    auto shape = outputs.front().GetTensorTypeAndShapeInfo().GetShape();
    if (shape.size() != 3 || shape[0] != 1 || shape[1] <= 4) {
        throw std::runtime_error("Unexpected YOLO output shape");
    }

    const int attrs = static_cast<int>(shape[1]);
    const int count = static_cast<int>(shape[2]);
    const int num_classes = attrs - 4;
    const float* data = outputs.front().GetTensorData<float>();
    auto at = [&](int attr, int i) { return data[attr * count + i]; };

    // Candidates grouped by class so NMS never suppresses across classes.
    std::map<int, std::vector<cv::Rect2f>> boxes;
    std::map<int, std::vector<float>> scores;
    const float conf_threshold = static_cast<float>(config_.confidence_threshold);

    for (int i = 0; i < count; ++i) {
        int best_cls = -1;
        float best_score = -1.0f;
        for (int c = 0; c < num_classes; ++c) {
            float p = at(4 + c, i);
            if (p > best_score) {
                best_score = p;
                best_cls = c;
            }
        }
        if (best_score < conf_threshold) {
            continue;
        }

        float cx = at(0, i);
        float cy = at(1, i);
        float w = at(2, i);
        float h = at(3, i);

        float x1 = std::clamp((cx - w * 0.5f - prep.pad_x) / prep.scale, 0.f, (float)frame.cols - 1);
        float y1 = std::clamp((cy - h * 0.5f - prep.pad_y) / prep.scale, 0.f, (float)frame.rows - 1);
        float x2 = std::clamp((cx + w * 0.5f - prep.pad_x) / prep.scale, 0.f, (float)frame.cols - 1);
        float y2 = std::clamp((cy + h * 0.5f - prep.pad_y) / prep.scale, 0.f, (float)frame.rows - 1);
        if (x2 <= x1 || y2 <= y1) {
            continue;
        }

        boxes[best_cls].emplace_back(x1, y1, x2 - x1, y2 - y1);
        scores[best_cls].push_back(best_score);
    }

    const float iou_threshold = static_cast<float>(config_.iou_threshold);
    for (const auto& entry : boxes) {
        const int cls = entry.first;
        const auto& cls_boxes = entry.second;
        const auto& cls_scores = scores[cls];
        for (int idx : NMS(cls_boxes, cls_scores, iou_threshold)) {
            const auto& r = cls_boxes[idx];
            Detection det;
            det.box.x1 = static_cast<int>(std::round(r.x));
            det.box.y1 = static_cast<int>(std::round(r.y));
            det.box.x2 = static_cast<int>(std::round(r.x + r.width));
            det.box.y2 = static_cast<int>(std::round(r.y + r.height));
            det.confidence = cls_scores[idx];
            det.class_name = cls < static_cast<int>(class_names_.size())
                                 ? class_names_[cls]
                                 : "class_" + std::to_string(cls);
            detections.push_back(std::move(det));
        }
    }
#endif
    return detections;
}

}  // namespace ppeguard

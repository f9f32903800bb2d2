#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "ppeguard/common.hpp"

namespace ppeguard {

// Maps one frame to the objects found in it. May throw; must not keep the frame.
class Detector {
public:
    virtual ~Detector() = default;
    virtual std::vector<Detection> detect(const cv::Mat& frame) = 0;
};

}  // namespace ppeguard

#include "ppeguard/evidence_store.hpp"
#include "ppeguard/common.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include <opencv2/imgcodecs.hpp>

namespace ppeguard {

DiskEvidenceStore::DiskEvidenceStore(std::filesystem::path directory, int jpeg_quality)
    : directory_(std::move(directory)), jpeg_quality_(jpeg_quality) {
    if (directory_.empty()) {
        directory_ = "snapshots";
    }
}

void DiskEvidenceStore::ensureDirectory() {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create snapshot directory " + directory_.string() + ": " + ec.message());
    }
}

std::string DiskEvidenceStore::captureSnapshot(const cv::Mat& frame) {
    if (frame.empty()) {
        throw std::runtime_error("Refusing to store an empty frame");
    }
    ensureDirectory();

    std::ostringstream name;
    name << "violation_" << formatUtc(Clock::now(), "%Y%m%d_%H%M%S") << "_"
         << std::setw(4) << std::setfill('0') << ++sequence_ << ".jpg";
    std::filesystem::path file_path = directory_ / name.str();

    std::vector<int> params{cv::IMWRITE_JPEG_QUALITY, jpeg_quality_};
    if (!cv::imwrite(file_path.string(), frame, params)) {
        throw std::runtime_error("Failed to write snapshot " + file_path.string());
    }
    std::cout << "[Evidence] Saved " << file_path.generic_string() << std::endl;
    return file_path.generic_string();
}

}  // namespace ppeguard

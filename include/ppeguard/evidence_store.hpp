#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include <opencv2/core.hpp>

namespace ppeguard {

class EvidenceStore {
public:
    virtual ~EvidenceStore() = default;
    // Persists the frame and returns where it went. Throws on failure.
    virtual std::string captureSnapshot(const cv::Mat& frame) = 0;
};

// Writes JPEG snapshots as violation_YYYYmmdd_HHMMSS_<seq>.jpg under one directory.
class DiskEvidenceStore : public EvidenceStore {
public:
    explicit DiskEvidenceStore(std::filesystem::path directory, int jpeg_quality = 90);

    std::string captureSnapshot(const cv::Mat& frame) override;

    const std::filesystem::path& directory() const { return directory_; }
    std::size_t captured() const { return sequence_; }

private:
    void ensureDirectory();

    std::filesystem::path directory_;
    int jpeg_quality_;
    std::size_t sequence_ = 0;
};

}  // namespace ppeguard

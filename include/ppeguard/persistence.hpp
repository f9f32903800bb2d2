#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "ppeguard/common.hpp"
#include "ppeguard/frame_analyzer.hpp"

namespace ppeguard {

class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Aggregated compliance state for one log interval, as written to storage.
struct ComplianceWindow {
    TimePoint started_at{};
    unsigned person_count = 0;
    unsigned ppe_worn_count = 0;
    unsigned violation_count = 0;
    ComplianceStatus status = ComplianceStatus::NoPersonsDetected;
    std::optional<std::string> snapshot_path;

    ComplianceMetrics metrics() const {
        return ComplianceMetrics{person_count, ppe_worn_count, violation_count, status};
    }
};

struct StoredWindow {
    std::int64_t id = 0;
    ComplianceWindow window;
};

struct StoredViolation {
    std::int64_t id = 0;
    std::int64_t window_id = 0;
    TimePoint recorded_at{};
    ViolationEvent event;
    bool resolved = false;
};

struct ComplianceSummary {
    std::int64_t windows = 0;
    std::int64_t persons = 0;
    std::int64_t violations = 0;
    double compliance_rate = 100.0;  // percent, never below zero
};

Json windowToJson(const StoredWindow& stored);
Json storedViolationToJson(const StoredViolation& stored);
Json summaryToJson(const ComplianceSummary& summary);

// Storage backend for compliance windows and their violation events. Writes
// throw StorageError on failure.
class Persistence {
public:
    virtual ~Persistence() = default;

    virtual std::int64_t saveComplianceWindow(const ComplianceWindow& window) = 0;
    virtual std::int64_t saveViolationEvent(std::int64_t window_id, const ViolationEvent& event) = 0;

    virtual std::vector<StoredWindow> recentWindows(std::size_t limit) = 0;
    virtual std::vector<StoredViolation> violationsForWindow(std::int64_t window_id) = 0;
    virtual std::vector<StoredViolation> recentViolations(std::size_t limit) = 0;
    virtual ComplianceSummary summarySince(TimePoint since) = 0;
};

}  // namespace ppeguard

#pragma once

#include <string>
#include <vector>

#include "ppeguard/common.hpp"
#include "ppeguard/config.hpp"

namespace ppeguard {

enum class ComplianceStatus { Compliant, ViolationsDetected, NoPersonsDetected };

const char* statusToString(ComplianceStatus status);

struct ComplianceMetrics {
    unsigned person_count = 0;
    unsigned ppe_worn_count = 0;
    unsigned violation_count = 0;
    ComplianceStatus status = ComplianceStatus::NoPersonsDetected;

    bool operator==(const ComplianceMetrics& other) const {
        return person_count == other.person_count && ppe_worn_count == other.ppe_worn_count &&
               violation_count == other.violation_count && status == other.status;
    }
};

struct ViolationEvent {
    std::string violation_type;
    Box box;
    float confidence = 0.0f;
    int severity = 1;
};

struct FrameAnalysis {
    ComplianceMetrics metrics;
    std::vector<ViolationEvent> violations;
};

Json metricsToJson(const ComplianceMetrics& metrics);
Json violationToJson(const ViolationEvent& event);

// Interprets one frame's detections against the configured PPE rules.
class FrameAnalyzer {
public:
    explicit FrameAnalyzer(ComplianceRules rules = {});

    FrameAnalysis analyze(const std::vector<Detection>& detections) const;

    int severityFor(const std::string& violation_type) const;
    bool isViolation(const std::string& class_name) const;

    const ComplianceRules& rules() const { return rules_; }

private:
    ComplianceRules rules_;
};

}  // namespace ppeguard

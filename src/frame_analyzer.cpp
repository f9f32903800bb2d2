#include "ppeguard/frame_analyzer.hpp"

#include <utility>

namespace ppeguard {

const char* statusToString(ComplianceStatus status) {
    switch (status) {
    case ComplianceStatus::Compliant: return "Compliant";
    case ComplianceStatus::ViolationsDetected: return "Violations Detected";
    case ComplianceStatus::NoPersonsDetected: return "No Persons Detected";
    }
    return "Unknown";
}

Json metricsToJson(const ComplianceMetrics& metrics) {
    Json value = Json::object();
    value["person_count"] = metrics.person_count;
    value["ppe_worn_count"] = metrics.ppe_worn_count;
    value["violation_count"] = metrics.violation_count;
    value["status"] = statusToString(metrics.status);
    return value;
}

Json violationToJson(const ViolationEvent& event) {
    Json value = Json::object();
    value["violation_type"] = event.violation_type;
    value["box"] = boxToJson(event.box);
    value["confidence"] = event.confidence;
    value["severity"] = event.severity;
    return value;
}

FrameAnalyzer::FrameAnalyzer(ComplianceRules rules) : rules_(std::move(rules)) {}

bool FrameAnalyzer::isViolation(const std::string& class_name) const {
    const auto& prefix = rules_.violation_prefix;
    return !prefix.empty() && class_name.size() > prefix.size() &&
           class_name.compare(0, prefix.size(), prefix) == 0;
}

int FrameAnalyzer::severityFor(const std::string& violation_type) const {
    const std::string lowered = toLower(violation_type);
    for (const auto& rule : rules_.severity_table) {
        if (lowered.find(toLower(rule.keyword)) != std::string::npos) {
            return rule.severity;
        }
    }
    return rules_.default_severity;
}

FrameAnalysis FrameAnalyzer::analyze(const std::vector<Detection>& detections) const {
    FrameAnalysis result;
    auto& metrics = result.metrics;

    for (const auto& detection : detections) {
        const std::string& name = detection.class_name;
        if (name == rules_.person_class) {
            ++metrics.person_count;
        }
        if (rules_.worn_ppe.count(name) != 0) {
            ++metrics.ppe_worn_count;
        }
        if (isViolation(name)) {
            ++metrics.violation_count;
            ViolationEvent event;
            event.violation_type = name;
            event.box = detection.box;
            event.confidence = detection.confidence;
            event.severity = severityFor(name);
            result.violations.push_back(std::move(event));
        }
    }

    if (metrics.violation_count > 0) {
        metrics.status = ComplianceStatus::ViolationsDetected;
    } else if (metrics.person_count == 0) {
        metrics.status = ComplianceStatus::NoPersonsDetected;
    } else {
        metrics.status = ComplianceStatus::Compliant;
    }
    return result;
}

}  // namespace ppeguard

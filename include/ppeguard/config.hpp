#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include "ppeguard/json.hpp"

namespace ppeguard {

struct ServiceInfo {
    std::string name{"PPE Guard"};
    std::string description;
};

struct SourceConfig {
    std::string uri{"0"};  // camera index, video file, stream URL or still image
    int display_width{1280};  // 0 keeps the native frame size
    int display_height{720};
};

struct DetectorConfig {
    std::string model_path{"models/ppe.onnx"};
    std::string class_names_path{"models/classes.txt"};
    double confidence_threshold{0.5};
    double iou_threshold{0.45};
    int intra_op_threads{1};
};

// A violation type containing `keyword` gets `severity`; first match wins.
struct SeverityRule {
    std::string keyword;
    int severity{1};
};

struct ComplianceRules {
    std::string person_class{"person"};
    std::string violation_prefix{"no-"};
    std::set<std::string> worn_ppe{"helmet", "vest", "gloves"};
    std::vector<SeverityRule> severity_table{{"helmet", 4}, {"hardhat", 4}, {"vest", 2}};
    int default_severity{1};
};

struct RecorderConfig {
    double log_interval_seconds{5.0};
    std::size_t max_events_per_window{500};
};

struct SnapshotConfig {
    bool enabled{true};
    int consecutive_violations{5};
    std::string directory{"snapshots"};
};

struct AlertConfig {
    double cooldown_seconds{60.0};
};

struct MqttConfig {
    std::string server;
    int port{1883};
    std::string client_id{"ppeguard"};
    std::string username;
    std::string password;
    std::string alert_topic{"ppeguard/alerts"};
    std::string status_topic{"ppeguard/status"};
    int keep_alive{60};
    int qos{1};
};

struct DatabaseConfig {
    std::string path{"ppeguard.db"};
};

struct WorkerConfig {
    std::size_t persistence_queue{64};
    std::size_t alert_threads{2};
    std::size_t alert_queue{32};
};

struct AppConfig {
    std::string version;
    std::string source_path;

    ServiceInfo service;
    SourceConfig source;
    DetectorConfig detector;
    ComplianceRules rules;
    RecorderConfig recorder;
    SnapshotConfig snapshot;
    AlertConfig alerts;
    MqttConfig mqtt;
    DatabaseConfig database;
    WorkerConfig workers;
};

// Relative paths inside the document are resolved against base_dir.
AppConfig parseConfig(const Json& root, const std::string& base_dir);
AppConfig loadConfig(const std::string& path);

// PPEGUARD_SOURCE, PPEGUARD_MODEL, PPEGUARD_DB and PPEGUARD_MQTT_* take precedence
// over the file.
void applyEnvironmentOverrides(AppConfig& config);

// Throws std::runtime_error describing the first invalid value.
void validateConfig(const AppConfig& config);

Json configSummary(const AppConfig& config);

}  // namespace ppeguard

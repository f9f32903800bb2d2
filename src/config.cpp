#include "ppeguard/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include "ppeguard/common.hpp"

namespace ppeguard {
namespace {

std::string resolvePath(const std::string& root, const std::string& path) {
    if (path.empty() || root.empty()) {
        return path;
    }
    std::filesystem::path p(path);
    if (p.is_absolute()) {
        return p.string();
    }
    return (std::filesystem::path(root) / p).lexically_normal().string();
}

std::size_t parseCount(const Json& node, const std::string& key, std::size_t fallback) {
    double value = node.get_number(key, static_cast<double>(fallback));
    if (value < 0.0) {
        throw std::runtime_error("'" + key + "' must not be negative");
    }
    return static_cast<std::size_t>(value);
}

ComplianceRules parseRules(const Json& node) {
    ComplianceRules rules;
    rules.person_class = node.get_string("person_class", rules.person_class);
    rules.violation_prefix = node.get_string("violation_prefix", rules.violation_prefix);
    rules.default_severity = node.get_int("default_severity", rules.default_severity);

    if (node.contains("worn_ppe")) {
        auto items = parseStringList(node["worn_ppe"]);
        rules.worn_ppe = std::set<std::string>(items.begin(), items.end());
    }

    if (node.contains("severity")) {
        rules.severity_table.clear();
        for (const auto& entry : node["severity"].as_array()) {
            SeverityRule rule;
            rule.keyword = entry.get_string("keyword");
            rule.severity = entry.get_int("severity", 1);
            rules.severity_table.push_back(rule);
        }
    }
    return rules;
}

void overrideFromEnv(const char* name, std::string& target) {
    if (const char* value = std::getenv(name)) {
        target = value;
    }
}

}  // namespace

AppConfig parseConfig(const Json& root, const std::string& base_dir) {
    if (!root.is_object()) {
        throw std::runtime_error("Configuration root must be a JSON object");
    }

    AppConfig config;
    config.version = root.get_string("version");

    if (root.contains("service")) {
        const auto& service = root["service"];
        config.service.name = service.get_string("name", config.service.name);
        config.service.description = service.get_string("description");
    }

    if (root.contains("source")) {
        const auto& source = root["source"];
        config.source.uri = source.get_string("uri", config.source.uri);
        config.source.display_width = source.get_int("display_width", config.source.display_width);
        config.source.display_height = source.get_int("display_height", config.source.display_height);
    }

    if (root.contains("detector")) {
        const auto& detector = root["detector"];
        config.detector.model_path = detector.get_string("model_path", config.detector.model_path);
        config.detector.class_names_path =
            detector.get_string("class_names_path", config.detector.class_names_path);
        config.detector.confidence_threshold =
            detector.get_number("confidence_threshold", config.detector.confidence_threshold);
        config.detector.iou_threshold = detector.get_number("iou_threshold", config.detector.iou_threshold);
        config.detector.intra_op_threads = detector.get_int("intra_op_threads", config.detector.intra_op_threads);
    }
    config.detector.model_path = resolvePath(base_dir, config.detector.model_path);
    config.detector.class_names_path = resolvePath(base_dir, config.detector.class_names_path);

    if (root.contains("rules")) {
        config.rules = parseRules(root["rules"]);
    }

    if (root.contains("recorder")) {
        const auto& recorder = root["recorder"];
        config.recorder.log_interval_seconds =
            recorder.get_number("log_interval_seconds", config.recorder.log_interval_seconds);
        config.recorder.max_events_per_window =
            parseCount(recorder, "max_events_per_window", config.recorder.max_events_per_window);
    }

    if (root.contains("snapshot")) {
        const auto& snapshot = root["snapshot"];
        config.snapshot.enabled = snapshot.get_bool("enabled", config.snapshot.enabled);
        config.snapshot.consecutive_violations =
            snapshot.get_int("consecutive_violations", config.snapshot.consecutive_violations);
        config.snapshot.directory = snapshot.get_string("directory", config.snapshot.directory);
    }
    config.snapshot.directory = resolvePath(base_dir, config.snapshot.directory);

    if (root.contains("alerts")) {
        config.alerts.cooldown_seconds = root["alerts"].get_number("cooldown_seconds", config.alerts.cooldown_seconds);
    }

    if (root.contains("mqtt")) {
        const auto& mqtt = root["mqtt"];
        config.mqtt.server = mqtt.get_string("server");
        config.mqtt.port = mqtt.get_int("port", config.mqtt.port);
        config.mqtt.client_id = mqtt.get_string("client_id", config.mqtt.client_id);
        config.mqtt.username = mqtt.get_string("username");
        config.mqtt.password = mqtt.get_string("password");
        config.mqtt.alert_topic = mqtt.get_string("alert_topic", config.mqtt.alert_topic);
        config.mqtt.status_topic = mqtt.get_string("status_topic", config.mqtt.status_topic);
        config.mqtt.keep_alive = mqtt.get_int("keep_alive", config.mqtt.keep_alive);
        config.mqtt.qos = mqtt.get_int("qos", config.mqtt.qos);
    }

    if (root.contains("database")) {
        config.database.path = root["database"].get_string("path", config.database.path);
    }
    if (config.database.path != ":memory:") {
        config.database.path = resolvePath(base_dir, config.database.path);
    }

    if (root.contains("workers")) {
        const auto& workers = root["workers"];
        config.workers.persistence_queue = parseCount(workers, "persistence_queue", config.workers.persistence_queue);
        config.workers.alert_threads = parseCount(workers, "alert_threads", config.workers.alert_threads);
        config.workers.alert_queue = parseCount(workers, "alert_queue", config.workers.alert_queue);
    }

    return config;
}

AppConfig loadConfig(const std::string& path) {
    Json root = Json::parse_file(path);

    std::filesystem::path absoluteConfigPath = std::filesystem::absolute(path).lexically_normal();
    std::filesystem::path baseDir = absoluteConfigPath.has_parent_path() ? absoluteConfigPath.parent_path()
                                                                         : std::filesystem::path(".");

    AppConfig config = parseConfig(root, baseDir.string());
    config.source_path = absoluteConfigPath.generic_string();
    return config;
}

void applyEnvironmentOverrides(AppConfig& config) {
    overrideFromEnv("PPEGUARD_SOURCE", config.source.uri);
    overrideFromEnv("PPEGUARD_MODEL", config.detector.model_path);
    overrideFromEnv("PPEGUARD_DB", config.database.path);
    overrideFromEnv("PPEGUARD_MQTT_SERVER", config.mqtt.server);
    overrideFromEnv("PPEGUARD_MQTT_USERNAME", config.mqtt.username);
    overrideFromEnv("PPEGUARD_MQTT_PASSWORD", config.mqtt.password);
}

void validateConfig(const AppConfig& config) {
    if (config.recorder.log_interval_seconds <= 0.0) {
        throw std::runtime_error("recorder.log_interval_seconds must be positive");
    }
    if (config.snapshot.consecutive_violations < 1) {
        throw std::runtime_error("snapshot.consecutive_violations must be at least 1");
    }
    if (config.alerts.cooldown_seconds < 0.0) {
        throw std::runtime_error("alerts.cooldown_seconds must not be negative");
    }
    if (config.detector.confidence_threshold < 0.0 || config.detector.confidence_threshold > 1.0) {
        throw std::runtime_error("detector.confidence_threshold must be within [0, 1]");
    }
    if (config.rules.default_severity < 1 || config.rules.default_severity > 5) {
        throw std::runtime_error("rules.default_severity must be within 1..5");
    }
    for (const auto& rule : config.rules.severity_table) {
        if (rule.keyword.empty()) {
            throw std::runtime_error("rules.severity entries need a keyword");
        }
        if (rule.severity < 1 || rule.severity > 5) {
            throw std::runtime_error("Severity for '" + rule.keyword + "' must be within 1..5");
        }
    }
    if (config.mqtt.qos < 0 || config.mqtt.qos > 2) {
        throw std::runtime_error("mqtt.qos must be 0, 1 or 2");
    }
    if (config.workers.persistence_queue == 0 || config.workers.alert_queue == 0) {
        throw std::runtime_error("Worker queues must hold at least one task");
    }
}

Json configSummary(const AppConfig& config) {
    Json root = Json::object();
    root["service_name"] = config.service.name;
    if (!config.service.description.empty()) {
        root["description"] = config.service.description;
    }
    if (!config.version.empty()) {
        root["version"] = config.version;
    }
    root["source"] = config.source.uri;
    root["model"] = config.detector.model_path;
    root["database"] = config.database.path;
    root["log_interval_seconds"] = config.recorder.log_interval_seconds;
    root["snapshot_threshold"] = config.snapshot.consecutive_violations;
    root["snapshots_enabled"] = config.snapshot.enabled;
    root["alert_cooldown_seconds"] = config.alerts.cooldown_seconds;
    root["mqtt_server"] = config.mqtt.server;
    root["alert_topic"] = config.mqtt.alert_topic;

    Json worn = Json::array();
    for (const auto& item : config.rules.worn_ppe) {
        worn.push_back(item);
    }
    root["worn_ppe"] = worn;
    return root;
}

}  // namespace ppeguard

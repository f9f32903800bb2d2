#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <opencv2/highgui.hpp>
#include <opencv2/imgcodecs.hpp>

#include "ppeguard/alert_dispatcher.hpp"
#include "ppeguard/config.hpp"
#include "ppeguard/evidence_store.hpp"
#include "ppeguard/frame_analyzer.hpp"
#include "ppeguard/frame_source.hpp"
#include "ppeguard/mqtt_notifier.hpp"
#include "ppeguard/pipeline_driver.hpp"
#include "ppeguard/sqlite_store.hpp"
#include "ppeguard/thread_pool.hpp"
#include "ppeguard/vision.hpp"
#include "ppeguard/yolo_detector.hpp"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void signalHandler(int signal) {
    gSignalStatus = signal;
}

void printUsage(const char* executable) {
    std::cout << "Usage: " << executable
              << " [--config <path>] [--source <src>] [--image <path>] [--show] [--compact]\n"
              << "Runs PPE compliance monitoring on a camera, video file or stream, storing\n"
              << "compliance windows in SQLite and publishing alerts over MQTT.\n"
              << "With --image, analyzes one still image and prints the result as JSON." << std::endl;
}

ppeguard::AppConfig resolveConfig(const std::string& configPath, bool explicitPath) {
    ppeguard::AppConfig config;
    if (std::filesystem::exists(configPath)) {
        config = ppeguard::loadConfig(configPath);
        std::cout << "[Config] Loaded " << config.source_path << std::endl;
    } else if (explicitPath) {
        throw std::runtime_error("Configuration file not found: " + configPath);
    } else {
        std::cerr << "[Config] " << configPath << " not found, using built-in defaults" << std::endl;
    }
    ppeguard::applyEnvironmentOverrides(config);
    return config;
}

int analyzeImage(const ppeguard::AppConfig& config, const std::string& imagePath, bool prettyPrint) {
    cv::Mat image = cv::imread(imagePath, cv::IMREAD_COLOR);
    if (image.empty()) {
        std::cerr << "Failed to read image: " << imagePath << std::endl;
        return 1;
    }

    ppeguard::YoloDetector detector(config.detector);
    detector.load();
    ppeguard::FrameAnalyzer analyzer(config.rules);

    auto detections = detector.detect(image);
    auto analysis = analyzer.analyze(detections);

    ppeguard::Json result = ppeguard::Json::object();
    result["image"] = imagePath;
    ppeguard::Json list = ppeguard::Json::array();
    for (const auto& det : detections) {
        list.push_back(ppeguard::detectionToJson(det));
    }
    result["detections"] = list;
    result["metrics"] = ppeguard::metricsToJson(analysis.metrics);
    ppeguard::Json violations = ppeguard::Json::array();
    for (const auto& event : analysis.violations) {
        violations.push_back(ppeguard::violationToJson(event));
    }
    result["violations"] = violations;

    std::cout << result.dump(prettyPrint ? 2 : -1) << std::endl;
    return 0;
}

int runService(const ppeguard::AppConfig& config, bool show) {
    ppeguard::SqliteStore store(config.database.path);
    ppeguard::MqttNotifier notifier(config.mqtt, config.service.name);
    notifier.start();

    ppeguard::YoloDetector detector(config.detector);
    detector.load();

    ppeguard::VideoFrameSource source(config.source);
    source.open();

    std::unique_ptr<ppeguard::DiskEvidenceStore> evidence;
    if (config.snapshot.enabled) {
        evidence = std::make_unique<ppeguard::DiskEvidenceStore>(config.snapshot.directory);
    }

    // Declared after the collaborators so they drain before those go away.
    ppeguard::ThreadPool persistencePool(1, config.workers.persistence_queue);
    ppeguard::ThreadPool alertPool(config.workers.alert_threads, config.workers.alert_queue);

    ppeguard::AlertDispatcher dispatcher(notifier, config.alerts.cooldown_seconds, config.service.name, &alertPool);
    ppeguard::PipelineDriver driver(source, detector, store, dispatcher, evidence.get(),
                                    ppeguard::pipelineSettings(config), &persistencePool);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const char* window = "ppeguard";
    std::size_t processed = driver.run([&](const ppeguard::FrameOutcome& outcome) {
        if (show) {
            cv::imshow(window, outcome.frame);
            int key = cv::waitKey(1);
            if (key == 'q' || key == 27) {
                driver.requestStop();
            }
        }
        if (outcome.flushed) {
            const auto& w = outcome.flushed->window;
            std::cout << "[Pipeline] Window " << ppeguard::isoTimestamp(w.started_at) << ": "
                      << ppeguard::statusToString(w.status) << ", " << w.person_count << " persons, "
                      << w.violation_count << " violations" << std::endl;
        }
        if (gSignalStatus != 0) {
            driver.requestStop();
        }
    });

    if (show) {
        cv::destroyWindow(window);
    }
    if (gSignalStatus != 0) {
        std::cout << "[Pipeline] Stopping on signal " << gSignalStatus << std::endl;
    }

    driver.finish();
    persistencePool.shutdown();
    alertPool.shutdown();
    notifier.stop();
    source.close();

    const auto& stats = driver.recorder().stats();
    std::cout << "[Pipeline] Processed " << processed << " frames, " << stats.windows_written.load()
              << " windows stored, " << stats.write_failures.load() << " write failures, "
              << stats.windows_dropped.load() << " windows dropped" << std::endl;

    auto since = ppeguard::Clock::now() - std::chrono::hours(24);
    std::cout << "[Store] Last 24h: " << ppeguard::summaryToJson(store.summarySince(since)).dump(-1) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "ppeguard.config.json";
    bool explicitConfig = false;
    std::string sourceOverride;
    std::string imagePath;
    bool prettyPrint = true;
    bool show = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
            explicitConfig = true;
        } else if (arg == "--source" && i + 1 < argc) {
            sourceOverride = argv[++i];
        } else if (arg == "--image" && i + 1 < argc) {
            imagePath = argv[++i];
        } else if (arg == "--show") {
            show = true;
        } else if (arg == "--compact") {
            prettyPrint = false;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    try {
        ppeguard::AppConfig config = resolveConfig(configPath, explicitConfig);
        if (!sourceOverride.empty()) {
            config.source.uri = sourceOverride;
        }
        ppeguard::validateConfig(config);

        if (!imagePath.empty()) {
            return analyzeImage(config, imagePath, prettyPrint);
        }

        std::cout << "[Config] " << ppeguard::configSummary(config).dump(prettyPrint ? 2 : -1) << std::endl;
        return runService(config, show);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}

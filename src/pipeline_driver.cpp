#include "ppeguard/pipeline_driver.hpp"
#include "ppeguard/vision.hpp"

#include <exception>
#include <iostream>
#include <thread>
#include <utility>

namespace ppeguard {

PipelineSettings pipelineSettings(const AppConfig& config)
{
    PipelineSettings settings;
    settings.rules = config.rules;
    settings.recorder = config.recorder;
    settings.snapshot_threshold = static_cast<unsigned>(config.snapshot.consecutive_violations);
    settings.snapshots_enabled = config.snapshot.enabled;
    return settings;
}

Json outcomeToJson(const FrameOutcome& outcome)
{
    Json value = Json::object();
    value["frame"] = outcome.index;
    value["timestamp"] = isoTimestamp(outcome.timestamp);

    Json detections = Json::array();
    for (const auto& det : outcome.detections) {
        detections.push_back(detectionToJson(det));
    }
    value["detections"] = detections;
    value["metrics"] = metricsToJson(outcome.analysis.metrics);

    Json violations = Json::array();
    for (const auto& event : outcome.analysis.violations) {
        violations.push_back(violationToJson(event));
    }
    value["violations"] = violations;

    if (outcome.detector_failed) {
        value["detector_failed"] = true;
    }
    if (outcome.snapshot_path) {
        value["snapshot_path"] = *outcome.snapshot_path;
    }
    if (!outcome.alerts.empty()) {
        Json alerts = Json::array();
        for (const auto& alert : outcome.alerts) {
            Json entry = Json::object();
            entry["violation_type"] = alert.violation_type;
            entry["count"] = alert.count;
            entry["message"] = alert.message;
            alerts.push_back(entry);
        }
        value["alerts"] = alerts;
    }
    return value;
}

PipelineDriver::PipelineDriver(FrameSource& source, Detector& detector, Persistence& store,
                               AlertDispatcher& alerts, EvidenceStore* evidence, PipelineSettings settings,
                               ThreadPool* persistence_executor)
    : source_(source),
      detector_(detector),
      alerts_(alerts),
      evidence_(evidence),
      settings_(std::move(settings)),
      analyzer_(settings_.rules),
      trigger_(settings_.snapshot_threshold),
      recorder_(store, settings_.recorder, persistence_executor),
      clock_([] { return Clock::now(); }),
      sleep_([](std::chrono::nanoseconds d) { std::this_thread::sleep_for(d); }) {}

std::optional<FrameOutcome> PipelineDriver::step()
{
    std::optional<cv::Mat> frame;
    try {
        frame = source_.readFrame();
    } catch (const std::exception& ex) {
        std::cerr << "[Pipeline] Frame source failed: " << ex.what() << std::endl;
        return std::nullopt;
    }
    if (!frame || frame->empty()) {
        return std::nullopt;
    }

    FrameOutcome outcome;
    outcome.index = frames_;
    outcome.timestamp = clock_();
    outcome.frame = std::move(*frame);

    try {
        outcome.detections = detector_.detect(outcome.frame);
    } catch (const std::exception& ex) {
        std::cerr << "[Pipeline] Detector failed on frame " << outcome.index << ": " << ex.what() << std::endl;
        outcome.detections.clear();
        outcome.detector_failed = true;
    }

    outcome.analysis = analyzer_.analyze(outcome.detections);

    outcome.snapshot_requested = trigger_.onFrame(outcome.analysis.metrics.violation_count);
    if (outcome.snapshot_requested && settings_.snapshots_enabled && evidence_) {
        try {
            outcome.snapshot_path = evidence_->captureSnapshot(outcome.frame);
        } catch (const std::exception& ex) {
            std::cerr << "[Pipeline] Snapshot capture failed: " << ex.what() << std::endl;
        }
    }

    outcome.flushed = recorder_.observe(outcome.analysis, outcome.snapshot_path, outcome.timestamp);
    outcome.alerts = alerts_.onViolations(outcome.analysis.violations, outcome.timestamp);

    if (settings_.annotate) {
        annotateFrame(outcome.frame, outcome.detections, analyzer_, outcome.analysis.metrics);
    }

    ++frames_;
    return outcome;
}

std::size_t PipelineDriver::run(const FrameCallback& on_frame)
{
    std::size_t processed = 0;
    const auto interval = frameInterval();

    while (!stop_.load()) {
        auto started = std::chrono::steady_clock::now();
        auto outcome = step();
        if (!outcome) {
            std::cout << "[Pipeline] Source exhausted after " << frames_ << " frames" << std::endl;
            break;
        }
        ++processed;
        if (on_frame) {
            on_frame(*outcome);
        }
        if (stop_.load()) {
            break;
        }

        auto elapsed = std::chrono::steady_clock::now() - started;
        if (elapsed < interval) {
            sleep_(std::chrono::duration_cast<std::chrono::nanoseconds>(interval - elapsed));
        }
    }
    return processed;
}

std::optional<FlushedWindow> PipelineDriver::finish()
{
    return recorder_.flush(clock_());
}

std::chrono::nanoseconds PipelineDriver::frameInterval() const
{
    double fps = source_.frameRateHint();
    if (!(fps > 0.0)) {
        fps = settings_.default_fps > 0.0 ? settings_.default_fps : 30.0;
    }
    return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::duration<double>(1.0 / fps));
}

}  // namespace ppeguard

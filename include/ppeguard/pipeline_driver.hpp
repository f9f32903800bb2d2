#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "ppeguard/alert_dispatcher.hpp"
#include "ppeguard/compliance_recorder.hpp"
#include "ppeguard/config.hpp"
#include "ppeguard/detector.hpp"
#include "ppeguard/evidence_store.hpp"
#include "ppeguard/frame_analyzer.hpp"
#include "ppeguard/frame_source.hpp"
#include "ppeguard/snapshot_trigger.hpp"
#include "ppeguard/thread_pool.hpp"

namespace ppeguard {

struct PipelineSettings {
    ComplianceRules rules;
    RecorderConfig recorder;
    unsigned snapshot_threshold = 5;
    bool snapshots_enabled = true;
    bool annotate = true;
    double default_fps = 30.0;
};

PipelineSettings pipelineSettings(const AppConfig& config);

// Everything that happened to one frame on its way through the pipeline.
struct FrameOutcome {
    std::size_t index = 0;
    TimePoint timestamp{};
    cv::Mat frame;  // annotated when annotation is enabled
    std::vector<Detection> detections;
    FrameAnalysis analysis;
    bool detector_failed = false;
    bool snapshot_requested = false;
    std::optional<std::string> snapshot_path;
    std::optional<FlushedWindow> flushed;
    std::vector<DispatchedAlert> alerts;
};

Json outcomeToJson(const FrameOutcome& outcome);

// Drives a single stream: source -> detector -> analyzer -> snapshot trigger ->
// recorder -> alerts. The driver owns the stream's snapshot streak and open
// compliance window; the dispatcher (and its cooldowns) belongs to the caller
// and may only be shared by drivers running on the same thread.
class PipelineDriver {
public:
    using FrameCallback = std::function<void(const FrameOutcome&)>;
    using ClockFn = std::function<TimePoint()>;
    using SleepFn = std::function<void(std::chrono::nanoseconds)>;

    PipelineDriver(FrameSource& source, Detector& detector, Persistence& store, AlertDispatcher& alerts,
                   EvidenceStore* evidence, PipelineSettings settings,
                   ThreadPool* persistence_executor = nullptr);

    // Processes one frame. std::nullopt when the source has nothing more to give.
    std::optional<FrameOutcome> step();

    // Steps until the source ends or a stop is requested, pacing to the source's
    // frame rate. Returns the number of frames processed.
    std::size_t run(const FrameCallback& on_frame = {});

    // Honoured between frames; the frame in flight always completes.
    void requestStop() { stop_.store(true); }
    bool stopRequested() const { return stop_.load(); }

    // Closes the open compliance window. Call once the stream is over.
    std::optional<FlushedWindow> finish();

    void setClock(ClockFn clock) { clock_ = std::move(clock); }
    void setSleep(SleepFn sleep) { sleep_ = std::move(sleep); }

    const SnapshotTrigger& snapshotTrigger() const { return trigger_; }
    const ComplianceRecorder& recorder() const { return recorder_; }
    const FrameAnalyzer& analyzer() const { return analyzer_; }
    std::size_t framesProcessed() const { return frames_; }

private:
    std::chrono::nanoseconds frameInterval() const;

    FrameSource& source_;
    Detector& detector_;
    AlertDispatcher& alerts_;
    EvidenceStore* evidence_;
    PipelineSettings settings_;

    FrameAnalyzer analyzer_;
    SnapshotTrigger trigger_;
    ComplianceRecorder recorder_;

    ClockFn clock_;
    SleepFn sleep_;
    std::atomic<bool> stop_{false};
    std::size_t frames_ = 0;
};

}  // namespace ppeguard

#include "ppeguard/compliance_recorder.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace ppeguard {

namespace {

void writeWindow(Persistence& store, const FlushedWindow& flushed, RecorderStats& stats)
{
    std::int64_t window_id = 0;
    try {
        window_id = store.saveComplianceWindow(flushed.window);
    } catch (const std::exception& ex) {
        ++stats.write_failures;
        std::cerr << "[Recorder] Failed to save compliance window started "
                  << isoTimestamp(flushed.window.started_at) << ": " << ex.what() << std::endl;
        return;
    }
    ++stats.windows_written;

    for (const auto& event : flushed.events) {
        try {
            store.saveViolationEvent(window_id, event);
            ++stats.events_written;
        } catch (const std::exception& ex) {
            ++stats.write_failures;
            std::cerr << "[Recorder] Failed to save " << event.violation_type << " event for window "
                      << window_id << ": " << ex.what() << std::endl;
        }
    }
    if (flushed.dropped_events > 0) {
        std::cerr << "[Recorder] Window " << window_id << " exceeded its event cap, "
                  << flushed.dropped_events << " events not stored" << std::endl;
    }
}

}  // namespace

ComplianceRecorder::ComplianceRecorder(Persistence& store, RecorderConfig config, ThreadPool* executor)
    : store_(store),
      config_(std::move(config)),
      executor_(executor),
      stats_(std::make_shared<RecorderStats>()) {}

std::optional<FlushedWindow> ComplianceRecorder::observe(const FrameAnalysis& analysis,
                                                         const std::optional<std::string>& snapshot_path,
                                                         TimePoint now) {
    if (!open_) {
        window_ = ComplianceWindow{};
        window_.started_at = now;
        open_ = true;
    }

    const auto& metrics = analysis.metrics;
    window_.person_count = metrics.person_count;
    window_.ppe_worn_count = metrics.ppe_worn_count;
    window_.violation_count = metrics.violation_count;
    window_.status = metrics.status;
    if (snapshot_path && !window_.snapshot_path) {
        window_.snapshot_path = snapshot_path;
    }

    for (const auto& event : analysis.violations) {
        if (events_.size() < config_.max_events_per_window) {
            events_.push_back(event);
        } else {
            ++dropped_events_;
        }
    }

    if (secondsBetween(window_.started_at, now) < config_.log_interval_seconds) {
        return std::nullopt;
    }

    FlushedWindow flushed = rotate(now);
    persist(flushed);
    return flushed;
}

std::optional<FlushedWindow> ComplianceRecorder::flush(TimePoint now) {
    if (!open_) {
        return std::nullopt;
    }
    FlushedWindow flushed = rotate(now);
    open_ = false;
    persist(flushed);
    return flushed;
}

FlushedWindow ComplianceRecorder::rotate(TimePoint now) {
    FlushedWindow flushed;
    flushed.window = std::move(window_);
    flushed.events = std::move(events_);
    flushed.dropped_events = dropped_events_;

    window_ = ComplianceWindow{};
    window_.started_at = now;
    events_.clear();
    dropped_events_ = 0;
    return flushed;
}

void ComplianceRecorder::persist(const FlushedWindow& flushed) {
    if (!executor_) {
        writeWindow(store_, flushed, *stats_);
        return;
    }

    Persistence* store = &store_;
    auto stats = stats_;
    auto queued = executor_->trySubmit([store, stats, flushed]() {
        writeWindow(*store, flushed, *stats);
    });
    if (!queued) {
        ++stats_->windows_dropped;
        std::cerr << "[Recorder] Persistence queue full, dropping window started "
                  << isoTimestamp(flushed.window.started_at) << std::endl;
    }
}

}  // namespace ppeguard

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ppeguard/config.hpp"
#include "ppeguard/frame_analyzer.hpp"
#include "ppeguard/persistence.hpp"
#include "ppeguard/thread_pool.hpp"

namespace ppeguard {

// A closed window together with the violation events gathered while it was open.
struct FlushedWindow {
    ComplianceWindow window;
    std::vector<ViolationEvent> events;
    std::size_t dropped_events = 0;
};

struct RecorderStats {
    std::atomic<std::size_t> windows_written{0};
    std::atomic<std::size_t> events_written{0};
    std::atomic<std::size_t> write_failures{0};
    std::atomic<std::size_t> windows_dropped{0};
};

// Keeps the in-flight compliance window for one stream and hands it to the
// store once per log interval. The window holds the most recent frame's
// metrics and the first snapshot captured inside the interval.
//
// With an executor, writes are queued on it; the executor must run tasks in
// submission order (one worker) and must be drained before `store` goes away.
class ComplianceRecorder {
public:
    ComplianceRecorder(Persistence& store, RecorderConfig config, ThreadPool* executor = nullptr);

    std::optional<FlushedWindow> observe(const FrameAnalysis& analysis,
                                         const std::optional<std::string>& snapshot_path,
                                         TimePoint now);

    // Closes the open window regardless of its age. Used when a stream ends.
    std::optional<FlushedWindow> flush(TimePoint now);

    bool windowOpen() const { return open_; }
    const ComplianceWindow& currentWindow() const { return window_; }
    std::size_t pendingEvents() const { return events_.size(); }
    const RecorderStats& stats() const { return *stats_; }

private:
    FlushedWindow rotate(TimePoint now);
    void persist(const FlushedWindow& flushed);

    Persistence& store_;
    RecorderConfig config_;
    ThreadPool* executor_;

    bool open_{false};
    ComplianceWindow window_;
    std::vector<ViolationEvent> events_;
    std::size_t dropped_events_{0};

    std::shared_ptr<RecorderStats> stats_;
};

}  // namespace ppeguard

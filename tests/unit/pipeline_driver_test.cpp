#include "ppeguard/pipeline_driver.hpp"

#include <chrono>
#include <deque>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace ppeguard {
namespace {

const TimePoint kStart = Clock::from_time_t(1700000000);

class ScriptedSource : public FrameSource {
public:
    explicit ScriptedSource(std::size_t frames, double fps = 0.0) : remaining_(frames), fps_(fps) {}

    std::optional<cv::Mat> readFrame() override {
        if (remaining_ == 0) {
            return std::nullopt;
        }
        --remaining_;
        ++reads;
        return cv::Mat(120, 160, CV_8UC3, cv::Scalar::all(40));
    }

    double frameRateHint() const override { return fps_; }

    std::size_t reads = 0;

private:
    std::size_t remaining_;
    double fps_;
};

// Returns one scripted detection list per call; an entry of nullopt throws.
class ScriptedDetector : public Detector {
public:
    std::vector<Detection> detect(const cv::Mat&) override {
        if (script.empty()) {
            return {};
        }
        auto next = script.front();
        script.pop_front();
        if (!next) {
            throw std::runtime_error("inference backend crashed");
        }
        return *next;
    }

    std::deque<std::optional<std::vector<Detection>>> script;
};

class MemoryStore : public Persistence {
public:
    std::int64_t saveComplianceWindow(const ComplianceWindow& window) override {
        windows.push_back(window);
        return static_cast<std::int64_t>(windows.size());
    }
    std::int64_t saveViolationEvent(std::int64_t, const ViolationEvent& event) override {
        events.push_back(event);
        return static_cast<std::int64_t>(events.size());
    }
    std::vector<StoredWindow> recentWindows(std::size_t) override { return {}; }
    std::vector<StoredViolation> violationsForWindow(std::int64_t) override { return {}; }
    std::vector<StoredViolation> recentViolations(std::size_t) override { return {}; }
    ComplianceSummary summarySince(TimePoint) override { return {}; }

    std::vector<ComplianceWindow> windows;
    std::vector<ViolationEvent> events;
};

class RecordingNotifier : public Notifier {
public:
    bool send(const std::string& text) override {
        messages.push_back(text);
        return true;
    }
    std::vector<std::string> messages;
};

class CountingEvidence : public EvidenceStore {
public:
    std::string captureSnapshot(const cv::Mat& frame) override {
        if (fail) {
            throw std::runtime_error("disk unavailable");
        }
        EXPECT_FALSE(frame.empty());
        ++captures;
        return "snapshots/violation_" + std::to_string(captures) + ".jpg";
    }
    int captures = 0;
    bool fail = false;
};

Detection makeDetection(const std::string& name) {
    Detection det;
    det.class_name = name;
    det.confidence = 0.9F;
    det.box = Box{20, 20, 60, 100};
    return det;
}

PipelineSettings makeSettings(double log_interval) {
    PipelineSettings settings;
    settings.recorder.log_interval_seconds = log_interval;
    settings.snapshot_threshold = 5;
    return settings;
}

struct Harness {
    explicit Harness(std::size_t frames, double log_interval = 100.0)
        : source(frames),
          dispatcher(notifier, 60.0, "PPE Guard"),
          driver(source, detector, store, dispatcher, &evidence, makeSettings(log_interval)) {
        driver.setClock([this] { return kStart + std::chrono::seconds(tick++); });
        driver.setSleep([this](std::chrono::nanoseconds d) { slept.push_back(d); });
    }

    ScriptedSource source;
    ScriptedDetector detector;
    MemoryStore store;
    RecordingNotifier notifier;
    CountingEvidence evidence;
    AlertDispatcher dispatcher;
    PipelineDriver driver;
    int tick = 0;
    std::vector<std::chrono::nanoseconds> slept;
};

TEST(PipelineDriverTest, SustainedViolationCapturesOnceAndAlertsOnce) {
    Harness h(6);
    for (int i = 0; i < 5; ++i) {
        h.detector.script.push_back(std::vector<Detection>{makeDetection("no-helmet")});
    }
    h.detector.script.push_back(std::vector<Detection>{});

    std::vector<FrameOutcome> outcomes;
    const std::size_t processed = h.driver.run([&](const FrameOutcome& outcome) { outcomes.push_back(outcome); });

    EXPECT_EQ(processed, 6U);
    ASSERT_EQ(outcomes.size(), 6U);
    EXPECT_EQ(h.evidence.captures, 1);
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        EXPECT_EQ(outcomes[i].snapshot_requested, i == 4) << "frame " << i;
    }
    ASSERT_TRUE(outcomes[4].snapshot_path.has_value());

    ASSERT_EQ(h.notifier.messages.size(), 1U);
    EXPECT_NE(h.notifier.messages[0].find("1x missing helmet"), std::string::npos);
    ASSERT_EQ(outcomes[0].alerts.size(), 1U);

    EXPECT_EQ(h.driver.snapshotTrigger().consecutiveViolationFrames(), 0U);
    EXPECT_TRUE(h.store.windows.empty());
    EXPECT_EQ(outcomes[5].analysis.metrics.status, ComplianceStatus::NoPersonsDetected);
}

TEST(PipelineDriverTest, FinishWritesTheOpenWindowWithItsSnapshot) {
    Harness h(6);
    for (int i = 0; i < 5; ++i) {
        h.detector.script.push_back(std::vector<Detection>{makeDetection("person"), makeDetection("no-helmet")});
    }

    h.driver.run();
    auto flushed = h.driver.finish();

    ASSERT_TRUE(flushed.has_value());
    ASSERT_EQ(h.store.windows.size(), 1U);
    EXPECT_EQ(h.store.windows[0].started_at, kStart);
    ASSERT_TRUE(h.store.windows[0].snapshot_path.has_value());
    EXPECT_EQ(*h.store.windows[0].snapshot_path, "snapshots/violation_1.jpg");
    EXPECT_EQ(h.store.events.size(), 5U);
}

TEST(PipelineDriverTest, DetectorFailureIsTreatedAsAnEmptyFrame) {
    Harness h(3);
    h.detector.script.push_back(std::vector<Detection>{makeDetection("person")});
    h.detector.script.push_back(std::nullopt);
    h.detector.script.push_back(std::vector<Detection>{makeDetection("no-vest")});

    std::vector<FrameOutcome> outcomes;
    EXPECT_EQ(h.driver.run([&](const FrameOutcome& outcome) { outcomes.push_back(outcome); }), 3U);

    ASSERT_EQ(outcomes.size(), 3U);
    EXPECT_FALSE(outcomes[0].detector_failed);
    EXPECT_TRUE(outcomes[1].detector_failed);
    EXPECT_TRUE(outcomes[1].detections.empty());
    EXPECT_EQ(outcomes[1].analysis.metrics.status, ComplianceStatus::NoPersonsDetected);
    EXPECT_EQ(outcomes[2].analysis.metrics.violation_count, 1U);
}

TEST(PipelineDriverTest, RecorderFlushesOnItsInterval) {
    Harness h(7, 2.0);

    std::vector<FrameOutcome> outcomes;
    h.driver.run([&](const FrameOutcome& outcome) { outcomes.push_back(outcome); });

    ASSERT_EQ(outcomes.size(), 7U);
    EXPECT_TRUE(outcomes[2].flushed.has_value());
    EXPECT_TRUE(outcomes[4].flushed.has_value());
    EXPECT_TRUE(outcomes[6].flushed.has_value());
    EXPECT_FALSE(outcomes[3].flushed.has_value());
    EXPECT_EQ(h.store.windows.size(), 3U);
}

TEST(PipelineDriverTest, StopRequestLetsTheCurrentFrameFinish) {
    Harness h(10);
    h.detector.script.push_back(std::vector<Detection>{makeDetection("no-helmet")});

    std::size_t seen = 0;
    const std::size_t processed = h.driver.run([&](const FrameOutcome& outcome) {
        ++seen;
        EXPECT_EQ(outcome.alerts.size(), 1U);
        h.driver.requestStop();
    });

    EXPECT_EQ(processed, 1U);
    EXPECT_EQ(seen, 1U);
    EXPECT_EQ(h.source.reads, 1U);
    EXPECT_TRUE(h.driver.stopRequested());
}

TEST(PipelineDriverTest, SnapshotFailureDoesNotStopTheStream) {
    Harness h(5);
    h.evidence.fail = true;
    for (int i = 0; i < 5; ++i) {
        h.detector.script.push_back(std::vector<Detection>{makeDetection("no-helmet")});
    }

    std::vector<FrameOutcome> outcomes;
    EXPECT_EQ(h.driver.run([&](const FrameOutcome& outcome) { outcomes.push_back(outcome); }), 5U);

    EXPECT_TRUE(outcomes[4].snapshot_requested);
    EXPECT_FALSE(outcomes[4].snapshot_path.has_value());
}

TEST(PipelineDriverTest, PacesToTheDefaultFrameRateWhenUnknown) {
    Harness h(3);
    h.driver.run();

    ASSERT_FALSE(h.slept.empty());
    for (const auto& d : h.slept) {
        EXPECT_LE(d, std::chrono::nanoseconds(std::chrono::milliseconds(34)));
    }
}

TEST(PipelineDriverTest, EmptySourceEndsImmediately) {
    Harness h(0);
    EXPECT_EQ(h.driver.run(), 0U);
    EXPECT_FALSE(h.driver.step().has_value());
    EXPECT_EQ(h.driver.framesProcessed(), 0U);
}

TEST(PipelineDriverTest, OutcomeJsonCarriesMetricsAndAlerts) {
    Harness h(1);
    h.detector.script.push_back(std::vector<Detection>{makeDetection("person"), makeDetection("no-helmet")});

    auto outcome = h.driver.step();
    ASSERT_TRUE(outcome.has_value());
    const Json json = outcomeToJson(*outcome);

    EXPECT_EQ(json["detections"].as_array().size(), 2U);
    EXPECT_EQ(json["metrics"]["status"].as_string(), "Violations Detected");
    EXPECT_EQ(json["violations"].as_array().size(), 1U);
    EXPECT_EQ(json["alerts"].as_array().size(), 1U);
}

}  // namespace
}  // namespace ppeguard

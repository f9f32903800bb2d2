#include "ppeguard/alert_dispatcher.hpp"

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace ppeguard {
namespace {

const TimePoint kStart = Clock::from_time_t(1700000000);  // 2023-11-14 22:13:20 UTC

TimePoint at(int seconds) {
    return kStart + std::chrono::seconds(seconds);
}

class RecordingNotifier : public Notifier {
public:
    bool send(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex);
        messages.push_back(text);
        if (throw_on_send) {
            throw std::runtime_error("transport down");
        }
        return succeed;
    }

    std::size_t sent() {
        std::lock_guard<std::mutex> lock(mutex);
        return messages.size();
    }

    std::mutex mutex;
    std::vector<std::string> messages;
    bool succeed = true;
    bool throw_on_send = false;
};

ViolationEvent makeEvent(const std::string& type) {
    ViolationEvent event;
    event.violation_type = type;
    event.box = Box{0, 0, 10, 10};
    event.confidence = 0.9F;
    return event;
}

TEST(AlertDispatcherTest, HumanLabelReplacesThePrefix) {
    EXPECT_EQ(humanLabel("no-helmet"), "missing helmet");
    EXPECT_EQ(humanLabel("no-safety-vest"), "missing safety-vest");
    EXPECT_EQ(humanLabel("fall"), "fall");
}

TEST(AlertDispatcherTest, FormatsHeaderBulletsAndCallToAction) {
    const std::string message = formatAlertMessage("PPE Guard", {{"no-helmet", 2}, {"no-vest", 1}}, kStart);

    EXPECT_EQ(message,
              "PPE Guard ALERT at 2023-11-14 22:13:20 UTC:\n"
              "- 2x missing helmet\n"
              "- 1x missing vest\n"
              "Immediate action required.");
}

TEST(AlertDispatcherTest, SendsOnePerTypeWithItsCount) {
    RecordingNotifier notifier;
    AlertDispatcher dispatcher(notifier, 60.0, "PPE Guard");

    auto alerts = dispatcher.onViolations(
        {makeEvent("no-helmet"), makeEvent("no-vest"), makeEvent("no-helmet")}, at(0));

    ASSERT_EQ(alerts.size(), 2U);
    EXPECT_EQ(alerts[0].violation_type, "no-helmet");
    EXPECT_EQ(alerts[0].count, 2U);
    EXPECT_NE(alerts[0].message.find("2x missing helmet"), std::string::npos);
    EXPECT_EQ(alerts[1].violation_type, "no-vest");
    EXPECT_NE(alerts[1].message.find("1x missing vest"), std::string::npos);
    EXPECT_TRUE(alerts[0].delivery.get());
    EXPECT_EQ(notifier.sent(), 2U);
}

TEST(AlertDispatcherTest, CooldownSuppressesRepeatsOfTheSameType) {
    RecordingNotifier notifier;
    AlertDispatcher dispatcher(notifier, 60.0, "PPE Guard");

    EXPECT_EQ(dispatcher.onViolations({makeEvent("no-helmet")}, at(0)).size(), 1U);
    EXPECT_TRUE(dispatcher.onViolations({makeEvent("no-helmet")}, at(30)).empty());
    EXPECT_EQ(notifier.sent(), 1U);

    EXPECT_EQ(dispatcher.onViolations({makeEvent("no-helmet")}, at(60)).size(), 1U);
    EXPECT_EQ(notifier.sent(), 2U);
    EXPECT_EQ(dispatcher.lastSentAt("no-helmet"), at(60));
}

TEST(AlertDispatcherTest, CooldownIsTrackedPerType) {
    RecordingNotifier notifier;
    AlertDispatcher dispatcher(notifier, 60.0, "PPE Guard");

    dispatcher.onViolations({makeEvent("no-helmet")}, at(0));
    auto alerts = dispatcher.onViolations({makeEvent("no-helmet"), makeEvent("no-gloves")}, at(10));

    ASSERT_EQ(alerts.size(), 1U);
    EXPECT_EQ(alerts[0].violation_type, "no-gloves");
    EXPECT_EQ(dispatcher.trackedTypes(), 2U);
}

TEST(AlertDispatcherTest, FailedSendStillStartsTheCooldown) {
    RecordingNotifier notifier;
    notifier.succeed = false;
    AlertDispatcher dispatcher(notifier, 60.0, "PPE Guard");

    auto first = dispatcher.onViolations({makeEvent("no-helmet")}, at(0));
    ASSERT_EQ(first.size(), 1U);
    EXPECT_FALSE(first[0].delivery.get());
    EXPECT_EQ(dispatcher.lastSentAt("no-helmet"), at(0));

    notifier.succeed = true;
    EXPECT_TRUE(dispatcher.onViolations({makeEvent("no-helmet")}, at(45)).empty());
    EXPECT_EQ(notifier.sent(), 1U);
}

TEST(AlertDispatcherTest, ThrowingNotifierCountsAsFailure) {
    RecordingNotifier notifier;
    notifier.throw_on_send = true;
    AlertDispatcher dispatcher(notifier, 60.0, "PPE Guard");

    auto alerts = dispatcher.onViolations({makeEvent("no-vest")}, at(0));

    ASSERT_EQ(alerts.size(), 1U);
    EXPECT_FALSE(alerts[0].delivery.get());
    EXPECT_TRUE(dispatcher.onViolations({makeEvent("no-vest")}, at(1)).empty());
}

TEST(AlertDispatcherTest, NoEventsNoAlerts) {
    RecordingNotifier notifier;
    AlertDispatcher dispatcher(notifier, 60.0, "PPE Guard");

    EXPECT_TRUE(dispatcher.onViolations({}, at(0)).empty());
    EXPECT_EQ(dispatcher.lastSentAt("no-helmet"), TimePoint{});
    EXPECT_EQ(notifier.sent(), 0U);
}

TEST(AlertDispatcherTest, OffloadedSendsResolveThroughTheFuture) {
    RecordingNotifier notifier;
    ThreadPool pool(2, 8);
    AlertDispatcher dispatcher(notifier, 60.0, "PPE Guard", &pool);

    auto alerts = dispatcher.onViolations({makeEvent("no-helmet"), makeEvent("no-vest")}, at(0));

    ASSERT_EQ(alerts.size(), 2U);
    EXPECT_TRUE(alerts[0].delivery.get());
    EXPECT_TRUE(alerts[1].delivery.get());
    EXPECT_EQ(notifier.sent(), 2U);
}

}  // namespace
}  // namespace ppeguard

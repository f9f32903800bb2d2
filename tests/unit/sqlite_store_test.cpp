#include "ppeguard/sqlite_store.hpp"

#include <chrono>
#include <filesystem>
#include <string>

#include <gtest/gtest.h>

namespace ppeguard {
namespace {

const TimePoint kStart = Clock::from_time_t(1700000000);

std::filesystem::path makeTempPath(const std::string& stem) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() / (stem + "_" + std::to_string(stamp) + ".db");
}

ComplianceWindow makeWindow(TimePoint started, unsigned persons, unsigned violations) {
    ComplianceWindow window;
    window.started_at = started;
    window.person_count = persons;
    window.ppe_worn_count = persons - violations;
    window.violation_count = violations;
    window.status = violations > 0 ? ComplianceStatus::ViolationsDetected : ComplianceStatus::Compliant;
    return window;
}

ViolationEvent makeEvent(const std::string& type, int severity) {
    ViolationEvent event;
    event.violation_type = type;
    event.box = Box{12, 34, 56, 78};
    event.confidence = 0.875F;
    event.severity = severity;
    return event;
}

TEST(SqliteStoreTest, SavesAndReadsBackWindows) {
    SqliteStore store(":memory:");
    ComplianceWindow window = makeWindow(kStart, 4, 1);
    window.snapshot_path = "snapshots/violation_1.jpg";

    const auto id = store.saveComplianceWindow(window);
    EXPECT_GT(id, 0);

    const auto rows = store.recentWindows(10);
    ASSERT_EQ(rows.size(), 1U);
    EXPECT_EQ(rows[0].id, id);
    EXPECT_EQ(rows[0].window.started_at, kStart);
    EXPECT_EQ(rows[0].window.person_count, 4U);
    EXPECT_EQ(rows[0].window.ppe_worn_count, 3U);
    EXPECT_EQ(rows[0].window.violation_count, 1U);
    EXPECT_EQ(rows[0].window.status, ComplianceStatus::ViolationsDetected);
    ASSERT_TRUE(rows[0].window.snapshot_path.has_value());
    EXPECT_EQ(*rows[0].window.snapshot_path, "snapshots/violation_1.jpg");
}

TEST(SqliteStoreTest, RecentWindowsAreNewestFirstAndLimited) {
    SqliteStore store(":memory:");
    for (int i = 0; i < 5; ++i) {
        store.saveComplianceWindow(makeWindow(kStart + std::chrono::seconds(5 * i), 1, 0));
    }

    const auto rows = store.recentWindows(3);
    ASSERT_EQ(rows.size(), 3U);
    EXPECT_EQ(rows[0].window.started_at, kStart + std::chrono::seconds(20));
    EXPECT_EQ(rows[2].window.started_at, kStart + std::chrono::seconds(10));
    EXPECT_FALSE(rows[0].window.snapshot_path.has_value());
}

TEST(SqliteStoreTest, ViolationEventsBelongToTheirWindow) {
    SqliteStore store(":memory:");
    const auto first = store.saveComplianceWindow(makeWindow(kStart, 2, 2));
    const auto second = store.saveComplianceWindow(makeWindow(kStart + std::chrono::seconds(5), 1, 1));

    store.saveViolationEvent(first, makeEvent("no-helmet", 4));
    store.saveViolationEvent(first, makeEvent("no-vest", 2));
    store.saveViolationEvent(second, makeEvent("no-gloves", 1));

    const auto events = store.violationsForWindow(first);
    ASSERT_EQ(events.size(), 2U);
    EXPECT_EQ(events[0].window_id, first);
    EXPECT_EQ(events[0].event.violation_type, "no-helmet");
    EXPECT_EQ(events[0].event.box, (Box{12, 34, 56, 78}));
    EXPECT_FLOAT_EQ(events[0].event.confidence, 0.875F);
    EXPECT_EQ(events[0].event.severity, 4);
    EXPECT_EQ(events[0].recorded_at, kStart);
    EXPECT_FALSE(events[0].resolved);

    const auto recent = store.recentViolations(10);
    ASSERT_EQ(recent.size(), 3U);
    EXPECT_EQ(recent[0].event.violation_type, "no-gloves");
}

TEST(SqliteStoreTest, EventForUnknownWindowIsRejected) {
    SqliteStore store(":memory:");
    EXPECT_THROW(store.saveViolationEvent(42, makeEvent("no-helmet", 4)), StorageError);
}

TEST(SqliteStoreTest, SummaryCoversWindowsSinceTheGivenTime) {
    SqliteStore store(":memory:");
    store.saveComplianceWindow(makeWindow(kStart - std::chrono::hours(30), 50, 50));
    store.saveComplianceWindow(makeWindow(kStart, 4, 1));
    store.saveComplianceWindow(makeWindow(kStart + std::chrono::seconds(5), 4, 0));

    const auto summary = store.summarySince(kStart - std::chrono::hours(24));
    EXPECT_EQ(summary.windows, 2);
    EXPECT_EQ(summary.persons, 8);
    EXPECT_EQ(summary.violations, 1);
    EXPECT_DOUBLE_EQ(summary.compliance_rate, 87.5);
}

TEST(SqliteStoreTest, ComplianceRateIsClampedAndDefaultsToFull) {
    SqliteStore store(":memory:");
    EXPECT_DOUBLE_EQ(store.summarySince(kStart).compliance_rate, 100.0);

    ComplianceWindow window = makeWindow(kStart, 1, 0);
    window.violation_count = 3;
    store.saveComplianceWindow(window);
    EXPECT_DOUBLE_EQ(store.summarySince(kStart).compliance_rate, 0.0);
}

TEST(SqliteStoreTest, DataPersistsAcrossReopen) {
    const auto path = makeTempPath("ppeguard_store");
    {
        SqliteStore store(path.string());
        const auto id = store.saveComplianceWindow(makeWindow(kStart, 2, 1));
        store.saveViolationEvent(id, makeEvent("no-helmet", 4));
    }
    {
        SqliteStore store(path.string());
        EXPECT_EQ(store.recentWindows(10).size(), 1U);
        EXPECT_EQ(store.recentViolations(10).size(), 1U);
    }
    std::filesystem::remove(path);
}

TEST(SqliteStoreTest, UnopenablePathThrows) {
    const auto path = makeTempPath("ppeguard_missing_dir") / "nested" / "store.db";
    EXPECT_THROW(SqliteStore store(path.string()), StorageError);
}

TEST(SqliteStoreTest, JsonViewsUseStoredColumnNames) {
    StoredWindow stored;
    stored.id = 7;
    stored.window = makeWindow(kStart, 3, 0);
    const Json window = windowToJson(stored);
    EXPECT_EQ(window["id"].as_number(), 7.0);
    EXPECT_EQ(window["violations_count"].as_number(), 0.0);
    EXPECT_EQ(window["status"].as_string(), "Compliant");
    EXPECT_TRUE(window["frame_snapshot_path"].is_null());

    ComplianceSummary summary;
    summary.windows = 2;
    EXPECT_EQ(summaryToJson(summary)["compliance_rate"].as_number(), 100.0);
}

}  // namespace
}  // namespace ppeguard

#include "ppeguard/sqlite_store.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <iostream>

namespace ppeguard {

namespace {

const char* kSchema =
    "CREATE TABLE IF NOT EXISTS compliance_logs ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  timestamp INTEGER NOT NULL,"
    "  person_count INTEGER NOT NULL DEFAULT 0,"
    "  ppe_worn_count INTEGER NOT NULL DEFAULT 0,"
    "  violations_count INTEGER NOT NULL DEFAULT 0,"
    "  frame_snapshot_path TEXT,"
    "  status TEXT NOT NULL"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_compliance_logs_timestamp ON compliance_logs(timestamp);"
    "CREATE TABLE IF NOT EXISTS violation_events ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  log_id INTEGER NOT NULL REFERENCES compliance_logs(id) ON DELETE CASCADE,"
    "  timestamp INTEGER NOT NULL,"
    "  violation_type TEXT NOT NULL,"
    "  location_box TEXT NOT NULL,"
    "  confidence REAL NOT NULL,"
    "  severity INTEGER NOT NULL DEFAULT 1,"
    "  is_resolved INTEGER NOT NULL DEFAULT 0"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_violation_events_log ON violation_events(log_id);";

std::int64_t toMillis(TimePoint time)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

TimePoint fromMillis(std::int64_t millis)
{
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
}

ComplianceStatus parseStatus(const std::string& text)
{
    if (text == statusToString(ComplianceStatus::Compliant)) return ComplianceStatus::Compliant;
    if (text == statusToString(ComplianceStatus::ViolationsDetected)) return ComplianceStatus::ViolationsDetected;
    return ComplianceStatus::NoPersonsDetected;
}

// "[x1, y1, x2, y2]" back into a Box; malformed text yields an empty box.
Box parseBoxText(const std::string& text)
{
    Box box;
    if (std::sscanf(text.c_str(), "[%d, %d, %d, %d]", &box.x1, &box.y1, &box.x2, &box.y2) != 4) {
        return Box{};
    }
    return box;
}

std::string columnText(sqlite3_stmt* stmt, int column)
{
    const auto* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

// Owns one prepared statement for the duration of a call.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return stmt_; }

    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StorageError(std::string("SQLite step failed: ") + sqlite3_errmsg(db_));
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

StoredViolation readViolation(sqlite3_stmt* stmt)
{
    StoredViolation stored;
    stored.id = sqlite3_column_int64(stmt, 0);
    stored.window_id = sqlite3_column_int64(stmt, 1);
    stored.recorded_at = fromMillis(sqlite3_column_int64(stmt, 2));
    stored.event.violation_type = columnText(stmt, 3);
    stored.event.box = parseBoxText(columnText(stmt, 4));
    stored.event.confidence = static_cast<float>(sqlite3_column_double(stmt, 5));
    stored.event.severity = sqlite3_column_int(stmt, 6);
    stored.resolved = sqlite3_column_int(stmt, 7) != 0;
    return stored;
}

}  // namespace

Json windowToJson(const StoredWindow& stored)
{
    const auto& window = stored.window;
    Json value = Json::object();
    value["id"] = static_cast<long long>(stored.id);
    value["timestamp"] = isoTimestamp(window.started_at);
    value["person_count"] = window.person_count;
    value["ppe_worn_count"] = window.ppe_worn_count;
    value["violations_count"] = window.violation_count;
    value["status"] = statusToString(window.status);
    value["frame_snapshot_path"] = window.snapshot_path ? Json(*window.snapshot_path) : Json();
    return value;
}

Json storedViolationToJson(const StoredViolation& stored)
{
    Json value = violationToJson(stored.event);
    value["id"] = static_cast<long long>(stored.id);
    value["log_id"] = static_cast<long long>(stored.window_id);
    value["timestamp"] = isoTimestamp(stored.recorded_at);
    value["is_resolved"] = stored.resolved;
    return value;
}

Json summaryToJson(const ComplianceSummary& summary)
{
    Json value = Json::object();
    value["total_logs"] = static_cast<long long>(summary.windows);
    value["total_persons_detected"] = static_cast<long long>(summary.persons);
    value["total_violations"] = static_cast<long long>(summary.violations);
    value["compliance_rate"] = summary.compliance_rate;
    return value;
}

SqliteStore::SqliteStore(const std::string& path) : path_(path)
{
    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "Unknown SQLite error";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("Cannot open database " + path_ + ": " + message);
    }
    try {
        createSchema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    std::cout << "[Store] Using SQLite database " << path_ << std::endl;
}

SqliteStore::~SqliteStore()
{
    if (db_) sqlite3_close(db_);
}

void SqliteStore::createSchema()
{
    char* error = nullptr;
    if (sqlite3_exec(db_, "PRAGMA foreign_keys = ON;", nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "unknown error";
        sqlite3_free(error);
        throw StorageError("Failed to enable foreign keys: " + message);
    }
    if (sqlite3_exec(db_, kSchema, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "unknown error";
        sqlite3_free(error);
        throw StorageError("Failed to create schema: " + message);
    }
}

std::int64_t SqliteStore::saveComplianceWindow(const ComplianceWindow& window)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
                   "INSERT INTO compliance_logs (timestamp, person_count, ppe_worn_count, "
                   "violations_count, frame_snapshot_path, status) VALUES (?, ?, ?, ?, ?, ?)");
    const std::string status = statusToString(window.status);
    sqlite3_bind_int64(stmt.get(), 1, toMillis(window.started_at));
    sqlite3_bind_int(stmt.get(), 2, static_cast<int>(window.person_count));
    sqlite3_bind_int(stmt.get(), 3, static_cast<int>(window.ppe_worn_count));
    sqlite3_bind_int(stmt.get(), 4, static_cast<int>(window.violation_count));
    if (window.snapshot_path) {
        sqlite3_bind_text(stmt.get(), 5, window.snapshot_path->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt.get(), 5);
    }
    sqlite3_bind_text(stmt.get(), 6, status.c_str(), -1, SQLITE_TRANSIENT);
    stmt.step();
    return sqlite3_last_insert_rowid(db_);
}

std::int64_t SqliteStore::saveViolationEvent(std::int64_t window_id, const ViolationEvent& event)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Events share their window's timestamp; an unknown window inserts nothing.
    Statement stmt(db_,
                   "INSERT INTO violation_events (log_id, timestamp, violation_type, location_box, "
                   "confidence, severity, is_resolved) "
                   "SELECT id, timestamp, ?, ?, ?, ?, 0 FROM compliance_logs WHERE id = ?");
    const std::string box = formatBox(event.box);
    sqlite3_bind_text(stmt.get(), 1, event.violation_type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, box.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt.get(), 3, event.confidence);
    sqlite3_bind_int(stmt.get(), 4, event.severity);
    sqlite3_bind_int64(stmt.get(), 5, window_id);
    stmt.step();
    if (sqlite3_changes(db_) == 0) {
        throw StorageError("No compliance log with id " + std::to_string(window_id));
    }
    return sqlite3_last_insert_rowid(db_);
}

std::vector<StoredWindow> SqliteStore::recentWindows(std::size_t limit)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
                   "SELECT id, timestamp, person_count, ppe_worn_count, violations_count, "
                   "frame_snapshot_path, status FROM compliance_logs "
                   "ORDER BY timestamp DESC, id DESC LIMIT ?");
    sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(limit));

    std::vector<StoredWindow> rows;
    while (stmt.step()) {
        StoredWindow row;
        row.id = sqlite3_column_int64(stmt.get(), 0);
        row.window.started_at = fromMillis(sqlite3_column_int64(stmt.get(), 1));
        row.window.person_count = static_cast<unsigned>(sqlite3_column_int(stmt.get(), 2));
        row.window.ppe_worn_count = static_cast<unsigned>(sqlite3_column_int(stmt.get(), 3));
        row.window.violation_count = static_cast<unsigned>(sqlite3_column_int(stmt.get(), 4));
        if (sqlite3_column_type(stmt.get(), 5) != SQLITE_NULL) {
            row.window.snapshot_path = columnText(stmt.get(), 5);
        }
        row.window.status = parseStatus(columnText(stmt.get(), 6));
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<StoredViolation> SqliteStore::violationsForWindow(std::int64_t window_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
                   "SELECT id, log_id, timestamp, violation_type, location_box, confidence, "
                   "severity, is_resolved FROM violation_events WHERE log_id = ? ORDER BY id");
    sqlite3_bind_int64(stmt.get(), 1, window_id);

    std::vector<StoredViolation> rows;
    while (stmt.step()) {
        rows.push_back(readViolation(stmt.get()));
    }
    return rows;
}

std::vector<StoredViolation> SqliteStore::recentViolations(std::size_t limit)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
                   "SELECT id, log_id, timestamp, violation_type, location_box, confidence, "
                   "severity, is_resolved FROM violation_events "
                   "ORDER BY timestamp DESC, id DESC LIMIT ?");
    sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(limit));

    std::vector<StoredViolation> rows;
    while (stmt.step()) {
        rows.push_back(readViolation(stmt.get()));
    }
    return rows;
}

ComplianceSummary SqliteStore::summarySince(TimePoint since)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
                   "SELECT COUNT(*), COALESCE(SUM(person_count), 0), COALESCE(SUM(violations_count), 0) "
                   "FROM compliance_logs WHERE timestamp >= ?");
    sqlite3_bind_int64(stmt.get(), 1, toMillis(since));

    ComplianceSummary summary;
    if (stmt.step()) {
        summary.windows = sqlite3_column_int64(stmt.get(), 0);
        summary.persons = sqlite3_column_int64(stmt.get(), 1);
        summary.violations = sqlite3_column_int64(stmt.get(), 2);
    }
    if (summary.persons > 0) {
        double rate = static_cast<double>(summary.persons - summary.violations) /
                      static_cast<double>(summary.persons) * 100.0;
        rate = std::max(0.0, rate);
        summary.compliance_rate = std::round(rate * 100.0) / 100.0;
    }
    return summary;
}

}  // namespace ppeguard

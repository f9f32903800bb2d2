#pragma once

#include <mutex>
#include <string>

#include "ppeguard/persistence.hpp"

struct sqlite3;

namespace ppeguard {

// SQLite-backed Persistence. Opens (or creates) the database file and its
// schema on construction; ":memory:" keeps everything in process.
class SqliteStore : public Persistence {
public:
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    std::int64_t saveComplianceWindow(const ComplianceWindow& window) override;
    std::int64_t saveViolationEvent(std::int64_t window_id, const ViolationEvent& event) override;

    std::vector<StoredWindow> recentWindows(std::size_t limit) override;
    std::vector<StoredViolation> violationsForWindow(std::int64_t window_id) override;
    std::vector<StoredViolation> recentViolations(std::size_t limit) override;
    ComplianceSummary summarySince(TimePoint since) override;

    const std::string& path() const { return path_; }

private:
    void createSchema();

    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

}  // namespace ppeguard

#pragma once

#include <future>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "ppeguard/common.hpp"
#include "ppeguard/frame_analyzer.hpp"
#include "ppeguard/notifier.hpp"
#include "ppeguard/thread_pool.hpp"

namespace ppeguard {

struct DispatchedAlert {
    std::string violation_type;
    unsigned count = 0;
    std::string message;
    // Resolves to the notifier's result; false as well when the send was dropped.
    std::shared_future<bool> delivery;
};

// "no-helmet" -> "missing helmet"; other names pass through.
std::string humanLabel(const std::string& violation_type);

// Header with the UTC time, one "- Nx missing <item>" line per type, closing line.
std::string formatAlertMessage(const std::string& service_name,
                               const std::vector<std::pair<std::string, unsigned>>& counts,
                               TimePoint time);

// Rate-limits operator alerts per violation type. The cooldown restarts on every
// attempt, whether or not the notifier succeeded.
class AlertDispatcher {
public:
    AlertDispatcher(Notifier& notifier, double cooldown_seconds, std::string service_name,
                    ThreadPool* executor = nullptr);

    std::vector<DispatchedAlert> onViolations(const std::vector<ViolationEvent>& events, TimePoint now);

    // Epoch when the type was never attempted.
    TimePoint lastSentAt(const std::string& violation_type) const;
    std::size_t trackedTypes() const { return last_sent_.size(); }
    double cooldownSeconds() const { return cooldown_seconds_; }

private:
    std::shared_future<bool> deliver(const std::string& violation_type, const std::string& message);

    Notifier& notifier_;
    double cooldown_seconds_;
    std::string service_name_;
    ThreadPool* executor_;
    std::map<std::string, TimePoint> last_sent_;
};

}  // namespace ppeguard

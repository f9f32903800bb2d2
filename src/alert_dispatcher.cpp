#include "ppeguard/alert_dispatcher.hpp"

#include <exception>
#include <iostream>
#include <sstream>

namespace ppeguard {

namespace {

bool sendLogged(Notifier& notifier, const std::string& violation_type, const std::string& message)
{
    bool ok = false;
    try {
        ok = notifier.send(message);
    } catch (const std::exception& ex) {
        std::cerr << "[Alerts] Notifier threw for '" << violation_type << "': " << ex.what() << std::endl;
        return false;
    }
    if (!ok) {
        std::cerr << "[Alerts] Failed to deliver alert for '" << violation_type << "'" << std::endl;
    }
    return ok;
}

std::shared_future<bool> readyResult(bool value)
{
    std::promise<bool> promise;
    promise.set_value(value);
    return promise.get_future().share();
}

}  // namespace

std::string humanLabel(const std::string& violation_type)
{
    static const std::string prefix = "no-";
    if (violation_type.compare(0, prefix.size(), prefix) == 0) {
        return "missing " + violation_type.substr(prefix.size());
    }
    return violation_type;
}

std::string formatAlertMessage(const std::string& service_name,
                               const std::vector<std::pair<std::string, unsigned>>& counts,
                               TimePoint time)
{
    std::ostringstream oss;
    oss << service_name << " ALERT at " << formatUtc(time, "%Y-%m-%d %H:%M:%S") << " UTC:";
    for (const auto& entry : counts) {
        oss << "\n- " << entry.second << "x " << humanLabel(entry.first);
    }
    oss << "\nImmediate action required.";
    return oss.str();
}

AlertDispatcher::AlertDispatcher(Notifier& notifier, double cooldown_seconds, std::string service_name,
                                 ThreadPool* executor)
    : notifier_(notifier),
      cooldown_seconds_(cooldown_seconds),
      service_name_(std::move(service_name)),
      executor_(executor) {}

TimePoint AlertDispatcher::lastSentAt(const std::string& violation_type) const {
    auto it = last_sent_.find(violation_type);
    return it == last_sent_.end() ? TimePoint{} : it->second;
}

std::vector<DispatchedAlert> AlertDispatcher::onViolations(const std::vector<ViolationEvent>& events,
                                                           TimePoint now) {
    // Distinct types in order of first appearance, with their counts in this batch.
    std::vector<std::pair<std::string, unsigned>> counts;
    for (const auto& event : events) {
        bool found = false;
        for (auto& entry : counts) {
            if (entry.first == event.violation_type) {
                ++entry.second;
                found = true;
                break;
            }
        }
        if (!found) {
            counts.emplace_back(event.violation_type, 1u);
        }
    }

    std::vector<DispatchedAlert> dispatched;
    for (const auto& entry : counts) {
        const std::string& type = entry.first;
        auto previous = last_sent_.find(type);
        if (previous != last_sent_.end() && secondsBetween(previous->second, now) < cooldown_seconds_) {
            continue;
        }
        last_sent_[type] = now;

        DispatchedAlert alert;
        alert.violation_type = type;
        alert.count = entry.second;
        alert.message = formatAlertMessage(service_name_, {entry}, now);
        std::cout << "[Alerts] Sending alert for '" << type << "' (" << entry.second << "x)" << std::endl;
        alert.delivery = deliver(type, alert.message);
        dispatched.push_back(std::move(alert));
    }
    return dispatched;
}

std::shared_future<bool> AlertDispatcher::deliver(const std::string& violation_type, const std::string& message) {
    if (!executor_) {
        return readyResult(sendLogged(notifier_, violation_type, message));
    }

    Notifier* notifier = &notifier_;
    auto queued = executor_->trySubmit([notifier, violation_type, message]() {
        return sendLogged(*notifier, violation_type, message);
    });
    if (!queued) {
        std::cerr << "[Alerts] Alert queue full, dropping alert for '" << violation_type << "'" << std::endl;
        return readyResult(false);
    }
    return queued->share();
}

}  // namespace ppeguard

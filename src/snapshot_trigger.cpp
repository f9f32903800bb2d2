#include "ppeguard/snapshot_trigger.hpp"

#include <stdexcept>

namespace ppeguard {

SnapshotTrigger::SnapshotTrigger(unsigned threshold) : threshold_(threshold) {
    if (threshold_ == 0) {
        throw std::invalid_argument("Snapshot threshold must be at least one frame");
    }
}

bool SnapshotTrigger::onFrame(unsigned violation_count) {
    if (violation_count == 0) {
        count_ = 0;
        return false;
    }
    ++count_;
    if (count_ >= threshold_) {
        count_ = 0;
        return true;
    }
    return false;
}

}  // namespace ppeguard

#pragma once

namespace ppeguard {

// Counts consecutive violating frames and fires once each time the streak
// reaches the threshold. The counter restarts after firing.
class SnapshotTrigger {
public:
    explicit SnapshotTrigger(unsigned threshold = 5);

    bool onFrame(unsigned violation_count);
    void reset() { count_ = 0; }

    unsigned consecutiveViolationFrames() const { return count_; }
    unsigned threshold() const { return threshold_; }

private:
    unsigned threshold_;
    unsigned count_{0};
};

}  // namespace ppeguard

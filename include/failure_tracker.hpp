#pragma once

#include "adapter.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <system_error>

namespace pg {

struct FailurePolicy {
    int max_failed_times = 5;
    std::chrono::milliseconds window{5000};
};

// Counts dial failures of a group and escalates to a health check when
// max_failed_times failures land within one window. A refused connection
// escalates at once without touching the count.
//
// States: Healthy (count 0), Accumulating (0 < count < max), Escalated.
class FailureTracker {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using Escalate = std::function<void()>;
    using InFlight = std::function<bool()>;

    // escalate must not block: it is called with the failure lock held
    FailureTracker(std::string group_name, FailurePolicy policy,
                   Escalate escalate, InFlight sweep_in_flight,
                   Clock clock = std::chrono::steady_clock::now);

    void on_dial_failed(AdapterType type, const std::error_code& error);
    void on_dial_success();

    // Called by the sweep once it has finished
    void on_health_check_finished();

    int failure_count() const;
    const FailurePolicy& policy() const { return policy_; }

private:
    void reset_locked() { failed_times_ = 0; }

    std::string group_name_;
    FailurePolicy policy_;
    Escalate escalate_;
    InFlight sweep_in_flight_;
    Clock clock_;

    mutable std::mutex mutex_;
    int failed_times_ = 0;
    std::chrono::steady_clock::time_point first_failed_at_;
};

} // namespace pg

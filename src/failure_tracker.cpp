#include "failure_tracker.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>

namespace pg {

FailureTracker::FailureTracker(std::string group_name, FailurePolicy policy,
                               Escalate escalate, InFlight sweep_in_flight, Clock clock)
    : group_name_(std::move(group_name)),
      policy_(policy),
      escalate_(std::move(escalate)),
      sweep_in_flight_(std::move(sweep_in_flight)),
      clock_(std::move(clock)) {}

void FailureTracker::on_dial_failed(AdapterType type, const std::error_code& error) {
    if (!counts_toward_health(type)) {
        return;
    }

    if (error == std::errc::connection_refused) {
        Logger::warn(Logger::Component::Failure,
            fmt::format("{}: connection refused, active health check", group_name_));
        escalate_();
        return;
    }

    bool escalate = false;
    {
        std::lock_guard lock(mutex_);
        auto now = clock_();

        ++failed_times_;
        if (failed_times_ == 1) {
            Logger::debug(Logger::Component::Failure,
                fmt::format("{}: first failed ({})", group_name_, error.message()));
            first_failed_at_ = now;
            return;
        }

        if (now - first_failed_at_ > policy_.window) {
            reset_locked();
            return;
        }

        Logger::debug(Logger::Component::Failure,
            fmt::format("{}: failed count {}", group_name_, failed_times_));
        escalate = failed_times_ >= policy_.max_failed_times;
    }

    if (escalate) {
        Logger::warn(Logger::Component::Failure,
            fmt::format("because {} failed multiple times, active health check", group_name_));
        escalate_();
    }
}

void FailureTracker::on_dial_success() {
    if (sweep_in_flight_()) {
        return;
    }
    std::lock_guard lock(mutex_);
    reset_locked();
}

void FailureTracker::on_health_check_finished() {
    std::lock_guard lock(mutex_);
    reset_locked();
}

int FailureTracker::failure_count() const {
    std::lock_guard lock(mutex_);
    return failed_times_;
}

} // namespace pg

#pragma once

#include "failure_tracker.hpp"
#include "fallback_registry.hpp"
#include "filter_set.hpp"
#include "health_check_coordinator.hpp"
#include "latency_prober.hpp"
#include "proxy_provider.hpp"
#include "proxy_set_resolver.hpp"
#include <future>
#include <mutex>
#include <string>
#include <vector>

namespace pg {

struct GroupOptions {
    std::string name;
    FilterSet filters;
    std::vector<ProviderPtr> providers;
    FailurePolicy failure_policy;
};

// Shared state of one proxy group: backend resolution, failure escalation
// and health-check coordination. Selection policies build on top of it.
class GroupBase {
public:
    explicit GroupBase(GroupOptions options,
                       const FallbackRegistry& fallbacks = FallbackRegistry::instance());

    // Waits for outstanding background health checks
    ~GroupBase();

    GroupBase(const GroupBase&) = delete;
    GroupBase& operator=(const GroupBase&) = delete;

    const std::string& name() const { return name_; }

    // Touch every provider
    void touch();

    BackendList resolve(bool touch) { return resolver_.resolve(touch); }

    std::expected<DelayMap, std::string> url_test(const std::string& url,
                                                  std::chrono::milliseconds timeout,
                                                  std::stop_token stop = {}) {
        return prober_.probe_all(url, timeout, std::move(stop));
    }

    void on_dial_failed(AdapterType type, const std::error_code& error) {
        failures_.on_dial_failed(type, error);
    }
    void on_dial_success() { failures_.on_dial_success(); }

    // Runs a sweep on the calling thread
    bool health_check() { return coordinator_.run_sweep(); }

    bool health_check_in_flight() const { return coordinator_.in_flight(); }
    int failure_count() const { return failures_.failure_count(); }

    // Block until every background sweep spawned so far has finished
    void wait_background();

    // Background sweep tasks not yet collected
    size_t background_tasks() const {
        std::lock_guard lock(tasks_mutex_);
        return tasks_.size();
    }

private:
    void spawn_health_check();

    std::string name_;
    ProxySetResolver resolver_;
    HealthCheckCoordinator coordinator_;
    FailureTracker failures_;
    LatencyProber prober_;

    mutable std::mutex tasks_mutex_;
    std::vector<std::future<void>> tasks_;
};

} // namespace pg

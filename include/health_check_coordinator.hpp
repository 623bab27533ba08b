#pragma once

#include "proxy_provider.hpp"
#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace pg {

// Runs every provider's health check in parallel, one sweep at a time
class HealthCheckCoordinator {
public:
    using OnFinished = std::function<void()>;

    HealthCheckCoordinator(std::string group_name, std::vector<ProviderPtr> providers,
                           OnFinished on_finished = {});

    // Blocks until the sweep completes. Returns false without doing any
    // work when another sweep is already running.
    bool run_sweep();

    bool in_flight() const { return in_flight_.load(); }

private:
    void check_provider(const ProviderPtr& provider) const;

    std::string group_name_;
    std::vector<ProviderPtr> providers_;
    OnFinished on_finished_;
    std::atomic<bool> in_flight_{false};
};

} // namespace pg

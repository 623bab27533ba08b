#include "health_check_coordinator.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <thread>

namespace pg {

HealthCheckCoordinator::HealthCheckCoordinator(std::string group_name,
                                               std::vector<ProviderPtr> providers,
                                               OnFinished on_finished)
    : group_name_(std::move(group_name)),
      providers_(std::move(providers)),
      on_finished_(std::move(on_finished)) {}

bool HealthCheckCoordinator::run_sweep() {
    bool expected = false;
    if (!in_flight_.compare_exchange_strong(expected, true)) {
        Logger::debug(Logger::Component::HealthCheck,
            fmt::format("{}: sweep already running", group_name_));
        return false;
    }

    Logger::info(Logger::Component::HealthCheck,
        fmt::format("{}: sweep started over {} providers", group_name_, providers_.size()));
    auto start = std::chrono::steady_clock::now();

    {
        std::vector<std::jthread> workers;
        workers.reserve(providers_.size());
        for (const auto& provider : providers_) {
            workers.emplace_back([this, provider]() { check_provider(provider); });
        }
    }

    in_flight_.store(false);
    if (on_finished_) {
        on_finished_();
    }

    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    Logger::info(Logger::Component::HealthCheck,
        fmt::format("{}: sweep finished ({}ms)", group_name_, duration_ms));
    return true;
}

void HealthCheckCoordinator::check_provider(const ProviderPtr& provider) const {
    try {
        provider->health_check();
    } catch (const std::exception& e) {
        Logger::error(Logger::Component::HealthCheck,
            fmt::format("{}: provider {} health check failed: {}",
                group_name_, provider->name(), e.what()));
    }
}

} // namespace pg

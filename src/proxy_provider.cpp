#include "proxy_provider.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <mutex>
#include <thread>

namespace pg {

std::string_view to_string(VehicleType type) {
    switch (type) {
        case VehicleType::File: return "File";
        case VehicleType::HTTP: return "HTTP";
        case VehicleType::Inline: return "Inline";
        case VehicleType::Compatible: return "Compatible";
    }
    return "Unknown";
}

StaticProvider::StaticProvider(std::string name, VehicleType vehicle, BackendList backends,
                               ProviderHealthCheck health_check)
    : name_(std::move(name)), vehicle_(vehicle), health_check_(std::move(health_check)),
      backends_(std::move(backends)), version_(1), touches_(0) {}

void StaticProvider::touch() {
    touches_.fetch_add(1, std::memory_order_relaxed);
}

BackendList StaticProvider::proxies() const {
    std::shared_lock lock(mutex_);
    return backends_;
}

void StaticProvider::update(BackendList backends) {
    {
        std::unique_lock lock(mutex_);
        backends_ = std::move(backends);
    }
    // Publish the version after the list so a reader that sees the new
    // version also sees the new list
    auto version = version_.fetch_add(1) + 1;
    Logger::info(Logger::Component::Provider,
        fmt::format("{}: updated to version {}", name_, version));
}

void StaticProvider::health_check() {
    auto backends = proxies();
    if (health_check_.url.empty() || backends.empty()) {
        return;
    }

    ProbeContext ctx{{}, std::chrono::steady_clock::now() + health_check_.timeout};
    std::atomic<size_t> alive{0};
    {
        std::vector<std::jthread> workers;
        workers.reserve(backends.size());
        for (const auto& backend : backends) {
            workers.emplace_back([&ctx, &alive, backend, this]() {
                if (backend->url_test(ctx, health_check_.url)) {
                    alive.fetch_add(1, std::memory_order_relaxed);
                }
            });
        }
    }

    Logger::info(Logger::Component::Provider,
        fmt::format("{}: health check finished, {}/{} alive", name_, alive.load(), backends.size()));
}

} // namespace pg

#include "group_base.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace pg {

GroupBase::GroupBase(GroupOptions options, const FallbackRegistry& fallbacks)
    : name_(options.name),
      resolver_(options.name, std::move(options.filters), options.providers, fallbacks),
      coordinator_(options.name, options.providers,
                   [this]() { failures_.on_health_check_finished(); }),
      failures_(options.name, options.failure_policy,
                [this]() { spawn_health_check(); },
                [this]() { return coordinator_.in_flight(); }),
      prober_(resolver_) {
    Logger::info(Logger::Component::Group,
        fmt::format("{}: created with {} providers, {} filters",
            name_, options.providers.size(), resolver_.filters().size()));
}

GroupBase::~GroupBase() {
    wait_background();
}

void GroupBase::touch() {
    for (const auto& provider : resolver_.providers()) {
        provider->touch();
    }
}

void GroupBase::wait_background() {
    std::vector<std::future<void>> pending;
    {
        std::lock_guard lock(tasks_mutex_);
        pending.swap(tasks_);
    }
    for (auto& task : pending) {
        task.wait();
    }
}

void GroupBase::spawn_health_check() {
    // run_sweep claims the flag itself; this only saves a thread per request
    if (coordinator_.in_flight()) {
        Logger::debug(Logger::Component::Group,
            fmt::format("{}: health check already in flight", name_));
        return;
    }

    std::lock_guard lock(tasks_mutex_);

    // Drop finished sweeps
    std::erase_if(tasks_, [](const std::future<void>& task) {
        return task.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    });

    tasks_.push_back(std::async(std::launch::async, [this]() {
        if (!coordinator_.run_sweep()) {
            Logger::debug(Logger::Component::Group,
                fmt::format("{}: health check skipped, one is in flight", name_));
        }
    }));
}

} // namespace pg

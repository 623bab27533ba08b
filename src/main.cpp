#include "config_loader.hpp"
#include "fallback_registry.hpp"
#include "filter_set.hpp"
#include "group_base.hpp"
#include "http_proxy_backend.hpp"
#include "logger.hpp"
#include "proxy_provider.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <stop_token>
#include <thread>

using json = nlohmann::json;
using namespace pg;

namespace {

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested.store(true);
    }
}

std::vector<ProviderPtr> build_providers(const std::vector<ProviderConfig>& configs) {
    std::vector<ProviderPtr> providers;
    providers.reserve(configs.size());
    for (const auto& pc : configs) {
        BackendList backends;
        for (const auto& proxy : pc.proxies) {
            backends.push_back(std::make_shared<HttpProxyBackend>(proxy.name, proxy.host,
                static_cast<uint16_t>(proxy.port)));
        }
        auto vehicle = pc.type == "compatible" ? VehicleType::Compatible : VehicleType::Inline;
        providers.push_back(std::make_shared<StaticProvider>(
            pc.name, vehicle, std::move(backends),
            ProviderHealthCheck{pc.health_check_url,
                                std::chrono::milliseconds(pc.health_check_timeout_ms)}));
        Logger::info(Logger::Component::Config,
            fmt::format("Provider {} ({}): {} proxies", pc.name, pc.type, pc.proxies.size()));
    }
    return providers;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string config_path = argc > 1 ? argv[1] : "config.json";
    auto config_result = ConfigLoader::load(config_path);
    if (!config_result.has_value()) {
        std::cerr << "Failed to load configuration: " << config_result.error() << std::endl;
        return 1;
    }
    const Config& config = config_result.value();

    Logger::init(config.log.file, config.log.level);

    // Validated by the loader
    auto filters = FilterSet::parse(config.group.filter);
    if (!filters) {
        Logger::error(Logger::Component::Config, filters.error());
        Logger::shutdown();
        return 1;
    }

    GroupOptions options;
    options.name = config.group.name;
    options.filters = std::move(*filters);
    options.providers = build_providers(config.providers);
    options.failure_policy.max_failed_times = config.group.max_failed_times;
    options.failure_policy.window = std::chrono::milliseconds(config.group.failed_window_ms);

    // Turn Ctrl+C into cancellation of in-flight probes
    std::stop_source stop_source;
    std::jthread signal_watcher([&stop_source](std::stop_token watcher_stop) {
        while (!watcher_stop.stop_requested()) {
            if (shutdown_requested.load()) {
                stop_source.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    int exit_code = 0;
    {
        GroupBase group(std::move(options));

        group.health_check();

        auto backends = group.resolve(true);
        Logger::info(Logger::Component::Main,
            fmt::format("{} resolves to {} backends", group.name(), backends.size()));

        auto delays = group.url_test(config.group.test_url,
                                     std::chrono::milliseconds(config.group.test_timeout_ms),
                                     stop_source.get_token());

        json report;
        report["group"] = group.name();
        report["url"] = config.group.test_url;
        json entries = json::array();
        for (const auto& backend : backends) {
            json entry;
            entry["name"] = backend->name();
            entry["type"] = std::string(to_string(backend->type()));
            if (delays) {
                auto it = delays->find(backend->name());
                if (it != delays->end()) {
                    entry["delay_ms"] = it->second;
                }
            }
            entries.push_back(entry);
        }
        report["backends"] = entries;

        if (!delays) {
            report["error"] = delays.error();
            Logger::error(Logger::Component::Main, delays.error());
            exit_code = 1;
        }

        std::cout << report.dump(2) << std::endl;
    }

    Logger::shutdown();
    return exit_code;
}

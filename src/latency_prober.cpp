#include "latency_prober.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <mutex>
#include <thread>

namespace pg {

std::expected<DelayMap, std::string> LatencyProber::probe_all(const std::string& url,
                                                              std::chrono::milliseconds timeout,
                                                              std::stop_token stop) {
    auto backends = resolver_.resolve(false);
    ProbeContext ctx{std::move(stop), std::chrono::steady_clock::now() + timeout};

    DelayMap delays;
    std::mutex delays_mutex;
    {
        std::vector<std::jthread> workers;
        workers.reserve(backends.size());
        for (const auto& backend : backends) {
            workers.emplace_back([&ctx, &url, &delays, &delays_mutex, backend]() {
                auto delay = backend->url_test(ctx, url);
                if (!delay) {
                    Logger::debug(Logger::Component::Probe,
                        fmt::format("{}: {}", backend->name(), delay.error()));
                    return;
                }
                std::lock_guard lock(delays_mutex);
                delays[backend->name()] = *delay;
            });
        }
    }

    if (delays.empty()) {
        return std::unexpected("get delay: all proxies timeout");
    }

    Logger::debug(Logger::Component::Probe,
        fmt::format("{}/{} backends answered {}", delays.size(), backends.size(), url));
    return delays;
}

} // namespace pg

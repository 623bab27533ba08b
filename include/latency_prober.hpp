#pragma once

#include "adapter.hpp"
#include "proxy_set_resolver.hpp"
#include <chrono>
#include <expected>
#include <stop_token>
#include <string>

namespace pg {

// Url-tests every backend the group currently resolves to, in parallel
class LatencyProber {
public:
    explicit LatencyProber(ProxySetResolver& resolver) : resolver_(resolver) {}

    // Delay per backend name for the probes that succeeded. Fails only when
    // no probe succeeded. Each probe is bounded by timeout and by stop.
    std::expected<DelayMap, std::string> probe_all(const std::string& url,
                                                   std::chrono::milliseconds timeout,
                                                   std::stop_token stop = {});

private:
    ProxySetResolver& resolver_;
};

} // namespace pg

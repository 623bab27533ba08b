#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pg {

// Outbound adapter classification. Everything except Routed is a sentinel
// that never dials a real upstream proxy.
enum class AdapterType {
    Direct,
    Reject,
    Pass,
    Compatible,
    Routed
};

std::string_view to_string(AdapterType type);

// Sentinel kinds are excluded from group failure accounting
constexpr bool counts_toward_health(AdapterType type) {
    switch (type) {
        case AdapterType::Direct:
        case AdapterType::Reject:
        case AdapterType::Pass:
        case AdapterType::Compatible:
            return false;
        case AdapterType::Routed:
            return true;
    }
    return true;
}

// Cancellation and deadline handed to a single latency probe
struct ProbeContext {
    std::stop_token stop;
    std::chrono::steady_clock::time_point deadline;

    bool expired() const {
        return stop.stop_requested() || std::chrono::steady_clock::now() >= deadline;
    }

    std::chrono::milliseconds remaining() const {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }
};

class Backend {
public:
    virtual ~Backend() = default;

    virtual const std::string& name() const = 0;
    virtual AdapterType type() const = 0;

    // Measure the round trip to url through this backend, in milliseconds
    virtual std::expected<uint16_t, std::string> url_test(const ProbeContext& ctx,
                                                          const std::string& url) = 0;

    // Result of the most recent url_test
    virtual bool alive() const = 0;
};

using BackendPtr = std::shared_ptr<Backend>;
using BackendList = std::vector<BackendPtr>;
using DelayMap = std::unordered_map<std::string, uint16_t>;

} // namespace pg

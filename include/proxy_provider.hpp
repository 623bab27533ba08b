#pragma once

#include "adapter.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace pg {

// Where a provider's list comes from. Compatible providers wrap a list that
// is already authoritative and are re-read on every resolve.
enum class VehicleType {
    File,
    HTTP,
    Inline,
    Compatible
};

std::string_view to_string(VehicleType type);

class ProxyProvider {
public:
    virtual ~ProxyProvider() = default;

    virtual const std::string& name() const = 0;

    // Hint that the upstream subscription is in use; must not block
    virtual void touch() = 0;

    virtual BackendList proxies() const = 0;

    // Bumped whenever proxies() would return a different list
    virtual uint32_t version() const = 0;

    virtual VehicleType vehicle_type() const = 0;

    // Probe the provider's own backends; may block
    virtual void health_check() = 0;
};

using ProviderPtr = std::shared_ptr<ProxyProvider>;

struct ProviderHealthCheck {
    std::string url;
    std::chrono::milliseconds timeout{5000};
};

// Provider over an in-memory list, used for inline and compatible sources
class StaticProvider : public ProxyProvider {
public:
    StaticProvider(std::string name, VehicleType vehicle, BackendList backends,
                   ProviderHealthCheck health_check);

    const std::string& name() const override { return name_; }
    void touch() override;
    BackendList proxies() const override;
    uint32_t version() const override { return version_.load(); }
    VehicleType vehicle_type() const override { return vehicle_; }
    void health_check() override;

    // Replace the list and bump the version (write lock)
    void update(BackendList backends);

    uint64_t touch_count() const { return touches_.load(); }

private:
    std::string name_;
    VehicleType vehicle_;
    ProviderHealthCheck health_check_;
    BackendList backends_;
    mutable std::shared_mutex mutex_;
    std::atomic<uint32_t> version_;
    std::atomic<uint64_t> touches_;
};

} // namespace pg

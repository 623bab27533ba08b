#pragma once

#include "adapter.hpp"
#include "fallback_registry.hpp"
#include "filter_set.hpp"
#include "proxy_provider.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace pg {

// Builds a group's effective backend list from its providers.
//
// With filters configured, each provider's filtered list is cached and only
// recomputed when the provider's version moves. The claim cell is taken
// with a compare-and-swap so that racing callers recompute a slot once per
// version change. The list and the version it was built from are published
// together as one snapshot, and a snapshot only replaces an older one.
class ProxySetResolver {
public:
    ProxySetResolver(std::string group_name, FilterSet filters,
                     std::vector<ProviderPtr> providers,
                     const FallbackRegistry& fallbacks = FallbackRegistry::instance());

    ProxySetResolver(const ProxySetResolver&) = delete;
    ProxySetResolver& operator=(const ProxySetResolver&) = delete;

    // Current backends in provider/filter order; never empty while the
    // registry holds a compatible backend
    BackendList resolve(bool touch);

    const std::vector<ProviderPtr>& providers() const { return providers_; }
    const FilterSet& filters() const { return filters_; }

private:
    struct Snapshot {
        uint32_t version = 0;
        BackendList backends;
    };

    struct CacheSlot {
        // Highest version some caller has started recomputing
        std::atomic<uint32_t> claimed{0};
        std::atomic<std::shared_ptr<const Snapshot>> snapshot{
            std::make_shared<const Snapshot>()};
    };

    BackendList resolve_unfiltered(bool touch);
    void refresh_slot(size_t index, bool touch);
    static void publish(CacheSlot& slot, std::shared_ptr<const Snapshot> next);
    BackendList filter_provider_list(const BackendList& backends) const;
    BackendList merge_across_providers(const BackendList& combined) const;
    BackendList fallback_list() const;

    std::string group_name_;
    FilterSet filters_;
    std::vector<ProviderPtr> providers_;
    std::vector<CacheSlot> slots_;
    const FallbackRegistry& fallbacks_;
};

} // namespace pg

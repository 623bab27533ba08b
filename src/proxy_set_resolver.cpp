#include "proxy_set_resolver.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <unordered_set>

namespace pg {

ProxySetResolver::ProxySetResolver(std::string group_name, FilterSet filters,
                                   std::vector<ProviderPtr> providers,
                                   const FallbackRegistry& fallbacks)
    : group_name_(std::move(group_name)),
      filters_(std::move(filters)),
      providers_(std::move(providers)),
      slots_(providers_.size()),
      fallbacks_(fallbacks) {}

BackendList ProxySetResolver::resolve(bool touch) {
    if (filters_.empty()) {
        return resolve_unfiltered(touch);
    }

    for (size_t i = 0; i < providers_.size(); ++i) {
        refresh_slot(i, touch);
    }

    BackendList combined;
    for (const auto& slot : slots_) {
        auto snapshot = slot.snapshot.load();
        combined.insert(combined.end(), snapshot->backends.begin(), snapshot->backends.end());
    }

    if (combined.empty()) {
        return fallback_list();
    }

    if (providers_.size() > 1 && filters_.size() > 1) {
        return merge_across_providers(combined);
    }
    return combined;
}

BackendList ProxySetResolver::resolve_unfiltered(bool touch) {
    BackendList combined;
    for (const auto& provider : providers_) {
        if (touch) {
            provider->touch();
        }
        auto backends = provider->proxies();
        combined.insert(combined.end(), backends.begin(), backends.end());
    }

    if (combined.empty()) {
        return fallback_list();
    }
    return combined;
}

void ProxySetResolver::refresh_slot(size_t index, bool touch) {
    auto& provider = providers_[index];
    auto& slot = slots_[index];

    if (touch) {
        provider->touch();
    }

    // Already authoritative; taken as-is on every call
    if (provider->vehicle_type() == VehicleType::Compatible) {
        uint32_t version = provider->version();
        slot.snapshot.store(std::make_shared<const Snapshot>(
            Snapshot{version, provider->proxies()}));
        return;
    }

    uint32_t live = provider->version();
    if (slot.snapshot.load()->version == live) {
        return;
    }
    uint32_t claimed = slot.claimed.load();
    if (claimed == live || !slot.claimed.compare_exchange_strong(claimed, live)) {
        return;
    }

    auto filtered = filter_provider_list(provider->proxies());
    Logger::debug(Logger::Component::Resolver,
        fmt::format("{}: provider {} version {} -> {}, {} backends after filter",
            group_name_, provider->name(), claimed, live, filtered.size()));
    publish(slot, std::make_shared<const Snapshot>(Snapshot{live, std::move(filtered)}));
}

// Install next unless a snapshot of the same or a newer version is already
// there; a slow recompute must not overwrite a faster one for a later version
void ProxySetResolver::publish(CacheSlot& slot, std::shared_ptr<const Snapshot> next) {
    auto current = slot.snapshot.load();
    while (current->version < next->version) {
        if (slot.snapshot.compare_exchange_weak(current, next)) {
            return;
        }
    }
}

BackendList ProxySetResolver::filter_provider_list(const BackendList& backends) const {
    BackendList result;
    std::unordered_set<std::string> seen;
    for (size_t f = 0; f < filters_.size(); ++f) {
        for (const auto& backend : backends) {
            const auto& name = backend->name();
            if (filters_.matches(f, name) && seen.insert(name).second) {
                result.push_back(backend);
            }
        }
    }
    return result;
}

BackendList ProxySetResolver::merge_across_providers(const BackendList& combined) const {
    BackendList result;
    std::unordered_set<std::string> seen;
    for (size_t f = 0; f < filters_.size(); ++f) {
        for (const auto& backend : combined) {
            const auto& name = backend->name();
            if (filters_.matches(f, name) && seen.insert(name).second) {
                result.push_back(backend);
            }
        }
    }

    // Unmatched backends (from compatible providers) go last
    for (const auto& backend : combined) {
        if (seen.insert(backend->name()).second) {
            result.push_back(backend);
        }
    }
    return result;
}

BackendList ProxySetResolver::fallback_list() const {
    auto fallback = fallbacks_.compatible();
    if (!fallback) {
        Logger::error(Logger::Component::Resolver,
            fmt::format("{}: no backends and no fallback registered", group_name_));
        return {};
    }
    Logger::debug(Logger::Component::Resolver,
        fmt::format("{}: no eligible backends, using {}", group_name_, fallback->name()));
    return {fallback};
}

} // namespace pg

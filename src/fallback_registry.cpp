#include "fallback_registry.hpp"
#include "http_proxy_backend.hpp"
#include <mutex>

namespace pg {

FallbackRegistry::FallbackRegistry() {
    backends_.emplace(kCompatible, std::make_shared<CompatibleBackend>());
}

FallbackRegistry& FallbackRegistry::instance() {
    static FallbackRegistry registry;
    return registry;
}

void FallbackRegistry::register_backend(BackendPtr backend) {
    if (!backend) {
        return;
    }
    std::unique_lock lock(mutex_);
    backends_[backend->name()] = std::move(backend);
}

BackendPtr FallbackRegistry::lookup(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = backends_.find(name);
    if (it == backends_.end()) {
        return nullptr;
    }
    return it->second;
}

} // namespace pg

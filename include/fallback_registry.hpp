#pragma once

#include "adapter.hpp"
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace pg {

// Process-wide table of named always-available backends. A group that
// resolves to nothing substitutes the entry registered under kCompatible.
class FallbackRegistry {
public:
    static constexpr const char* kCompatible = "COMPATIBLE";

    // Starts with a CompatibleBackend registered under kCompatible
    FallbackRegistry();

    static FallbackRegistry& instance();

    // Register or replace the entry keyed by backend->name()
    void register_backend(BackendPtr backend);

    // nullptr when nothing is registered under name
    BackendPtr lookup(const std::string& name) const;

    BackendPtr compatible() const { return lookup(kCompatible); }

private:
    std::unordered_map<std::string, BackendPtr> backends_;
    mutable std::shared_mutex mutex_;
};

} // namespace pg

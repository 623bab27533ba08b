#pragma once

#include "adapter.hpp"
#include <atomic>
#include <cstdint>
#include <string>

namespace pg {

// An upstream HTTP proxy. url_test sends a HEAD request for the target
// through the proxy and reports the elapsed time.
class HttpProxyBackend : public Backend {
public:
    HttpProxyBackend(std::string name, std::string host, uint16_t port);

    const std::string& name() const override { return name_; }
    AdapterType type() const override { return AdapterType::Routed; }

    std::expected<uint16_t, std::string> url_test(const ProbeContext& ctx,
                                                  const std::string& url) override;

    bool alive() const override { return alive_.load(); }
    uint16_t last_delay() const { return last_delay_.load(); }

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

private:
    std::string name_;
    std::string host_;
    uint16_t port_;
    std::atomic<bool> alive_;
    std::atomic<uint16_t> last_delay_;
};

// Direct connection used as the group of last resort
class CompatibleBackend : public Backend {
public:
    CompatibleBackend();

    const std::string& name() const override { return name_; }
    AdapterType type() const override { return AdapterType::Compatible; }

    std::expected<uint16_t, std::string> url_test(const ProbeContext& ctx,
                                                  const std::string& url) override;

    bool alive() const override { return true; }

private:
    std::string name_;
};

// Split "http://host:port/path?q" into scheme-host-port and path parts
struct SplitUrl {
    std::string origin;
    std::string path;
};

std::expected<SplitUrl, std::string> split_url(const std::string& url);

} // namespace pg

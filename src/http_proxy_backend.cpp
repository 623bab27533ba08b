#include "http_proxy_backend.hpp"
#include "logger.hpp"
#include <httplib.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <limits>
#include <stop_token>

namespace pg {

namespace {

constexpr const char* kCompatibleName = "COMPATIBLE";

// Connect, write and read share one budget so a probe cannot overrun its deadline
void apply_timeouts(httplib::Client& client, std::chrono::milliseconds budget) {
    auto connect = budget * 2 / 5;
    auto write = budget / 5;
    auto read = budget - connect - write;
    auto sec = [](std::chrono::milliseconds t) { return static_cast<time_t>(t.count() / 1000); };
    auto usec = [](std::chrono::milliseconds t) {
        return static_cast<time_t>((t.count() % 1000) * 1000);
    };
    client.set_connection_timeout(sec(connect), usec(connect));
    client.set_write_timeout(sec(write), usec(write));
    client.set_read_timeout(sec(read), usec(read));
}

uint16_t clamp_delay(std::chrono::steady_clock::duration elapsed) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    ms = std::clamp<long long>(ms, 0, std::numeric_limits<uint16_t>::max());
    return static_cast<uint16_t>(ms);
}

// Issue a HEAD for path through client and time it. Cancelling ctx.stop
// shuts the client's socket so a blocked request returns at once.
std::expected<uint16_t, std::string> timed_head(httplib::Client& client,
                                                const ProbeContext& ctx,
                                                const std::string& path) {
    if (ctx.expired()) {
        return std::unexpected("probe cancelled before start");
    }
    apply_timeouts(client, ctx.remaining());

    std::stop_callback on_stop(ctx.stop, [&client]() { client.stop(); });

    auto start = std::chrono::steady_clock::now();
    auto res = client.Head(path);
    auto elapsed = std::chrono::steady_clock::now() - start;

    if (ctx.stop.stop_requested()) {
        return std::unexpected("probe cancelled");
    }
    if (!res) {
        return std::unexpected(httplib::to_string(res.error()));
    }
    if (res->status >= 400) {
        return std::unexpected(fmt::format("unexpected status {}", res->status));
    }
    return clamp_delay(elapsed);
}

} // namespace

std::expected<SplitUrl, std::string> split_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::unexpected("URL has no scheme: " + url);
    }

    auto path_start = url.find('/', scheme_end + 3);
    SplitUrl parts;
    if (path_start == std::string::npos) {
        parts.origin = url;
        parts.path = "/";
    } else {
        parts.origin = url.substr(0, path_start);
        parts.path = url.substr(path_start);
    }

    if (parts.origin.size() == scheme_end + 3) {
        return std::unexpected("URL has no host: " + url);
    }
    return parts;
}

HttpProxyBackend::HttpProxyBackend(std::string name, std::string host, uint16_t port)
    : name_(std::move(name)), host_(std::move(host)), port_(port),
      alive_(true), last_delay_(0) {}

std::expected<uint16_t, std::string> HttpProxyBackend::url_test(const ProbeContext& ctx,
                                                                const std::string& url) {
    auto parts = split_url(url);
    if (!parts) {
        alive_.store(false);
        return std::unexpected(parts.error());
    }

    std::expected<uint16_t, std::string> result;
    try {
        httplib::Client client(parts->origin);
        client.set_proxy(host_, port_);
        client.set_url_encode(false);
        // httplib turns the path into the absolute-form target proxies expect
        result = timed_head(client, ctx, parts->path);
    } catch (const std::exception& e) {
        result = std::unexpected(std::string("url test exception: ") + e.what());
    }

    alive_.store(result.has_value());
    last_delay_.store(result.value_or(0));
    if (!result) {
        Logger::debug(Logger::Component::Probe,
            fmt::format("{} ({}:{}) url test failed: {}", name_, host_, port_, result.error()));
    }
    return result;
}

CompatibleBackend::CompatibleBackend() : name_(kCompatibleName) {}

std::expected<uint16_t, std::string> CompatibleBackend::url_test(const ProbeContext& ctx,
                                                                 const std::string& url) {
    auto parts = split_url(url);
    if (!parts) {
        return std::unexpected(parts.error());
    }

    try {
        httplib::Client client(parts->origin);
        return timed_head(client, ctx, parts->path);
    } catch (const std::exception& e) {
        return std::unexpected(std::string("url test exception: ") + e.what());
    }
}

} // namespace pg

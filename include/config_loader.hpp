#pragma once

#include <string>
#include <vector>
#include <expected>
#include <cstdint>

namespace pg {

struct ProxyConfig {
    std::string name;
    std::string host;
    int port = 0;
};

struct ProviderConfig {
    std::string name;
    std::string type;  // "inline" or "compatible"
    std::string health_check_url;
    int health_check_timeout_ms;
    std::vector<ProxyConfig> proxies;
};

struct GroupConfig {
    std::string name;
    std::string filter;
    int max_failed_times;
    int failed_window_ms;
    std::string test_url;
    int test_timeout_ms;
};

struct LogConfig {
    std::string file;
    std::string level;
};

struct Config {
    LogConfig log;
    GroupConfig group;
    std::vector<ProviderConfig> providers;
};

class ConfigLoader {
public:
    static std::expected<Config, std::string> load(const std::string& config_path);

    static std::expected<Config, std::string> parse_config(const std::string& content);

private:
    static std::expected<void, std::string> validate_config(const Config& config);
};

} // namespace pg

#include "config_loader.hpp"
#include "filter_set.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>


using json = nlohmann::json;

namespace pg {

std::expected<Config, std::string> ConfigLoader::load(const std::string& config_path) {
    // Try multiple locations for the config file
    std::vector<std::string> search_paths = {
        config_path,                           // Current directory
        "../" + config_path,                   // Parent directory (for build dirs)
        "../../" + config_path                 // Two levels up (for nested builds)
    };

    std::ifstream file;
    for (const auto& path : search_paths) {
        file.open(path);
        if (file.is_open()) {
            break;
        }
        file.clear(); // Clear error flags before next attempt
    }

    if (!file.is_open()) {
        return std::unexpected("Failed to open config file: " + config_path +
                             " (searched in: ., .., ../..)");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str());
}

std::expected<Config, std::string> ConfigLoader::parse_config(const std::string& content) {
    try {
        json j = json::parse(content);

        Config config;

        if (j.contains("log")) {
            auto& log = j["log"];
            config.log.file = log.value("file", "logs/proxy-group.log");
            config.log.level = log.value("level", "INFO");
        } else {
            config.log.file = "logs/proxy-group.log";
            config.log.level = "INFO";
        }

        if (!j.contains("group")) {
            return std::unexpected("Missing 'group' section");
        }
        auto& group = j["group"];
        config.group.name = group.value("name", "");
        config.group.filter = group.value("filter", "");
        config.group.max_failed_times = group.value("max_failed_times", 5);
        config.group.failed_window_ms = group.value("failed_window_ms", 5000);
        config.group.test_url = group.value("test_url", "http://www.gstatic.com/generate_204");
        config.group.test_timeout_ms = group.value("test_timeout_ms", 5000);

        if (!j.contains("providers")) {
            return std::unexpected("Missing 'providers' section");
        }
        for (const auto& provider : j["providers"]) {
            ProviderConfig pc;
            pc.name = provider.value("name", "");
            pc.type = provider.value("type", "inline");
            if (provider.contains("health_check")) {
                auto& hc = provider["health_check"];
                pc.health_check_url = hc.value("url", "");
                pc.health_check_timeout_ms = hc.value("timeout_ms", 5000);
            } else {
                pc.health_check_url = config.group.test_url;
                pc.health_check_timeout_ms = config.group.test_timeout_ms;
            }
            if (provider.contains("proxies")) {
                for (const auto& proxy : provider.at("proxies")) {
                    ProxyConfig proxy_config;
                    proxy_config.name = proxy.value("name", "");
                    proxy_config.host = proxy.value("host", "127.0.0.1");
                    proxy_config.port = proxy.value("port", 0);  // range-checked in validate_config
                    pc.proxies.push_back(proxy_config);
                }
            }
            config.providers.push_back(pc);
        }

        auto valid = validate_config(config);
        if (!valid) {
            return std::unexpected("Configuration validation failed: " + valid.error());
        }

        return config;

    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parsing error: ") + e.what());
    }
}

std::expected<void, std::string> ConfigLoader::validate_config(const Config& config) {
    if (config.group.name.empty()) {
        return std::unexpected("group name is empty");
    }

    if (config.group.max_failed_times <= 0 || config.group.failed_window_ms <= 0) {
        return std::unexpected("failure threshold and window must be positive");
    }

    if (config.group.test_timeout_ms <= 0) {
        return std::unexpected("test_timeout_ms must be positive");
    }

    auto filters = FilterSet::parse(config.group.filter);
    if (!filters) {
        return std::unexpected(filters.error());
    }

    if (config.providers.empty()) {
        return std::unexpected("no providers");
    }

    for (const auto& provider : config.providers) {
        if (provider.name.empty()) {
            return std::unexpected("provider without a name");
        }
        if (provider.type != "inline" && provider.type != "compatible") {
            return std::unexpected("provider " + provider.name + ": unknown type '" +
                                   provider.type + "'");
        }
        if (provider.health_check_timeout_ms <= 0) {
            return std::unexpected("provider " + provider.name +
                                   ": health check timeout must be positive");
        }
        for (const auto& proxy : provider.proxies) {
            if (proxy.name.empty()) {
                return std::unexpected("provider " + provider.name + ": proxy needs a name");
            }
            if (proxy.port <= 0 || proxy.port > 65535) {
                return std::unexpected("provider " + provider.name + ": proxy " + proxy.name +
                                       " has invalid port " + std::to_string(proxy.port));
            }
        }
    }

    return {};
}

} // namespace pg

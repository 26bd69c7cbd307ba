#include "pathgate/core/config.h"

#include <cctype>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>

namespace pathgate::core {

namespace {

bool IsBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> GetStringArray(const Poco::Util::AbstractConfiguration& cfg,
                                        const std::string& key) {
    // JSONConfiguration exposes array elements as "key[0]", "key[1]", ...
    std::vector<std::string> values;
    for (int i = 0;; ++i) {
        const auto element = key + "[" + std::to_string(i) + "]";
        if (!cfg.has(element)) {
            break;
        }
        values.push_back(cfg.getString(element));
    }
    return values;
}

}  // namespace

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    Config config;
    config.server.host = cfg->getString("server.host", "0.0.0.0");
    config.server.port = cfg->getInt("server.port", 8080);
    config.server.threads = cfg->getInt("server.threads", 4);
    config.server.tls.enabled = cfg->getBool("server.tls.enabled", false);
    config.server.tls.certificate = cfg->getString("server.tls.certificate", "");
    config.server.tls.private_key = cfg->getString("server.tls.private_key", "");
    config.server.limits.max_body_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("server.limits.max_body_bytes", 16777216));

    config.sandbox.root_path = cfg->getString("sandbox.root_path", "data/sandbox");
    config.sandbox.platform = cfg->getString("sandbox.platform", "host");
    config.sandbox.allowed_prefixes = GetStringArray(*cfg, "sandbox.allowed_prefixes");

    config.tools.read_default_limit = cfg->getInt("tools.read_default_limit", 2000);
    config.tools.max_line_length = cfg->getInt("tools.max_line_length", 2000);

    config.observability.log_level = cfg->getString("observability.log_level", "information");

    if (config.server.port <= 0 || config.server.port > 65535) {
        throw std::invalid_argument("server.port must be in 1..65535");
    }
    if (config.server.threads <= 0) {
        throw std::invalid_argument("server.threads must be positive");
    }
    if (config.server.tls.enabled) {
        if (IsBlank(config.server.tls.certificate) || IsBlank(config.server.tls.private_key)) {
            throw std::invalid_argument(
                "server.tls.enabled=true requires certificate and private_key");
        }
    }
    if (IsBlank(config.sandbox.root_path)) {
        throw std::invalid_argument("sandbox.root_path must not be empty");
    }
    if (config.sandbox.platform != "host" && config.sandbox.platform != "posix" &&
        config.sandbox.platform != "windows") {
        throw std::invalid_argument("sandbox.platform must be one of host, posix, windows");
    }
    for (const auto& prefix : config.sandbox.allowed_prefixes) {
        // Prefixes are compared verbatim; a blank entry would admit every path.
        if (IsBlank(prefix)) {
            throw std::invalid_argument("sandbox.allowed_prefixes must not contain blank entries");
        }
    }
    if (config.tools.read_default_limit <= 0) {
        throw std::invalid_argument("tools.read_default_limit must be positive");
    }
    if (config.tools.max_line_length <= 0) {
        throw std::invalid_argument("tools.max_line_length must be positive");
    }
    return config;
}

}  // namespace pathgate::core

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pathgate::core {

/// @brief TLS configuration for the HTTP server.
struct TlsConfig {
    bool enabled{false};
    std::string certificate;
    std::string private_key;
};

/// @brief Request/connection limits for the HTTP server.
struct LimitsConfig {
    std::uint64_t max_body_bytes{16777216};
};

/// @brief HTTP server configuration (bind address, TLS, limits).
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    int threads{4};
    TlsConfig tls;
    LimitsConfig limits;
};

/// @brief Sandbox settings: host directory backing the virtual root and path policy.
struct SandboxConfig {
    std::string root_path{"data/sandbox"};
    // One of "host", "posix", "windows".
    std::string platform{"host"};
    std::vector<std::string> allowed_prefixes;
};

/// @brief Output shaping for the file tools.
struct ToolsConfig {
    int read_default_limit{2000};
    int max_line_length{2000};
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
};

/// @brief Top-level configuration for PathGate.
struct Config {
    ServerConfig server;
    SandboxConfig sandbox;
    ToolsConfig tools;
    ObservabilityConfig observability;
};

/// @brief Load server configuration from a JSON file.
/// @throws std::invalid_argument when a value is out of range or inconsistent.
Config LoadConfig(const std::string& path);

}  // namespace pathgate::core

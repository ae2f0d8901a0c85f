#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace hoststatsd::agent {

// Longest accepted fast-tier interval
constexpr std::chrono::milliseconds MAX_INTERVAL = std::chrono::hours(24);

// Agent configuration
struct AgentConfig {
    std::string statsd_host = "192.168.1.128";
    uint16_t statsd_port = 8125;
    std::string prefix = "_t_";          // statsd-opentsdb-backend tag prefix
    std::chrono::milliseconds interval{1000};   // Fast tier; medium is 10x, resync 100x
    std::string latency_host = "8.8.8.8";
    uint16_t latency_port = 53;
    bool debug = false;                  // Log lines instead of sending them
    std::string log_level = "info";
};

// Defaults overridden by HOSTSTATSD_* environment variables (and .env).
AgentConfig load_agent_config();

} // namespace hoststatsd::agent

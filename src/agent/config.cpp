#include "agent/config.hpp"
#include "core/config.hpp"
#include <spdlog/spdlog.h>

namespace hoststatsd::agent {

namespace {

uint16_t port_from_env(const std::string& key, uint16_t fallback) {
    int64_t value = core::config::get_env_int(key, fallback);
    if (value < 1 || value > 65535) {
        spdlog::warn("Ignoring {}={}: not a port number", key, value);
        return fallback;
    }
    return static_cast<uint16_t>(value);
}

} // namespace

AgentConfig load_agent_config() {
    core::config::load_dotenv();

    AgentConfig config;
    config.statsd_host = core::config::get_env_or("HOSTSTATSD_HOST", config.statsd_host);
    config.statsd_port = port_from_env("HOSTSTATSD_PORT", config.statsd_port);
    config.prefix = core::config::get_env_or("HOSTSTATSD_PREFIX", config.prefix);
    config.latency_host = core::config::get_env_or("HOSTSTATSD_LATENCY_HOST", config.latency_host);
    config.latency_port = port_from_env("HOSTSTATSD_LATENCY_PORT", config.latency_port);
    config.debug = core::config::get_env_flag("HOSTSTATSD_DEBUG", config.debug);
    config.log_level = core::config::get_env_or("HOSTSTATSD_LOG_LEVEL", config.log_level);

    int64_t interval_ms = core::config::get_env_int("HOSTSTATSD_INTERVAL_MS", config.interval.count());
    if (interval_ms <= 0) {
        spdlog::warn("Ignoring HOSTSTATSD_INTERVAL_MS={}: must be positive", interval_ms);
    } else if (interval_ms > MAX_INTERVAL.count()) {
        spdlog::warn("Ignoring HOSTSTATSD_INTERVAL_MS={}: longer than {} ms", interval_ms, MAX_INTERVAL.count());
    } else {
        config.interval = std::chrono::milliseconds(interval_ms);
    }

    return config;
}

} // namespace hoststatsd::agent

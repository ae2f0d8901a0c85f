#include "agent/agent.hpp"
#include <spdlog/spdlog.h>

namespace hoststatsd::agent {

Agent::Agent(const AgentConfig& config,
             std::unique_ptr<metrics::HostProvider> provider,
             std::unique_ptr<transport::Transport> transport,
             const std::string& hostname)
    : config_(config),
      provider_(std::move(provider)),
      transport_(std::move(transport)),
      encoder_(hostname, config.prefix),
      samplers_(*provider_, encoder_, *transport_, deltas_) {}

Agent::~Agent() = default;

std::unique_ptr<Agent> Agent::create(const AgentConfig& config) {
    metrics::LatencyTarget latency;
    latency.host = config.latency_host;
    latency.port = config.latency_port;

    auto provider = std::make_unique<metrics::ProcHostProvider>("/", latency);
    auto os = provider->os_info();
    spdlog::info("Host {} ({} {} {})", os.hostname, os.platform, os.release, os.arch);

    std::unique_ptr<transport::Transport> transport;
    if (config.debug) {
        spdlog::info("Debug mode: logging metrics instead of sending");
        transport = std::make_unique<transport::LogTransport>();
    } else {
        transport = std::make_unique<transport::UdpTransport>(config.statsd_host, config.statsd_port);
    }

    return std::make_unique<Agent>(config, std::move(provider), std::move(transport), os.hostname);
}

std::vector<Task> Agent::fast_tier() {
    return {
        {"cpu", [this]() { samplers_.sample_cpu(); }},
        {"memory", [this]() { samplers_.sample_memory(); }},
        {"network", [this]() { samplers_.sample_network(); }},
        {"uptime", [this]() { samplers_.sample_uptime(); }},
        {"diskio", [this]() { samplers_.sample_disk_io(); }},
    };
}

std::vector<Task> Agent::medium_tier() {
    return {
        {"latency", [this]() { samplers_.sample_latency(); }},
        {"disk_usage", [this]() { samplers_.sample_disk_usage(); }},
        {"battery", [this]() { samplers_.sample_battery(); }},
    };
}

void Agent::install_signal_handlers() {
    scheduler_.enable_signal_stop();
}

void Agent::run() {
    auto interval = config_.interval;

    scheduler_.add_timer("fast", interval, fast_tier());
    scheduler_.add_timer("medium", interval * MEDIUM_TIER_FACTOR, medium_tier());

    auto resync = medium_tier();
    resync.insert(resync.begin(), Task{"resync", [this]() { samplers_.reset_deltas(); }});
    scheduler_.add_timer("resync", interval * RESYNC_TIER_FACTOR, std::move(resync));

    for (auto& task : medium_tier()) {
        scheduler_.post(std::move(task));
    }

    spdlog::info("running...");
    scheduler_.run();

    spdlog::info("stopping...");
    transport_->close();
}

void Agent::stop() {
    scheduler_.stop();
}

} // namespace hoststatsd::agent

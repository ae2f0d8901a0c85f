#pragma once
#include <memory>
#include <string>
#include "agent/config.hpp"
#include "agent/samplers.hpp"
#include "agent/scheduler.hpp"
#include "metrics/metrics.hpp"
#include "statsd/delta_tracker.hpp"
#include "statsd/encoder.hpp"
#include "transport/transport.hpp"

namespace hoststatsd::agent {

/**
 * The sampling service
 *
 * Owns the provider, encoder, transport and delta state and drives the
 * sampler set from three timers:
 *   fast   (interval)        cpu, memory, network, uptime, disk I/O
 *   medium (interval x 10)   latency, disk usage, battery
 *   resync (interval x 100)  drop delta baselines, then the medium tier
 * The medium tier also runs once at start-up.
 */
class Agent {
public:
    static constexpr int MEDIUM_TIER_FACTOR = 10;
    static constexpr int RESYNC_TIER_FACTOR = 100;

    Agent(const AgentConfig& config,
          std::unique_ptr<metrics::HostProvider> provider,
          std::unique_ptr<transport::Transport> transport,
          const std::string& hostname);
    ~Agent();

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    // Linux provider, hostname from the OS, UDP (or log-only when debug is set).
    static std::unique_ptr<Agent> create(const AgentConfig& config);

    // Stop on SIGINT/SIGTERM.
    void install_signal_handlers();

    // Blocks until stop(); closes the transport on return.
    void run();
    void stop();

    Scheduler& scheduler() { return scheduler_; }

private:
    std::vector<Task> fast_tier();
    std::vector<Task> medium_tier();

    AgentConfig config_;
    std::unique_ptr<metrics::HostProvider> provider_;
    std::unique_ptr<transport::Transport> transport_;
    statsd::LineEncoder encoder_;
    statsd::DeltaTracker deltas_;
    SamplerSet samplers_;
    Scheduler scheduler_;
};

} // namespace hoststatsd::agent

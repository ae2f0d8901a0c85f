#pragma once
#include "metrics/metrics.hpp"
#include "statsd/delta_tracker.hpp"
#include "statsd/encoder.hpp"
#include "transport/transport.hpp"

namespace hoststatsd::agent {

// Round to a fixed number of decimal places.
double round_to(double value, int decimals);

/**
 * One sampler per metric family
 *
 * Each sampler queries the provider once, normalizes the reading, encodes
 * one line per element and sends it. Provider errors are not caught here.
 */
class SamplerSet {
public:
    SamplerSet(metrics::HostProvider& provider,
               const statsd::LineEncoder& encoder,
               transport::Transport& transport,
               statsd::DeltaTracker& deltas);

    // Fast tier
    void sample_cpu();
    void sample_memory();
    void sample_network();
    void sample_uptime();
    void sample_disk_io();

    // Medium tier, reported as gauge deltas
    void sample_latency();
    void sample_disk_usage();
    void sample_battery();

    // Forget every delta baseline so the next medium tier reports absolutes.
    void reset_deltas();

private:
    metrics::HostProvider& provider_;
    const statsd::LineEncoder& encoder_;
    transport::Transport& transport_;
    statsd::DeltaTracker& deltas_;
};

} // namespace hoststatsd::agent

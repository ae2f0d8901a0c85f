#include "agent/samplers.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace hoststatsd::agent {

using statsd::make_tag;
using statsd::MetricType;

namespace {

constexpr const char* LATENCY_KEY = "latency";
constexpr const char* BATTERY_KEY = "battery";

template <typename Reading>
void log_reading(const char* what, const Reading& reading) {
    if (spdlog::should_log(spdlog::level::debug)) {
        spdlog::debug("{}: {}", what, reading.to_json().dump());
    }
}

std::string strip_colons(std::string value) {
    value.erase(std::remove(value.begin(), value.end(), ':'), value.end());
    return value;
}

} // namespace

double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

SamplerSet::SamplerSet(metrics::HostProvider& provider,
                       const statsd::LineEncoder& encoder,
                       transport::Transport& transport,
                       statsd::DeltaTracker& deltas)
    : provider_(provider),
      encoder_(encoder),
      transport_(transport),
      deltas_(deltas) {}

void SamplerSet::sample_cpu() {
    auto load = provider_.current_load();
    log_reading("cpu", load);

    for (const auto& [core, usage] : load.per_core) {
        auto percent = static_cast<int64_t>(std::llround(usage));
        transport_.send(encoder_.encode("cpu_usage", percent, MetricType::COUNTER,
                                        {make_tag("cpu", core)}));
    }
}

void SamplerSet::sample_memory() {
    auto mem = provider_.memory();
    log_reading("memory", mem);

    auto ratio = [](uint64_t part, uint64_t total) {
        return round_to(static_cast<double>(part) / total, 4);
    };

    std::vector<std::string> lines;
    lines.push_back(encoder_.encode("ram", ratio(mem.free, mem.total), MetricType::COUNTER,
                                    {make_tag("memory", "free")}));
    lines.push_back(encoder_.encode("ram", ratio(mem.used, mem.total), MetricType::COUNTER,
                                    {make_tag("memory", "used")}));
    lines.push_back(encoder_.encode("ram", ratio(mem.active, mem.total), MetricType::COUNTER,
                                    {make_tag("memory", "active")}));

    // Hosts without swap have nothing to report
    if (mem.swap_total > 0) {
        lines.push_back(encoder_.encode("swap", ratio(mem.swap_free, mem.swap_total), MetricType::COUNTER,
                                        {make_tag("memory", "free")}));
        lines.push_back(encoder_.encode("swap", ratio(mem.swap_used, mem.swap_total), MetricType::COUNTER,
                                        {make_tag("memory", "used")}));
    }

    transport_.send(lines);
}

void SamplerSet::sample_network() {
    for (const auto& stats : provider_.network_stats()) {
        log_reading("network", stats);
        if (stats.internal || !stats.rx_sec || !stats.tx_sec) {
            continue;
        }

        transport_.send(std::vector<std::string>{
            encoder_.encode("network", round_to(*stats.rx_sec, 2), MetricType::COUNTER,
                            {make_tag("interface", stats.iface), make_tag("direction", "rx")}),
            encoder_.encode("network", round_to(*stats.tx_sec, 2), MetricType::COUNTER,
                            {make_tag("interface", stats.iface), make_tag("direction", "tx")})
        });
    }
}

void SamplerSet::sample_uptime() {
    auto uptime = static_cast<int64_t>(provider_.uptime_seconds());
    transport_.send(encoder_.encode("uptime", uptime, MetricType::COUNTER));
}

void SamplerSet::sample_disk_io() {
    // Block device counters come from /proc/diskstats
    auto platform = provider_.os_info().platform;
    if (platform != "linux") {
        spdlog::debug("Disk I/O not sampled on platform {}", platform);
        return;
    }

    auto io = provider_.disks_io();
    log_reading("diskio", io);
    if (!io.read_ops_sec || !io.write_ops_sec) {
        return;
    }

    transport_.send(encoder_.encode("diskio", round_to(*io.read_ops_sec, 2), MetricType::COUNTER,
                                    {make_tag("direction", "read")}));
    transport_.send(encoder_.encode("diskio", round_to(*io.write_ops_sec, 2), MetricType::COUNTER,
                                    {make_tag("direction", "write")}));
}

void SamplerSet::sample_latency() {
    // A zero gauge re-establishes the baseline the signed deltas build on
    if (!deltas_.contains(LATENCY_KEY)) {
        transport_.send(encoder_.encode("latency", 0, MetricType::GAUGE));
    }

    double ms = provider_.latency_ms();
    transport_.send(encoder_.encode("latency", deltas_.track_from_zero(LATENCY_KEY, ms),
                                    MetricType::GAUGE));
}

void SamplerSet::sample_disk_usage() {
    for (const auto& device : provider_.fs_size()) {
        log_reading("disk", device);

        double use = round_to(device.use_percent, 3);
        std::string mount = strip_colons(device.mount);

        transport_.send(encoder_.encode("disk_usage", deltas_.track(mount, use), MetricType::GAUGE, {
            make_tag("type", device.type),
            make_tag("mount", mount),
            make_tag("fs", strip_colons(device.fs))
        }));
    }
}

void SamplerSet::sample_battery() {
    auto battery = provider_.battery();
    log_reading("battery", battery);
    if (!battery.has_battery) {
        return;
    }

    transport_.send(encoder_.encode("battery", deltas_.track(BATTERY_KEY, battery.percent),
                                    MetricType::GAUGE));
}

void SamplerSet::reset_deltas() {
    spdlog::debug("Resync: dropping {} delta baseline(s)", deltas_.size());
    deltas_.reset();
}

} // namespace hoststatsd::agent

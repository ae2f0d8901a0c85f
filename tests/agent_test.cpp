// ============================================================================
// AGENT WIRING TESTS
// ============================================================================
// Runs the three tiers with a short interval against canned readings.
// ============================================================================

#include <gtest/gtest.h>
#include <algorithm>
#include <thread>
#include "agent/agent.hpp"
#include "test_helpers.hpp"

using namespace hoststatsd;
using hoststatsd::testing::CaptureTransport;
using hoststatsd::testing::FakeProvider;
using namespace std::chrono_literals;

namespace {

size_t count_prefix(const std::vector<std::string>& lines, const std::string& prefix) {
    return std::count_if(lines.begin(), lines.end(), [&](const std::string& line) {
        return line.rfind(prefix, 0) == 0;
    });
}

} // namespace

TEST(Agent, RunsStartupMediumTierThenFastTier) {
    auto provider = std::make_unique<FakeProvider>();
    provider->cpu.per_core = {{0, 10.0}};
    provider->mem.total = 100;
    provider->mem.free = 50;
    provider->mem.used = 50;
    provider->mem.active = 40;
    provider->uptime = 99;
    provider->battery_info.has_battery = true;
    provider->battery_info.percent = 64;
    provider->latencies.assign(100, 15.0);

    auto transport = std::make_unique<CaptureTransport>();
    auto* captured = transport.get();

    agent::AgentConfig config;
    config.interval = 5ms;
    agent::Agent host_agent(config, std::move(provider), std::move(transport), "h1");

    std::thread stopper([&]() {
        std::this_thread::sleep_for(120ms);
        host_agent.stop();
    });
    host_agent.run();
    stopper.join();

    auto lines = captured->lines();
    ASSERT_GE(lines.size(), 3u);

    // Start-up medium tier comes first
    EXPECT_EQ(lines[0], "latency._t_hostname.h1:0|g");
    EXPECT_EQ(lines[1], "latency._t_hostname.h1:+15|g");
    EXPECT_EQ(lines[2], "battery._t_hostname.h1:64|g");

    EXPECT_GE(count_prefix(lines, "cpu_usage._t_cpu.0._t_hostname.h1:10|c"), 2u);
    EXPECT_GE(count_prefix(lines, "uptime._t_hostname.h1:99|c"), 2u);
    // Later medium ticks report deltas against the start-up baseline
    EXPECT_GE(count_prefix(lines, "battery._t_hostname.h1:+0|g"), 1u);
    EXPECT_EQ(host_agent.scheduler().task_failures(), 0u);
}

TEST(Agent, ProviderFailureDoesNotStopOtherSamplers) {
    auto provider = std::make_unique<FakeProvider>();
    provider->fail_memory = true;
    provider->uptime = 5;

    auto transport = std::make_unique<CaptureTransport>();
    auto* captured = transport.get();

    agent::AgentConfig config;
    config.interval = 5ms;
    agent::Agent host_agent(config, std::move(provider), std::move(transport), "h1");

    std::thread stopper([&]() {
        std::this_thread::sleep_for(40ms);
        host_agent.stop();
    });
    host_agent.run();
    stopper.join();

    EXPECT_GE(count_prefix(captured->lines(), "uptime._t_hostname.h1:5|c"), 1u);
    EXPECT_EQ(count_prefix(captured->lines(), "ram."), 0u);
    EXPECT_GE(host_agent.scheduler().task_failures(), 1u);
}

TEST(Agent, ResyncResendsAbsoluteValues) {
    auto provider = std::make_unique<FakeProvider>();
    provider->battery_info.has_battery = true;
    provider->battery_info.percent = 64;
    provider->latencies.assign(500, 15.0);

    auto transport = std::make_unique<CaptureTransport>();
    auto* captured = transport.get();

    agent::AgentConfig config;
    config.interval = 3ms;
    agent::Agent host_agent(config, std::move(provider), std::move(transport), "h1");

    // Resync first fires at 300ms
    std::thread stopper([&]() {
        std::this_thread::sleep_for(450ms);
        host_agent.stop();
    });
    host_agent.run();
    stopper.join();

    auto lines = captured->lines();
    // One absolute line at start-up, another after each resync
    EXPECT_GE(count_prefix(lines, "battery._t_hostname.h1:64|g"), 2u);
    EXPECT_GE(count_prefix(lines, "latency._t_hostname.h1:0|g"), 2u);
    EXPECT_GE(count_prefix(lines, "battery._t_hostname.h1:+0|g"), 1u);
}

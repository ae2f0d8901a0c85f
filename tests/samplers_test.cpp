// ============================================================================
// SAMPLER SET UNIT TESTS
// ============================================================================
// Samplers run against canned readings and a capturing transport.
// ============================================================================

#include <gtest/gtest.h>
#include "agent/samplers.hpp"
#include "test_helpers.hpp"

using namespace hoststatsd;
using hoststatsd::testing::CaptureTransport;
using hoststatsd::testing::FakeProvider;

class SamplerSetTest : public ::testing::Test {
protected:
    FakeProvider provider;
    statsd::LineEncoder encoder{"h1"};
    CaptureTransport transport;
    statsd::DeltaTracker deltas;
    agent::SamplerSet samplers{provider, encoder, transport, deltas};
};

TEST(RoundTo, Decimals) {
    EXPECT_DOUBLE_EQ(agent::round_to(0.123456, 4), 0.1235);
    EXPECT_DOUBLE_EQ(agent::round_to(41.12345, 3), 41.123);
    EXPECT_DOUBLE_EQ(agent::round_to(2.5, 0), 3.0);
}

// ============================================================================
// FAST TIER
// ============================================================================

TEST_F(SamplerSetTest, CpuOneDatagramPerCore) {
    provider.cpu.per_core = {{0, 12.4}, {1, 87.6}};
    samplers.sample_cpu();

    ASSERT_EQ(transport.datagrams.size(), 2u);
    EXPECT_EQ(transport.datagrams[0], std::vector<std::string>{"cpu_usage._t_cpu.0._t_hostname.h1:12|c"});
    EXPECT_EQ(transport.datagrams[1], std::vector<std::string>{"cpu_usage._t_cpu.1._t_hostname.h1:88|c"});
}

TEST_F(SamplerSetTest, CpuSkipsOfflineCores) {
    provider.cpu.per_core = {{0, 10.0}, {1, 20.0}, {3, 40.0}};
    samplers.sample_cpu();

    EXPECT_EQ(transport.lines(), (std::vector<std::string>{
        "cpu_usage._t_cpu.0._t_hostname.h1:10|c",
        "cpu_usage._t_cpu.1._t_hostname.h1:20|c",
        "cpu_usage._t_cpu.3._t_hostname.h1:40|c"}));
}

TEST_F(SamplerSetTest, MemoryRatiosInOneDatagram) {
    provider.mem.total = 8000;
    provider.mem.free = 2000;
    provider.mem.used = 6000;
    provider.mem.active = 3333;
    provider.mem.swap_total = 1000;
    provider.mem.swap_free = 750;
    provider.mem.swap_used = 250;
    samplers.sample_memory();

    ASSERT_EQ(transport.datagrams.size(), 1u);
    std::vector<std::string> expected{
        "ram._t_memory.free._t_hostname.h1:0.25|c",
        "ram._t_memory.used._t_hostname.h1:0.75|c",
        "ram._t_memory.active._t_hostname.h1:0.4166|c",
        "swap._t_memory.free._t_hostname.h1:0.75|c",
        "swap._t_memory.used._t_hostname.h1:0.25|c",
    };
    EXPECT_EQ(transport.datagrams[0], expected);
}

TEST_F(SamplerSetTest, MemoryWithoutSwapSkipsSwapLines) {
    provider.mem.total = 100;
    provider.mem.free = 50;
    provider.mem.used = 50;
    provider.mem.active = 25;
    samplers.sample_memory();

    ASSERT_EQ(transport.datagrams.size(), 1u);
    EXPECT_EQ(transport.datagrams[0].size(), 3u);
}

TEST_F(SamplerSetTest, MemoryFailurePropagates) {
    provider.fail_memory = true;
    EXPECT_THROW(samplers.sample_memory(), metrics::ProviderError);
    EXPECT_TRUE(transport.datagrams.empty());
}

TEST_F(SamplerSetTest, NetworkSkipsLoopbackAndUnknownRates) {
    metrics::InterfaceStats lo;
    lo.iface = "lo";
    lo.internal = true;
    lo.rx_sec = 10.0;
    lo.tx_sec = 10.0;

    metrics::InterfaceStats fresh;
    fresh.iface = "wlan0";

    metrics::InterfaceStats eth;
    eth.iface = "eth0";
    eth.rx_sec = 1500.0;
    eth.tx_sec = 250.257;

    provider.interfaces = {lo, fresh, eth};
    samplers.sample_network();

    ASSERT_EQ(transport.datagrams.size(), 1u);
    std::vector<std::string> expected{
        "network._t_interface.eth0._t_direction.rx._t_hostname.h1:1500|c",
        "network._t_interface.eth0._t_direction.tx._t_hostname.h1:250.26|c",
    };
    EXPECT_EQ(transport.datagrams[0], expected);
}

TEST_F(SamplerSetTest, UptimeWholeSeconds) {
    provider.uptime = 3600.87;
    samplers.sample_uptime();
    EXPECT_EQ(transport.lines(), std::vector<std::string>{"uptime._t_hostname.h1:3600|c"});
}

TEST_F(SamplerSetTest, DiskIoNeedsRate) {
    samplers.sample_disk_io();
    EXPECT_TRUE(transport.datagrams.empty());

    provider.io.read_ops_sec = 12.0;
    provider.io.write_ops_sec = 3.5;
    samplers.sample_disk_io();

    std::vector<std::string> expected{
        "diskio._t_direction.read._t_hostname.h1:12|c",
        "diskio._t_direction.write._t_hostname.h1:3.5|c",
    };
    EXPECT_EQ(transport.lines(), expected);
}

TEST_F(SamplerSetTest, DiskIoSkippedOffLinux) {
    provider.os.platform = "win32";
    provider.io.read_ops_sec = 12.0;
    provider.io.write_ops_sec = 3.5;
    samplers.sample_disk_io();
    EXPECT_TRUE(transport.datagrams.empty());
}

// ============================================================================
// MEDIUM TIER (GAUGE DELTAS)
// ============================================================================

TEST_F(SamplerSetTest, LatencyResetsGaugeThenReportsDeltas) {
    provider.latencies = {20.0, 25.0, 22.0};

    samplers.sample_latency();
    samplers.sample_latency();
    samplers.sample_latency();

    std::vector<std::string> expected{
        "latency._t_hostname.h1:0|g",
        "latency._t_hostname.h1:+20|g",
        "latency._t_hostname.h1:+5|g",
        "latency._t_hostname.h1:-3|g",
    };
    EXPECT_EQ(transport.lines(), expected);
}

TEST_F(SamplerSetTest, LatencyFailureAfterBaselineReset) {
    provider.latencies = {};
    EXPECT_THROW(samplers.sample_latency(), metrics::ProviderError);
    EXPECT_EQ(transport.lines(), std::vector<std::string>{"latency._t_hostname.h1:0|g"});
}

TEST_F(SamplerSetTest, DiskUsageTracksPerMount) {
    metrics::FsUsage root;
    root.fs = "/dev/sda1";
    root.type = "ext4";
    root.mount = "/";
    root.use_percent = 41.12345;

    metrics::FsUsage home;
    home.fs = "/dev/sda2";
    home.type = "ext4";
    home.mount = "/home";
    home.use_percent = 10.0;

    provider.filesystems = {root, home};
    samplers.sample_disk_usage();

    provider.filesystems[0].use_percent = 41.2;
    provider.filesystems[1].use_percent = 9.5;
    samplers.sample_disk_usage();

    std::vector<std::string> expected{
        "disk_usage._t_type.ext4._t_mount./._t_fs./dev/sda1._t_hostname.h1:41.123|g",
        "disk_usage._t_type.ext4._t_mount./home._t_fs./dev/sda2._t_hostname.h1:10|g",
        "disk_usage._t_type.ext4._t_mount./._t_fs./dev/sda1._t_hostname.h1:+0.077|g",
        "disk_usage._t_type.ext4._t_mount./home._t_fs./dev/sda2._t_hostname.h1:-0.5|g",
    };
    EXPECT_EQ(transport.lines(), expected);
    EXPECT_EQ(transport.datagrams.size(), 4u);
}

TEST_F(SamplerSetTest, DiskUsageStripsColons) {
    metrics::FsUsage drive;
    drive.fs = "C:";
    drive.type = "NTFS";
    drive.mount = "C:";
    drive.use_percent = 50.0;
    provider.filesystems = {drive};

    samplers.sample_disk_usage();
    EXPECT_EQ(transport.lines(),
              std::vector<std::string>{"disk_usage._t_type.NTFS._t_mount.C._t_fs.C._t_hostname.h1:50|g"});
    EXPECT_TRUE(deltas.contains("C"));
}

TEST_F(SamplerSetTest, BatteryAbsentSendsNothing) {
    samplers.sample_battery();
    EXPECT_TRUE(transport.datagrams.empty());
}

TEST_F(SamplerSetTest, BatteryDeltas) {
    provider.battery_info.has_battery = true;
    provider.battery_info.percent = 80;
    samplers.sample_battery();

    provider.battery_info.percent = 78;
    samplers.sample_battery();

    std::vector<std::string> expected{
        "battery._t_hostname.h1:80|g",
        "battery._t_hostname.h1:-2|g",
    };
    EXPECT_EQ(transport.lines(), expected);
}

TEST_F(SamplerSetTest, ResetDeltasForcesAbsoluteReports) {
    provider.battery_info.has_battery = true;
    provider.battery_info.percent = 80;
    provider.latencies = {20.0, 30.0};

    samplers.sample_battery();
    samplers.sample_latency();
    samplers.reset_deltas();

    provider.battery_info.percent = 90;
    samplers.sample_battery();
    samplers.sample_latency();

    std::vector<std::string> expected{
        "battery._t_hostname.h1:80|g",
        "latency._t_hostname.h1:0|g",
        "latency._t_hostname.h1:+20|g",
        "battery._t_hostname.h1:90|g",
        "latency._t_hostname.h1:0|g",
        "latency._t_hostname.h1:+30|g",
    };
    EXPECT_EQ(transport.lines(), expected);
}

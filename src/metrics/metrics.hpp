/**
 * hoststatsd host telemetry
 *
 * Readings for the sampler set and the provider interface that produces
 * them. The Linux provider reads /proc, /sys and statvfs(3); latency is the
 * time to complete a TCP handshake with a fixed host.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace hoststatsd::metrics {

// A mandatory telemetry source could not be read.
class ProviderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Static host identity
 */
struct OsInfo {
    std::string platform;                   // "linux"
    std::string hostname;
    std::string release;                    // kernel release
    std::string arch;

    nlohmann::json to_json() const;
};

/**
 * CPU load since the previous query (since boot on the first one)
 */
struct CpuLoad {
    double load_percent = 0.0;              // All cores (0-100)
    std::map<unsigned, double> per_core;    // Keyed by core id, online cores only

    nlohmann::json to_json() const;
};

/**
 * Memory (in bytes)
 */
struct MemoryInfo {
    uint64_t total = 0;
    uint64_t free = 0;                      // MemFree
    uint64_t used = 0;                      // total - free
    uint64_t active = 0;                    // total - available
    uint64_t available = 0;
    uint64_t swap_total = 0;
    uint64_t swap_used = 0;
    uint64_t swap_free = 0;

    nlohmann::json to_json() const;
};

/**
 * Per-interface throughput
 */
struct InterfaceStats {
    std::string iface;
    bool internal = false;                  // Loopback
    uint64_t rx_bytes = 0;                  // Cumulative since boot
    uint64_t tx_bytes = 0;
    std::optional<double> rx_sec;           // Unknown until the second query
    std::optional<double> tx_sec;

    nlohmann::json to_json() const;
};

/**
 * Mounted filesystem usage
 */
struct FsUsage {
    std::string fs;                         // Device, e.g. /dev/sda1
    std::string type;                       // ext4, xfs, ...
    std::string mount;
    uint64_t size = 0;                      // Bytes
    uint64_t used = 0;
    uint64_t available = 0;
    double use_percent = 0.0;               // used / (used + available)

    nlohmann::json to_json() const;
};

struct BatteryInfo {
    bool has_battery = false;
    double percent = 0.0;
    bool is_charging = false;

    nlohmann::json to_json() const;
};

/**
 * Block device operations, physical disks only
 */
struct DiskIo {
    uint64_t read_ops = 0;                  // Cumulative since boot
    uint64_t write_ops = 0;
    std::optional<double> read_ops_sec;     // Unknown until the second query
    std::optional<double> write_ops_sec;

    nlohmann::json to_json() const;
};

/**
 * Source of host telemetry. Methods throw ProviderError when a mandatory
 * source is unavailable.
 */
class HostProvider {
public:
    virtual ~HostProvider() = default;

    virtual OsInfo os_info() = 0;
    virtual CpuLoad current_load() = 0;
    virtual MemoryInfo memory() = 0;
    virtual std::vector<InterfaceStats> network_stats() = 0;
    virtual double uptime_seconds() = 0;
    virtual DiskIo disks_io() = 0;
    virtual std::vector<FsUsage> fs_size() = 0;
    virtual BatteryInfo battery() = 0;

    /**
     * Round-trip latency to the configured probe target, in milliseconds
     */
    virtual double latency_ms() = 0;
};

struct LatencyTarget {
    std::string host = "8.8.8.8";
    uint16_t port = 53;
    std::chrono::milliseconds timeout{5000};
};

/**
 * Linux provider
 *
 * Reads from /proc and /sys under a configurable root so tests can point it
 * at a fixture tree. Rates (network, disk I/O) and CPU load are computed
 * against the previous query.
 */
class ProcHostProvider : public HostProvider {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit ProcHostProvider(std::filesystem::path root = "/",
                              LatencyTarget latency_target = {},
                              Clock clock = [] { return std::chrono::steady_clock::now(); });
    ~ProcHostProvider() override;

    // Disable copy
    ProcHostProvider(const ProcHostProvider&) = delete;
    ProcHostProvider& operator=(const ProcHostProvider&) = delete;

    OsInfo os_info() override;
    CpuLoad current_load() override;
    MemoryInfo memory() override;
    std::vector<InterfaceStats> network_stats() override;
    double uptime_seconds() override;
    DiskIo disks_io() override;
    std::vector<FsUsage> fs_size() override;
    BatteryInfo battery() override;
    double latency_ms() override;

private:
    std::filesystem::path root_;
    LatencyTarget latency_target_;
    Clock clock_;

    // CPU calculation state
    struct CpuTimes {
        uint64_t total = 0;
        uint64_t idle = 0;
    };
    CpuTimes prev_cpu_;
    std::map<unsigned, CpuTimes> prev_cpu_per_core_;

    // Rate tracking
    struct NetSample {
        uint64_t rx_bytes = 0;
        uint64_t tx_bytes = 0;
        std::chrono::steady_clock::time_point time;
    };
    std::unordered_map<std::string, NetSample> prev_net_;

    bool have_prev_disk_ = false;
    uint64_t prev_disk_reads_ = 0;
    uint64_t prev_disk_writes_ = 0;
    std::chrono::steady_clock::time_point prev_disk_time_;

    // Helper methods
    std::filesystem::path path(const std::string& relative) const;
    std::string read_file(const std::filesystem::path& path) const;
    std::vector<std::string> read_required_lines(const std::string& relative) const;
    bool is_loopback(const std::string& iface) const;
};

// Decode the octal escapes (\040 and friends) used in /proc/mounts.
std::string unescape_mount_path(const std::string& raw);

// True for whole-disk names in /proc/diskstats (sda, nvme0n1, mmcblk0, md0).
bool is_physical_disk(const std::string& name);

} // namespace hoststatsd::metrics

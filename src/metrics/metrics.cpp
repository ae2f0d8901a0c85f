/**
 * hoststatsd host telemetry - Linux implementation
 *
 * Reads metrics from Linux /proc and /sys filesystems.
 */

#include "metrics/metrics.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <spdlog/spdlog.h>
#include <sys/statvfs.h>
#include <sys/utsname.h>
#include <unistd.h>
#include <limits.h>
#include <net/if.h>

namespace fs = std::filesystem;

namespace hoststatsd::metrics {

// ============================================================================
// JSON Conversion
// ============================================================================

nlohmann::json OsInfo::to_json() const {
    return nlohmann::json{
        {"platform", platform},
        {"hostname", hostname},
        {"release", release},
        {"arch", arch}
    };
}

nlohmann::json CpuLoad::to_json() const {
    nlohmann::json cores = nlohmann::json::object();
    for (const auto& [id, percent] : per_core) {
        cores[std::to_string(id)] = percent;
    }
    return nlohmann::json{
        {"load_percent", load_percent},
        {"per_core", cores}
    };
}

nlohmann::json MemoryInfo::to_json() const {
    return nlohmann::json{
        {"total", total},
        {"free", free},
        {"used", used},
        {"active", active},
        {"available", available},
        {"swap", {
            {"total", swap_total},
            {"used", swap_used},
            {"free", swap_free}
        }}
    };
}

nlohmann::json InterfaceStats::to_json() const {
    return nlohmann::json{
        {"iface", iface},
        {"internal", internal},
        {"rx_bytes", rx_bytes},
        {"tx_bytes", tx_bytes},
        {"rx_sec", rx_sec ? nlohmann::json(*rx_sec) : nlohmann::json(nullptr)},
        {"tx_sec", tx_sec ? nlohmann::json(*tx_sec) : nlohmann::json(nullptr)}
    };
}

nlohmann::json FsUsage::to_json() const {
    return nlohmann::json{
        {"fs", fs},
        {"type", type},
        {"mount", mount},
        {"size", size},
        {"used", used},
        {"available", available},
        {"use", use_percent}
    };
}

nlohmann::json BatteryInfo::to_json() const {
    return nlohmann::json{
        {"has_battery", has_battery},
        {"percent", percent},
        {"is_charging", is_charging}
    };
}

nlohmann::json DiskIo::to_json() const {
    return nlohmann::json{
        {"read_ops", read_ops},
        {"write_ops", write_ops},
        {"read_ops_sec", read_ops_sec ? nlohmann::json(*read_ops_sec) : nlohmann::json(nullptr)},
        {"write_ops_sec", write_ops_sec ? nlohmann::json(*write_ops_sec) : nlohmann::json(nullptr)}
    };
}

// ============================================================================
// Helpers
// ============================================================================

std::string unescape_mount_path(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '\\' && i + 3 < raw.size() &&
            std::isdigit(static_cast<unsigned char>(raw[i + 1])) &&
            std::isdigit(static_cast<unsigned char>(raw[i + 2])) &&
            std::isdigit(static_cast<unsigned char>(raw[i + 3]))) {
            int code = (raw[i + 1] - '0') * 64 + (raw[i + 2] - '0') * 8 + (raw[i + 3] - '0');
            out += static_cast<char>(code);
            i += 3;
        } else {
            out += raw[i];
        }
    }
    return out;
}

bool is_physical_disk(const std::string& name) {
    if (name.empty()) return false;
    if (name.rfind("loop", 0) == 0) return false;
    if (name.rfind("ram", 0) == 0) return false;
    if (name.rfind("dm-", 0) == 0) return false;
    // Devices whose whole-disk name ends in a digit mark partitions with pN
    for (const char* prefix : {"nvme", "mmcblk", "md"}) {
        std::string p(prefix);
        if (name.rfind(p, 0) == 0) {
            return name.find('p', p.size()) == std::string::npos;
        }
    }
    // Partitions: sda1, vdb2
    return !std::isdigit(static_cast<unsigned char>(name.back()));
}

namespace {

double seconds_between(std::chrono::steady_clock::time_point from,
                       std::chrono::steady_clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace

// ============================================================================
// ProcHostProvider Implementation
// ============================================================================

ProcHostProvider::ProcHostProvider(fs::path root, LatencyTarget latency_target, Clock clock)
    : root_(std::move(root)),
      latency_target_(std::move(latency_target)),
      clock_(std::move(clock)) {}

ProcHostProvider::~ProcHostProvider() = default;

fs::path ProcHostProvider::path(const std::string& relative) const {
    return root_ / relative;
}

std::string ProcHostProvider::read_file(const fs::path& file_path) const {
    std::ifstream file(file_path);
    if (!file) return "";
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::vector<std::string> ProcHostProvider::read_required_lines(const std::string& relative) const {
    auto file_path = path(relative);
    std::ifstream file(file_path);
    if (!file) {
        throw ProviderError("cannot read " + file_path.string());
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

bool ProcHostProvider::is_loopback(const std::string& iface) const {
    std::string flags = read_file(path("sys/class/net/" + iface + "/flags"));
    if (!flags.empty()) {
        try {
            return (std::stoul(flags, nullptr, 16) & IFF_LOOPBACK) != 0;
        } catch (const std::exception&) {
            spdlog::debug("Unparseable flags for {}: {}", iface, flags);
        }
    }
    return iface == "lo";
}

OsInfo ProcHostProvider::os_info() {
    OsInfo info;

    struct utsname uts;
    if (uname(&uts) != 0) {
        throw ProviderError("uname failed");
    }
    info.platform = uts.sysname;
    std::transform(info.platform.begin(), info.platform.end(), info.platform.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    info.release = uts.release;
    info.arch = uts.machine;

    char host[HOST_NAME_MAX + 1] = {};
    if (gethostname(host, sizeof(host) - 1) != 0) {
        throw ProviderError("gethostname failed");
    }
    info.hostname = host;

    return info;
}

CpuLoad ProcHostProvider::current_load() {
    auto lines = read_required_lines("proc/stat");

    CpuTimes all;
    std::map<unsigned, CpuTimes> per_core;

    for (const auto& line : lines) {
        if (line.compare(0, 3, "cpu") != 0) continue;

        std::istringstream iss(line);
        std::string cpu_name;
        uint64_t user = 0, nice = 0, system = 0, idle_val = 0, iowait = 0, irq = 0, softirq = 0, steal = 0;
        iss >> cpu_name >> user >> nice >> system >> idle_val >> iowait >> irq >> softirq >> steal;

        CpuTimes times;
        times.total = user + nice + system + idle_val + iowait + irq + softirq + steal;
        times.idle = idle_val + iowait;

        if (cpu_name == "cpu") {
            all = times;
        } else if (cpu_name.length() > 3 &&
                   std::all_of(cpu_name.begin() + 3, cpu_name.end(),
                               [](unsigned char c) { return std::isdigit(c); })) {
            // cpuN; offline cores have no line
            per_core[static_cast<unsigned>(std::stoul(cpu_name.substr(3)))] = times;
        }
    }

    // Counters that went backwards (core re-onlined, counter reset) count from zero
    auto percent = [](const CpuTimes& now, const CpuTimes& before) {
        CpuTimes base = (now.total < before.total || now.idle < before.idle) ? CpuTimes{} : before;
        uint64_t total_diff = now.total - base.total;
        uint64_t idle_diff = now.idle - base.idle;
        if (total_diff == 0) return 0.0;
        return 100.0 * (1.0 - static_cast<double>(idle_diff) / total_diff);
    };

    CpuLoad load;
    load.load_percent = percent(all, prev_cpu_);

    for (const auto& [id, times] : per_core) {
        auto prev = prev_cpu_per_core_.find(id);
        // Hotplugged cores start from zero
        load.per_core[id] = percent(times, prev == prev_cpu_per_core_.end() ? CpuTimes{} : prev->second);
    }

    prev_cpu_ = all;
    prev_cpu_per_core_ = std::move(per_core);

    return load;
}

MemoryInfo ProcHostProvider::memory() {
    auto lines = read_required_lines("proc/meminfo");

    MemoryInfo info;
    bool have_available = false;

    for (const auto& line : lines) {
        std::istringstream iss(line);
        std::string key;
        uint64_t value = 0;
        iss >> key >> value;

        // Values are in kB, convert to bytes
        value *= 1024;

        if (key == "MemTotal:") info.total = value;
        else if (key == "MemFree:") info.free = value;
        else if (key == "MemAvailable:") {
            info.available = value;
            have_available = true;
        }
        else if (key == "SwapTotal:") info.swap_total = value;
        else if (key == "SwapFree:") info.swap_free = value;
    }

    if (info.total == 0) {
        throw ProviderError("no MemTotal in " + path("proc/meminfo").string());
    }

    // Kernels before 3.14 lack MemAvailable
    if (!have_available) {
        info.available = info.free;
    }

    info.used = info.total - info.free;
    info.active = info.total - info.available;
    info.swap_used = info.swap_total - info.swap_free;
    return info;
}

std::vector<InterfaceStats> ProcHostProvider::network_stats() {
    auto lines = read_required_lines("proc/net/dev");
    auto now = clock_();

    std::vector<InterfaceStats> result;
    for (size_t i = 2; i < lines.size(); ++i) {  // Skip header lines
        std::string line = lines[i];
        // Replace ':' with space for easier parsing
        std::replace(line.begin(), line.end(), ':', ' ');

        std::istringstream iss(line);
        std::string iface;
        uint64_t rx_bytes = 0, rx_packets, rx_errs, rx_drop, rx_fifo, rx_frame, rx_compressed, rx_multicast;
        uint64_t tx_bytes = 0;

        iss >> iface >> rx_bytes >> rx_packets >> rx_errs >> rx_drop >> rx_fifo >> rx_frame >> rx_compressed >> rx_multicast
            >> tx_bytes;
        if (iface.empty()) continue;

        InterfaceStats stats;
        stats.iface = iface;
        stats.internal = is_loopback(iface);
        stats.rx_bytes = rx_bytes;
        stats.tx_bytes = tx_bytes;

        auto prev = prev_net_.find(iface);
        if (prev != prev_net_.end()) {
            double elapsed = seconds_between(prev->second.time, now);
            // Counters reset when an interface is re-created
            if (elapsed > 0 && rx_bytes >= prev->second.rx_bytes && tx_bytes >= prev->second.tx_bytes) {
                stats.rx_sec = (rx_bytes - prev->second.rx_bytes) / elapsed;
                stats.tx_sec = (tx_bytes - prev->second.tx_bytes) / elapsed;
            }
        }
        prev_net_[iface] = NetSample{rx_bytes, tx_bytes, now};

        result.push_back(std::move(stats));
    }
    return result;
}

double ProcHostProvider::uptime_seconds() {
    auto lines = read_required_lines("proc/uptime");
    double uptime = 0.0;
    std::istringstream iss(lines.empty() ? std::string() : lines.front());
    if (!(iss >> uptime)) {
        throw ProviderError("malformed " + path("proc/uptime").string());
    }
    return uptime;
}

DiskIo ProcHostProvider::disks_io() {
    auto lines = read_required_lines("proc/diskstats");
    auto now = clock_();

    DiskIo io;
    for (const auto& line : lines) {
        std::istringstream iss(line);
        int major, minor;
        std::string name;
        uint64_t reads_completed = 0, reads_merged, sectors_read, read_time;
        uint64_t writes_completed = 0;

        iss >> major >> minor >> name
            >> reads_completed >> reads_merged >> sectors_read >> read_time
            >> writes_completed;

        if (!is_physical_disk(name)) continue;

        io.read_ops += reads_completed;
        io.write_ops += writes_completed;
    }

    if (have_prev_disk_) {
        double elapsed = seconds_between(prev_disk_time_, now);
        if (elapsed > 0 && io.read_ops >= prev_disk_reads_ && io.write_ops >= prev_disk_writes_) {
            io.read_ops_sec = (io.read_ops - prev_disk_reads_) / elapsed;
            io.write_ops_sec = (io.write_ops - prev_disk_writes_) / elapsed;
        }
    }
    have_prev_disk_ = true;
    prev_disk_reads_ = io.read_ops;
    prev_disk_writes_ = io.write_ops;
    prev_disk_time_ = now;

    return io;
}

std::vector<FsUsage> ProcHostProvider::fs_size() {
    auto lines = read_required_lines("proc/mounts");

    std::vector<FsUsage> result;
    std::unordered_set<std::string> seen;

    for (const auto& line : lines) {
        std::istringstream iss(line);
        std::string device, mount, type;
        iss >> device >> mount >> type;
        if (device.empty() || mount.empty()) continue;

        mount = unescape_mount_path(mount);
        device = unescape_mount_path(device);

        // Block-device backed filesystems and the root mount only
        if (type == "squashfs") continue;
        if (device.front() != '/' && mount != "/") continue;
        if (!seen.insert(mount).second) continue;

        struct statvfs st;
        auto target = root_ / fs::path(mount).relative_path();
        if (statvfs(target.c_str(), &st) != 0) {
            spdlog::debug("statvfs({}) failed, skipping mount", target.string());
            continue;
        }

        FsUsage usage;
        usage.fs = device;
        usage.type = type;
        usage.mount = mount;
        usage.size = static_cast<uint64_t>(st.f_blocks) * st.f_frsize;
        usage.used = static_cast<uint64_t>(st.f_blocks - st.f_bfree) * st.f_frsize;
        usage.available = static_cast<uint64_t>(st.f_bavail) * st.f_frsize;
        uint64_t usable = usage.used + usage.available;
        usage.use_percent = usable > 0 ? 100.0 * usage.used / usable : 0.0;

        result.push_back(std::move(usage));
    }
    return result;
}

BatteryInfo ProcHostProvider::battery() {
    BatteryInfo info;

    auto supply_dir = path("sys/class/power_supply");
    std::error_code ec;
    if (!fs::is_directory(supply_dir, ec)) {
        return info;
    }

    std::vector<fs::path> entries;
    for (const auto& entry : fs::directory_iterator(supply_dir, ec)) {
        entries.push_back(entry.path());
    }
    std::sort(entries.begin(), entries.end());

    for (const auto& dir : entries) {
        std::string type = read_file(dir / "type");
        if (type.rfind("Battery", 0) != 0) continue;

        // Peripheral batteries (mice, headsets) report scope "Device"
        if (read_file(dir / "scope").rfind("Device", 0) == 0) continue;

        std::string capacity = read_file(dir / "capacity");
        if (capacity.empty()) continue;

        try {
            info.percent = std::stod(capacity);
        } catch (const std::exception&) {
            spdlog::debug("Unparseable battery capacity in {}", dir.string());
            continue;
        }
        info.has_battery = true;
        info.is_charging = read_file(dir / "status").rfind("Charging", 0) == 0;
        break;
    }
    return info;
}

} // namespace hoststatsd::metrics

#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace hoststatsd::service {

// Options for registering the collector as a systemd service
struct ServiceOptions {
    std::string name = "hoststatsd";
    std::string description = "Host metrics to statsd";
    std::filesystem::path executable;
    std::filesystem::path working_directory;
    std::vector<std::string> args = {"--run"};
    std::string username;                // Empty runs as root
    std::string password;                // Not used by systemd
};

// Render the systemd unit for the options.
std::string render_unit(const ServiceOptions& options);

// Run a command and wait for it; returns its exit status, or -1 if it could not be run.
int run_command(const std::vector<std::string>& argv);

/**
 * Registers and unregisters the collector with systemd
 *
 * Writes <unit_dir>/<name>.service and drives systemctl through the command
 * runner, which tests replace.
 */
class ServiceManager {
public:
    using CommandRunner = std::function<int(const std::vector<std::string>&)>;

    explicit ServiceManager(std::filesystem::path unit_dir = "/etc/systemd/system",
                            CommandRunner runner = run_command);

    // Write the unit, reload systemd and enable it at boot.
    bool add(const ServiceOptions& options);

    // Disable the unit, delete it and reload systemd.
    bool remove(const std::string& name);

    std::filesystem::path unit_path(const std::string& name) const;

private:
    bool systemctl(const std::vector<std::string>& args);

    std::filesystem::path unit_dir_;
    CommandRunner runner_;
};

} // namespace hoststatsd::service

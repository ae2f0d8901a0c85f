#include "service/service_manager.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace hoststatsd::service {

namespace {

// systemd splits ExecStart on whitespace unless the word is quoted
std::string quote_arg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"\\") == std::string::npos) {
        return arg;
    }
    std::string quoted = "\"";
    for (char c : arg) {
        if (c == '"' || c == '\\') quoted += '\\';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace

std::string render_unit(const ServiceOptions& options) {
    std::ostringstream unit;
    unit << "[Unit]\n"
         << "Description=" << options.description << "\n"
         << "After=network-online.target\n"
         << "Wants=network-online.target\n"
         << "\n"
         << "[Service]\n"
         << "Type=simple\n";

    unit << "ExecStart=" << quote_arg(options.executable.string());
    for (const auto& arg : options.args) {
        unit << ' ' << quote_arg(arg);
    }
    unit << "\n";

    if (!options.working_directory.empty()) {
        unit << "WorkingDirectory=" << quote_arg(options.working_directory.string()) << "\n";
    }
    if (!options.username.empty()) {
        unit << "User=" << options.username << "\n";
    }

    unit << "Restart=on-failure\n"
         << "\n"
         << "[Install]\n"
         << "WantedBy=multi-user.target\n";
    return unit.str();
}

int run_command(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return -1;
    }

    std::vector<char*> c_argv;
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("Failed to fork for {}: {}", argv[0], std::strerror(errno));
        return -1;
    }

    if (pid == 0) {
        execvp(c_argv[0], c_argv.data());
        // If exec fails
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::error("waitpid for {} failed: {}", argv[0], std::strerror(errno));
            return -1;
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

ServiceManager::ServiceManager(fs::path unit_dir, CommandRunner runner)
    : unit_dir_(std::move(unit_dir)), runner_(std::move(runner)) {}

fs::path ServiceManager::unit_path(const std::string& name) const {
    return unit_dir_ / (name + ".service");
}

bool ServiceManager::systemctl(const std::vector<std::string>& args) {
    std::vector<std::string> argv{"systemctl"};
    argv.insert(argv.end(), args.begin(), args.end());

    int status = runner_(argv);
    if (status != 0) {
        std::string command;
        for (const auto& a : argv) {
            if (!command.empty()) command += ' ';
            command += a;
        }
        spdlog::error("'{}' failed (status {})", command, status);
        return false;
    }
    return true;
}

bool ServiceManager::add(const ServiceOptions& options) {
    if (options.executable.empty()) {
        spdlog::error("Cannot register {}: executable path unknown", options.name);
        return false;
    }

    auto path = unit_path(options.name);
    std::error_code ec;
    if (fs::exists(path, ec)) {
        spdlog::error("Service {} already exists ({})", options.name, path.string());
        return false;
    }

    if (!options.password.empty()) {
        spdlog::warn("Ignoring password: systemd services run without one");
    }

    {
        std::ofstream file(path);
        if (!file) {
            spdlog::error("Cannot write {}: {}", path.string(), std::strerror(errno));
            return false;
        }
        file << render_unit(options);
        if (!file) {
            spdlog::error("Cannot write {}", path.string());
            return false;
        }
    }
    spdlog::debug("Wrote {}", path.string());

    if (!systemctl({"daemon-reload"}) || !systemctl({"enable", options.name + ".service"})) {
        if (!fs::remove(path, ec)) {
            spdlog::warn("Left {} behind: {}", path.string(), ec.message());
        }
        return false;
    }
    return true;
}

bool ServiceManager::remove(const std::string& name) {
    auto path = unit_path(name);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        spdlog::error("Service {} does not exist ({})", name, path.string());
        return false;
    }

    if (!systemctl({"disable", name + ".service"})) {
        return false;
    }

    if (!fs::remove(path, ec)) {
        spdlog::error("Cannot delete {}: {}", path.string(), ec.message());
        return false;
    }

    return systemctl({"daemon-reload"});
}

} // namespace hoststatsd::service

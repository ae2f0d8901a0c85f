#include "agent/agent.hpp"
#include "agent/config.hpp"
#include "core/logger.hpp"
#include "core/paths.hpp"
#include "service/service_manager.hpp"
#include <iostream>
#include <string>
#include <spdlog/spdlog.h>

using namespace hoststatsd;

namespace {

void usage(const char* argv0) {
    std::cout << "usage: " << argv0 << " --add [username] [password]\n"
              << "       " << argv0 << " --remove\n"
              << "       " << argv0 << " --run\n";
}

int add_service(const agent::AgentConfig& config, int argc, char* argv[]) {
    service::ServiceOptions options;
    options.executable = core::paths::executable_path();
    options.working_directory = core::paths::executable_dir();
    if (argc > 2) options.username = argv[2];
    if (argc > 3) options.password = argv[3];

    spdlog::info("adding service...");
    service::ServiceManager manager;
    if (!manager.add(options)) {
        spdlog::error("Failed to add service {}", options.name);
        return 1;
    }
    spdlog::info("service added. Metrics sending to {}:{}", config.statsd_host, config.statsd_port);
    return 0;
}

int remove_service() {
    service::ServiceOptions defaults;

    spdlog::info("removing service...");
    service::ServiceManager manager;
    if (!manager.remove(defaults.name)) {
        spdlog::error("Failed to remove service {}", defaults.name);
        return 1;
    }
    spdlog::info("service removed");
    return 0;
}

int run_agent(const agent::AgentConfig& config) {
    try {
        auto host_agent = agent::Agent::create(config);
        host_agent->install_signal_handlers();
        host_agent->run();
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    core::init_logger();

    auto config = agent::load_agent_config();
    core::set_log_level(core::parse_log_level(config.log_level));

    std::string command = argc > 1 ? argv[1] : "";
    if (command == "--add") {
        return add_service(config, argc, argv);
    }
    if (command == "--remove") {
        return remove_service();
    }
    if (command == "--run") {
        return run_agent(config);
    }

    usage(argv[0]);
    return 0;
}

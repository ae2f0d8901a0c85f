#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hoststatsd::agent {

struct Task {
    std::string name;
    std::function<void()> fn;
};

/**
 * Fixed-rate timers on a single-threaded epoll loop
 *
 * Each timer is a timerfd; tasks of a timer run in registration order when
 * it expires. An exception escaping a task is logged and the loop carries
 * on. Expirations missed while a task ran are coalesced into one run.
 *
 * add_timer(), post() and enable_signal_stop() must be called from the
 * thread that calls run(). stop() may be called from anywhere.
 */
class Scheduler {
public:
    Scheduler();
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void add_timer(const std::string& name, std::chrono::milliseconds interval, std::vector<Task> tasks);

    // Run once on the next loop iteration.
    void post(Task task);

    // Stop the loop on SIGINT or SIGTERM. Blocks both for the calling thread.
    void enable_signal_stop();

    // Blocks until stop() or a handled signal.
    void run();
    void stop();

    bool stopped() const { return stop_requested_; }
    uint64_t task_failures() const { return task_failures_; }

private:
    struct Timer {
        std::string name;
        int fd = -1;
        std::vector<Task> tasks;
    };

    void run_task(const Task& task);
    void run_posted();
    void on_timer(Timer& timer);
    void on_signal();
    void watch(int fd);

    int epoll_fd_ = -1;
    int stop_fd_ = -1;
    int signal_fd_ = -1;
    std::unordered_map<int, Timer> timers_;
    std::vector<Task> posted_;
    std::atomic<bool> stop_requested_{false};
    uint64_t task_failures_ = 0;
};

} // namespace hoststatsd::agent

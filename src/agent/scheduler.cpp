#include "agent/scheduler.hpp"
#include <cerrno>
#include <csignal>
#include <stdexcept>
#include <system_error>
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace hoststatsd::agent {

namespace {

constexpr int MAX_EVENTS = 16;

[[noreturn]] void throw_errno(const char* what) {
    throw std::system_error(errno, std::generic_category(), what);
}

} // namespace

Scheduler::Scheduler() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        throw_errno("epoll_create1");
    }

    stop_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (stop_fd_ < 0) {
        close(epoll_fd_);
        throw_errno("eventfd");
    }
    watch(stop_fd_);
}

Scheduler::~Scheduler() {
    for (auto& [fd, _] : timers_) {
        close(fd);
    }
    if (signal_fd_ >= 0) close(signal_fd_);
    if (stop_fd_ >= 0) close(stop_fd_);
    if (epoll_fd_ >= 0) close(epoll_fd_);
}

void Scheduler::watch(int fd) {
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = fd;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
        throw_errno("epoll_ctl");
    }
}

void Scheduler::add_timer(const std::string& name, std::chrono::milliseconds interval, std::vector<Task> tasks) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("timer " + name + " needs a positive interval");
    }

    int fd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) {
        throw_errno("timerfd_create");
    }

    itimerspec spec{};
    spec.it_interval.tv_sec = interval.count() / 1000;
    spec.it_interval.tv_nsec = (interval.count() % 1000) * 1000000;
    spec.it_value = spec.it_interval;
    if (timerfd_settime(fd, 0, &spec, nullptr) != 0) {
        close(fd);
        throw_errno("timerfd_settime");
    }

    try {
        watch(fd);
    } catch (const std::system_error&) {
        close(fd);
        throw;
    }

    timers_.emplace(fd, Timer{name, fd, std::move(tasks)});
    spdlog::debug("Timer {} every {} ms", name, interval.count());
}

void Scheduler::post(Task task) {
    posted_.push_back(std::move(task));
}

void Scheduler::enable_signal_stop() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (sigprocmask(SIG_BLOCK, &mask, nullptr) != 0) {
        throw_errno("sigprocmask");
    }

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        throw_errno("signalfd");
    }
    watch(signal_fd_);
}

void Scheduler::stop() {
    stop_requested_ = true;
    uint64_t one = 1;
    if (write(stop_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
        spdlog::warn("Scheduler wakeup failed: errno {}", errno);
    }
}

void Scheduler::run_task(const Task& task) {
    try {
        task.fn();
    } catch (const std::exception& e) {
        ++task_failures_;
        spdlog::error("Task {} failed: {}", task.name, e.what());
    }
}

void Scheduler::run_posted() {
    // Tasks may post more work; it runs on the next iteration
    std::vector<Task> batch;
    batch.swap(posted_);
    for (const auto& task : batch) {
        if (stop_requested_) return;
        run_task(task);
    }
}

void Scheduler::on_timer(Timer& timer) {
    uint64_t expirations = 0;
    if (read(timer.fd, &expirations, sizeof(expirations)) != sizeof(expirations)) {
        return;  // Spurious wakeup
    }
    if (expirations > 1) {
        spdlog::debug("Timer {} overran, {} expirations coalesced", timer.name, expirations);
    }

    for (const auto& task : timer.tasks) {
        if (stop_requested_) return;
        run_task(task);
    }
}

void Scheduler::on_signal() {
    signalfd_siginfo info{};
    if (read(signal_fd_, &info, sizeof(info)) != sizeof(info)) {
        return;
    }
    spdlog::info("Received signal {}", info.ssi_signo);
    stop();
}

void Scheduler::run() {
    epoll_event events[MAX_EVENTS];

    while (!stop_requested_) {
        run_posted();
        if (stop_requested_) break;

        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, posted_.empty() ? -1 : 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw_errno("epoll_wait");
        }

        for (int i = 0; i < n && !stop_requested_; ++i) {
            int fd = events[i].data.fd;
            if (fd == stop_fd_) {
                break;
            }
            if (fd == signal_fd_) {
                on_signal();
                continue;
            }
            auto it = timers_.find(fd);
            if (it != timers_.end()) {
                on_timer(it->second);
            }
        }
    }
}

} // namespace hoststatsd::agent

#include "notify/alarm_channel.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <thread>

#include <spawn.h>
#include <sys/wait.h>

extern char** environ;

namespace notify {

namespace {
    // Шаг опроса waitpid(WNOHANG).
    constexpr std::chrono::milliseconds kPollStep{20};
}

AlarmChannel::AlarmChannel(const Config& cfg) : cfg_(cfg) {}

ChannelOutcome AlarmChannel::send(const std::string&, const Snapshot*) {
    if (!enabled()) {
        return ChannelOutcome::skipped("alarm disabled");
    }
    if (cancelled_.load(std::memory_order_acquire)) {
        return ChannelOutcome::failed("cancelled");
    }

    if (cfg_.command.empty()) {
        std::cout << '\a' << std::flush;
        return ChannelOutcome::delivered();
    }
    return run_command();
}

void AlarmChannel::cancel() {
    cancelled_.store(true, std::memory_order_release);
    kill_child();
}

void AlarmChannel::kill_child() {
    std::lock_guard<std::mutex> lk(child_mu_);
    if (child_ > 0) {
        // Отрицательный pid = вся группа: sh и то, что он запустил.
        ::kill(-child_, SIGKILL);
    }
}

ChannelOutcome AlarmChannel::run_command() {
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attr, 0);

    const char* argv[] = {"sh", "-c", cfg_.command.c_str(), nullptr};

    pid_t pid = -1;
    int rc = 0;
    {
        // Под мьютексом: cancel() не должен проскочить между spawn и записью child_.
        std::lock_guard<std::mutex> lk(child_mu_);
        rc = posix_spawn(&pid, "/bin/sh", nullptr, &attr, const_cast<char* const*>(argv), environ);
        if (rc == 0) {
            child_ = pid;
        }
    }
    posix_spawnattr_destroy(&attr);

    if (rc != 0) {
        return ChannelOutcome::failed(std::string("could not start alarm command: ") + std::strerror(rc));
    }

    const auto deadline = std::chrono::steady_clock::now() + cfg_.timeout;
    bool killed = false;
    const char* kill_reason = nullptr;
    int status = 0;

    for (;;) {
        const pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            break;
        }
        if (done < 0 && errno != EINTR) {
            std::lock_guard<std::mutex> lk(child_mu_);
            child_ = -1;
            return ChannelOutcome::failed(std::string("waitpid failed: ") + std::strerror(errno));
        }

        if (!killed) {
            if (cancelled_.load(std::memory_order_acquire)) {
                kill_reason = "cancelled";
            } else if (std::chrono::steady_clock::now() >= deadline) {
                kill_reason = "alarm command timed out";
            }
            if (kill_reason) {
                kill_child();
                killed = true;
            }
        }
        std::this_thread::sleep_for(kPollStep);
    }

    {
        std::lock_guard<std::mutex> lk(child_mu_);
        child_ = -1;
    }

    if (kill_reason) {
        return ChannelOutcome::failed(kill_reason);
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        return ChannelOutcome::failed("alarm command exited with status " + std::to_string(code));
    }
    return ChannelOutcome::delivered();
}

} // namespace notify

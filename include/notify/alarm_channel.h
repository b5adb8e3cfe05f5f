#pragma once
#include <sys/types.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include "notify/channel.h"

namespace notify {

// Локальная тревога. Без команды звонит терминал ('\a'),
// с командой запускается /bin/sh -c (например, "aplay /usr/share/sounds/alarm.wav").
// Команда живёт в своей группе процессов: по таймауту или cancel() группа получает SIGKILL.
// Ненулевой код возврата, таймаут и отмена = failed.
class AlarmChannel : public Channel {
public:
    struct Config {
        bool enabled = true;
        std::string command;
        std::chrono::milliseconds timeout{5000};
    };

    explicit AlarmChannel(const Config& cfg);

    const std::string& name() const override { return name_; }
    bool enabled() const override { return cfg_.enabled; }
    ChannelOutcome send(const std::string& message, const Snapshot* snapshot) override;

    // Убивает выполняющуюся команду; все последующие send() сразу failed.
    void cancel() override;

private:
    ChannelOutcome run_command();
    void kill_child();

    Config cfg_;
    std::string name_ = "alarm";

    std::atomic<bool> cancelled_{false};
    std::mutex child_mu_;
    pid_t child_ = -1;
};

} // namespace notify

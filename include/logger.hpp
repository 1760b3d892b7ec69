#pragma once

#include <cstdio>
#include <mutex>
#include <print>
#include <string_view>

namespace packager {

// Пишем только в stderr: stdout в режиме одной папки занят списком <members>.
class Logger {
    std::mutex mutex_;
    bool verbose_{false};

    Logger() = default;

    void Write(std::string_view level, std::string_view message) {
        std::lock_guard lock(mutex_);
        std::println(stderr, "[{}] {}", level, message);
    }

    public:
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger& Get() {
        static Logger instance;
        return instance;
    }

    void SetVerbose(bool verbose) {
        std::lock_guard lock(mutex_);
        verbose_ = verbose;
    }

    void Debug(std::string_view message) {
        {
            std::lock_guard lock(mutex_);
            if(!verbose_) {
                return;
            }
        }
        Write("debug", message);
    }

    void Log(std::string_view message) {
        Write("info", message);
    }

    void Warn(std::string_view message) {
        Write("warn", message);
    }

    void Error(std::string_view message) {
        Write("error", message);
    }
};

}  // namespace packager

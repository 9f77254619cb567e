#pragma once

#include <iostream>
#include <mutex>
#include <string>
#include <utility>

namespace coffer {

    enum class LogLevel { Off = 0, Error = 1, Info = 2, Debug = 3 };

    /// Console logger. Errors go to stderr, everything else to stdout.
    class Logger {
      public:
        explicit Logger(LogLevel level = LogLevel::Error, std::string component = "coffer")
            : level_(level), component_(std::move(component)) {}

        LogLevel level() const { return level_; }
        bool enabled(LogLevel level) const { return level != LogLevel::Off && level <= level_; }

        void error(const std::string &msg) const { write(LogLevel::Error, msg); }
        void info(const std::string &msg) const { write(LogLevel::Info, msg); }
        void debug(const std::string &msg) const { write(LogLevel::Debug, msg); }

      private:
        void write(LogLevel level, const std::string &msg) const {
            if (!enabled(level))
                return;

            // Keep lines from concurrent units from interleaving
            static std::mutex output_mutex;
            std::lock_guard<std::mutex> lock(output_mutex);

            if (level == LogLevel::Error) {
                std::cerr << "[" << component_ << "] ERROR: " << msg << std::endl;
            } else {
                std::cout << "[" << component_ << "] " << (level == LogLevel::Info ? "INFO" : "DEBUG") << ": " << msg
                          << std::endl;
            }
        }

        LogLevel level_;
        std::string component_;
    };

} // namespace coffer

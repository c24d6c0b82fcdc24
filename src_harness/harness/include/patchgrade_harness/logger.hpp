#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace patchgrade::harness {

enum class LogLevel { Debug, Info, Warning, Error };

[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

/**
 * \brief Named, thread-safe line logger.
 *
 * Each line is written as `[LEVEL] name: message` to the console stream (when
 * one is attached and the level passes the console threshold) and to the log
 * file (every level). Workers of the scheduler share one run-level logger and
 * own one logger per instance.
 */
class Logger {
public:
    struct Config {
        std::string name;
        std::ostream* console{nullptr};
        LogLevel console_level{LogLevel::Info};
        std::filesystem::path file{};
    };

    explicit Logger(Config config);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /// Logger that discards everything.
    static Logger& null();

    void log(LogLevel level, std::string_view message);

    void debug(std::string_view message) { log(LogLevel::Debug, message); }
    void info(std::string_view message) { log(LogLevel::Info, message); }
    void warning(std::string_view message) { log(LogLevel::Warning, message); }
    void error(std::string_view message) { log(LogLevel::Error, message); }

    [[nodiscard]] const std::string& name() const noexcept { return config_.name; }

private:
    Config config_;
    std::ofstream file_;
    std::mutex mutex_;
};

}  // namespace patchgrade::harness

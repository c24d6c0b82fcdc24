#include "patchgrade_harness/logger.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace patchgrade::harness {

std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

Logger::Logger(Config config) : config_{std::move(config)} {
    if (!config_.file.empty()) {
        std::error_code ec;
        if (const auto parent = config_.file.parent_path(); !parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        file_.open(config_.file, std::ios::app);
        if (!file_.is_open() && config_.console != nullptr) {
            *config_.console << "[WARNING] " << config_.name
                             << ": unable to open log file " << config_.file.string() << "\n";
        }
    }
}

Logger& Logger::null() {
    static Logger sink{Config{.name = "null"}};
    return sink;
}

void Logger::log(LogLevel level, std::string_view message) {
    if (config_.console == nullptr && !file_.is_open()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.console != nullptr && level >= config_.console_level) {
        *config_.console << '[' << to_string(level) << "] " << config_.name << ": " << message << '\n';
    }
    if (file_.is_open()) {
        file_ << '[' << to_string(level) << "] " << config_.name << ": " << message << '\n';
        file_.flush();
    }
}

}  // namespace patchgrade::harness

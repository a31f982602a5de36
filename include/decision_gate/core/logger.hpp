// include/decision_gate/core/logger.hpp
#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>
#include "decision_gate/core/config_base.hpp"

namespace decision_gate {

enum class LogLevel {
    TRACE,
    DEBUG,    // per-claim and per-attempt detail
    INFO,     // one line per decision
    WARNING,  // degraded operation, e.g. keyword fallback
    ERR,
    FATAL
};

enum class LogDestination { CONSOLE, FILE, BOTH };

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
    }
    return "UNKNOWN";
}

inline LogLevel level_from_string(const std::string& name, LogLevel fallback) {
    for (LogLevel level : {LogLevel::TRACE, LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARNING,
                           LogLevel::ERR, LogLevel::FATAL}) {
        if (level_to_string(level) == name)
            return level;
    }
    return fallback;
}

inline std::string destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::CONSOLE:
            return "CONSOLE";
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
    }
    return "UNKNOWN";
}

inline LogDestination destination_from_string(const std::string& name, LogDestination fallback) {
    for (LogDestination dest :
         {LogDestination::CONSOLE, LogDestination::FILE, LogDestination::BOTH}) {
        if (destination_to_string(dest) == name)
            return dest;
    }
    return fallback;
}

/**
 * @brief Where and how much the gates log
 *
 * File output goes to <log_directory>/<filename_prefix>_<session>_part<N>.log and rolls
 * over to the next part once max_file_size bytes have been written.
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"decision_gate"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{50 * 1024 * 1024};
    size_t max_files{10};  // including the file being written

    nlohmann::json to_json() const override {
        return {{"min_level", level_to_string(min_level)},
                {"destination", destination_to_string(destination)},
                {"log_directory", log_directory},
                {"filename_prefix", filename_prefix},
                {"include_timestamp", include_timestamp},
                {"include_level", include_level},
                {"max_file_size", max_file_size},
                {"max_files", max_files}};
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("min_level"))
            min_level = level_from_string(j.at("min_level").get<std::string>(), min_level);
        if (j.contains("destination"))
            destination =
                destination_from_string(j.at("destination").get<std::string>(), destination);
        log_directory = j.value("log_directory", log_directory);
        filename_prefix = j.value("filename_prefix", filename_prefix);
        include_timestamp = j.value("include_timestamp", include_timestamp);
        include_level = j.value("include_level", include_level);
        max_file_size = j.value("max_file_size", max_file_size);
        max_files = j.value("max_files", max_files);
    }

    std::vector<ConfigValidationError> validate() const override {
        std::vector<ConfigValidationError> errors;
        if (max_files == 0)
            errors.push_back({"max_files", "Must keep at least one log file"});
        if (max_file_size == 0)
            errors.push_back({"max_file_size", "Must be positive"});
        if (destination != LogDestination::CONSOLE && filename_prefix.empty())
            errors.push_back({"filename_prefix", "Required when logging to a file"});
        return errors;
    }
};

/**
 * @brief Process-wide, mutex-guarded logger
 *
 * Lines carry the component tag of the calling thread, set through
 * ScopedLogComponent, so one evaluation's gates are told apart in a shared file.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Apply a configuration, opening a fresh session file when logging to disk
     * @throws std::runtime_error if the directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /// Closes the session file and returns to the uninitialized state
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /// Path of the file currently written, empty for console-only logging
    std::filesystem::path current_file() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_path_;
    }

    static void register_component(const std::string& component) {
        current_component_ = component;
    }

    static const std::string& current_component() {
        return current_component_;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string format_line(LogLevel level, const std::string& message) const;
    void open_part_unsafe();
    void prune_old_files_unsafe() const;
    std::filesystem::path log_dir() const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream file_;
    std::filesystem::path current_path_;
    std::string session_;
    int part_{0};
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;
};

/**
 * @brief Tags log lines from the current thread until the scope ends
 */
class ScopedLogComponent {
public:
    explicit ScopedLogComponent(const std::string& component)
        : previous_(Logger::current_component()) {
        Logger::register_component(component);
    }

    ~ScopedLogComponent() {
        Logger::register_component(previous_);
    }

    ScopedLogComponent(const ScopedLogComponent&) = delete;
    ScopedLogComponent& operator=(const ScopedLogComponent&) = delete;

private:
    std::string previous_;
};

/**
 * Usage: LOG(LogLevel::INFO, "approved " << asset << " at " << risk)
 * The stream expression is only evaluated when the level passes the filter.
 */
#define LOG(level, message)                                                 \
    do {                                                                    \
        if (level >= ::decision_gate::Logger::instance().get_min_level()) { \
            std::ostringstream os;                                          \
            os << message;                                                  \
            ::decision_gate::Logger::instance().log(level, os.str());       \
        }                                                                   \
    } while (0)

#define TRACE(message) LOG(::decision_gate::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::decision_gate::LogLevel::DEBUG, message)
#define INFO(message) LOG(::decision_gate::LogLevel::INFO, message)
#define WARN(message) LOG(::decision_gate::LogLevel::WARNING, message)
#define ERROR(message) LOG(::decision_gate::LogLevel::ERR, message)
#define FATAL(message) LOG(::decision_gate::LogLevel::FATAL, message)

}  // namespace decision_gate

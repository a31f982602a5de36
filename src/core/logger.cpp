// src/core/logger.cpp

#include "decision_gate/core/logger.hpp"
#include <algorithm>
#include <stdexcept>
#include "decision_gate/core/time_utils.hpp"

namespace decision_gate {

thread_local std::string Logger::current_component_;

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::~Logger() {
    if (file_.is_open()) {
        file_.close();
    }
}

void Logger::reset_for_tests() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_.store(false, std::memory_order_release);
    if (logger.file_.is_open()) {
        logger.file_.close();
    }
    logger.current_path_.clear();
    logger.session_.clear();
    logger.part_ = 0;
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    if (file_.is_open()) {
        file_.close();
    }
    current_path_.clear();

    if (config_.destination != LogDestination::CONSOLE) {
        std::error_code ec;
        std::filesystem::create_directories(log_dir(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create log directory " + log_dir().string() + ": " +
                                     ec.message());
        }

        session_ = core::get_formatted_time("%Y%m%d_%H%M%S");
        part_ = 0;
        open_part_unsafe();
        if (!file_.is_open()) {
            throw std::runtime_error("Cannot open log file " + current_path_.string());
        }
    }

    initialized_.store(true, std::memory_order_release);
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "Logger not initialized, dropping: " << message << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    const std::string line = format_line(level, message);

    if (config_.destination != LogDestination::FILE) {
        std::cout << line << std::endl;
    }

    if (config_.destination != LogDestination::CONSOLE && file_.is_open()) {
        file_ << line << '\n';
        file_.flush();
        if (file_.tellp() >= static_cast<std::streamoff>(config_.max_file_size)) {
            file_.close();
            open_part_unsafe();
        }
    }
}

std::string Logger::format_line(LogLevel level, const std::string& message) const {
    std::string line;
    if (config_.include_timestamp) {
        line += core::get_formatted_time("%Y-%m-%d %H:%M:%S") + " ";
    }
    if (config_.include_level) {
        line += "[" + level_to_string(level) + "] ";
    }
    if (!current_component_.empty()) {
        line += "[" + current_component_ + "] ";
    }
    return line + message;
}

std::filesystem::path Logger::log_dir() const {
    return std::filesystem::absolute(config_.log_directory);
}

void Logger::open_part_unsafe() {
    // Make room first so the new part never pushes the count past max_files
    prune_old_files_unsafe();

    ++part_;
    current_path_ = log_dir() / (config_.filename_prefix + "_" + session_ + "_part" +
                                 std::to_string(part_) + ".log");
    file_.open(current_path_, std::ios::app);
}

void Logger::prune_old_files_unsafe() const {
    std::error_code ec;
    std::vector<std::filesystem::path> existing;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir(), ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".log") {
            existing.push_back(entry.path());
        }
    }
    if (existing.size() < config_.max_files) {
        return;
    }

    std::sort(existing.begin(), existing.end(),
              [](const std::filesystem::path& a, const std::filesystem::path& b) {
                  std::error_code ignored;
                  return std::filesystem::last_write_time(a, ignored) <
                         std::filesystem::last_write_time(b, ignored);
              });

    const size_t excess = existing.size() - config_.max_files + 1;
    for (size_t i = 0; i < excess; ++i) {
        std::filesystem::remove(existing[i], ec);
    }
}

}  // namespace decision_gate

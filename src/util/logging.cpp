// Implementation - util/logging.cpp
#include "mixnet/util/logging.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace mixnet::util {

namespace {

thread_local std::string current_context;

const char* level_colour(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info: return "\033[32m";
        case LogLevel::Warn: return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[1;31m";
        default: return "";
    }
}

}  // namespace

Logger& global_logger() {
    static Logger instance;
    return instance;
}

void configure_logging(LogLevel level, bool to_console, const std::string& log_file,
                       size_t max_size_mb, size_t max_files) {
    auto& logger = global_logger();
    logger.set_level(level);
    logger.clear_sinks();
    if (to_console) {
        logger.add_sink(std::make_shared<ConsoleSink>());
    }
    if (!log_file.empty()) {
        if (max_size_mb > 0) {
            logger.add_sink(std::make_shared<RotatingFileSink>(
                log_file, max_size_mb * 1024 * 1024, max_files));
        } else {
            logger.add_sink(std::make_shared<FileSink>(log_file));
        }
    }
}

LogLevel parse_log_level(std::string_view str) {
    if (str == "trace" || str == "TRACE") return LogLevel::Trace;
    if (str == "debug" || str == "DEBUG") return LogLevel::Debug;
    if (str == "info" || str == "INFO") return LogLevel::Info;
    if (str == "warn" || str == "WARN" || str == "warning") return LogLevel::Warn;
    if (str == "error" || str == "ERROR") return LogLevel::Error;
    if (str == "fatal" || str == "FATAL") return LogLevel::Fatal;
    if (str == "off" || str == "OFF") return LogLevel::Off;
    return LogLevel::Info;
}

std::string LogRecord::format() const {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()).count() % 1000;

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms
        << " [" << log_level_name(level) << "] ";
    if (!category.empty()) {
        oss << "[" << category << "] ";
    }
    if (!context.empty()) {
        oss << "(" << context << ") ";
    }
    oss << message;
    return oss.str();
}

// ConsoleSink

ConsoleSink::ConsoleSink(bool colorize) : colorize_(colorize) {}

void ConsoleSink::write(const LogRecord& record) {
    std::lock_guard lock(mutex_);
    if (colorize_) {
        std::cerr << level_colour(record.level) << record.format() << "\033[0m\n";
    } else {
        std::cerr << record.format() << "\n";
    }
}

void ConsoleSink::flush() {
    std::lock_guard lock(mutex_);
    std::cerr.flush();
}

// FileSink

FileSink::FileSink(const std::string& path) : path_(path) {
    file_ = std::fopen(path.c_str(), "a");
}

FileSink::~FileSink() {
    if (file_) {
        std::fclose(file_);
    }
}

void FileSink::write(const LogRecord& record) {
    std::lock_guard lock(mutex_);
    if (!file_) return;
    std::fprintf(file_, "%s\n", record.format().c_str());
}

void FileSink::flush() {
    std::lock_guard lock(mutex_);
    if (!file_) return;
    std::fflush(file_);
}

void FileSink::reopen() {
    std::lock_guard lock(mutex_);
    if (file_) {
        std::fclose(file_);
    }
    file_ = std::fopen(path_.c_str(), "a");
}

// RotatingFileSink

RotatingFileSink::RotatingFileSink(
    const std::string& base_path,
    size_t max_size_bytes,
    size_t max_files)
    : base_path_(base_path), max_size_(max_size_bytes),
      max_files_(max_files == 0 ? 1 : max_files) {
    std::error_code ec;
    auto existing = std::filesystem::file_size(base_path_, ec);
    current_size_ = ec ? 0 : static_cast<size_t>(existing);
    current_file_ = std::make_unique<FileSink>(base_path_);
}

RotatingFileSink::~RotatingFileSink() = default;

void RotatingFileSink::write(const LogRecord& record) {
    std::lock_guard lock(mutex_);
    if (!current_file_) return;
    auto line = record.format();
    current_file_->write(record);
    current_size_ += line.size() + 1;
    rotate_if_needed();
}

void RotatingFileSink::flush() {
    std::lock_guard lock(mutex_);
    if (current_file_) {
        current_file_->flush();
    }
}

void RotatingFileSink::rotate_if_needed() {
    if (current_size_ < max_size_) return;

    current_file_.reset();
    std::error_code ec;
    if (max_files_ > 1) {
        // base.(n-2) -> base.(n-1), ..., base -> base.1
        for (size_t i = max_files_ - 1; i > 1; --i) {
            std::filesystem::rename(base_path_ + "." + std::to_string(i - 1),
                                    base_path_ + "." + std::to_string(i), ec);
        }
        std::filesystem::rename(base_path_, base_path_ + ".1", ec);
    } else {
        std::filesystem::remove(base_path_, ec);
    }
    current_file_ = std::make_unique<FileSink>(base_path_);
    current_size_ = 0;
}

// Logger

Logger::Logger() = default;

Logger::Logger(std::string_view category) : category_(category) {}

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard lock(mutex_);
    sinks_.clear();
}

void Logger::do_log(LogLevel level, std::string message, std::source_location loc) {
    LogRecord record{
        .level = level,
        .message = std::move(message),
        .file = loc.file_name(),
        .line = loc.line(),
        .function = loc.function_name(),
        .timestamp = std::chrono::system_clock::now(),
        .category = category_,
        .context = current_context,
    };

    std::lock_guard lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

// LogContext

LogContext::LogContext(std::string context)
    : context_(std::move(context)), previous_(current_context) {
    current_context = context_;
}

LogContext::~LogContext() {
    current_context = previous_;
}

std::string_view LogContext::current() {
    return current_context;
}

}  // namespace mixnet::util

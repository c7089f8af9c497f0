#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <memory>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace mixnet::util {

enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6,
};

[[nodiscard]] constexpr const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off: return "OFF";
        default: return "UNKNOWN";
    }
}

// Unknown names map to Info
[[nodiscard]] LogLevel parse_log_level(std::string_view str);

struct LogRecord {
    LogLevel level;
    std::string message;
    std::string_view file;
    uint32_t line;
    std::string_view function;
    std::chrono::system_clock::time_point timestamp;
    std::string_view category;
    std::string context;  // LogContext active on the logging thread

    [[nodiscard]] std::string format() const;
};

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

// Writes to stderr, ANSI-coloured by level when colorize is set
class ConsoleSink : public LogSink {
public:
    ConsoleSink() = default;
    explicit ConsoleSink(bool colorize);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_colorize(bool colorize) { colorize_ = colorize; }

private:
    bool colorize_{true};
    std::mutex mutex_;
};

class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] bool is_open() const { return file_ != nullptr; }
    [[nodiscard]] const std::string& path() const { return path_; }

    // Close and reopen the file (after an external move)
    void reopen();

private:
    std::string path_;
    std::FILE* file_{nullptr};
    std::mutex mutex_;
};

// Keeps base_path plus base_path.1 .. base_path.(max_files-1)
class RotatingFileSink : public LogSink {
public:
    RotatingFileSink(
        const std::string& base_path,
        size_t max_size_bytes,
        size_t max_files
    );
    ~RotatingFileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::string base_path_;
    size_t max_size_;
    size_t max_files_;
    size_t current_size_{0};
    std::unique_ptr<FileSink> current_file_;
    std::mutex mutex_;

    void rotate_if_needed();
};

class Logger {
public:
    Logger();
    explicit Logger(std::string_view category);

    void set_level(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel level() const { return min_level_; }

    void add_sink(std::shared_ptr<LogSink> sink);
    void clear_sinks();

    [[nodiscard]] bool is_enabled(LogLevel level) const {
        return level >= min_level_;
    }

    template <typename... Args>
    void log(LogLevel level,
             std::format_string<Args...> fmt,
             Args&&... args) {
        if (is_enabled(level)) {
            do_log(level, std::format(fmt, std::forward<Args>(args)...),
                   std::source_location::current());
        }
    }

    template <typename... Args>
    void trace(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void fatal(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Fatal, fmt, std::forward<Args>(args)...);
    }

    void flush();

private:
    void do_log(LogLevel level, std::string message, std::source_location loc);

    std::string_view category_;
    LogLevel min_level_{LogLevel::Info};
    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::mutex mutex_;
};

Logger& global_logger();

// Replaces the sinks of the global logger. max_size_mb > 0 selects rotation.
void configure_logging(LogLevel level, bool to_console = true,
                       const std::string& log_file = "",
                       size_t max_size_mb = 0, size_t max_files = 5);

#define LOG_TRACE(...) ::mixnet::util::global_logger().trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::mixnet::util::global_logger().debug(__VA_ARGS__)
#define LOG_INFO(...) ::mixnet::util::global_logger().info(__VA_ARGS__)
#define LOG_WARN(...) ::mixnet::util::global_logger().warn(__VA_ARGS__)
#define LOG_ERROR(...) ::mixnet::util::global_logger().error(__VA_ARGS__)
#define LOG_FATAL(...) ::mixnet::util::global_logger().fatal(__VA_ARGS__)

// Scoped per-thread tag prefixed to log lines (e.g. the peer a link thread serves)
class LogContext {
public:
    explicit LogContext(std::string context);
    ~LogContext();

    LogContext(const LogContext&) = delete;
    LogContext& operator=(const LogContext&) = delete;

    [[nodiscard]] static std::string_view current();

private:
    std::string context_;
    std::string previous_;
};

}  // namespace mixnet::util

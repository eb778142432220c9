#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sccplib::utils {

/**
 * @brief Log level
 */
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/**
 * @brief One log record
 */
struct LogEntry {
    LogLevel level;
    std::string logger_name;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::string file;
    int line = 0;
    std::string function;
    std::unordered_map<std::string, std::string> metadata;
};

/**
 * @brief Log formatter shared by the sinks
 */
class UnifiedLogFormatter {
public:
    struct FormatConfig {
        std::string timestamp_format = "%Y-%m-%d %H:%M:%S";
        bool include_file_info = false;
        bool include_metadata = true;
        std::string field_separator = " | ";
    };

    UnifiedLogFormatter();
    explicit UnifiedLogFormatter(const FormatConfig& config);

    /**
     * @brief Format as a single text line
     * @param entry log entry
     * @return "time | LEVEL | logger | message[ | k=v,...]"
     */
    std::string format(const LogEntry& entry) const;

    /**
     * @brief Format as a single-line JSON object
     * @param entry log entry
     * @return JSON text with time, level, logger, msg and metadata keys
     */
    std::string format_json(const LogEntry& entry) const;

    void update_config(const FormatConfig& new_config);

private:
    FormatConfig config_;
    mutable std::mutex format_mutex_;

    std::string format_timestamp(const std::chrono::system_clock::time_point& timestamp) const;
    std::string format_metadata(const std::unordered_map<std::string, std::string>& metadata) const;
};

/**
 * @brief Log sink (output destination)
 */
class LogSink {
public:
    virtual ~LogSink() = default;

    /**
     * @brief Write one entry
     * @param entry log entry
     */
    virtual void write(const LogEntry& entry) = 0;

    virtual void flush() {}
    virtual void close() {}

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel get_min_level() const { return min_level_; }

    void set_formatter(std::shared_ptr<UnifiedLogFormatter> formatter) { formatter_ = std::move(formatter); }

    // Write one JSON object per line instead of the text format.
    void set_json_format(bool json) { json_format_ = json; }
    bool is_json_format() const { return json_format_; }

protected:
    LogLevel min_level_ = LogLevel::Trace;
    std::shared_ptr<UnifiedLogFormatter> formatter_ = std::make_shared<UnifiedLogFormatter>();
    bool json_format_ = false;

    std::string render(const LogEntry& entry) const {
        return json_format_ ? formatter_->format_json(entry) : formatter_->format(entry);
    }
};

/**
 * @brief Console sink; writes to stderr unless another stream is given
 */
class ConsoleLogSink : public LogSink {
public:
    explicit ConsoleLogSink(bool use_colors = true);
    ConsoleLogSink(std::ostream& out, bool use_colors);
    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::ostream& out_;
    bool use_colors_;
    std::mutex console_mutex_;
    std::string colorize(LogLevel level, const std::string& text) const;
};

/**
 * @brief File sink with size based rotation
 */
class FileLogSink : public LogSink {
public:
    /**
     * @param file_path file path
     * @param max_file_size rotate once the file grows past this (0 = never)
     * @param max_files number of rotated files kept (file.1 .. file.N)
     */
    explicit FileLogSink(const std::filesystem::path& file_path,
                         size_t max_file_size = 10 * 1024 * 1024,
                         size_t max_files = 5);

    ~FileLogSink() override;

    void write(const LogEntry& entry) override;
    void flush() override;
    void close() override;

    bool is_open() const;

private:
    std::filesystem::path file_path_;
    size_t max_file_size_;
    size_t max_files_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex file_mutex_;
    size_t current_file_size_{0};

    void rotate_file();
    std::filesystem::path get_rotated_file_path(size_t index) const;
};

/**
 * @brief Named logger fanning entries out to its sinks
 */
class Logger {
public:
    explicit Logger(const std::string& name);

    void add_sink(std::shared_ptr<LogSink> sink);
    void remove_sink(const std::shared_ptr<LogSink>& sink);
    void clear_sinks();

    void set_level(LogLevel level);
    LogLevel get_level() const;
    bool should_log(LogLevel level) const;

    void log(LogLevel level, const std::string& message,
             const std::string& file = "", int line = 0, const std::string& function = "");

    /**
     * @brief Log with key/value metadata attached
     */
    void log_with_metadata(LogLevel level, const std::string& message,
                           const std::unordered_map<std::string, std::string>& metadata,
                           const std::string& file = "", int line = 0, const std::string& function = "");

    void trace(const std::string& message, const std::string& file = "", int line = 0, const std::string& function = "");
    void debug(const std::string& message, const std::string& file = "", int line = 0, const std::string& function = "");
    void info(const std::string& message, const std::string& file = "", int line = 0, const std::string& function = "");
    void warning(const std::string& message, const std::string& file = "", int line = 0, const std::string& function = "");
    void error(const std::string& message, const std::string& file = "", int line = 0, const std::string& function = "");
    void critical(const std::string& message, const std::string& file = "", int line = 0, const std::string& function = "");

    void flush();

    const std::string& get_name() const { return name_; }

private:
    std::string name_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex sinks_mutex_;
    LogLevel min_level_;

    void write_to_sinks(const LogEntry& entry);
};

/**
 * @brief Registry of named loggers
 */
class LogManager {
public:
    static LogManager& instance();

    /**
     * @brief Get a logger, creating it with the global level and sinks if needed
     * @param name logger name
     */
    std::shared_ptr<Logger> get_logger(const std::string& name);
    std::shared_ptr<Logger> get_default_logger();

    void remove_logger(const std::string& name);
    void clear_loggers();

    /**
     * @brief Set the level of every existing and future logger
     */
    void set_global_level(LogLevel level);
    LogLevel get_global_level() const;

    /**
     * @brief Attach a sink to every existing and future logger
     */
    void add_global_sink(std::shared_ptr<LogSink> sink);

    /**
     * @brief Detach all global sinks from every logger
     */
    void clear_global_sinks();

    void flush_all();
    void shutdown();

private:
    std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
    mutable std::mutex loggers_mutex_;
    LogLevel global_level_{LogLevel::Info};
    std::vector<std::shared_ptr<LogSink>> global_sinks_;

    LogManager() = default;
    ~LogManager();
};

#define SCCPLIB_LOG_TRACE(logger, message) \
    logger->trace(message, __FILE__, __LINE__, __FUNCTION__)

#define SCCPLIB_LOG_DEBUG(logger, message) \
    logger->debug(message, __FILE__, __LINE__, __FUNCTION__)

#define SCCPLIB_LOG_INFO(logger, message) \
    logger->info(message, __FILE__, __LINE__, __FUNCTION__)

#define SCCPLIB_LOG_WARNING(logger, message) \
    logger->warning(message, __FILE__, __LINE__, __FUNCTION__)

#define SCCPLIB_LOG_ERROR(logger, message) \
    logger->error(message, __FILE__, __LINE__, __FUNCTION__)

#define SCCPLIB_LOG_CRITICAL(logger, message) \
    logger->critical(message, __FILE__, __LINE__, __FUNCTION__)

namespace log_utils {
    /**
     * @brief Parse "trace" .. "critical" / "off" (case-insensitive)
     * @return LogLevel::Info for unrecognized text
     */
    LogLevel parse_log_level(const std::string& level_str);

    std::string log_level_to_string(LogLevel level);

    /**
     * @brief Reset global sinks and level
     * @param level minimum level
     * @param log_to_console add a ConsoleLogSink on stderr
     * @param log_file add a FileLogSink when not empty
     * @param use_colors ANSI colours on the console (text format only)
     * @param json_format every sink writes JSON lines
     */
    void setup_basic_logging(LogLevel level = LogLevel::Info,
                             bool log_to_console = true,
                             const std::filesystem::path& log_file = {},
                             bool use_colors = true,
                             bool json_format = false);
}

} // namespace sccplib::utils

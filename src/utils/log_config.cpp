#include "sccplib/utils/log_config.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace sccplib::utils {

// UnifiedLogFormatter
UnifiedLogFormatter::UnifiedLogFormatter() : config_{} {}
UnifiedLogFormatter::UnifiedLogFormatter(const FormatConfig& config) : config_(config) {}

std::string UnifiedLogFormatter::format_timestamp(const std::chrono::system_clock::time_point& tp) const {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);
    char buf[64];
    std::size_t n = std::strftime(buf, sizeof(buf), config_.timestamp_format.c_str(), &tm);
    return std::string(buf, n);
}

std::string UnifiedLogFormatter::format_metadata(const std::unordered_map<std::string, std::string>& md) const {
    if (!config_.include_metadata || md.empty()) return "";
    // Sorted so identical metadata always renders identically.
    std::vector<std::pair<std::string, std::string>> items(md.begin(), md.end());
    std::sort(items.begin(), items.end());
    std::ostringstream ss;
    bool first = true;
    for (const auto& [k, v] : items) {
        if (!first) ss << ',';
        first = false;
        ss << k << '=' << v;
    }
    return ss.str();
}

std::string UnifiedLogFormatter::format(const LogEntry& e) const {
    std::lock_guard<std::mutex> lk(format_mutex_);
    std::ostringstream ss;
    ss << format_timestamp(e.timestamp) << config_.field_separator
       << log_utils::log_level_to_string(e.level) << config_.field_separator
       << e.logger_name << config_.field_separator << e.message;
    if (config_.include_file_info && !e.file.empty()) {
        ss << config_.field_separator << e.file << ':' << e.line;
    }
    auto md = format_metadata(e.metadata);
    if (!md.empty()) ss << config_.field_separator << md;
    return ss.str();
}

std::string UnifiedLogFormatter::format_json(const LogEntry& e) const {
    std::lock_guard<std::mutex> lk(format_mutex_);
    nlohmann::json j;
    j["time"] = format_timestamp(e.timestamp);
    j["level"] = log_utils::log_level_to_string(e.level);
    j["logger"] = e.logger_name;
    j["msg"] = e.message;
    if (!e.metadata.empty()) j["metadata"] = e.metadata;
    return j.dump();
}

void UnifiedLogFormatter::update_config(const FormatConfig& cfg) {
    std::lock_guard<std::mutex> lk(format_mutex_);
    config_ = cfg;
}

// ConsoleLogSink
ConsoleLogSink::ConsoleLogSink(bool use_colors) : out_(std::cerr), use_colors_(use_colors) {}
ConsoleLogSink::ConsoleLogSink(std::ostream& out, bool use_colors) : out_(out), use_colors_(use_colors) {}

std::string ConsoleLogSink::colorize(LogLevel level, const std::string& text) const {
    if (!use_colors_) return text;
    const char* c = "\033[0m";
    switch (level) {
        case LogLevel::Trace: c = "\033[37m"; break;
        case LogLevel::Debug: c = "\033[36m"; break;
        case LogLevel::Info: c = "\033[32m"; break;
        case LogLevel::Warning: c = "\033[33m"; break;
        case LogLevel::Error: c = "\033[31m"; break;
        case LogLevel::Critical: c = "\033[35m"; break;
        default: break;
    }
    return std::string(c) + text + "\033[0m";
}

void ConsoleLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lk(console_mutex_);
    const auto line = render(entry);
    out_ << (json_format_ ? line : colorize(entry.level, line)) << '\n';
}

void ConsoleLogSink::flush() {
    std::lock_guard<std::mutex> lk(console_mutex_);
    out_.flush();
}

// FileLogSink
FileLogSink::FileLogSink(const std::filesystem::path& file_path, size_t max_file_size, size_t max_files)
    : file_path_(file_path), max_file_size_(max_file_size), max_files_(max_files) {
    file_stream_ = std::make_unique<std::ofstream>(file_path_, std::ios::app);
    std::error_code ec;
    auto size = std::filesystem::file_size(file_path_, ec);
    current_file_size_ = ec ? 0 : static_cast<size_t>(size);
}

FileLogSink::~FileLogSink() { close(); }

bool FileLogSink::is_open() const {
    std::lock_guard<std::mutex> lk(file_mutex_);
    return file_stream_ && file_stream_->is_open();
}

void FileLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lk(file_mutex_);
    if (!file_stream_ || !file_stream_->is_open()) return;
    std::string line = render(entry);
    (*file_stream_) << line << '\n';
    current_file_size_ += line.size() + 1;
    if (max_file_size_ && current_file_size_ > max_file_size_) rotate_file();
}

void FileLogSink::flush() {
    std::lock_guard<std::mutex> lk(file_mutex_);
    if (file_stream_) file_stream_->flush();
}

void FileLogSink::close() {
    std::lock_guard<std::mutex> lk(file_mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
        file_stream_->close();
    }
}

void FileLogSink::rotate_file() {
    if (!file_stream_) return;
    file_stream_->close();
    std::error_code ec;
    if (max_files_ > 0) {
        for (size_t i = max_files_; i-- > 1;) {
            auto src = get_rotated_file_path(i - 1);
            if (!std::filesystem::exists(src, ec)) continue;
            std::filesystem::rename(src, get_rotated_file_path(i), ec);
        }
        std::filesystem::rename(file_path_, get_rotated_file_path(0), ec);
    }
    file_stream_ = std::make_unique<std::ofstream>(file_path_, std::ios::trunc);
    current_file_size_ = 0;
}

std::filesystem::path FileLogSink::get_rotated_file_path(size_t index) const {
    return std::filesystem::path(file_path_.string() + "." + std::to_string(index + 1));
}

// Logger
Logger::Logger(const std::string& name) : name_(name), min_level_(LogLevel::Info) {}

void Logger::add_sink(std::shared_ptr<LogSink> s) {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    if (std::find(sinks_.begin(), sinks_.end(), s) == sinks_.end()) sinks_.push_back(std::move(s));
}

void Logger::remove_sink(const std::shared_ptr<LogSink>& s) {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), s), sinks_.end());
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel l) {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    min_level_ = l;
}

LogLevel Logger::get_level() const {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    return min_level_;
}

bool Logger::should_log(LogLevel level) const {
    return level != LogLevel::Off && level >= get_level();
}

void Logger::write_to_sinks(const LogEntry& e) {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    for (auto& s : sinks_) {
        if (e.level >= s->get_min_level()) s->write(e);
    }
}

void Logger::log(LogLevel level, const std::string& message, const std::string& file, int line, const std::string& function) {
    log_with_metadata(level, message, {}, file, line, function);
}

void Logger::log_with_metadata(LogLevel level, const std::string& message,
                               const std::unordered_map<std::string, std::string>& metadata,
                               const std::string& file, int line, const std::string& function) {
    if (!should_log(level)) return;
    LogEntry e{level, name_, message, std::chrono::system_clock::now(), file, line, function, metadata};
    write_to_sinks(e);
}

void Logger::trace(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Trace, m, f, l, fn); }
void Logger::debug(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Debug, m, f, l, fn); }
void Logger::info(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Info, m, f, l, fn); }
void Logger::warning(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Warning, m, f, l, fn); }
void Logger::error(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Error, m, f, l, fn); }
void Logger::critical(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Critical, m, f, l, fn); }

void Logger::flush() {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    for (auto& s : sinks_) s->flush();
}

// LogManager
LogManager& LogManager::instance() {
    static LogManager inst;
    return inst;
}

LogManager::~LogManager() { shutdown(); }

std::shared_ptr<Logger> LogManager::get_logger(const std::string& name) {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    auto it = loggers_.find(name);
    if (it != loggers_.end()) return it->second;
    auto l = std::make_shared<Logger>(name);
    l->set_level(global_level_);
    for (auto& s : global_sinks_) l->add_sink(s);
    loggers_[name] = l;
    return l;
}

std::shared_ptr<Logger> LogManager::get_default_logger() { return get_logger("default"); }

void LogManager::remove_logger(const std::string& name) {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    loggers_.erase(name);
}

void LogManager::clear_loggers() {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    loggers_.clear();
}

void LogManager::set_global_level(LogLevel l) {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    global_level_ = l;
    for (auto& [n, logger] : loggers_) logger->set_level(l);
}

LogLevel LogManager::get_global_level() const {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    return global_level_;
}

void LogManager::add_global_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    for (auto& [n, logger] : loggers_) logger->add_sink(sink);
    global_sinks_.push_back(std::move(sink));
}

void LogManager::clear_global_sinks() {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    for (auto& sink : global_sinks_) {
        for (auto& [n, logger] : loggers_) logger->remove_sink(sink);
        sink->flush();
    }
    global_sinks_.clear();
}

void LogManager::flush_all() {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    for (auto& [n, l] : loggers_) l->flush();
}

void LogManager::shutdown() { flush_all(); }

// log_utils
LogLevel log_utils::parse_log_level(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace") return LogLevel::Trace;
    if (v == "debug") return LogLevel::Debug;
    if (v == "info") return LogLevel::Info;
    if (v == "warn" || v == "warning") return LogLevel::Warning;
    if (v == "error") return LogLevel::Error;
    if (v == "critical" || v == "fatal") return LogLevel::Critical;
    if (v == "off") return LogLevel::Off;
    return LogLevel::Info;
}

std::string log_utils::log_level_to_string(LogLevel l) {
    switch (l) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default: return "OFF";
    }
}

void log_utils::setup_basic_logging(LogLevel level, bool log_to_console,
                                    const std::filesystem::path& log_file, bool use_colors,
                                    bool json_format) {
    auto& mgr = LogManager::instance();
    mgr.clear_global_sinks();
    mgr.set_global_level(level);
    if (log_to_console) {
        auto sink = std::make_shared<ConsoleLogSink>(use_colors);
        sink->set_json_format(json_format);
        mgr.add_global_sink(std::move(sink));
    }
    if (!log_file.empty()) {
        auto sink = std::make_shared<FileLogSink>(log_file);
        sink->set_json_format(json_format);
        mgr.add_global_sink(std::move(sink));
    }
}

} // namespace sccplib::utils

// =============================================================================
// FILE: src/common/logger.cpp
// =============================================================================
#include "common/logger.h"
#include <cerrno>
#include <cstring>
#include <ctime>
#include <sys/stat.h>
#include <unistd.h>

namespace sip_subscription {

// =============================================================================
// LogSink
// =============================================================================

LogSink::LogSink(const LogSinkConfig& config) : config_(config) {
    open_file();
}

LogSink::~LogSink() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fp_ && fp_ != stderr) {
        fflush(fp_);
        fclose(fp_);
    }
    fp_ = nullptr;
}

void LogSink::open_file() {
    if (config_.file_path.empty()) {
        fp_ = stderr;
        return;
    }

    fp_ = fopen(config_.file_path.c_str(), "a");
    if (!fp_) {
        fprintf(stderr, "LOGGER: cannot open '%s': %s, falling back to stderr\n",
                config_.file_path.c_str(), strerror(errno));
        fp_ = stderr;
        return;
    }

    struct stat st;
    current_size_ = (fstat(fileno(fp_), &st) == 0) ? static_cast<size_t>(st.st_size) : 0;
}

std::string LogSink::rotated_path(int index) const {
    return config_.file_path + "." + std::to_string(index);
}

bool LogSink::needs_rotation() const {
    return fp_ != stderr &&
           config_.max_file_size_bytes > 0 &&
           current_size_ >= config_.max_file_size_bytes;
}

void LogSink::rotate() {
    fflush(fp_);
    fclose(fp_);
    fp_ = nullptr;

    // name.log.N is dropped, name.log.(i) -> name.log.(i+1), name.log -> name.log.1
    if (config_.max_rotated_files > 0) {
        std::remove(rotated_path(config_.max_rotated_files).c_str());
        for (int i = config_.max_rotated_files - 1; i >= 1; --i) {
            std::rename(rotated_path(i).c_str(), rotated_path(i + 1).c_str());
        }
        std::rename(config_.file_path.c_str(), rotated_path(1).c_str());
    } else {
        std::remove(config_.file_path.c_str());
    }

    current_size_ = 0;
    open_file();
}

void LogSink::write(LogLevel level, const char* formatted_msg, size_t len) {
    if (level < config_.min_level || level > config_.max_level) return;

    std::lock_guard<std::mutex> lk(mu_);
    if (!fp_) return;

    if (needs_rotation()) rotate();

    current_size_ += fwrite(formatted_msg, 1, len, fp_);

    if (config_.also_stderr && fp_ != stderr) {
        fwrite(formatted_msg, 1, len, stderr);
    }
    if (level >= LogLevel::kWarn) fflush(fp_);
}

void LogSink::flush() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fp_) fflush(fp_);
}


// =============================================================================
// Logger
// =============================================================================

Logger::Logger() : level_(LogLevel::kInfo) {}

Logger::~Logger() {
    flush_all();
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::configure(const LoggingOptions& options) {
    std::lock_guard<std::mutex> lk(configure_mu_);

    configured_.store(false, std::memory_order_release);
    sinks_.clear();
    slow_sink_.reset();

    if (!options.directory.empty() &&
        mkdir(options.directory.c_str(), 0755) != 0 && errno != EEXIST) {
        fprintf(stderr, "LOGGER: cannot create '%s': %s\n",
                options.directory.c_str(), strerror(errno));
    }
    std::string prefix = options.directory.empty()
        ? options.base_name
        : options.directory + "/" + options.base_name;

    LogSinkConfig main_cfg;
    main_cfg.file_path           = prefix + ".log";
    main_cfg.max_file_size_bytes = options.max_file_size_bytes;
    main_cfg.max_rotated_files   = options.max_rotated_files;
    main_cfg.min_level           = LogLevel::kInfo;
    main_cfg.also_stderr         = options.console_level <= LogLevel::kInfo;
    sinks_.push_back(std::make_unique<LogSink>(main_cfg));

    if (options.split_debug_file) {
        LogSinkConfig debug_cfg = main_cfg;
        debug_cfg.file_path         = prefix + "_debug.log";
        debug_cfg.max_rotated_files = options.max_rotated_files / 2;
        debug_cfg.min_level         = LogLevel::kTrace;
        debug_cfg.max_level         = LogLevel::kDebug;
        debug_cfg.also_stderr       = false;
        sinks_.push_back(std::make_unique<LogSink>(debug_cfg));
    }

    LogSinkConfig error_cfg = main_cfg;
    error_cfg.file_path   = prefix + "_error.log";
    error_cfg.min_level   = LogLevel::kError;
    // main sink already echoes errors when the console shows info
    error_cfg.also_stderr = options.console_level > LogLevel::kInfo &&
                            options.console_level <= LogLevel::kError;
    sinks_.push_back(std::make_unique<LogSink>(error_cfg));

    LogSinkConfig slow_cfg = main_cfg;
    slow_cfg.file_path   = prefix + "_slow.log";
    slow_cfg.min_level   = LogLevel::kTrace;
    slow_cfg.also_stderr = false;
    slow_sink_ = std::make_unique<LogSink>(slow_cfg);

    configured_.store(true, std::memory_order_release);

    fprintf(stderr, "Logger configured: prefix=%s max_size=%zu max_files=%d\n",
            prefix.c_str(), options.max_file_size_bytes, options.max_rotated_files);
}

size_t Logger::format_message(char* buf, size_t buf_size,
                              LogLevel level, const char* file, int line,
                              const char* fmt, va_list args) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    const char* base = strrchr(file, '/');
    base = base ? base + 1 : file;

    int prefix_len = snprintf(buf, buf_size,
        "%04d-%02d-%02d %02d:%02d:%02d.%03d [%s] [tid:%lu] [%s:%d] ",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
        static_cast<int>(ms.count()),
        log_level_name(level), static_cast<unsigned long>(pthread_self()),
        base, line);

    if (prefix_len < 0 || static_cast<size_t>(prefix_len) >= buf_size) {
        return 0;
    }

    int msg_len = vsnprintf(buf + prefix_len,
                            buf_size - static_cast<size_t>(prefix_len),
                            fmt, args);
    if (msg_len < 0) msg_len = 0;

    size_t total = static_cast<size_t>(prefix_len) + static_cast<size_t>(msg_len);
    if (total >= buf_size - 1) total = buf_size - 2;

    buf[total] = '\n';
    buf[total + 1] = '\0';
    return total + 1;
}

void Logger::write_stderr(LogLevel level, const char* buf, size_t len) {
    fwrite(buf, 1, len, stderr);
    if (level >= LogLevel::kWarn) fflush(stderr);
}

void Logger::log(LogLevel level, const char* file, int line, const char* fmt, ...) {
    if (!enabled(level)) return;

    char buf[4096];
    va_list args;
    va_start(args, fmt);
    size_t len = format_message(buf, sizeof(buf), level, file, line, fmt, args);
    va_end(args);
    if (len == 0) return;

    if (!configured()) {
        write_stderr(level, buf, len);
        return;
    }

    std::lock_guard<std::mutex> lk(configure_mu_);
    for (auto& sink : sinks_) {
        sink->write(level, buf, len);
    }
    if (level == LogLevel::kFatal) {
        for (auto& sink : sinks_) sink->flush();
    }
}

void Logger::log_slow(const char* file, int line, const char* fmt, ...) {
    char buf[4096];
    va_list args;
    va_start(args, fmt);
    size_t len = format_message(buf, sizeof(buf), LogLevel::kWarn, file, line, fmt, args);
    va_end(args);
    if (len == 0) return;

    if (!configured()) {
        write_stderr(LogLevel::kWarn, buf, len);
        return;
    }

    std::lock_guard<std::mutex> lk(configure_mu_);
    if (slow_sink_) slow_sink_->write(LogLevel::kWarn, buf, len);
    for (auto& sink : sinks_) {
        sink->write(LogLevel::kWarn, buf, len);
    }
}

void Logger::flush_all() {
    std::lock_guard<std::mutex> lk(configure_mu_);
    for (auto& sink : sinks_) sink->flush();
    if (slow_sink_) slow_sink_->flush();
}

} // namespace sip_subscription

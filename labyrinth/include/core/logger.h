/**
 * @file logger.h
 * @brief 日志基础设施：级别、输出端、按通道命名的记录器
 *
 * 一条日志的格式：
 *   [2024-01-01 12:00:00.123] [INFO ] [pipeline] [pipeline.h:210] message
 * 位置字段只在 DEBUG 及以下级别打开。
 */

#ifndef LABYRINTH_CORE_LOGGER_H
#define LABYRINTH_CORE_LOGGER_H

#include <string>
#include <fstream>
#include <iostream>
#include <sstream>
#include <ctime>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <memory>
#include <vector>
#include <algorithm>
#include <cctype>
#include <cstring>

namespace labyrinth {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6
};

/// 固定 5 字符宽，日志列对齐
inline const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   break;
    }
    return "-----";
}

/**
 * @brief 配置文件中的级别名 -> LogLevel，不认识的名字返回 false
 */
inline bool level_from_string(const std::string &name, LogLevel &out) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static const std::pair<const char*, LogLevel> names[] = {
        {"trace", LogLevel::TRACE}, {"debug", LogLevel::DEBUG},
        {"info", LogLevel::INFO},   {"warn", LogLevel::WARN},
        {"warning", LogLevel::WARN}, {"error", LogLevel::ERROR},
        {"fatal", LogLevel::FATAL}, {"off", LogLevel::OFF},
    };
    for (const auto &n : names) {
        if (s == n.first) {
            out = n.second;
            return true;
        }
    }
    return false;
}

//==============================================================================
// 输出端
//==============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(LogLevel level, const std::string &line) = 0;
    virtual void flush() = 0;
};

/**
 * @brief 终端输出；WARN 及以上写 stderr 并着色
 */
class ConsoleSink : public LogSink {
private:
    std::mutex mutex_;
    bool color_;

    static const char* color_of(LogLevel level) {
        if (level >= LogLevel::ERROR) return "\033[31m";
        if (level == LogLevel::WARN) return "\033[33m";
        if (level <= LogLevel::DEBUG) return "\033[90m";
        return "";
    }

public:
    explicit ConsoleSink(bool color) : color_(color) {}

    void write(LogLevel level, const std::string &line) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream &out = level >= LogLevel::WARN ? std::cerr : std::cout;
        const char *color = color_ ? color_of(level) : "";
        if (*color) {
            out << color << line << "\033[0m\n";
        } else {
            out << line << '\n';
        }
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout.flush();
        std::cerr.flush();
    }
};

/**
 * @brief 追加写入的日志文件，每行落盘
 */
class FileSink : public LogSink {
private:
    std::mutex mutex_;
    std::ofstream file_;

public:
    explicit FileSink(const std::string &path) : file_(path, std::ios::app) {}

    bool is_open() const { return file_.is_open(); }

    void write(LogLevel, const std::string &line) override {
        std::lock_guard<std::mutex> lock(mutex_);
        file_ << line << '\n';
        file_.flush();
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        file_.flush();
    }
};

//==============================================================================
// 记录器
//==============================================================================

/**
 * @brief 一个日志通道
 *
 * 没有 sink 时只做级别判断，消息被丢弃。
 */
class Logger {
private:
    std::string channel_;
    LogLevel level_ = LogLevel::INFO;
    bool with_location_ = false;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::mutex mutex_;

    static std::string now_string() {
        auto now = std::chrono::system_clock::now();
        std::time_t secs = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        std::tm local{};
        localtime_r(&secs, &local);
        std::ostringstream oss;
        oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << ms;
        return oss.str();
    }

public:
    explicit Logger(std::string channel) : channel_(std::move(channel)) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    const std::string& channel() const { return channel_; }
    LogLevel level() const { return level_; }
    bool enabled(LogLevel level) const { return level_ != LogLevel::OFF && level >= level_; }

    /**
     * @brief 重新配置：替换全部 sink
     *
     * @param file 日志文件路径，空表示不写文件
     * @return 文件打不开时返回 false，其余设置照常生效
     */
    bool configure(LogLevel level, bool console, const std::string &file) {
        std::vector<std::shared_ptr<LogSink>> sinks;
        if (console) {
            sinks.push_back(std::make_shared<ConsoleSink>(true));
        }
        bool file_ok = true;
        if (!file.empty()) {
            auto sink = std::make_shared<FileSink>(file);
            file_ok = sink->is_open();
            if (file_ok) sinks.push_back(sink);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
        with_location_ = level <= LogLevel::DEBUG;
        sinks_.swap(sinks);
        return file_ok;
    }

    void flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &sink : sinks_) sink->flush();
    }

    void log(LogLevel level, const char *file, int line, const std::string &message) {
        if (!enabled(level)) return;

        std::ostringstream oss;
        oss << '[' << now_string() << "] [" << level_tag(level) << "] [" << channel_ << "] ";
        if (with_location_ && file) {
            const char *base = std::strrchr(file, '/');
            oss << '[' << (base ? base + 1 : file) << ':' << line << "] ";
        }
        oss << message;

        std::string text = oss.str();
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &sink : sinks_) sink->write(level, text);
    }
};

/**
 * @brief 流式构建一条日志，析构时提交
 */
class LogStream {
private:
    Logger &logger_;
    LogLevel level_;
    const char *file_;
    int line_;
    std::ostringstream buf_;

public:
    LogStream(Logger &logger, LogLevel level, const char *file, int line)
        : logger_(logger), level_(level), file_(file), line_(line) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    ~LogStream() {
        if (logger_.enabled(level_)) {
            logger_.log(level_, file_, line_, buf_.str());
        }
    }

    template<typename T>
    LogStream& operator<<(const T &value) {
        if (logger_.enabled(level_)) buf_ << value;
        return *this;
    }
};

} // namespace labyrinth

#define LOGGER_TRACE(logger) labyrinth::LogStream(logger, labyrinth::LogLevel::TRACE, __FILE__, __LINE__)
#define LOGGER_DEBUG(logger) labyrinth::LogStream(logger, labyrinth::LogLevel::DEBUG, __FILE__, __LINE__)
#define LOGGER_INFO(logger)  labyrinth::LogStream(logger, labyrinth::LogLevel::INFO,  __FILE__, __LINE__)
#define LOGGER_WARN(logger)  labyrinth::LogStream(logger, labyrinth::LogLevel::WARN,  __FILE__, __LINE__)
#define LOGGER_ERROR(logger) labyrinth::LogStream(logger, labyrinth::LogLevel::ERROR, __FILE__, __LINE__)

#endif // LABYRINTH_CORE_LOGGER_H

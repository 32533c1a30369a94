/**
 * @file error.h
 * @brief 错误码、Error 与 Result<T>
 *
 * 错误按百位分段：
 *   1xx 文件   2xx 配置   3xx 迷宫与方向   4xx 会话状态
 *   5xx 提交   6xx 沙箱   7xx 安全         9xx 系统
 *
 * 面向用户的状态只暴露错误码和 message；file/line 只进日志。
 */

#ifndef LABYRINTH_CORE_ERROR_H
#define LABYRINTH_CORE_ERROR_H

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>
#include <ostream>

namespace labyrinth {

enum class ErrorCode {
    OK = 0,

    FILE_NOT_FOUND = 100,
    FILE_READ_ERROR = 101,
    FILE_WRITE_ERROR = 102,

    CONFIG_PARSE_ERROR = 200,
    CONFIG_MISSING_KEY = 201,
    CONFIG_INVALID_VALUE = 202,

    MAZE_STRUCTURE_ERROR = 300,
    MAZE_NO_START = 301,
    MAZE_NO_EXIT = 302,
    MAZE_DUPLICATE_MARKER = 303,
    MAZE_NOT_FOUND = 304,
    INVALID_DIRECTION = 305,

    SESSION_NOT_ACTIVE = 400,
    SESSION_NOT_FOUND = 401,
    PROTOCOL_ERROR = 402,
    INVALID_TRANSITION = 403,

    ARTIFACT_INVALID = 500,
    QUEUE_FULL = 501,
    RATE_LIMITED = 502,
    SUBMISSION_NOT_FOUND = 503,
    PIPELINE_STOPPED = 504,
    PERSISTENCE_FAILED = 505,

    SANDBOX_SETUP_FAILED = 600,
    CGROUP_ERROR = 601,
    SECCOMP_ERROR = 602,

    SESSION_TOKEN_MISMATCH = 701,

    SYSTEM_ERROR = 900,
    FORK_FAILED = 901,
    PIPE_FAILED = 903
};

/// 协议 error 行和日志中使用的名字
inline const char* error_code_str(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                     return "OK";
        case ErrorCode::FILE_NOT_FOUND:         return "FILE_NOT_FOUND";
        case ErrorCode::FILE_READ_ERROR:        return "FILE_READ_ERROR";
        case ErrorCode::FILE_WRITE_ERROR:       return "FILE_WRITE_ERROR";
        case ErrorCode::CONFIG_PARSE_ERROR:     return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_MISSING_KEY:     return "CONFIG_MISSING_KEY";
        case ErrorCode::CONFIG_INVALID_VALUE:   return "CONFIG_INVALID_VALUE";
        case ErrorCode::MAZE_STRUCTURE_ERROR:   return "MAZE_STRUCTURE_ERROR";
        case ErrorCode::MAZE_NO_START:          return "MAZE_NO_START";
        case ErrorCode::MAZE_NO_EXIT:           return "MAZE_NO_EXIT";
        case ErrorCode::MAZE_DUPLICATE_MARKER:  return "MAZE_DUPLICATE_MARKER";
        case ErrorCode::MAZE_NOT_FOUND:         return "MAZE_NOT_FOUND";
        case ErrorCode::INVALID_DIRECTION:      return "INVALID_DIRECTION";
        case ErrorCode::SESSION_NOT_ACTIVE:     return "SESSION_NOT_ACTIVE";
        case ErrorCode::SESSION_NOT_FOUND:      return "SESSION_NOT_FOUND";
        case ErrorCode::PROTOCOL_ERROR:         return "PROTOCOL_ERROR";
        case ErrorCode::INVALID_TRANSITION:     return "INVALID_TRANSITION";
        case ErrorCode::ARTIFACT_INVALID:       return "ARTIFACT_INVALID";
        case ErrorCode::QUEUE_FULL:             return "QUEUE_FULL";
        case ErrorCode::RATE_LIMITED:           return "RATE_LIMITED";
        case ErrorCode::SUBMISSION_NOT_FOUND:   return "SUBMISSION_NOT_FOUND";
        case ErrorCode::PIPELINE_STOPPED:       return "PIPELINE_STOPPED";
        case ErrorCode::PERSISTENCE_FAILED:     return "PERSISTENCE_FAILED";
        case ErrorCode::SANDBOX_SETUP_FAILED:   return "SANDBOX_SETUP_FAILED";
        case ErrorCode::CGROUP_ERROR:           return "CGROUP_ERROR";
        case ErrorCode::SECCOMP_ERROR:          return "SECCOMP_ERROR";
        case ErrorCode::SESSION_TOKEN_MISMATCH: return "SESSION_TOKEN_MISMATCH";
        case ErrorCode::SYSTEM_ERROR:           return "SYSTEM_ERROR";
        case ErrorCode::FORK_FAILED:            return "FORK_FAILED";
        case ErrorCode::PIPE_FAILED:            return "PIPE_FAILED";
    }
    return "UNKNOWN_ERROR";
}

inline std::ostream& operator<<(std::ostream &os, ErrorCode code) {
    return os << error_code_str(code);
}

/**
 * @brief 基础设施类故障，可以退避后重试
 */
inline bool is_transient(ErrorCode code) {
    switch (code) {
        case ErrorCode::PERSISTENCE_FAILED:
        case ErrorCode::FILE_WRITE_ERROR:
            return true;
        default:
            return false;
    }
}

//==============================================================================
// Error
//==============================================================================

class Error {
private:
    ErrorCode code_ = ErrorCode::OK;
    std::string message_;
    std::string context_;
    const char *file_ = nullptr;
    int line_ = 0;

public:
    Error() = default;

    Error(ErrorCode code, std::string message, const char *file = nullptr, int line = 0)
        : code_(code), message_(std::move(message)), file_(file), line_(line) {}

    Error(ErrorCode code) : code_(code) {}

    /// 附加上下文，例如出错的文件路径
    Error& with_context(const std::string &ctx) {
        context_ = ctx;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string to_string() const {
        std::string s = std::string("[") + error_code_str(code_) + "]";
        if (!message_.empty()) s += " " + message_;
        if (!context_.empty()) s += " (" + context_ + ")";
        if (file_ && line_ > 0) {
            s += std::string(" at ") + file_ + ":" + std::to_string(line_);
        }
        return s;
    }
};

//==============================================================================
// Result
//==============================================================================

/**
 * @brief 值或错误
 *
 *   auto maze = Maze::load(text);
 *   if (!maze.ok()) return maze.error();
 */
template<typename T>
class Result {
private:
    std::variant<T, Error> data_;

public:
    Result(const T &value) : data_(value) {}
    Result(T &&value) : data_(std::move(value)) {}
    Result(Error err) : data_(std::move(err)) {}
    Result(ErrorCode code) : data_(Error(code)) {}

    bool ok() const { return data_.index() == 0; }

    T& value() & { return std::get<0>(data_); }
    const T& value() const & { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    Error& error() & { return std::get<1>(data_); }
    const Error& error() const & { return std::get<1>(data_); }

    /// 出错时抛 runtime_error，只在 main 这样的顶层使用
    T& unwrap() & {
        if (!ok()) throw std::runtime_error(error().to_string());
        return value();
    }

    T unwrap() && {
        if (!ok()) throw std::runtime_error(error().to_string());
        return std::get<0>(std::move(data_));
    }
};

template<>
class Result<void> {
private:
    std::optional<Error> error_;

public:
    Result() = default;
    Result(Error err) : error_(std::move(err)) {}
    Result(ErrorCode code) : error_(Error(code)) {}

    bool ok() const { return !error_; }

    Error& error() { return *error_; }
    const Error& error() const { return *error_; }
};

inline Result<void> Ok() {
    return Result<void>();
}

//==============================================================================
// 传播宏
//==============================================================================

#define LABYRINTH_ERROR(code, msg) \
    labyrinth::Error(code, msg, __FILE__, __LINE__)

/// expr 出错时原样返回
#define LABYRINTH_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (!_result.ok()) return _result.error(); \
    } while (0)

/// expr 出错时返回错误，否则把值移入新变量 var
#define LABYRINTH_TRY_UNWRAP(var, expr) \
    auto _tmp_##var = (expr); \
    if (!_tmp_##var.ok()) return _tmp_##var.error(); \
    auto var = std::move(_tmp_##var.value())

#define LABYRINTH_ENSURE(cond, code, msg) \
    do { \
        if (!(cond)) return LABYRINTH_ERROR(code, msg); \
    } while (0)

} // namespace labyrinth

#endif // LABYRINTH_CORE_ERROR_H

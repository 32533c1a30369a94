/**
 * @file utils.h
 * @brief 工具函数
 *
 * - 文件读取与预览
 * - 随机标识符（会话 token、提交 id）
 * - 字符串处理
 * - 时间戳
 */

#ifndef LABYRINTH_CORE_UTILS_H
#define LABYRINTH_CORE_UTILS_H

#include "error.h"

#include <string>
#include <vector>
#include <sstream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <cstdio>
#include <cstdlib>
#include <climits>
#include <cstdint>
#include <cstring>
#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

namespace labyrinth {

//==============================================================================
// 文件操作
//==============================================================================

inline std::string get_realpath(const std::string &path) {
    char real[PATH_MAX + 1];
    if (realpath(path.c_str(), real) == NULL) {
        return "";
    }
    return real;
}

inline bool file_exists(const std::string &path) {
    return access(path.c_str(), F_OK) == 0;
}

inline Result<std::string> read_text_file(const std::string &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        return LABYRINTH_ERROR(ErrorCode::FILE_NOT_FOUND, "cannot open " + path);
    }
    std::ostringstream oss;
    oss << f.rdbuf();
    if (f.bad()) {
        return LABYRINTH_ERROR(ErrorCode::FILE_READ_ERROR, "cannot read " + path);
    }
    return oss.str();
}

/**
 * @brief 预览文件内容
 *
 * 最多取 len 字节，截断点回退到 UTF-8 字符边界，超长时追加 "..."。
 * 文件不存在时返回空串。
 */
inline std::string file_preview(const std::string &name, size_t len = 1024) {
    std::ifstream f(name, std::ios::binary);
    if (!f) {
        return "";
    }
    std::string buf(len + 1, '\0');
    f.read(&buf[0], static_cast<std::streamsize>(len + 1));
    buf.resize(static_cast<size_t>(f.gcount()));

    if (buf.size() <= len) {
        return buf;
    }
    size_t cut = len;
    while (cut > 0 && (static_cast<unsigned char>(buf[cut]) & 0xC0) == 0x80) {
        cut--;
    }
    buf.resize(cut);
    return buf + "...";
}

//==============================================================================
// 随机标识符
//==============================================================================

/**
 * @brief 从 /dev/urandom 读取 bytes 字节并转成十六进制
 */
inline Result<std::string> random_hex(size_t bytes) {
    int fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return LABYRINTH_ERROR(ErrorCode::SYSTEM_ERROR, "cannot open /dev/urandom");
    }
    std::vector<unsigned char> raw(bytes);
    size_t got = 0;
    while (got < bytes) {
        ssize_t n = read(fd, raw.data() + got, bytes - got);
        if (n <= 0) {
            close(fd);
            return LABYRINTH_ERROR(ErrorCode::SYSTEM_ERROR, "short read from /dev/urandom");
        }
        got += static_cast<size_t>(n);
    }
    close(fd);

    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes * 2);
    for (unsigned char c : raw) {
        out += digits[c >> 4];
        out += digits[c & 0x0F];
    }
    return out;
}

//==============================================================================
// 字符串处理
//==============================================================================

inline std::string trim(const std::string &s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

/**
 * @brief 按空白切分，连续空白视为一个分隔符
 */
inline std::vector<std::string> split_ws(const std::string &s) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string tok;
    while (iss >> tok) {
        parts.push_back(tok);
    }
    return parts;
}

/**
 * @brief 整串都是十进制整数时才返回 true
 */
inline bool parse_int(const std::string &s, int64_t &out) {
    if (s.empty()) return false;
    errno = 0;
    char *end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    out = static_cast<int64_t>(v);
    return true;
}

inline bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

template <class T>
inline std::string to_string(const T &v) {
    std::ostringstream sout;
    sout << v;
    return sout.str();
}

//==============================================================================
// 时间
//==============================================================================

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline int64_t to_unix_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

inline TimePoint from_unix_ms(int64_t ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

/**
 * @brief UTC ISO-8601，精确到毫秒
 */
inline std::string format_time(TimePoint tp) {
    auto t = Clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

} // namespace labyrinth

#endif // LABYRINTH_CORE_UTILS_H

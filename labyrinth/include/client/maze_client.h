/**
 * @file maze_client.h
 * @brief 沙箱内程序使用的会话客户端
 *
 * 通过继承来的会话通道（默认 fd 3）与会话引擎通信。
 * 只使用 read / write，不创建任何 socket。
 *
 * 用法：
 *   auto client = MazeClient::from_env();
 *   client.value().start();
 *   auto view = client.value().look();
 *   auto step = client.value().move(Direction::East);
 */

#ifndef LABYRINTH_CLIENT_MAZE_CLIENT_H
#define LABYRINTH_CLIENT_MAZE_CLIENT_H

#include <string>
#include <cstdlib>
#include <cerrno>

#include <unistd.h>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "maze/protocol.h"

namespace labyrinth {

class MazeClient {
private:
    int fd_;
    std::string token_;
    std::string buffer_;
    std::string session_id_;
    Position position_;
    int turns_ = 0;
    bool completed_ = false;

    Result<void> send_line(const std::string &line) {
        std::string data = line + "\n";
        size_t off = 0;
        while (off < data.size()) {
            ssize_t n = ::write(fd_, data.data() + off, data.size() - off);
            if (n < 0) {
                if (errno == EINTR) continue;
                return LABYRINTH_ERROR(ErrorCode::PIPE_FAILED, "session channel write failed");
            }
            off += static_cast<size_t>(n);
        }
        return Ok();
    }

    Result<std::string> recv_line() {
        while (true) {
            size_t nl = buffer_.find('\n');
            if (nl != std::string::npos) {
                std::string line = buffer_.substr(0, nl);
                buffer_.erase(0, nl + 1);
                return line;
            }
            char chunk[512];
            ssize_t n = ::read(fd_, chunk, sizeof(chunk));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                return LABYRINTH_ERROR(ErrorCode::PIPE_FAILED, "session channel closed");
            }
            buffer_.append(chunk, static_cast<size_t>(n));
        }
    }

    Result<std::string> request(const std::string &line) {
        LABYRINTH_TRY(send_line(line));
        return recv_line();
    }

public:
    MazeClient(int fd, std::string token) : fd_(fd), token_(std::move(token)) {}

    /**
     * @brief 从 LABYRINTH_SESSION_FD / LABYRINTH_SESSION_TOKEN 构造
     */
    static Result<MazeClient> from_env() {
        const char *token = std::getenv(protocol::ENV_SESSION_TOKEN);
        if (!token || !*token) {
            return LABYRINTH_ERROR(ErrorCode::CONFIG_MISSING_KEY,
                std::string(protocol::ENV_SESSION_TOKEN) + " is not set");
        }
        int fd = protocol::SESSION_FD;
        const char *fd_env = std::getenv(protocol::ENV_SESSION_FD);
        int64_t parsed = 0;
        if (fd_env && parse_int(fd_env, parsed)) {
            fd = static_cast<int>(parsed);
        }
        return MazeClient(fd, token);
    }

    Result<SessionTicket> start() {
        LABYRINTH_TRY_UNWRAP(line, request(std::string("START ") + token_));
        auto ticket = protocol::decode_session(line);
        if (ticket.ok()) {
            session_id_ = ticket.value().session_id;
            position_ = ticket.value().position;
            turns_ = ticket.value().turns;
        }
        return ticket;
    }

    Result<Surroundings> look() {
        LABYRINTH_TRY_UNWRAP(line, request(std::string("LOOK ") + token_));
        return protocol::decode_look(line);
    }

    Result<MoveResult> move(Direction dir) {
        LABYRINTH_TRY_UNWRAP(line, request(std::string("MOVE ") + token_ + " " + to_string(dir)));
        auto result = protocol::decode_move(line);
        if (result.ok()) {
            position_ = result.value().position;
            turns_ = result.value().turns;
            if (result.value().status == MoveStatus::Completed) {
                completed_ = true;
            }
        }
        return result;
    }

    const std::string& session_id() const { return session_id_; }
    const Position& position() const { return position_; }
    int turns() const { return turns_; }
    bool completed() const { return completed_; }
};

} // namespace labyrinth

#endif // LABYRINTH_CLIENT_MAZE_CLIENT_H

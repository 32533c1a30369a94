/**
 * @file session_registry.h
 * @brief 会话注册表
 *
 * 创建会话并签发与之绑定的唯一 token，按 (session id, token) 路由 look / move。
 *
 * 两级锁：mutex_ 只保护 map，每个会话另有自己的锁，串行化
 * look / move / abandon / snapshot 与空闲清理。两者从不嵌套持有。
 *
 * 以 in_use 方式创建的会话（流水线正在运行的提交）不参与空闲清理，
 * 直到 release。
 */

#ifndef LABYRINTH_MAZE_SESSION_REGISTRY_H
#define LABYRINTH_MAZE_SESSION_REGISTRY_H

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <chrono>
#include <vector>
#include <utility>

#include "core/error.h"
#include "core/utils.h"
#include "core/labyrinth_logger.h"
#include "maze/session.h"

namespace labyrinth {

/**
 * @brief start 的返回值，token 只在这里出现一次
 */
struct SessionTicket {
    std::string session_id;
    std::string token;
    Position position;
    int turns = 0;
};

/**
 * @brief 会话的只读快照
 */
struct SessionSnapshot {
    std::string session_id;
    std::string user;
    std::string maze_id;
    Position position;
    int turns = 0;
    MudState mud = MudState::None;
    SessionStatus status = SessionStatus::Active;
};

class SessionRegistry {
private:
    struct Entry {
        std::string token;
        std::shared_ptr<Session> session;
        std::shared_ptr<std::mutex> lock;
        bool in_use = false;
    };

    std::map<std::string, Entry> sessions_;
    mutable std::mutex mutex_;

    // 长度不同或任一字节不同都视为不匹配，比较耗时与内容无关
    static bool token_equals(const std::string &a, const std::string &b) {
        if (a.size() != b.size()) return false;
        unsigned char diff = 0;
        for (size_t i = 0; i < a.size(); i++) {
            diff |= static_cast<unsigned char>(a[i] ^ b[i]);
        }
        return diff == 0;
    }

    Result<Entry> find(const std::string &id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return LABYRINTH_ERROR(ErrorCode::SESSION_NOT_FOUND, "unknown session " + id);
        }
        return it->second;
    }

    Result<Entry> authorize(const std::string &id, const std::string &token) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return LABYRINTH_ERROR(ErrorCode::SESSION_NOT_FOUND, "unknown session " + id);
        }
        if (!token_equals(it->second.token, token)) {
            SLOG_WARN << "token mismatch on session " << id;
            return LABYRINTH_ERROR(ErrorCode::SESSION_TOKEN_MISMATCH, "token does not match session");
        }
        return it->second;
    }

    static SessionSnapshot snapshot_of(const Session &s) {
        SessionSnapshot snap;
        snap.session_id = s.id();
        snap.user = s.user();
        snap.maze_id = s.maze_id();
        snap.position = s.position();
        snap.turns = s.turns();
        snap.mud = s.mud_state();
        snap.status = s.status();
        return snap;
    }

public:
    SessionRegistry() = default;
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief 为 user 在 maze 上开一个新会话
     *
     * @param in_use 为 true 时会话由调用方持有，expire_idle 不会动它
     */
    Result<SessionTicket> start(const std::string &user, const std::string &maze_id, MazePtr maze,
                                bool in_use = false) {
        LABYRINTH_ENSURE(maze != nullptr, ErrorCode::MAZE_NOT_FOUND, "no maze for " + maze_id);
        LABYRINTH_TRY_UNWRAP(suffix, random_hex(6));
        LABYRINTH_TRY_UNWRAP(token, random_hex(16));

        SessionTicket ticket;
        ticket.session_id = "sess_" + suffix;
        ticket.token = token;
        ticket.position = maze->start();
        ticket.turns = 0;

        auto session = std::make_shared<Session>(ticket.session_id, user, maze_id, std::move(maze));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            Entry entry;
            entry.token = token;
            entry.session = session;
            entry.lock = std::make_shared<std::mutex>();
            entry.in_use = in_use;
            sessions_[ticket.session_id] = std::move(entry);
        }
        SLOG_INFO << "session " << ticket.session_id << " started by " << user << " on " << maze_id;
        return ticket;
    }

    Result<Surroundings> look(const std::string &id, const std::string &token) const {
        LABYRINTH_TRY_UNWRAP(entry, authorize(id, token));
        std::lock_guard<std::mutex> guard(*entry.lock);
        return entry.session->look();
    }

    Result<MoveResult> move(const std::string &id, const std::string &token, Direction dir) {
        LABYRINTH_TRY_UNWRAP(entry, authorize(id, token));
        Result<MoveResult> result = [&entry, dir] {
            std::lock_guard<std::mutex> guard(*entry.lock);
            return entry.session->move(dir);
        }();
        if (result.ok()) {
            SLOG_TRACE << id << " " << to_string(dir) << " -> " << to_string(result.value().status)
                       << " " << result.value().position << " turns=" << result.value().turns;
            if (result.value().status == MoveStatus::Completed) {
                SLOG_INFO << "session " << id << " completed in " << result.value().turns << " turns";
            }
        }
        return result;
    }

    Result<void> abandon(const std::string &id) {
        LABYRINTH_TRY_UNWRAP(entry, find(id));
        std::lock_guard<std::mutex> guard(*entry.lock);
        return entry.session->abandon();
    }

    Result<SessionSnapshot> snapshot(const std::string &id) const {
        LABYRINTH_TRY_UNWRAP(entry, find(id));
        std::lock_guard<std::mutex> guard(*entry.lock);
        return snapshot_of(*entry.session);
    }

    /**
     * @brief 把空闲超过 max_idle 的 active 会话标记为 abandoned，跳过 in_use 的会话
     * @return 本次标记的数量
     */
    size_t expire_idle(std::chrono::steady_clock::duration max_idle) {
        std::vector<std::pair<std::string, Entry>> candidates;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &kv : sessions_) {
                if (!kv.second.in_use) candidates.push_back(kv);
            }
        }
        auto now = std::chrono::steady_clock::now();
        size_t expired = 0;
        for (auto &c : candidates) {
            std::lock_guard<std::mutex> guard(*c.second.lock);
            Session &session = *c.second.session;
            if (session.is_active() && now - session.last_activity() > max_idle &&
                session.abandon().ok()) {
                SLOG_INFO << "session " << c.first << " abandoned after idle timeout";
                expired++;
            }
        }
        return expired;
    }

    /**
     * @brief 丢弃会话记录；之后该 id 上的任何调用都返回 SESSION_NOT_FOUND
     */
    void release(const std::string &id) {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(id);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }
};

} // namespace labyrinth

#endif // LABYRINTH_MAZE_SESSION_REGISTRY_H

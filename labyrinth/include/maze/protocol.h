/**
 * @file protocol.h
 * @brief 会话通道的行协议
 *
 * 沙箱内程序与会话引擎之间唯一的通道，一行请求对应一行应答：
 *
 *   START <token>            -> session <id> <x> <y> <turns>
 *   LOOK <token>             -> look <n> <s> <e> <w> <current>
 *   MOVE <token> <dir>       -> move <status> <x> <y> <turns>
 *   其他 / 参数错误          -> error <CODE> <message>
 *
 * 格子用网格字符表示（X . # S E）。token 不匹配属于安全违规，
 * 服务端应答后由监督方立即终止运行。
 */

#ifndef LABYRINTH_MAZE_PROTOCOL_H
#define LABYRINTH_MAZE_PROTOCOL_H

#include <string>
#include <vector>
#include <sstream>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "maze/session_registry.h"

namespace labyrinth {
namespace protocol {

/// 单行请求的上限，超过即视为协议错误
constexpr size_t MAX_LINE = 256;

/// 子进程中会话通道所在的 fd
constexpr int SESSION_FD = 3;

constexpr const char* ENV_SESSION_FD = "LABYRINTH_SESSION_FD";
constexpr const char* ENV_SESSION_TOKEN = "LABYRINTH_SESSION_TOKEN";

//==============================================================================
// 编码
//==============================================================================

inline std::string encode_session(const std::string &id, const Position &p, int turns) {
    std::ostringstream oss;
    oss << "session " << id << " " << p.x << " " << p.y << " " << turns;
    return oss.str();
}

inline std::string encode_look(const Surroundings &s) {
    std::string out = "look";
    for (CellKind k : {s.north, s.south, s.east, s.west, s.current}) {
        out += ' ';
        out += cell_char(k);
    }
    return out;
}

inline std::string encode_move(const MoveResult &m) {
    std::ostringstream oss;
    oss << "move " << to_string(m.status) << " " << m.position.x << " "
        << m.position.y << " " << m.turns;
    return oss.str();
}

/**
 * @brief 错误应答；message 中的换行替换为空格，保证一行
 */
inline std::string encode_error(ErrorCode code, const std::string &message) {
    std::string msg = message;
    for (char &c : msg) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    return std::string("error ") + error_code_str(code) + " " + msg;
}

//==============================================================================
// 服务端
//==============================================================================

struct Reply {
    std::string line;
    bool violation = false;   ///< true 时监督方应立即终止沙箱
};

/**
 * @brief 绑定到一个会话的请求处理器
 *
 * 只认识创建时绑定的会话；不提供开新会话或访问其他会话的能力。
 */
class SessionEndpoint {
private:
    SessionRegistry &registry_;
    std::string session_id_;
    std::string token_;
    size_t requests_ = 0;

    Reply fail(ErrorCode code, const std::string &message) {
        Reply r;
        r.line = encode_error(code, message);
        r.violation = (code == ErrorCode::SESSION_TOKEN_MISMATCH);
        return r;
    }

public:
    SessionEndpoint(SessionRegistry &registry, std::string session_id, std::string token)
        : registry_(registry), session_id_(std::move(session_id)), token_(std::move(token)) {}

    Reply handle(const std::string &raw) {
        requests_++;
        if (raw.size() > MAX_LINE) {
            return fail(ErrorCode::PROTOCOL_ERROR, "request too long");
        }
        auto parts = split_ws(raw);
        if (parts.empty()) {
            return fail(ErrorCode::PROTOCOL_ERROR, "empty request");
        }
        const std::string &verb = parts[0];
        if (verb != "START" && verb != "LOOK" && verb != "MOVE") {
            return fail(ErrorCode::PROTOCOL_ERROR, "unknown verb " + verb);
        }
        if (parts.size() < 2) {
            return fail(ErrorCode::PROTOCOL_ERROR, verb + " requires a token");
        }
        // token 校验在参数校验之前：错 token 的任何请求都是违规
        if (parts[1] != token_) {
            return fail(ErrorCode::SESSION_TOKEN_MISMATCH, "token does not match session");
        }

        Reply reply;
        if (verb == "START") {
            if (parts.size() != 2) return fail(ErrorCode::PROTOCOL_ERROR, "usage: START <token>");
            auto snap = registry_.snapshot(session_id_);
            if (!snap.ok()) return fail(snap.error().code(), snap.error().message());
            reply.line = encode_session(session_id_, snap.value().position, snap.value().turns);
        } else if (verb == "LOOK") {
            if (parts.size() != 2) return fail(ErrorCode::PROTOCOL_ERROR, "usage: LOOK <token>");
            auto look = registry_.look(session_id_, parts[1]);
            if (!look.ok()) return fail(look.error().code(), look.error().message());
            reply.line = encode_look(look.value());
        } else {
            if (parts.size() != 3) return fail(ErrorCode::PROTOCOL_ERROR, "usage: MOVE <token> <dir>");
            Direction dir;
            if (!parse_direction(parts[2], dir)) {
                return fail(ErrorCode::INVALID_DIRECTION, "invalid direction " + parts[2]);
            }
            auto moved = registry_.move(session_id_, parts[1], dir);
            if (!moved.ok()) return fail(moved.error().code(), moved.error().message());
            reply.line = encode_move(moved.value());
        }
        return reply;
    }

    const std::string& session_id() const { return session_id_; }
    size_t requests() const { return requests_; }
};

//==============================================================================
// 客户端解码
//==============================================================================

inline bool parse_cell_token(const std::string &tok, CellKind &out) {
    return tok.size() == 1 && parse_cell(tok[0], out);
}

/**
 * @brief 应答是 "error ..." 时转成对应的 Error
 */
inline Error decode_error(const std::string &line) {
    auto parts = split_ws(line);
    std::string code = parts.size() > 1 ? parts[1] : "UNKNOWN_ERROR";
    std::string message;
    size_t pos = line.find(code);
    if (pos != std::string::npos) {
        message = trim(line.substr(pos + code.size()));
    }
    ErrorCode ec = ErrorCode::PROTOCOL_ERROR;
    if (code == "SESSION_NOT_ACTIVE") ec = ErrorCode::SESSION_NOT_ACTIVE;
    else if (code == "INVALID_DIRECTION") ec = ErrorCode::INVALID_DIRECTION;
    else if (code == "SESSION_TOKEN_MISMATCH") ec = ErrorCode::SESSION_TOKEN_MISMATCH;
    else if (code == "SESSION_NOT_FOUND") ec = ErrorCode::SESSION_NOT_FOUND;
    return Error(ec, code + ": " + message);
}

inline Result<SessionTicket> decode_session(const std::string &line) {
    auto p = split_ws(line);
    if (!p.empty() && p[0] == "error") return decode_error(line);
    int64_t x = 0, y = 0, t = 0;
    if (p.size() != 5 || p[0] != "session" ||
        !parse_int(p[2], x) || !parse_int(p[3], y) || !parse_int(p[4], t)) {
        return LABYRINTH_ERROR(ErrorCode::PROTOCOL_ERROR, "bad session reply: " + line);
    }
    SessionTicket ticket;
    ticket.session_id = p[1];
    ticket.position = Position(static_cast<int>(x), static_cast<int>(y));
    ticket.turns = static_cast<int>(t);
    return ticket;
}

inline Result<Surroundings> decode_look(const std::string &line) {
    auto p = split_ws(line);
    if (!p.empty() && p[0] == "error") return decode_error(line);
    Surroundings s;
    if (p.size() != 6 || p[0] != "look" ||
        !parse_cell_token(p[1], s.north) || !parse_cell_token(p[2], s.south) ||
        !parse_cell_token(p[3], s.east) || !parse_cell_token(p[4], s.west) ||
        !parse_cell_token(p[5], s.current)) {
        return LABYRINTH_ERROR(ErrorCode::PROTOCOL_ERROR, "bad look reply: " + line);
    }
    return s;
}

inline Result<MoveResult> decode_move(const std::string &line) {
    auto p = split_ws(line);
    if (!p.empty() && p[0] == "error") return decode_error(line);
    MoveResult m;
    int64_t x = 0, y = 0, t = 0;
    if (p.size() != 5 || p[0] != "move" || !parse_move_status(p[1], m.status) ||
        !parse_int(p[2], x) || !parse_int(p[3], y) || !parse_int(p[4], t)) {
        return LABYRINTH_ERROR(ErrorCode::PROTOCOL_ERROR, "bad move reply: " + line);
    }
    m.position = Position(static_cast<int>(x), static_cast<int>(y));
    m.turns = static_cast<int>(t);
    return m;
}

} // namespace protocol
} // namespace labyrinth

#endif // LABYRINTH_MAZE_PROTOCOL_H

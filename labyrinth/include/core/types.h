/**
 * @file types.h
 * @brief 核心数据结构定义
 *
 * 平台各处共用的封闭枚举与坐标：
 * - CellKind / Direction / Position：迷宫
 * - MudState / SessionStatus / MoveStatus：会话
 * - SubmissionStatus / FailureKind：提交
 *
 * 所有枚举都提供 to_string 与 parse_xxx；parse 对未知取值返回 false，
 * 边界上不做任何猜测或强制转换。
 */

#ifndef LABYRINTH_CORE_TYPES_H
#define LABYRINTH_CORE_TYPES_H

#include <string>
#include <ostream>

namespace labyrinth {

//==============================================================================
// 迷宫
//==============================================================================

enum class CellKind {
    Wall,
    Open,
    Mud,
    Start,
    Exit
};

/**
 * @brief 格子在网格文本中的字符
 */
inline char cell_char(CellKind kind) {
    switch (kind) {
        case CellKind::Wall:  return 'X';
        case CellKind::Open:  return '.';
        case CellKind::Mud:   return '#';
        case CellKind::Start: return 'S';
        case CellKind::Exit:  return 'E';
    }
    return 'X';
}

inline bool parse_cell(char c, CellKind &out) {
    switch (c) {
        case 'X': out = CellKind::Wall;  return true;
        case '.': out = CellKind::Open;  return true;
        case '#': out = CellKind::Mud;   return true;
        case 'S': out = CellKind::Start; return true;
        case 'E': out = CellKind::Exit;  return true;
        default:  return false;
    }
}

inline const char* to_string(CellKind kind) {
    switch (kind) {
        case CellKind::Wall:  return "wall";
        case CellKind::Open:  return "open";
        case CellKind::Mud:   return "mud";
        case CellKind::Start: return "start";
        case CellKind::Exit:  return "exit";
    }
    return "wall";
}

enum class Direction {
    North,
    South,
    East,
    West
};

inline const char* to_string(Direction dir) {
    switch (dir) {
        case Direction::North: return "north";
        case Direction::South: return "south";
        case Direction::East:  return "east";
        case Direction::West:  return "west";
    }
    return "north";
}

/**
 * @brief 接受全称或首字母（north / n / N）
 */
inline bool parse_direction(const std::string &s, Direction &out) {
    if (s == "north" || s == "n" || s == "N") { out = Direction::North; return true; }
    if (s == "south" || s == "s" || s == "S") { out = Direction::South; return true; }
    if (s == "east"  || s == "e" || s == "E") { out = Direction::East;  return true; }
    if (s == "west"  || s == "w" || s == "W") { out = Direction::West;  return true; }
    return false;
}

struct Position {
    int x;
    int y;

    Position() : x(0), y(0) {}
    Position(int _x, int _y) : x(_x), y(_y) {}

    /**
     * @brief 向 dir 走一步后的坐标（y 轴向下）
     */
    Position step(Direction dir) const {
        switch (dir) {
            case Direction::North: return Position(x, y - 1);
            case Direction::South: return Position(x, y + 1);
            case Direction::East:  return Position(x + 1, y);
            case Direction::West:  return Position(x - 1, y);
        }
        return *this;
    }

    bool operator==(const Position &o) const { return x == o.x && y == o.y; }
    bool operator!=(const Position &o) const { return !(*this == o); }
};

inline std::ostream& operator<<(std::ostream &os, const Position &p) {
    return os << "(" << p.x << "," << p.y << ")";
}

enum class Difficulty {
    Tutorial,
    Intermediate,
    Challenge
};

inline const char* to_string(Difficulty d) {
    switch (d) {
        case Difficulty::Tutorial:     return "tutorial";
        case Difficulty::Intermediate: return "intermediate";
        case Difficulty::Challenge:    return "challenge";
    }
    return "tutorial";
}

//==============================================================================
// 会话
//==============================================================================

/**
 * @brief 泥地状态
 *
 * none -> entered（踏入泥地）-> stuck（下一次尝试开始时）-> none（耗掉一回合）
 */
enum class MudState {
    None,
    Entered,
    Stuck
};

inline const char* to_string(MudState m) {
    switch (m) {
        case MudState::None:    return "none";
        case MudState::Entered: return "entered";
        case MudState::Stuck:   return "stuck";
    }
    return "none";
}

enum class SessionStatus {
    Active,
    Completed,
    Abandoned
};

inline const char* to_string(SessionStatus s) {
    switch (s) {
        case SessionStatus::Active:    return "active";
        case SessionStatus::Completed: return "completed";
        case SessionStatus::Abandoned: return "abandoned";
    }
    return "active";
}

enum class MoveStatus {
    Moved,
    Blocked,
    Mud,
    Stuck,
    Completed
};

inline const char* to_string(MoveStatus s) {
    switch (s) {
        case MoveStatus::Moved:     return "moved";
        case MoveStatus::Blocked:   return "blocked";
        case MoveStatus::Mud:       return "mud";
        case MoveStatus::Stuck:     return "stuck";
        case MoveStatus::Completed: return "completed";
    }
    return "moved";
}

inline bool parse_move_status(const std::string &s, MoveStatus &out) {
    if (s == "moved")     { out = MoveStatus::Moved;     return true; }
    if (s == "blocked")   { out = MoveStatus::Blocked;   return true; }
    if (s == "mud")       { out = MoveStatus::Mud;       return true; }
    if (s == "stuck")     { out = MoveStatus::Stuck;     return true; }
    if (s == "completed") { out = MoveStatus::Completed; return true; }
    return false;
}

//==============================================================================
// 提交
//==============================================================================

enum class SubmissionStatus {
    Pending = 0,
    Running = 1,
    Completed = 2,
    Failed = 3,
    Timeout = 4
};

inline const char* to_string(SubmissionStatus s) {
    switch (s) {
        case SubmissionStatus::Pending:   return "pending";
        case SubmissionStatus::Running:   return "running";
        case SubmissionStatus::Completed: return "completed";
        case SubmissionStatus::Failed:    return "failed";
        case SubmissionStatus::Timeout:   return "timeout";
    }
    return "pending";
}

inline bool parse_submission_status(const std::string &s, SubmissionStatus &out) {
    if (s == "pending")   { out = SubmissionStatus::Pending;   return true; }
    if (s == "running")   { out = SubmissionStatus::Running;   return true; }
    if (s == "completed") { out = SubmissionStatus::Completed; return true; }
    if (s == "failed")    { out = SubmissionStatus::Failed;    return true; }
    if (s == "timeout")   { out = SubmissionStatus::Timeout;   return true; }
    return false;
}

inline bool is_terminal(SubmissionStatus s) {
    return s == SubmissionStatus::Completed ||
           s == SubmissionStatus::Failed ||
           s == SubmissionStatus::Timeout;
}

/**
 * @brief failed 的细分原因，对用户可见
 */
enum class FailureKind {
    None,
    MazeNotSolved,
    Crashed,
    ResourceExceeded,
    SecurityViolation,
    Internal
};

inline const char* to_string(FailureKind k) {
    switch (k) {
        case FailureKind::None:              return "none";
        case FailureKind::MazeNotSolved:     return "maze_not_solved";
        case FailureKind::Crashed:           return "crashed";
        case FailureKind::ResourceExceeded:  return "resource_exceeded";
        case FailureKind::SecurityViolation: return "security_violation";
        case FailureKind::Internal:          return "internal";
    }
    return "none";
}

inline bool parse_failure_kind(const std::string &s, FailureKind &out) {
    if (s == "none")               { out = FailureKind::None;              return true; }
    if (s == "maze_not_solved")    { out = FailureKind::MazeNotSolved;     return true; }
    if (s == "crashed")            { out = FailureKind::Crashed;           return true; }
    if (s == "resource_exceeded")  { out = FailureKind::ResourceExceeded;  return true; }
    if (s == "security_violation") { out = FailureKind::SecurityViolation; return true; }
    if (s == "internal")           { out = FailureKind::Internal;          return true; }
    return false;
}

} // namespace labyrinth

#endif // LABYRINTH_CORE_TYPES_H

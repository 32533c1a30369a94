/**
 * @file session.h
 * @brief 会话引擎
 *
 * 一个用户对一个迷宫的一次尝试。状态：active -> completed | abandoned。
 *
 * move 的判定顺序：
 * 1. 计算目标格
 * 2. 目标是终点：直接完成（终点短路泥地状态）
 * 3. 泥地待发作（entered 在本次尝试开始时变为 stuck）：耗一回合、不移动、回到 none
 * 4. 目标是墙（含越界）：blocked，不耗回合，状态不变
 * 5. 否则移动并耗一回合；踏入泥地记为 entered
 *
 * 会话本身不加锁，并发访问由 SessionRegistry 的会话锁串行化。
 */

#ifndef LABYRINTH_MAZE_SESSION_H
#define LABYRINTH_MAZE_SESSION_H

#include <string>
#include <chrono>

#include "core/error.h"
#include "core/types.h"
#include "maze/maze.h"

namespace labyrinth {

struct MoveResult {
    MoveStatus status;
    Position position;
    int turns;

    MoveResult() : status(MoveStatus::Blocked), turns(0) {}
    MoveResult(MoveStatus s, Position p, int t) : status(s), position(p), turns(t) {}
};

class Session {
private:
    std::string id_;
    std::string user_;
    std::string maze_id_;
    MazePtr maze_;
    Position position_;
    int turns_ = 0;
    MudState mud_ = MudState::None;
    SessionStatus status_ = SessionStatus::Active;
    std::chrono::steady_clock::time_point last_activity_;

    void touch() { last_activity_ = std::chrono::steady_clock::now(); }

public:
    Session(std::string id, std::string user, std::string maze_id, MazePtr maze)
        : id_(std::move(id)), user_(std::move(user)), maze_id_(std::move(maze_id)),
          maze_(std::move(maze)) {
        position_ = maze_->start();
        touch();
    }

    /**
     * @brief 四个方向加当前格，无副作用，任何状态下都可调用
     */
    Surroundings look() const {
        return maze_->surroundings(position_);
    }

    Result<MoveResult> move(Direction dir) {
        if (status_ != SessionStatus::Active) {
            return LABYRINTH_ERROR(ErrorCode::SESSION_NOT_ACTIVE,
                std::string("session is ") + to_string(status_));
        }
        touch();

        // 上一步踏入泥地，本次尝试被困住
        if (mud_ == MudState::Entered) {
            mud_ = MudState::Stuck;
        }

        Position target = position_.step(dir);
        CellKind kind = maze_->cell_at(target);

        if (kind == CellKind::Exit) {
            position_ = target;
            turns_++;
            mud_ = MudState::None;
            status_ = SessionStatus::Completed;
            return MoveResult(MoveStatus::Completed, position_, turns_);
        }

        if (mud_ == MudState::Stuck) {
            turns_++;
            mud_ = MudState::None;
            return MoveResult(MoveStatus::Stuck, position_, turns_);
        }

        if (kind == CellKind::Wall) {
            return MoveResult(MoveStatus::Blocked, position_, turns_);
        }

        position_ = target;
        turns_++;
        if (kind == CellKind::Mud) {
            mud_ = MudState::Entered;
            return MoveResult(MoveStatus::Mud, position_, turns_);
        }
        mud_ = MudState::None;
        return MoveResult(MoveStatus::Moved, position_, turns_);
    }

    /**
     * @brief active -> abandoned；对 abandoned 幂等，对 completed 报错
     */
    Result<void> abandon() {
        if (status_ == SessionStatus::Completed) {
            return LABYRINTH_ERROR(ErrorCode::SESSION_NOT_ACTIVE, "session already completed");
        }
        status_ = SessionStatus::Abandoned;
        return Ok();
    }

    const std::string& id() const { return id_; }
    const std::string& user() const { return user_; }
    const std::string& maze_id() const { return maze_id_; }
    const Position& position() const { return position_; }
    int turns() const { return turns_; }
    MudState mud_state() const { return mud_; }
    SessionStatus status() const { return status_; }
    bool is_active() const { return status_ == SessionStatus::Active; }
    bool is_completed() const { return status_ == SessionStatus::Completed; }

    /**
     * @brief 完成时的得分（回合数），未完成返回 -1
     */
    int score() const { return is_completed() ? turns_ : -1; }

    std::chrono::steady_clock::time_point last_activity() const { return last_activity_; }
};

} // namespace labyrinth

#endif // LABYRINTH_MAZE_SESSION_H

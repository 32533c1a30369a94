/**
 * @file bfs_solver.cpp
 * @brief 参考解题程序
 *
 * 在沙箱内运行，只通过会话通道与引擎通信。
 * 只能看到四邻格，所以边走边建图：深度优先探索未访问的格子，
 * 走投无路时沿原路退回。已知地图上找到终点后用 BFS 求最短路径直接走过去。
 *
 * 退出码：0 通关，1 无解，2 通道或协议错误。
 */

#include <iostream>
#include <map>
#include <set>
#include <queue>
#include <vector>
#include <utility>

#include "client/maze_client.h"

using namespace labyrinth;

namespace {

const Direction kDirections[] = {
    Direction::East, Direction::South, Direction::West, Direction::North
};

Direction opposite(Direction d) {
    switch (d) {
        case Direction::North: return Direction::South;
        case Direction::South: return Direction::North;
        case Direction::East:  return Direction::West;
        case Direction::West:  return Direction::East;
    }
    return Direction::North;
}

using Cell = std::pair<int, int>;

Cell key(const Position &p) { return Cell(p.x, p.y); }

class Solver {
private:
    MazeClient &client_;
    std::map<Cell, CellKind> known_;
    std::set<Cell> visited_;
    bool exit_known_ = false;
    Position exit_;

    /**
     * @brief 走一步；被泥地困住时重试同一方向
     */
    Result<MoveResult> step(Direction dir) {
        while (true) {
            LABYRINTH_TRY_UNWRAP(r, client_.move(dir));
            if (r.status != MoveStatus::Stuck) {
                return r;
            }
        }
    }

    Result<void> observe() {
        LABYRINTH_TRY_UNWRAP(view, client_.look());
        const Position &here = client_.position();
        known_[key(here)] = view.current;
        for (Direction d : kDirections) {
            Position next = here.step(d);
            CellKind kind = view.toward(d);
            known_[key(next)] = kind;
            if (kind == CellKind::Exit) {
                exit_known_ = true;
                exit_ = next;
            }
        }
        return Ok();
    }

    bool passable(const Cell &c) const {
        auto it = known_.find(c);
        return it != known_.end() && it->second != CellKind::Wall;
    }

    /**
     * @brief 已知格子上从当前位置到终点的最短方向序列
     */
    std::vector<Direction> route_to_exit() const {
        Cell from = key(client_.position());
        Cell to = key(exit_);
        std::map<Cell, std::pair<Cell, Direction>> parent;
        std::queue<Cell> frontier;
        frontier.push(from);
        parent[from] = std::make_pair(from, Direction::North);
        while (!frontier.empty()) {
            Cell cur = frontier.front();
            frontier.pop();
            if (cur == to) break;
            for (Direction d : kDirections) {
                Position next = Position(cur.first, cur.second).step(d);
                Cell nk = key(next);
                if (!passable(nk) || parent.count(nk)) continue;
                parent[nk] = std::make_pair(cur, d);
                frontier.push(nk);
            }
        }
        std::vector<Direction> path;
        if (!parent.count(to)) return path;
        for (Cell c = to; c != from; c = parent[c].first) {
            path.push_back(parent.at(c).second);
        }
        return std::vector<Direction>(path.rbegin(), path.rend());
    }

    Result<bool> walk_to_exit() {
        for (Direction d : route_to_exit()) {
            LABYRINTH_TRY_UNWRAP(r, step(d));
            if (r.status == MoveStatus::Completed) return true;
        }
        return client_.completed();
    }

public:
    explicit Solver(MazeClient &client) : client_(client) {}

    Result<bool> solve() {
        LABYRINTH_TRY(observe());
        visited_.insert(key(client_.position()));

        std::vector<Direction> trail;
        while (true) {
            if (exit_known_) {
                return walk_to_exit();
            }

            bool advanced = false;
            for (Direction d : kDirections) {
                Cell next = key(client_.position().step(d));
                if (!passable(next) || visited_.count(next)) continue;

                LABYRINTH_TRY_UNWRAP(r, step(d));
                if (r.status == MoveStatus::Completed) return true;
                if (r.status == MoveStatus::Blocked) {
                    known_[next] = CellKind::Wall;
                    continue;
                }
                visited_.insert(next);
                trail.push_back(d);
                LABYRINTH_TRY(observe());
                advanced = true;
                break;
            }
            if (advanced) continue;

            if (trail.empty()) {
                return false;
            }
            Direction back = opposite(trail.back());
            trail.pop_back();
            LABYRINTH_TRY_UNWRAP(r, step(back));
            if (r.status == MoveStatus::Completed) return true;
        }
    }
};

} // namespace

int main() {
    auto client = MazeClient::from_env();
    if (!client.ok()) {
        std::cerr << client.error().to_string() << std::endl;
        return 2;
    }
    auto ticket = client.value().start();
    if (!ticket.ok()) {
        std::cerr << ticket.error().to_string() << std::endl;
        return 2;
    }
    std::cout << "session " << ticket.value().session_id << " at "
              << ticket.value().position << std::endl;

    Solver solver(client.value());
    auto solved = solver.solve();
    if (!solved.ok()) {
        std::cerr << solved.error().to_string() << std::endl;
        return 2;
    }
    if (!solved.value()) {
        std::cout << "no path to exit" << std::endl;
        return 1;
    }
    std::cout << "completed in " << client.value().turns() << " turns" << std::endl;
    return 0;
}

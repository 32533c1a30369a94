/**
 * @file maze.h
 * @brief 迷宫模型
 *
 * 从网格文本加载并校验迷宫，加载后不可变，多个会话共享只读。
 *
 * 网格字符：X 墙 / . 空地 / # 泥地 / S 起点 / E 终点
 */

#ifndef LABYRINTH_MAZE_MAZE_H
#define LABYRINTH_MAZE_MAZE_H

#include <string>
#include <vector>
#include <memory>
#include <sstream>

#include "core/error.h"
#include "core/types.h"

namespace labyrinth {

/**
 * @brief 一个邻域视图，look 的返回值
 */
struct Surroundings {
    CellKind north;
    CellKind south;
    CellKind east;
    CellKind west;
    CellKind current;

    Surroundings()
        : north(CellKind::Wall), south(CellKind::Wall),
          east(CellKind::Wall), west(CellKind::Wall),
          current(CellKind::Wall) {}

    CellKind toward(Direction dir) const {
        switch (dir) {
            case Direction::North: return north;
            case Direction::South: return south;
            case Direction::East:  return east;
            case Direction::West:  return west;
        }
        return CellKind::Wall;
    }
};

class Maze {
private:
    std::vector<std::vector<CellKind>> grid_;
    int width_ = 0;
    int height_ = 0;
    Position start_;
    Position exit_;

    Maze() = default;

    /**
     * @brief 拆行：去掉 '\r' 和行内的空格/制表符，丢弃首尾空行
     *
     * "X S . E X" 与 "XS.EX" 是同一行。
     */
    static std::vector<std::string> normalize_rows(const std::string &text) {
        std::vector<std::string> rows;
        std::istringstream iss(text);
        std::string line;
        while (std::getline(iss, line)) {
            std::string row;
            row.reserve(line.size());
            for (char c : line) {
                if (c != ' ' && c != '\t' && c != '\r') {
                    row += c;
                }
            }
            rows.push_back(row);
        }
        while (!rows.empty() && rows.back().empty()) rows.pop_back();
        size_t first = 0;
        while (first < rows.size() && rows[first].empty()) first++;
        rows.erase(rows.begin(), rows.begin() + static_cast<std::ptrdiff_t>(first));
        return rows;
    }

public:
    /**
     * @brief 从网格文本加载迷宫
     *
     * 校验顺序（各自独立的错误码）：
     * 1. 空网格、行长不等、非法字符 -> MAZE_STRUCTURE_ERROR
     * 2. 没有起点 -> MAZE_NO_START
     * 3. 没有终点 -> MAZE_NO_EXIT
     * 4. 起点或终点多于一个 -> MAZE_DUPLICATE_MARKER
     *
     * 不检查连通性，走不通的迷宫也是合法迷宫。
     */
    static Result<Maze> load(const std::string &text) {
        auto rows = normalize_rows(text);
        LABYRINTH_ENSURE(!rows.empty(), ErrorCode::MAZE_STRUCTURE_ERROR, "empty grid");

        Maze maze;
        maze.height_ = static_cast<int>(rows.size());
        maze.width_ = static_cast<int>(rows[0].size());

        int starts = 0;
        int exits = 0;
        for (int y = 0; y < maze.height_; y++) {
            const std::string &row = rows[static_cast<size_t>(y)];
            if (static_cast<int>(row.size()) != maze.width_) {
                return LABYRINTH_ERROR(ErrorCode::MAZE_STRUCTURE_ERROR,
                    "row " + std::to_string(y) + " has length " + std::to_string(row.size()) +
                    ", expected " + std::to_string(maze.width_));
            }
            std::vector<CellKind> cells;
            cells.reserve(row.size());
            for (int x = 0; x < maze.width_; x++) {
                CellKind kind;
                char c = row[static_cast<size_t>(x)];
                if (!parse_cell(c, kind)) {
                    return LABYRINTH_ERROR(ErrorCode::MAZE_STRUCTURE_ERROR,
                        std::string("invalid character '") + c + "' at (" +
                        std::to_string(x) + "," + std::to_string(y) + ")");
                }
                if (kind == CellKind::Start) {
                    if (starts++ == 0) maze.start_ = Position(x, y);
                } else if (kind == CellKind::Exit) {
                    if (exits++ == 0) maze.exit_ = Position(x, y);
                }
                cells.push_back(kind);
            }
            maze.grid_.push_back(std::move(cells));
        }

        LABYRINTH_ENSURE(starts > 0, ErrorCode::MAZE_NO_START, "maze has no start cell");
        LABYRINTH_ENSURE(exits > 0, ErrorCode::MAZE_NO_EXIT, "maze has no exit cell");
        LABYRINTH_ENSURE(starts == 1 && exits == 1, ErrorCode::MAZE_DUPLICATE_MARKER,
            "found " + std::to_string(starts) + " start and " +
            std::to_string(exits) + " exit cells");

        return maze;
    }

    /**
     * @brief 越界坐标视为墙，不会失败
     */
    CellKind cell_at(int x, int y) const {
        if (x < 0 || y < 0 || x >= width_ || y >= height_) {
            return CellKind::Wall;
        }
        return grid_[static_cast<size_t>(y)][static_cast<size_t>(x)];
    }

    CellKind cell_at(const Position &p) const { return cell_at(p.x, p.y); }

    Surroundings surroundings(const Position &p) const {
        Surroundings s;
        s.north = cell_at(p.step(Direction::North));
        s.south = cell_at(p.step(Direction::South));
        s.east = cell_at(p.step(Direction::East));
        s.west = cell_at(p.step(Direction::West));
        s.current = cell_at(p);
        return s;
    }

    int width() const { return width_; }
    int height() const { return height_; }
    const Position& start() const { return start_; }
    const Position& exit() const { return exit_; }

    /**
     * @brief 还原成紧凑网格文本（每行一个换行）
     */
    std::string to_text() const {
        std::string out;
        for (const auto &row : grid_) {
            for (CellKind k : row) out += cell_char(k);
            out += '\n';
        }
        return out;
    }
};

using MazePtr = std::shared_ptr<const Maze>;

} // namespace labyrinth

#endif // LABYRINTH_MAZE_MAZE_H

/**
 * @file maze_catalog.h
 * @brief 迷宫目录
 *
 * 从目录加载全部 *.txt 迷宫；id 为文件名（不含扩展名），
 * 难度由文件名推断。单个文件校验失败只记日志并跳过。
 */

#ifndef LABYRINTH_MAZE_MAZE_CATALOG_H
#define LABYRINTH_MAZE_MAZE_CATALOG_H

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <filesystem>
#include <algorithm>
#include <cctype>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/labyrinth_logger.h"
#include "maze/maze.h"

namespace labyrinth {

namespace fs = std::filesystem;

struct MazeInfo {
    std::string id;
    std::string name;
    Difficulty difficulty;
    MazePtr maze;

    MazeInfo() : difficulty(Difficulty::Tutorial) {}
};

/**
 * @brief 文件名中包含 challenge / intermediate 时取对应难度，否则为 tutorial
 */
inline Difficulty infer_difficulty(const std::string &stem) {
    std::string lower = stem;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.find("challenge") != std::string::npos) return Difficulty::Challenge;
    if (lower.find("intermediate") != std::string::npos) return Difficulty::Intermediate;
    return Difficulty::Tutorial;
}

/**
 * @brief "dark_forest-2" -> "Dark Forest 2"
 */
inline std::string display_name(const std::string &stem) {
    std::string out;
    bool word_start = true;
    for (char c : stem) {
        if (c == '_' || c == '-') {
            out += ' ';
            word_start = true;
        } else if (word_start) {
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            word_start = false;
        } else {
            out += c;
        }
    }
    return out;
}

namespace builtin {

inline const char* tutorial_maze() {
    return
        "XXXXXXXXXX\n"
        "XS.......X\n"
        "X.XXXXXX.X\n"
        "X.X....X.X\n"
        "X.X.XX.X.X\n"
        "X.X.XX.X.X\n"
        "X.X....X.X\n"
        "X.XXXXXX.X\n"
        "X........E\n"
        "XXXXXXXXXX\n";
}

inline const char* intermediate_maze() {
    return
        "XXXXXXXXXXXXXXXXXXXXXXXXXXXXXX\n"
        "XS.....X......X..............X\n"
        "X.XXXX.X.XXXX.X.XXXXXXXXXXXX.X\n"
        "X.X....X.X....X.X............X\n"
        "X.X.XXXX.X.XXXX.X.XXXXXXXXXXXX\n"
        "X.X.X....X.X....X............X\n"
        "X.X.X.XXXX.X.XXXX.XXXXXXXXXX.X\n"
        "X.X.X....X.X....X.X..........X\n"
        "X.X.XXXX.X.X.XXXX.X.XXXXXXXXXX\n"
        "X.X....X.X.X.....#X..........X\n"
        "X.XXXX.X.X.XXXXXXXX.XXXXXXXX.X\n"
        "X......X.X.........#.........X\n"
        "XXXXXX.X.XXXXXXXXXX.XXXXXXXXXX\n"
        "X......X...........#.........X\n"
        "X.XXXXXXXXXXXXXXXXXXXXXXXX.XXX\n"
        "X........................#...E\n"
        "XXXXXXXXXXXXXXXXXXXXXXXXXXXXXX\n";
}

} // namespace builtin

class MazeCatalog {
private:
    std::map<std::string, MazeInfo> mazes_;
    mutable std::mutex mutex_;

public:
    MazeCatalog() = default;
    MazeCatalog(const MazeCatalog&) = delete;
    MazeCatalog& operator=(const MazeCatalog&) = delete;

    /**
     * @brief 注册一个迷宫；id 已存在时覆盖
     */
    Result<void> add(const std::string &id, const std::string &text,
                     const std::string &name = "") {
        LABYRINTH_ENSURE(!id.empty(), ErrorCode::CONFIG_INVALID_VALUE, "empty maze id");
        LABYRINTH_TRY_UNWRAP(maze, Maze::load(text));

        MazeInfo info;
        info.id = id;
        info.name = name.empty() ? display_name(id) : name;
        info.difficulty = infer_difficulty(id);
        info.maze = std::make_shared<const Maze>(std::move(maze));

        std::lock_guard<std::mutex> lock(mutex_);
        mazes_[id] = std::move(info);
        return Ok();
    }

    void add_builtin() {
        auto r1 = add("tutorial", builtin::tutorial_maze(), "Tutorial");
        auto r2 = add("intermediate", builtin::intermediate_maze(), "Intermediate");
        if (!r1.ok()) MLOG_ERROR << "builtin tutorial maze rejected: " << r1.error().to_string();
        if (!r2.ok()) MLOG_ERROR << "builtin intermediate maze rejected: " << r2.error().to_string();
    }

    /**
     * @brief 加载目录下的全部 *.txt（按文件名排序）
     * @return 成功加载的数量；目录不存在时返回 FILE_NOT_FOUND
     */
    Result<size_t> load_directory(const std::string &dir) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            return LABYRINTH_ERROR(ErrorCode::FILE_NOT_FOUND, "maze directory not found: " + dir);
        }

        std::vector<fs::path> files;
        for (const auto &entry : fs::directory_iterator(dir, ec)) {
            if (entry.is_regular_file() && entry.path().extension() == ".txt") {
                files.push_back(entry.path());
            }
        }
        if (ec) {
            return LABYRINTH_ERROR(ErrorCode::FILE_READ_ERROR, "cannot list " + dir + ": " + ec.message());
        }
        std::sort(files.begin(), files.end());

        size_t loaded = 0;
        for (const auto &path : files) {
            auto text = read_text_file(path.string());
            if (!text.ok()) {
                MLOG_WARN << "skip maze " << path.string() << ": " << text.error().to_string();
                continue;
            }
            auto r = add(path.stem().string(), text.value());
            if (!r.ok()) {
                MLOG_WARN << "skip maze " << path.string() << ": " << r.error().to_string();
                continue;
            }
            MLOG_DEBUG << "loaded maze " << path.stem().string();
            loaded++;
        }
        return loaded;
    }

    Result<MazeInfo> find(const std::string &id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = mazes_.find(id);
        if (it == mazes_.end()) {
            return LABYRINTH_ERROR(ErrorCode::MAZE_NOT_FOUND, "unknown maze: " + id);
        }
        return it->second;
    }

    bool contains(const std::string &id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return mazes_.count(id) > 0;
    }

    std::vector<MazeInfo> list() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<MazeInfo> out;
        out.reserve(mazes_.size());
        for (const auto &kv : mazes_) out.push_back(kv.second);
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return mazes_.size();
    }
};

} // namespace labyrinth

#endif // LABYRINTH_MAZE_MAZE_CATALOG_H

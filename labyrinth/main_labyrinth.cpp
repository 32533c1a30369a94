/**
 * @file main_labyrinth.cpp
 * @brief 平台命令行入口
 *
 *   labyrinth <config.yml> <user> <maze-id> <artifact>...
 *
 * 在本机按配置执行若干提交，输出每个提交的终态和该迷宫的排行榜前列。
 * 退出码：0 全部通关，1 有提交未通关，2 配置或受理错误。
 */

#include <iostream>
#include <iomanip>
#include <vector>
#include <string>
#include <chrono>
#include <stdexcept>

#include "labyrinth.h"
#include "sandbox/cgroup.h"

using namespace labyrinth;

namespace {

void usage(const char *prog) {
    std::cerr << "usage: " << prog << " <config.yml> <user> <maze-id> <artifact>..." << std::endl;
}

void print_submission(const Submission &s) {
    std::cout << s.id << "  " << std::left << std::setw(10) << to_string(s.status);
    if (s.score) {
        std::cout << " score=" << *s.score;
    }
    if (s.failure != FailureKind::None) {
        std::cout << " reason=" << to_string(s.failure);
    }
    if (!s.error.empty()) {
        std::cout << " (" << s.error << ")";
    }
    std::cout << "  cpu=" << s.cpu_ms << "ms wall=" << s.wall_ms << "ms mem="
              << s.memory_kb << "KB" << std::endl;
    if (!s.stderr_preview.empty()) {
        std::cout << "  stderr: " << s.stderr_preview << std::endl;
    }
}

void print_leaderboard(const Leaderboard &board, const MazeInfo &maze) {
    std::cout << std::endl << "Leaderboard: " << maze.name
              << " [" << to_string(maze.difficulty) << "]" << std::endl;
    auto entries = board.top(10, maze.id);
    if (entries.empty()) {
        std::cout << "  (no entries)" << std::endl;
        return;
    }
    for (const auto &e : entries) {
        std::cout << "  " << std::right << std::setw(3) << e.rank << ". "
                  << std::left << std::setw(16) << e.user << " " << e.score
                  << "  " << format_time(e.achieved_at) << std::endl;
    }
}

} // namespace

int main(int argc, char **argv) {
    if (argc < 5) {
        usage(argv[0]);
        return 2;
    }
    std::string config_path = argv[1];
    std::string user = argv[2];
    std::string maze_id = argv[3];
    std::vector<std::string> artifacts(argv + 4, argv + argc);

    LabyrinthConfig config;
    try {
        config = load_config(config_path).unwrap();
    } catch (const std::runtime_error &e) {
        std::cerr << "config: " << e.what() << std::endl;
        return 2;
    }

    labyrinth_log().init(config.log.level, config.log.console, config.log.dir);
    MLOG_INFO << "labyrinth starting with " << config_path;

    if (config.sandbox.use_cgroup) {
        auto cgroup = sandbox::CgroupManager::instance().initialize();
        if (!cgroup.ok()) {
            MLOG_WARN << "cgroup manager: " << cgroup.error().to_string()
                      << ", memory accounting falls back to rusage";
            config.sandbox.use_cgroup = false;
        }
    }
    sandbox::check_sandbox_features();

    Platform platform(config);
    auto started = platform.init();
    if (!started.ok()) {
        std::cerr << "startup: " << started.error().to_string() << std::endl;
        return 2;
    }

    auto maze = platform.catalog.find(maze_id);
    if (!maze.ok()) {
        std::cerr << maze.error().message() << std::endl;
        return 2;
    }

    auto events = platform.leaderboard.subscribe();

    std::vector<std::string> ids;
    for (const auto &artifact : artifacts) {
        auto id = platform.pipeline->submit(user, maze_id, artifact);
        if (!id.ok()) {
            std::cerr << artifact << ": " << id.error().message()
                      << " [" << error_code_str(id.error().code()) << "]" << std::endl;
            continue;
        }
        std::cout << artifact << " -> " << id.value() << std::endl;
        ids.push_back(id.value());
    }
    if (ids.empty()) {
        return 2;
    }

    // 等待时间：墙钟上限加排队余量
    auto budget = std::chrono::milliseconds(
        static_cast<int64_t>(config.sandbox.wall_time_limit_ms > 0
                             ? config.sandbox.wall_time_limit_ms
                             : config.sandbox.time_limit_ms * 3 + 1000) *
        static_cast<int64_t>(ids.size()) + 10000);

    bool all_completed = true;
    std::cout << std::endl;
    for (const auto &id : ids) {
        auto done = platform.pipeline->wait(id, budget);
        if (!done.ok()) {
            std::cerr << done.error().to_string() << std::endl;
            all_completed = false;
            continue;
        }
        print_submission(done.value());
        if (done.value().status != SubmissionStatus::Completed) {
            all_completed = false;
        }
    }

    for (const auto &event : events->drain()) {
        std::cout << "new best #" << event.seq << ": " << event.user << " "
                  << event.score << " turns, rank " << event.rank << std::endl;
    }
    print_leaderboard(platform.leaderboard, maze.value());

    platform.pipeline->stop();
    labyrinth_log().flush_all();
    return all_completed ? 0 : 1;
}

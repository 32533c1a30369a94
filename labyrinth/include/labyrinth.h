/**
 * @file labyrinth.h
 * @brief 迷宫对战平台主头文件
 *
 * 使用方式：
 *   #include "labyrinth.h"
 *   using namespace labyrinth;
 */

#ifndef LABYRINTH_H
#define LABYRINTH_H

// 核心模块
#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/logger.h"
#include "core/labyrinth_logger.h"
#include "core/yaml_config.h"
#include "core/config.h"

// 迷宫与会话
#include "maze/maze.h"
#include "maze/maze_catalog.h"
#include "maze/session.h"
#include "maze/session_registry.h"
#include "maze/protocol.h"

// 沙箱
#include "sandbox/sandbox.h"

// 流水线与排行榜
#include "leaderboard/leaderboard.h"
#include "pipeline/submission.h"
#include "pipeline/admission.h"
#include "pipeline/store.h"
#include "pipeline/pipeline.h"

namespace labyrinth {

/**
 * @brief 平台上下文
 *
 * 持有目录、会话、排行榜、执行器和存储，按配置组装流水线。
 * 成员的析构顺序保证流水线先于其依赖停止。
 */
class Platform {
public:
    LabyrinthConfig config;
    MazeCatalog catalog;
    SessionRegistry registry;
    Leaderboard leaderboard;
    std::unique_ptr<sandbox::SandboxRunner> runner;
    std::unique_ptr<SubmissionStore> store;
    std::unique_ptr<Pipeline> pipeline;

    explicit Platform(const LabyrinthConfig &cfg) : config(cfg) {}

    ~Platform() {
        if (pipeline) pipeline->stop();
    }

    /**
     * @brief 加载迷宫、打开存储、启动工作线程
     */
    Result<void> init(std::unique_ptr<sandbox::SandboxRunner> r = nullptr) {
        catalog.add_builtin();
        if (!config.maze_dir.empty()) {
            auto loaded = catalog.load_directory(config.maze_dir);
            if (!loaded.ok()) {
                MLOG_WARN << loaded.error().to_string();
            } else {
                MLOG_INFO << "loaded " << loaded.value() << " mazes from " << config.maze_dir;
            }
        }

        if (config.pipeline.store_dir.empty()) {
            store = std::make_unique<MemoryStore>();
        } else {
            auto files = std::make_unique<FileStore>(config.pipeline.store_dir);
            LABYRINTH_TRY(files->init());
            store = std::move(files);
        }

        runner = r ? std::move(r) : std::make_unique<sandbox::ProcessSandboxRunner>();
        pipeline = std::make_unique<Pipeline>(config, catalog, registry, leaderboard,
                                              *runner, *store);
        LABYRINTH_TRY_UNWRAP(recovered, pipeline->start());
        MLOG_DEBUG << "recovered " << recovered << " submissions";
        return Ok();
    }
};

} // namespace labyrinth

#endif // LABYRINTH_H

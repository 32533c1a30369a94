/**
 * @file labyrinth_logger.h
 * @brief 平台各通道日志
 *
 * - main：进程生命周期、配置、迷宫目录
 * - session：会话状态变化
 * - sandbox：隔离层与进程监督细节（不暴露给用户）
 * - pipeline：提交受理、排队、调度、持久化
 * - leaderboard：榜单更新与推送
 */

#ifndef LABYRINTH_CORE_LABYRINTH_LOGGER_H
#define LABYRINTH_CORE_LABYRINTH_LOGGER_H

#include "logger.h"
#include <string>
#include <vector>

namespace labyrinth {

class LabyrinthLogger {
private:
    Logger main_logger_;
    Logger session_logger_;
    Logger sandbox_logger_;
    Logger pipeline_logger_;
    Logger leaderboard_logger_;
    std::string log_dir_;

    /// 文件打不开时记下路径，由 init 统一报告
    void setup(Logger &logger, LogLevel level, bool console, std::vector<std::string> &failed) {
        std::string file = log_dir_.empty() ? "" : log_dir_ + "/" + logger.channel() + ".log";
        if (!logger.configure(level, console, file)) {
            failed.push_back(file);
        }
    }

public:
    LabyrinthLogger()
        : main_logger_("main"),
          session_logger_("session"),
          sandbox_logger_("sandbox"),
          pipeline_logger_("pipeline"),
          leaderboard_logger_("leaderboard") {}

    /**
     * @brief 初始化所有通道
     *
     * 未初始化时各通道没有 sink，日志被丢弃（单元测试中的默认状态）。
     * 控制台只挂在 main / pipeline 上，其余通道只写文件。
     *
     * @param level   日志级别
     * @param console 是否输出到控制台
     * @param log_dir 日志目录，空表示不写文件
     */
    void init(LogLevel level, bool console, const std::string &log_dir) {
        log_dir_ = log_dir;
        std::vector<std::string> failed;
        setup(main_logger_, level, console, failed);
        setup(session_logger_, level, false, failed);
        setup(sandbox_logger_, level, false, failed);
        setup(pipeline_logger_, level, console, failed);
        setup(leaderboard_logger_, level, false, failed);
        for (const auto &file : failed) {
            LOGGER_WARN(main_logger_) << "cannot open log file " << file;
        }
    }

    Logger& main()        { return main_logger_; }
    Logger& session()     { return session_logger_; }
    Logger& sandbox()     { return sandbox_logger_; }
    Logger& pipeline()    { return pipeline_logger_; }
    Logger& leaderboard() { return leaderboard_logger_; }

    void flush_all() {
        main_logger_.flush();
        session_logger_.flush();
        sandbox_logger_.flush();
        pipeline_logger_.flush();
        leaderboard_logger_.flush();
    }
};

inline LabyrinthLogger& labyrinth_log() {
    static LabyrinthLogger instance;
    return instance;
}

} // namespace labyrinth

//==============================================================================
// 通道日志宏
//==============================================================================

// main
#define MLOG_DEBUG LOGGER_DEBUG(labyrinth::labyrinth_log().main())
#define MLOG_INFO  LOGGER_INFO(labyrinth::labyrinth_log().main())
#define MLOG_WARN  LOGGER_WARN(labyrinth::labyrinth_log().main())
#define MLOG_ERROR LOGGER_ERROR(labyrinth::labyrinth_log().main())

// session
#define SLOG_TRACE LOGGER_TRACE(labyrinth::labyrinth_log().session())
#define SLOG_DEBUG LOGGER_DEBUG(labyrinth::labyrinth_log().session())
#define SLOG_INFO  LOGGER_INFO(labyrinth::labyrinth_log().session())
#define SLOG_WARN  LOGGER_WARN(labyrinth::labyrinth_log().session())

// sandbox
#define XLOG_DEBUG LOGGER_DEBUG(labyrinth::labyrinth_log().sandbox())
#define XLOG_INFO  LOGGER_INFO(labyrinth::labyrinth_log().sandbox())
#define XLOG_WARN  LOGGER_WARN(labyrinth::labyrinth_log().sandbox())
#define XLOG_ERROR LOGGER_ERROR(labyrinth::labyrinth_log().sandbox())

// pipeline
#define PLOG_DEBUG LOGGER_DEBUG(labyrinth::labyrinth_log().pipeline())
#define PLOG_INFO  LOGGER_INFO(labyrinth::labyrinth_log().pipeline())
#define PLOG_WARN  LOGGER_WARN(labyrinth::labyrinth_log().pipeline())
#define PLOG_ERROR LOGGER_ERROR(labyrinth::labyrinth_log().pipeline())

// leaderboard
#define BLOG_DEBUG LOGGER_DEBUG(labyrinth::labyrinth_log().leaderboard())
#define BLOG_INFO  LOGGER_INFO(labyrinth::labyrinth_log().leaderboard())
#define BLOG_WARN  LOGGER_WARN(labyrinth::labyrinth_log().leaderboard())

#endif // LABYRINTH_CORE_LABYRINTH_LOGGER_H

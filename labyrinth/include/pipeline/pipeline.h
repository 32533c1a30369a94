/**
 * @file pipeline.h
 * @brief 提交流水线
 *
 * submit 同步做受理检查（迷宫、artifact、脚本规则、限流、队列深度），
 * 通过后记录为 pending、落盘并入队。max_concurrent_sandboxes 个工作线程
 * 按 FIFO 取出，每次运行：
 *
 *   running 落盘 -> 新会话 -> 绑定该会话的通道端点 -> 沙箱运行 -> 分类
 *                -> 通关则提交排行榜 -> 终态落盘
 *
 * 会话从不复用；超时和未通关的会话被放弃后释放。
 *
 * 落盘总是写入记录的最新状态（store_mutex_ 内取副本再保存），
 * 旧状态不会覆盖新状态。重试用尽仍失败的记录进入 unsaved_，
 * 空闲的工作线程按退避间隔重写，stop() 时再强制写一次。
 *
 * 加锁顺序：store_mutex_ -> records_mutex_；unsaved_mutex_ 不与其它锁嵌套。
 */

#ifndef LABYRINTH_PIPELINE_PIPELINE_H
#define LABYRINTH_PIPELINE_PIPELINE_H

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <system_error>
#include <algorithm>
#include <utility>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/config.h"
#include "core/script_check.h"
#include "core/labyrinth_logger.h"
#include "maze/maze_catalog.h"
#include "maze/session_registry.h"
#include "maze/protocol.h"
#include "sandbox/sandbox.h"
#include "leaderboard/leaderboard.h"
#include "pipeline/submission.h"
#include "pipeline/admission.h"
#include "pipeline/store.h"

namespace labyrinth {

struct PipelineStats {
    size_t pending = 0;
    size_t running = 0;
    size_t completed = 0;
    size_t failed = 0;
    size_t timeout = 0;
};

/**
 * @brief 一次运行的最终判定
 */
struct RunOutcome {
    SubmissionStatus status = SubmissionStatus::Failed;
    FailureKind failure = FailureKind::Internal;
    std::optional<int> score;
    std::string error;
};

/**
 * @brief 沙箱结果 + 会话状态 -> 提交终态
 *
 * completed 要求程序正常退出且会话独立报告已通关；
 * 程序自称成功但会话未通关仍是 failed。
 */
inline RunOutcome classify_run(const sandbox::SandboxResult &run,
                               const std::optional<SessionSnapshot> &session) {
    using sandbox::RunStatus;
    RunOutcome out;
    switch (run.status) {
        case RunStatus::TIMED_OUT:
            out.status = SubmissionStatus::Timeout;
            out.failure = FailureKind::None;
            out.error = "Execution timed out";
            return out;
        case RunStatus::CPU_LIMIT:
        case RunStatus::MEMORY_LIMIT:
        case RunStatus::OUTPUT_LIMIT:
            out.failure = FailureKind::ResourceExceeded;
            out.error = run.message;
            return out;
        case RunStatus::SECURITY_VIOLATION:
            out.failure = FailureKind::SecurityViolation;
            out.error = run.message;
            return out;
        case RunStatus::INTERNAL_ERROR:
            out.failure = FailureKind::Internal;
            out.error = "Internal error";
            return out;
        case RunStatus::RUNTIME_ERROR:
        case RunStatus::KILLED_BY_SIGNAL:
            out.failure = FailureKind::Crashed;
            out.error = run.message;
            return out;
        case RunStatus::OK:
            break;
    }

    if (run.exit_code != 0) {
        out.failure = FailureKind::Crashed;
        out.error = "Exit code: " + std::to_string(run.exit_code);
        return out;
    }
    if (session && session->status == SessionStatus::Completed) {
        out.status = SubmissionStatus::Completed;
        out.failure = FailureKind::None;
        out.score = session->turns;
        return out;
    }
    out.failure = FailureKind::MazeNotSolved;
    out.error = "Maze not solved";
    return out;
}

class Pipeline {
private:
    LabyrinthConfig config_;
    MazeCatalog &catalog_;
    SessionRegistry &registry_;
    Leaderboard &leaderboard_;
    sandbox::SandboxRunner &runner_;
    SubmissionStore &store_;

    BoundedQueue<std::string> queue_;
    RateLimiter limiter_;

    std::map<std::string, Submission> records_;
    mutable std::mutex records_mutex_;
    std::condition_variable records_cv_;

    using SteadyClock = std::chrono::steady_clock;

    struct Unsaved {
        int attempts = 0;
        SteadyClock::time_point next_at;
    };

    std::mutex store_mutex_;
    std::map<std::string, Unsaved> unsaved_;
    std::mutex unsaved_mutex_;

    // 空闲工作线程检查 unsaved_ 的间隔与重写退避上限
    static constexpr std::chrono::milliseconds IDLE_POLL{200};
    static constexpr std::chrono::milliseconds UNSAVED_BACKOFF_CAP{10000};

    /// 与 config_.sandbox.runtimes 一一对应，在 start() 中编译
    std::vector<std::pair<std::string, ScriptCheck>> checks_;

    std::mutex submit_mutex_;
    std::vector<std::thread> workers_;
    std::atomic<bool> started_{false};

    Result<void> check_artifact(const std::string &artifact) const {
        namespace fs = std::filesystem;
        std::error_code ec;
        if (artifact.empty() || !fs::is_regular_file(artifact, ec)) {
            return LABYRINTH_ERROR(ErrorCode::ARTIFACT_INVALID, "artifact not found: " + artifact);
        }
        auto size = fs::file_size(artifact, ec);
        if (ec) {
            return LABYRINTH_ERROR(ErrorCode::ARTIFACT_INVALID,
                                   "cannot stat artifact: " + ec.message());
        }
        if (size == 0) {
            return LABYRINTH_ERROR(ErrorCode::ARTIFACT_INVALID, "artifact is empty");
        }
        if (static_cast<int64_t>(size) > config_.pipeline.max_artifact_bytes) {
            return LABYRINTH_ERROR(ErrorCode::ARTIFACT_INVALID,
                "artifact is " + std::to_string(size) + " bytes, limit " +
                std::to_string(config_.pipeline.max_artifact_bytes));
        }
        return check_script(artifact);
    }

    Result<void> check_script(const std::string &artifact) const {
        for (const auto &c : checks_) {
            if (c.first.empty() || !ends_with(artifact, c.first)) continue;
            if (c.second.empty()) return Ok();
            auto source = read_text_file(artifact);
            if (!source.ok()) {
                return LABYRINTH_ERROR(ErrorCode::ARTIFACT_INVALID,
                                       "cannot read artifact: " + source.error().message());
            }
            auto checked = c.second.check(source.value());
            if (!checked.ok()) {
                PLOG_INFO << "rejected " << artifact << ": " << checked.error().message();
            }
            return checked;
        }
        return Ok();
    }

    void worker_loop() {
        while (true) {
            auto id = queue_.pop_for(IDLE_POLL);
            if (id) {
                process(*id);
            } else if (queue_.closed()) {
                return;
            }
            flush_unsaved(false);
            size_t expired = registry_.expire_idle(
                std::chrono::seconds(config_.session.idle_timeout_seconds));
            if (expired > 0) {
                SLOG_INFO << "expired " << expired << " idle sessions";
            }
        }
    }

    /**
     * @brief 运行结束，写入终态并通知等待者
     */
    Submission finish(const std::string &id, const RunOutcome &outcome,
                      const sandbox::SandboxResult *run) {
        std::lock_guard<std::mutex> lock(records_mutex_);
        Submission &s = records_.at(id);
        auto moved = s.transition(outcome.status);
        if (!moved.ok()) {
            PLOG_ERROR << id << ": " << moved.error().to_string();
        }
        s.failure = outcome.failure;
        s.score = outcome.score;
        s.error = outcome.error;
        if (run) {
            s.cpu_ms = run->cpu_ms;
            s.wall_ms = run->wall_ms;
            s.memory_kb = run->memory_kb;
            s.stdout_preview = run->stdout_preview;
            s.stderr_preview = run->stderr_preview;
        }
        records_cv_.notify_all();
        return s;
    }

    /**
     * @brief 保存记录的当前状态
     */
    Result<void> write_latest(const std::string &id) {
        std::lock_guard<std::mutex> slock(store_mutex_);
        Submission copy;
        {
            std::lock_guard<std::mutex> lock(records_mutex_);
            auto it = records_.find(id);
            if (it == records_.end()) {
                return Ok();
            }
            copy = it->second;
        }
        return store_.save(copy);
    }

    SteadyClock::duration unsaved_delay(int attempts) const {
        auto base = std::chrono::milliseconds(std::max(1, config_.pipeline.persist_backoff_ms));
        auto delay = base * (1LL << std::min(attempts, 16));
        return std::min<SteadyClock::duration>(delay, UNSAVED_BACKOFF_CAP);
    }

    /**
     * @brief 带重试地落盘；仍失败则留在 unsaved_ 里稍后重写
     */
    void persist(const std::string &id) {
        auto saved = retry_transient(id, [this, &id] { return write_latest(id); },
                                     config_.pipeline.persist_retries,
                                     std::chrono::milliseconds(config_.pipeline.persist_backoff_ms));
        std::lock_guard<std::mutex> lock(unsaved_mutex_);
        if (saved.ok()) {
            unsaved_.erase(id);
            return;
        }
        Unsaved &entry = unsaved_[id];
        entry.attempts++;
        entry.next_at = SteadyClock::now() + unsaved_delay(entry.attempts);
        PLOG_ERROR << "persist " << id << " failed, kept for later: " << saved.error().to_string();
    }

    /**
     * @brief 重写到期的 unsaved_ 记录，force 时不看到期时间
     *
     * @return 仍未写入的记录数
     */
    size_t flush_unsaved(bool force) {
        std::vector<std::string> due;
        {
            std::lock_guard<std::mutex> lock(unsaved_mutex_);
            auto now = SteadyClock::now();
            for (auto &kv : unsaved_) {
                if (force || kv.second.next_at <= now) {
                    due.push_back(kv.first);
                    // 占住这一轮，其它工作线程不会同时重写
                    kv.second.next_at = now + unsaved_delay(kv.second.attempts + 1);
                }
            }
        }
        for (const auto &id : due) {
            auto saved = write_latest(id);
            std::lock_guard<std::mutex> lock(unsaved_mutex_);
            auto it = unsaved_.find(id);
            if (it == unsaved_.end()) continue;
            if (saved.ok()) {
                PLOG_INFO << "persisted " << id << " after " << (it->second.attempts + 1) << " rounds";
                unsaved_.erase(it);
            } else {
                it->second.attempts++;
                PLOG_WARN << "persist " << id << " still failing (round " << it->second.attempts
                          << "): " << saved.error().message();
            }
        }
        std::lock_guard<std::mutex> lock(unsaved_mutex_);
        return unsaved_.size();
    }

    static RunOutcome internal_failure() {
        RunOutcome out;
        out.status = SubmissionStatus::Failed;
        out.failure = FailureKind::Internal;
        out.error = "Internal error";
        return out;
    }

    void process(const std::string &id) {
        Submission sub;
        {
            std::lock_guard<std::mutex> lock(records_mutex_);
            Submission &s = records_.at(id);
            auto moved = s.transition(SubmissionStatus::Running);
            if (!moved.ok()) {
                PLOG_ERROR << id << ": " << moved.error().to_string();
                return;
            }
            sub = s;
            records_cv_.notify_all();
        }
        PLOG_INFO << id << " running (" << sub.user << " on " << sub.maze_id << ")";
        persist(id);

        auto maze = catalog_.find(sub.maze_id);
        if (!maze.ok()) {
            PLOG_ERROR << id << ": " << maze.error().to_string();
            finish(id, internal_failure(), nullptr);
            persist(id);
            return;
        }
        // 运行期间会话标记为占用，expire_idle 不会回收它
        auto ticket = registry_.start(sub.user, sub.maze_id, maze.value().maze, true);
        if (!ticket.ok()) {
            PLOG_ERROR << id << ": " << ticket.error().to_string();
            finish(id, internal_failure(), nullptr);
            persist(id);
            return;
        }
        const std::string session_id = ticket.value().session_id;
        {
            std::lock_guard<std::mutex> lock(records_mutex_);
            records_.at(id).session_id = session_id;
        }

        protocol::SessionEndpoint endpoint(registry_, session_id, ticket.value().token);
        sandbox::SandboxConfig cfg = config_.sandbox.to_sandbox_config(sub.artifact);
        cfg.add_env(std::string(protocol::ENV_SESSION_TOKEN) + "=" + ticket.value().token);

        auto run = runner_.run(cfg, [&endpoint](const std::string &line) {
            return endpoint.handle(line);
        });

        std::optional<SessionSnapshot> snapshot;
        auto snap = registry_.snapshot(session_id);
        if (snap.ok()) {
            snapshot = snap.value();
        }

        RunOutcome outcome;
        if (!run.ok()) {
            PLOG_ERROR << id << ": sandbox setup failed: " << run.error().to_string();
            outcome = internal_failure();
        } else {
            outcome = classify_run(run.value(), snapshot);
        }

        if (snapshot && snapshot->status == SessionStatus::Active) {
            auto abandoned = registry_.abandon(session_id);
            if (!abandoned.ok()) {
                SLOG_WARN << "abandon " << session_id << ": " << abandoned.error().to_string();
            }
        }
        registry_.release(session_id);

        if (outcome.status == SubmissionStatus::Completed && outcome.score) {
            leaderboard_.offer(sub.user, sub.maze_id, *outcome.score);
        }

        Submission done = finish(id, outcome, run.ok() ? &run.value() : nullptr);
        PLOG_INFO << id << " " << to_string(done.status)
                  << (done.score ? " score=" + std::to_string(*done.score) : "")
                  << (done.error.empty() ? "" : " (" + done.error + ")");
        persist(id);
    }

public:
    Pipeline(const LabyrinthConfig &config, MazeCatalog &catalog, SessionRegistry &registry,
             Leaderboard &leaderboard, sandbox::SandboxRunner &runner, SubmissionStore &store)
        : config_(config), catalog_(catalog), registry_(registry),
          leaderboard_(leaderboard), runner_(runner), store_(store),
          queue_(static_cast<size_t>(config.pipeline.max_queue_depth)),
          limiter_(static_cast<size_t>(config.pipeline.rate_limit_submissions),
                   std::chrono::seconds(config.pipeline.rate_limit_window_seconds)) {}

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    ~Pipeline() {
        stop();
    }

    /**
     * @brief 编译脚本规则，载入已持久化的记录并启动工作线程
     *
     * 上次退出时未结束的记录（pending / running）不会再执行，
     * 以 internal 失败收尾并重新落盘；已通关的记录按完成时间
     * 回放到排行榜，不产生事件。
     */
    Result<size_t> start() {
        LABYRINTH_ENSURE(!started_, ErrorCode::SYSTEM_ERROR, "pipeline already started");
        checks_.clear();
        for (const auto &rt : config_.sandbox.runtimes) {
            auto compiled = ScriptCheck::compile(rt.rules);
            if (!compiled.ok()) {
                return compiled.error().with_context("runtime " + rt.extension);
            }
            checks_.emplace_back(rt.extension, compiled.value());
        }

        LABYRINTH_TRY_UNWRAP(existing, store_.load_all());
        std::vector<std::string> interrupted;
        std::vector<Submission> solved;
        {
            std::lock_guard<std::mutex> lock(records_mutex_);
            for (auto &s : existing) {
                if (!s.is_terminal()) {
                    s.status = SubmissionStatus::Failed;
                    s.failure = FailureKind::Internal;
                    s.error = "Interrupted";
                    s.finished_at = Clock::now();
                    interrupted.push_back(s.id);
                } else if (s.status == SubmissionStatus::Completed && s.score) {
                    solved.push_back(s);
                }
                records_[s.id] = s;
            }
        }
        size_t recovered = existing.size();

        auto achieved = [](const Submission &s) { return s.finished_at.value_or(s.created_at); };
        std::sort(solved.begin(), solved.end(), [&achieved](const Submission &a, const Submission &b) {
            if (achieved(a) != achieved(b)) return achieved(a) < achieved(b);
            return a.id < b.id;
        });
        for (const auto &s : solved) {
            leaderboard_.restore(s.user, s.maze_id, *s.score, achieved(s));
        }
        for (const auto &id : interrupted) {
            PLOG_WARN << id << " was interrupted by shutdown";
            persist(id);
        }

        int n = std::max(1, config_.pipeline.max_concurrent_sandboxes);
        workers_.reserve(static_cast<size_t>(n));
        for (int i = 0; i < n; i++) {
            workers_.emplace_back([this] { worker_loop(); });
        }
        started_ = true;
        PLOG_INFO << "pipeline started with " << n << " workers, "
                  << recovered << " stored submissions (" << interrupted.size()
                  << " interrupted, " << solved.size() << " solved)";
        return recovered;
    }

    /**
     * @brief 停止接收，等待运行中的提交结束，最后重写一次 unsaved_
     *
     * 队列中尚未开始的提交保持 pending（已落盘，重启后以 internal 失败收尾）。
     */
    void stop() {
        auto rest = queue_.close();
        for (auto &t : workers_) {
            if (t.joinable()) t.join();
        }
        workers_.clear();
        if (!rest.empty()) {
            PLOG_WARN << rest.size() << " submissions left pending at shutdown";
        }
        if (flush_unsaved(true) > 0) {
            std::lock_guard<std::mutex> lock(unsaved_mutex_);
            for (const auto &kv : unsaved_) {
                PLOG_ERROR << kv.first << " was never persisted";
            }
        }
    }

    /**
     * @brief 受理一次提交
     *
     * 检查顺序：迷宫存在 -> artifact 合法 -> 脚本规则 -> 限流 -> 队列深度。
     * 任一失败都不产生记录。
     */
    Result<std::string> submit(const std::string &user, const std::string &maze_id,
                               const std::string &artifact) {
        if (!catalog_.contains(maze_id)) {
            return LABYRINTH_ERROR(ErrorCode::MAZE_NOT_FOUND, "unknown maze " + maze_id);
        }
        LABYRINTH_TRY(check_artifact(artifact));
        LABYRINTH_TRY_UNWRAP(suffix, random_hex(8));

        Submission s;
        s.id = "sub_" + suffix;
        s.user = user;
        s.maze_id = maze_id;
        s.artifact = get_realpath(artifact);
        s.created_at = Clock::now();

        {
            std::lock_guard<std::mutex> lock(submit_mutex_);
            if (!limiter_.check(user)) {
                PLOG_INFO << "rate limited " << user;
                return LABYRINTH_ERROR(ErrorCode::RATE_LIMITED,
                    "more than " + std::to_string(config_.pipeline.rate_limit_submissions) +
                    " submissions in " + std::to_string(config_.pipeline.rate_limit_window_seconds) + "s");
            }
            {
                std::lock_guard<std::mutex> rlock(records_mutex_);
                records_[s.id] = s;
            }
            auto pushed = queue_.push(s.id);
            if (!pushed.ok()) {
                std::lock_guard<std::mutex> rlock(records_mutex_);
                records_.erase(s.id);
                return pushed.error();
            }
            limiter_.record(user);
        }
        PLOG_INFO << s.id << " accepted from " << user << " for " << maze_id;
        persist(s.id);
        return s.id;
    }

    Result<Submission> status(const std::string &id) const {
        std::lock_guard<std::mutex> lock(records_mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) {
            return LABYRINTH_ERROR(ErrorCode::SUBMISSION_NOT_FOUND, "no submission " + id);
        }
        return it->second;
    }

    /**
     * @brief 等待提交到达终态，超时返回当前状态
     */
    Result<Submission> wait(const std::string &id, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(records_mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) {
            return LABYRINTH_ERROR(ErrorCode::SUBMISSION_NOT_FOUND, "no submission " + id);
        }
        records_cv_.wait_for(lock, timeout, [this, &id] {
            return records_.at(id).is_terminal();
        });
        return records_.at(id);
    }

    /**
     * @brief 某用户的提交，新的在前；maze_id 为空表示全部迷宫
     */
    std::vector<Submission> list_for_user(const std::string &user, const std::string &maze_id = "",
                                          size_t limit = 20) const {
        std::vector<Submission> out;
        {
            std::lock_guard<std::mutex> lock(records_mutex_);
            for (const auto &kv : records_) {
                const Submission &s = kv.second;
                if (s.user == user && (maze_id.empty() || s.maze_id == maze_id)) {
                    out.push_back(s);
                }
            }
        }
        std::sort(out.begin(), out.end(), [](const Submission &a, const Submission &b) {
            if (a.created_at != b.created_at) return a.created_at > b.created_at;
            return a.id > b.id;
        });
        if (out.size() > limit) {
            out.resize(limit);
        }
        return out;
    }

    PipelineStats stats() const {
        PipelineStats st;
        std::lock_guard<std::mutex> lock(records_mutex_);
        for (const auto &kv : records_) {
            switch (kv.second.status) {
                case SubmissionStatus::Pending:   st.pending++;   break;
                case SubmissionStatus::Running:   st.running++;   break;
                case SubmissionStatus::Completed: st.completed++; break;
                case SubmissionStatus::Failed:    st.failed++;    break;
                case SubmissionStatus::Timeout:   st.timeout++;   break;
            }
        }
        return st;
    }

    size_t queue_depth() const { return queue_.size(); }
    bool started() const { return started_; }
};

} // namespace labyrinth

#endif // LABYRINTH_PIPELINE_PIPELINE_H

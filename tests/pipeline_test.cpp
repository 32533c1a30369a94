/**
 * @file pipeline_test.cpp
 * @brief 提交流水线测试
 *
 * 用脚本化的执行器代替真实沙箱：它通过通道处理器驱动会话，
 * 或直接返回指定的运行结果。
 */

#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <thread>
#include <chrono>

#include "pipeline/pipeline.h"

using namespace labyrinth;
using sandbox::RunStatus;
using sandbox::SandboxConfig;
using sandbox::SandboxResult;
using sandbox::ChannelHandler;

namespace {

SandboxResult result_of(RunStatus status, int exit_code = 0, const std::string &message = "") {
    SandboxResult r;
    r.status = status;
    r.exit_code = exit_code;
    r.message = message;
    r.cpu_ms = 3;
    r.wall_ms = 5;
    r.memory_kb = 1024;
    return r;
}

std::string token_from(const SandboxConfig &cfg) {
    const std::string prefix = std::string(protocol::ENV_SESSION_TOKEN) + "=";
    for (const auto &kv : cfg.env) {
        if (kv.compare(0, prefix.size(), prefix) == 0) {
            return kv.substr(prefix.size());
        }
    }
    return "";
}

/**
 * @brief 脚本化执行器
 *
 * 每次运行调用 script；gate 关闭时运行阻塞，直到 open()。
 */
class ScriptedRunner : public sandbox::SandboxRunner {
public:
    using Script = std::function<Result<SandboxResult>(const SandboxConfig&, const ChannelHandler&)>;

private:
    Script script_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool gate_open_ = true;

public:
    std::atomic<int> runs{0};
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    SandboxConfig last_config;

    explicit ScriptedRunner(Script script) : script_(std::move(script)) {}

    void set_script(Script script) { script_ = std::move(script); }

    void close_gate() {
        std::lock_guard<std::mutex> lock(mutex_);
        gate_open_ = false;
    }

    void open_gate() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            gate_open_ = true;
        }
        cv_.notify_all();
    }

    Result<SandboxResult> run(const SandboxConfig &config, const ChannelHandler &handler) override {
        runs++;
        int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        {
            std::unique_lock<std::mutex> lock(mutex_);
            last_config = config;
            cv_.wait(lock, [this] { return gate_open_; });
        }
        auto r = script_(config, handler);
        active--;
        return r;
    }
};

/// 走完 "XS.EX" 的脚本：START，再向东两步
Result<SandboxResult> solve_corridor(const SandboxConfig &cfg, const ChannelHandler &handler) {
    std::string token = token_from(cfg);
    handler("START " + token);
    handler("LOOK " + token);
    handler("MOVE " + token + " east");
    auto last = handler("MOVE " + token + " east");
    if (last.line.rfind("move completed", 0) != 0) {
        return result_of(RunStatus::RUNTIME_ERROR, 1, "Exit code: 1");
    }
    return result_of(RunStatus::OK);
}

/// 撞墙一次再通关：回合数不变
Result<SandboxResult> solve_corridor_with_bump(const SandboxConfig &cfg, const ChannelHandler &handler) {
    std::string token = token_from(cfg);
    handler("MOVE " + token + " north");
    return solve_corridor(cfg, handler);
}

/// 存储故障注入：前 N 次保存失败
class FlakyStore : public SubmissionStore {
private:
    MemoryStore inner_;

public:
    std::atomic<int> failures_left;
    std::atomic<int> attempts{0};
    ErrorCode failure_code;

    FlakyStore(int failures, ErrorCode code = ErrorCode::PERSISTENCE_FAILED)
        : failures_left(failures), failure_code(code) {}

    Result<void> save(const Submission &s) override {
        attempts++;
        if (failures_left > 0) {
            failures_left--;
            return LABYRINTH_ERROR(failure_code, "injected failure");
        }
        return inner_.save(s);
    }

    Result<Submission> load(const std::string &id) override { return inner_.load(id); }
    Result<std::vector<Submission>> load_all() override { return inner_.load_all(); }
};

} // namespace

class PipelineTest : public ::testing::Test {
protected:
    std::string dir;
    std::string artifact;
    LabyrinthConfig config;
    MazeCatalog catalog;
    SessionRegistry registry;
    Leaderboard board;
    ScriptedRunner runner{solve_corridor};
    std::unique_ptr<SubmissionStore> store;
    std::unique_ptr<Pipeline> pipeline;

    void SetUp() override {
        dir = ::testing::TempDir() + "labyrinth_pipeline_" +
              ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        artifact = write_file("solver.py", "print('hello')\n");

        ASSERT_TRUE(catalog.add("corridor", "XXXXX\nXS.EX\nXXXXX\n").ok());
        config.pipeline.max_concurrent_sandboxes = 2;
        config.pipeline.persist_backoff_ms = 1;
        store = std::make_unique<MemoryStore>();
    }

    void TearDown() override {
        runner.open_gate();
        pipeline.reset();
        std::filesystem::remove_all(dir);
    }

    std::string write_file(const std::string &name, const std::string &content) {
        std::string path = dir + "/" + name;
        std::ofstream f(path);
        f << content;
        return path;
    }

    void start() {
        pipeline = std::make_unique<Pipeline>(config, catalog, registry, board, runner, *store);
        auto started = pipeline->start();
        ASSERT_TRUE(started.ok()) << started.error().to_string();
    }

    Submission run_one(const std::string &user = "alice") {
        auto id = pipeline->submit(user, "corridor", artifact);
        EXPECT_TRUE(id.ok()) << id.error().to_string();
        auto done = pipeline->wait(id.value(), std::chrono::seconds(5));
        EXPECT_TRUE(done.ok());
        EXPECT_TRUE(done.value().is_terminal());
        return done.value();
    }

    void wait_for_status(const std::string &id, SubmissionStatus status) {
        for (int i = 0; i < 500; i++) {
            if (pipeline->status(id).value().status == status) return;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        FAIL() << id << " never reached " << to_string(status);
    }

    /// 终态先通知等待者再落盘
    Result<Submission> wait_stored(SubmissionStore &target, const std::string &id) {
        auto stored = target.load(id);
        for (int i = 0; i < 400 && !(stored.ok() && stored.value().is_terminal()); i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            stored = target.load(id);
        }
        return stored;
    }
};

// 测试：通关后 completed，得分为回合数并进入排行榜
TEST_F(PipelineTest, SolvedRunCompletes) {
    start();
    auto s = run_one();
    EXPECT_EQ(s.status, SubmissionStatus::Completed);
    ASSERT_TRUE(s.score.has_value());
    EXPECT_EQ(*s.score, 2);
    EXPECT_EQ(s.failure, FailureKind::None);
    EXPECT_TRUE(s.started_at.has_value());
    EXPECT_TRUE(s.finished_at.has_value());
    EXPECT_FALSE(s.session_id.empty());
    EXPECT_EQ(s.cpu_ms, 3u);

    auto best = board.best("alice", "corridor");
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->score, 2);

    // 会话用完即释放
    EXPECT_EQ(registry.size(), 0u);

    auto stored = wait_stored(*store, s.id);
    ASSERT_TRUE(stored.ok());
    EXPECT_EQ(stored.value().status, SubmissionStatus::Completed);
}

TEST_F(PipelineTest, SandboxConfigCarriesTokenAndInterpreter) {
    start();
    run_one();
    EXPECT_EQ(runner.last_config.program, "/usr/bin/python3");
    EXPECT_EQ(runner.last_config.artifact, get_realpath(artifact));
    EXPECT_FALSE(token_from(runner.last_config).empty());
}

TEST_F(PipelineTest, WallBumpsDoNotCost) {
    runner.set_script(solve_corridor_with_bump);
    start();
    auto s = run_one();
    ASSERT_EQ(s.status, SubmissionStatus::Completed);
    EXPECT_EQ(*s.score, 2);
}

// 测试：程序自称成功但会话未通关仍是失败
TEST_F(PipelineTest, CleanExitWithoutSolvingFails) {
    runner.set_script([](const SandboxConfig &cfg, const ChannelHandler &handler) {
        handler("MOVE " + token_from(cfg) + " east");
        return Result<SandboxResult>(result_of(RunStatus::OK));
    });
    start();
    auto s = run_one();
    EXPECT_EQ(s.status, SubmissionStatus::Failed);
    EXPECT_EQ(s.failure, FailureKind::MazeNotSolved);
    EXPECT_FALSE(s.score.has_value());
    EXPECT_FALSE(board.best("alice", "corridor").has_value());
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(PipelineTest, TimeoutIsTerminal) {
    runner.set_script([](const SandboxConfig&, const ChannelHandler&) {
        return Result<SandboxResult>(result_of(RunStatus::TIMED_OUT, -1, "Wall time limit exceeded"));
    });
    start();
    auto s = run_one();
    EXPECT_EQ(s.status, SubmissionStatus::Timeout);
    EXPECT_FALSE(s.score.has_value());
    EXPECT_EQ(runner.runs.load(), 1);
}

// 测试：token 错误是安全违规，与崩溃区分
TEST_F(PipelineTest, SecurityViolationIsDistinctFromCrash) {
    runner.set_script([](const SandboxConfig&, const ChannelHandler &handler) {
        auto reply = handler("MOVE forged-token east");
        EXPECT_TRUE(reply.violation);
        return Result<SandboxResult>(result_of(RunStatus::SECURITY_VIOLATION, -1, "Session token mismatch"));
    });
    start();
    auto s = run_one();
    EXPECT_EQ(s.status, SubmissionStatus::Failed);
    EXPECT_EQ(s.failure, FailureKind::SecurityViolation);

    runner.set_script([](const SandboxConfig&, const ChannelHandler&) {
        return Result<SandboxResult>(result_of(RunStatus::KILLED_BY_SIGNAL, -1, "Killed by signal 11"));
    });
    auto crash = run_one("bob");
    EXPECT_EQ(crash.status, SubmissionStatus::Failed);
    EXPECT_EQ(crash.failure, FailureKind::Crashed);
}

TEST_F(PipelineTest, RunnerErrorIsInternalFailure) {
    runner.set_script([](const SandboxConfig&, const ChannelHandler&) {
        return Result<SandboxResult>(LABYRINTH_ERROR(ErrorCode::FORK_FAILED, "fork: EAGAIN"));
    });
    start();
    auto s = run_one();
    EXPECT_EQ(s.status, SubmissionStatus::Failed);
    EXPECT_EQ(s.failure, FailureKind::Internal);
    EXPECT_EQ(s.error, "Internal error");
}

//==============================================================================
// 受理
//==============================================================================

TEST_F(PipelineTest, RejectsUnknownMaze) {
    start();
    auto id = pipeline->submit("alice", "atlantis", artifact);
    ASSERT_FALSE(id.ok());
    EXPECT_EQ(id.error().code(), ErrorCode::MAZE_NOT_FOUND);
    EXPECT_EQ(pipeline->stats().pending, 0u);
}

TEST_F(PipelineTest, RejectsBadArtifacts) {
    config.pipeline.max_artifact_bytes = 16;
    start();

    auto missing = pipeline->submit("alice", "corridor", dir + "/nope.py");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code(), ErrorCode::ARTIFACT_INVALID);

    auto empty = pipeline->submit("alice", "corridor", write_file("empty.py", ""));
    ASSERT_FALSE(empty.ok());
    EXPECT_EQ(empty.error().code(), ErrorCode::ARTIFACT_INVALID);

    auto big = pipeline->submit("alice", "corridor", write_file("big.py", std::string(17, 'x')));
    ASSERT_FALSE(big.ok());
    EXPECT_EQ(big.error().code(), ErrorCode::ARTIFACT_INVALID);

    auto dir_artifact = pipeline->submit("alice", "corridor", dir);
    ASSERT_FALSE(dir_artifact.ok());
    EXPECT_EQ(dir_artifact.error().code(), ErrorCode::ARTIFACT_INVALID);

    EXPECT_EQ(runner.runs.load(), 0);
}

// 测试：解释器脚本在受理时逐行检查，命中规则的不会进入沙箱
TEST_F(PipelineTest, RejectsBlockedScripts) {
    start();

    auto spawn = pipeline->submit("alice", "corridor",
                                  write_file("spawn.py", "import os\nimport subprocess\n"));
    ASSERT_FALSE(spawn.ok());
    EXPECT_EQ(spawn.error().code(), ErrorCode::ARTIFACT_INVALID);
    EXPECT_NE(spawn.error().message().find("subprocess"), std::string::npos);
    EXPECT_NE(spawn.error().message().find("line 2"), std::string::npos);

    auto dynamic = pipeline->submit("alice", "corridor", write_file("dyn.py", "eval('1')\n"));
    ASSERT_FALSE(dynamic.ok());
    EXPECT_EQ(dynamic.error().code(), ErrorCode::ARTIFACT_INVALID);

    auto fine = pipeline->submit("alice", "corridor",
                                 write_file("fine.py", "import re\np = re.compile('x')\nprint('hello')\n"));
    ASSERT_TRUE(fine.ok()) << fine.error().to_string();
    pipeline->wait(fine.value(), std::chrono::seconds(5));

    EXPECT_EQ(runner.runs.load(), 1);
    EXPECT_EQ(pipeline->list_for_user("alice").size(), 1u);
}

// 测试：不带规则的运行时与可直接执行的文件不做脚本检查
TEST_F(PipelineTest, ScriptRulesFollowRuntime) {
    config.sandbox.runtimes = {{".py", "/usr/bin/python3", ScriptRules()}};
    start();
    auto id = pipeline->submit("alice", "corridor", write_file("raw.py", "import subprocess\n"));
    EXPECT_TRUE(id.ok());
    auto bin = pipeline->submit("bob", "corridor", write_file("solver", "import subprocess\n"));
    EXPECT_TRUE(bin.ok());
}

// 测试：被拒绝的提交不计入限流
TEST_F(PipelineTest, RateLimitPerUser) {
    config.pipeline.rate_limit_submissions = 2;
    start();

    ASSERT_FALSE(pipeline->submit("alice", "atlantis", artifact).ok());
    ASSERT_TRUE(pipeline->submit("alice", "corridor", artifact).ok());
    ASSERT_TRUE(pipeline->submit("alice", "corridor", artifact).ok());

    auto third = pipeline->submit("alice", "corridor", artifact);
    ASSERT_FALSE(third.ok());
    EXPECT_EQ(third.error().code(), ErrorCode::RATE_LIMITED);

    EXPECT_TRUE(pipeline->submit("bob", "corridor", artifact).ok());
}

TEST_F(PipelineTest, QueueFullIsRejected) {
    config.pipeline.max_concurrent_sandboxes = 1;
    config.pipeline.max_queue_depth = 1;
    runner.close_gate();
    start();

    auto first = pipeline->submit("alice", "corridor", artifact);
    ASSERT_TRUE(first.ok());
    wait_for_status(first.value(), SubmissionStatus::Running);

    auto second = pipeline->submit("bob", "corridor", artifact);
    ASSERT_TRUE(second.ok());
    auto third = pipeline->submit("carol", "corridor", artifact);
    ASSERT_FALSE(third.ok());
    EXPECT_EQ(third.error().code(), ErrorCode::QUEUE_FULL);

    auto missing = pipeline->status("sub_unknown");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code(), ErrorCode::SUBMISSION_NOT_FOUND);

    runner.open_gate();
    EXPECT_TRUE(pipeline->wait(second.value(), std::chrono::seconds(5)).value().is_terminal());
}

// 测试：超过并发上限的提交保持 pending，前一个结束后才开始运行
TEST_F(PipelineTest, ConcurrencyLimitKeepsExtraPending) {
    config.pipeline.max_concurrent_sandboxes = 1;
    runner.close_gate();
    start();

    auto first = pipeline->submit("alice", "corridor", artifact).value();
    auto second = pipeline->submit("bob", "corridor", artifact).value();
    wait_for_status(first, SubmissionStatus::Running);

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(pipeline->status(second).value().status, SubmissionStatus::Pending);
    auto st = pipeline->stats();
    EXPECT_EQ(st.running, 1u);
    EXPECT_EQ(st.pending, 1u);

    runner.open_gate();
    auto a = pipeline->wait(first, std::chrono::seconds(5)).value();
    auto b = pipeline->wait(second, std::chrono::seconds(5)).value();
    EXPECT_EQ(a.status, SubmissionStatus::Completed);
    EXPECT_EQ(b.status, SubmissionStatus::Completed);
    EXPECT_GE(*b.started_at, *a.finished_at);
    EXPECT_EQ(runner.peak.load(), 1);
}

TEST_F(PipelineTest, ParallelRunsRespectLimit) {
    config.pipeline.max_concurrent_sandboxes = 3;
    runner.set_script([](const SandboxConfig &cfg, const ChannelHandler &handler) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return solve_corridor(cfg, handler);
    });
    start();

    std::vector<std::string> ids;
    for (int i = 0; i < 8; i++) {
        auto id = pipeline->submit("user" + std::to_string(i), "corridor", artifact);
        ASSERT_TRUE(id.ok());
        ids.push_back(id.value());
    }
    for (const auto &id : ids) {
        EXPECT_EQ(pipeline->wait(id, std::chrono::seconds(10)).value().status,
                  SubmissionStatus::Completed);
    }
    EXPECT_LE(runner.peak.load(), 3);
    EXPECT_EQ(board.top(100, "corridor").size(), 8u);
    EXPECT_EQ(pipeline->stats().completed, 8u);
}

TEST_F(PipelineTest, ListForUserNewestFirst) {
    start();
    auto first = run_one();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    auto second = run_one();
    run_one("bob");

    auto mine = pipeline->list_for_user("alice");
    ASSERT_EQ(mine.size(), 2u);
    EXPECT_EQ(mine[0].id, second.id);
    EXPECT_EQ(mine[1].id, first.id);

    EXPECT_EQ(pipeline->list_for_user("alice", "corridor", 1).size(), 1u);
    EXPECT_TRUE(pipeline->list_for_user("alice", "elsewhere").empty());
}

//==============================================================================
// 持久化
//==============================================================================

// 测试：存储暂时失败时重试保存，不会重新执行程序
TEST_F(PipelineTest, TransientStoreFailureIsRetried) {
    auto flaky = std::make_unique<FlakyStore>(3);
    FlakyStore *f = flaky.get();
    store = std::move(flaky);
    start();
    auto s = run_one();
    EXPECT_EQ(s.status, SubmissionStatus::Completed);

    auto stored = wait_stored(*f, s.id);
    ASSERT_TRUE(stored.ok());
    EXPECT_EQ(stored.value().status, SubmissionStatus::Completed);
    EXPECT_GE(f->attempts.load(), 4);
    EXPECT_EQ(runner.runs.load(), 1);
}

// 测试：故障持续超过重试次数时，记录留待工作线程稍后写入，成绩不丢失
TEST_F(PipelineTest, StoreOutageOutlastsRetries) {
    config.pipeline.persist_retries = 1;
    auto flaky = std::make_unique<FlakyStore>(8);
    FlakyStore *f = flaky.get();
    store = std::move(flaky);
    start();
    auto s = run_one();
    EXPECT_EQ(s.status, SubmissionStatus::Completed);

    auto stored = wait_stored(*f, s.id);
    ASSERT_TRUE(stored.ok()) << stored.error().to_string();
    EXPECT_EQ(stored.value().status, SubmissionStatus::Completed);
    ASSERT_TRUE(stored.value().score.has_value());
    EXPECT_EQ(*stored.value().score, 2);
    EXPECT_GT(f->attempts.load(), 8);
    EXPECT_EQ(runner.runs.load(), 1);
}

// 测试：不可重试的错误不在当场重试，但同样留待稍后写入
TEST_F(PipelineTest, PermanentStoreFailureIsRetriedLater) {
    auto broken = std::make_unique<FlakyStore>(3, ErrorCode::FILE_READ_ERROR);
    FlakyStore *b = broken.get();
    store = std::move(broken);
    start();
    auto s = run_one();
    EXPECT_EQ(s.status, SubmissionStatus::Completed);

    auto stored = wait_stored(*b, s.id);
    ASSERT_TRUE(stored.ok()) << stored.error().to_string();
    EXPECT_EQ(stored.value().status, SubmissionStatus::Completed);
    EXPECT_EQ(runner.runs.load(), 1);
}

// 测试：stop 时强制写入仍未落盘的记录
TEST_F(PipelineTest, StopFlushesUnsavedRecords) {
    config.pipeline.persist_retries = 0;
    auto flaky = std::make_unique<FlakyStore>(1000000);
    FlakyStore *f = flaky.get();
    store = std::move(flaky);
    start();
    auto s = run_one();
    EXPECT_EQ(s.status, SubmissionStatus::Completed);
    EXPECT_FALSE(f->load(s.id).ok());

    f->failures_left = 0;
    pipeline->stop();
    auto stored = f->load(s.id);
    ASSERT_TRUE(stored.ok());
    EXPECT_EQ(stored.value().status, SubmissionStatus::Completed);
}

// 测试：重启后未结束的记录以 internal 失败收尾，已通关的成绩回到排行榜
TEST_F(PipelineTest, RecoversStoredSubmissions) {
    auto owned = std::make_unique<FileStore>(dir + "/store");
    FileStore *files = owned.get();
    store = std::move(owned);
    ASSERT_TRUE(files->init().ok());

    Submission interrupted;
    interrupted.id = "sub_interrupted";
    interrupted.user = "alice";
    interrupted.maze_id = "corridor";
    interrupted.created_at = Clock::now();
    ASSERT_TRUE(interrupted.transition(SubmissionStatus::Running).ok());
    ASSERT_TRUE(files->save(interrupted).ok());

    Submission solved;
    solved.id = "sub_solved";
    solved.user = "bob";
    solved.maze_id = "corridor";
    solved.created_at = Clock::now();
    ASSERT_TRUE(solved.transition(SubmissionStatus::Running).ok());
    ASSERT_TRUE(solved.transition(SubmissionStatus::Completed).ok());
    solved.score = 12;
    ASSERT_TRUE(files->save(solved).ok());

    start();

    auto recovered = pipeline->status("sub_interrupted");
    ASSERT_TRUE(recovered.ok());
    EXPECT_EQ(recovered.value().status, SubmissionStatus::Failed);
    EXPECT_EQ(recovered.value().failure, FailureKind::Internal);

    auto on_disk = files->load("sub_interrupted");
    ASSERT_TRUE(on_disk.ok());
    EXPECT_EQ(on_disk.value().status, SubmissionStatus::Failed);

    auto best = board.best("bob", "corridor");
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->score, 12);
    EXPECT_EQ(runner.runs.load(), 0);
}

// 测试：同分记录按原完成时间排序，与文件名顺序无关，且回放不推送事件
TEST_F(PipelineTest, RecoveredTiesKeepOriginalOrder) {
    auto owned = std::make_unique<FileStore>(dir + "/store");
    FileStore *files = owned.get();
    store = std::move(owned);
    ASSERT_TRUE(files->init().ok());

    auto solved = [](const std::string &id, const std::string &user, TimePoint finished) {
        Submission s;
        s.id = id;
        s.user = user;
        s.maze_id = "corridor";
        s.created_at = finished - std::chrono::seconds(5);
        EXPECT_TRUE(s.transition(SubmissionStatus::Running).ok());
        EXPECT_TRUE(s.transition(SubmissionStatus::Completed).ok());
        s.finished_at = finished;
        s.score = 12;
        return s;
    };
    // 文件名在前的 amy 反而晚完成
    ASSERT_TRUE(files->save(solved("sub_aaaa", "amy", Clock::now())).ok());
    ASSERT_TRUE(files->save(solved("sub_ffff", "zed", Clock::now() - std::chrono::hours(1))).ok());

    auto events = board.subscribe();
    start();

    auto top = board.top(2, "corridor");
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].user, "zed");
    EXPECT_EQ(top[1].user, "amy");
    EXPECT_EQ(top[0].achieved_at, *files->load("sub_ffff").value().finished_at);
    EXPECT_EQ(top[1].achieved_at, *files->load("sub_aaaa").value().finished_at);
    EXPECT_EQ(events->pending(), 0u);
}

// 测试：pending 与 running 的记录在受理和开始运行时就已落盘，
// 进程中途消失后由下一个实例以 internal 失败收尾
TEST_F(PipelineTest, PendingAndRunningSurviveRestart) {
    auto owned = std::make_unique<FileStore>(dir + "/store");
    FileStore *files = owned.get();
    store = std::move(owned);
    ASSERT_TRUE(files->init().ok());
    config.pipeline.max_concurrent_sandboxes = 1;
    runner.close_gate();
    start();

    auto first = pipeline->submit("alice", "corridor", artifact).value();
    auto second = pipeline->submit("bob", "corridor", artifact).value();
    wait_for_status(first, SubmissionStatus::Running);

    auto on_disk = [files](const std::string &id, SubmissionStatus status) {
        for (int i = 0; i < 400; i++) {
            auto s = files->load(id);
            if (s.ok() && s.value().status == status) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return false;
    };
    ASSERT_TRUE(on_disk(first, SubmissionStatus::Running));
    ASSERT_TRUE(on_disk(second, SubmissionStatus::Pending));

    // 第一个实例仍被挡在沙箱里，第二个实例只看磁盘
    FileStore reopened(dir + "/store");
    ASSERT_TRUE(reopened.init().ok());
    SessionRegistry other_registry;
    Leaderboard other_board;
    ScriptedRunner other_runner{solve_corridor};
    Pipeline restarted(config, catalog, other_registry, other_board, other_runner, reopened);
    auto count = restarted.start();
    ASSERT_TRUE(count.ok()) << count.error().to_string();
    EXPECT_EQ(count.value(), 2u);

    for (const auto &id : {first, second}) {
        auto s = restarted.status(id);
        ASSERT_TRUE(s.ok());
        EXPECT_EQ(s.value().status, SubmissionStatus::Failed);
        EXPECT_EQ(s.value().failure, FailureKind::Internal);
        EXPECT_EQ(s.value().error, "Interrupted");
    }
    EXPECT_EQ(other_runner.runs.load(), 0);
    restarted.stop();

    runner.open_gate();
    EXPECT_EQ(pipeline->wait(first, std::chrono::seconds(5)).value().status,
              SubmissionStatus::Completed);
}

TEST_F(PipelineTest, StopLeavesQueuedSubmissionsPending) {
    config.pipeline.max_concurrent_sandboxes = 1;
    runner.close_gate();
    start();

    auto first = pipeline->submit("alice", "corridor", artifact).value();
    auto second = pipeline->submit("bob", "corridor", artifact).value();
    wait_for_status(first, SubmissionStatus::Running);

    std::thread stopper([this] { pipeline->stop(); });
    // 队列被关闭后才放行正在运行的提交
    for (int i = 0; i < 400 && pipeline->queue_depth() > 0; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    runner.open_gate();
    stopper.join();

    EXPECT_TRUE(pipeline->status(first).value().is_terminal());
    EXPECT_EQ(pipeline->status(second).value().status, SubmissionStatus::Pending);

    auto after = pipeline->submit("carol", "corridor", artifact);
    ASSERT_FALSE(after.ok());
    EXPECT_EQ(after.error().code(), ErrorCode::PIPELINE_STOPPED);
}

//==============================================================================
// 分类
//==============================================================================

TEST(ClassifyRunTest, RequiresCompletedSession) {
    SessionSnapshot done;
    done.status = SessionStatus::Completed;
    done.turns = 17;
    SessionSnapshot active;
    active.status = SessionStatus::Active;

    auto ok = classify_run(result_of(RunStatus::OK), done);
    EXPECT_EQ(ok.status, SubmissionStatus::Completed);
    EXPECT_EQ(*ok.score, 17);

    auto unsolved = classify_run(result_of(RunStatus::OK), active);
    EXPECT_EQ(unsolved.status, SubmissionStatus::Failed);
    EXPECT_EQ(unsolved.failure, FailureKind::MazeNotSolved);

    auto no_session = classify_run(result_of(RunStatus::OK), std::nullopt);
    EXPECT_EQ(no_session.failure, FailureKind::MazeNotSolved);
}

// 测试：通关后非零退出算崩溃
TEST(ClassifyRunTest, CrashAfterSolvingIsFailure) {
    SessionSnapshot done;
    done.status = SessionStatus::Completed;
    auto r = classify_run(result_of(RunStatus::RUNTIME_ERROR, 3, "Exit code: 3"), done);
    EXPECT_EQ(r.status, SubmissionStatus::Failed);
    EXPECT_EQ(r.failure, FailureKind::Crashed);
    EXPECT_FALSE(r.score.has_value());
}

TEST(ClassifyRunTest, ResourceStatuses) {
    for (RunStatus s : {RunStatus::CPU_LIMIT, RunStatus::MEMORY_LIMIT, RunStatus::OUTPUT_LIMIT}) {
        auto r = classify_run(result_of(s, -1, "limit"), std::nullopt);
        EXPECT_EQ(r.status, SubmissionStatus::Failed);
        EXPECT_EQ(r.failure, FailureKind::ResourceExceeded);
    }
    auto t = classify_run(result_of(RunStatus::TIMED_OUT, -1), std::nullopt);
    EXPECT_EQ(t.status, SubmissionStatus::Timeout);

    auto internal = classify_run(result_of(RunStatus::INTERNAL_ERROR, -1), std::nullopt);
    EXPECT_EQ(internal.failure, FailureKind::Internal);
    EXPECT_EQ(internal.error, "Internal error");
}

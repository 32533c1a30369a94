/**
 * @file config_test.cpp
 * @brief YAML 解析、平台配置与提交记录存储测试
 */

#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>

#include "core/yaml_config.h"
#include "core/config.h"
#include "core/syscall_map.h"
#include "pipeline/submission.h"
#include "pipeline/store.h"

using namespace labyrinth;

//==============================================================================
// YAML
//==============================================================================

TEST(YamlTest, NestedMapsAndScalars) {
    auto doc = yaml::parse_yaml(
        "name: labyrinth\n"
        "pipeline:\n"
        "  workers: 4   # comment\n"
        "  ratio: 0.5\n"
        "  enabled: yes\n"
        "  mode: on\n"
        "  label: \"a # b\"\n");
    ASSERT_TRUE(doc->is_map());
    EXPECT_TRUE(doc->get("name")->is_string());
    EXPECT_EQ(doc->get("name")->as_string(), "labyrinth");
    EXPECT_EQ((*doc)["pipeline.workers"]->as_int(), 4);
    EXPECT_DOUBLE_EQ((*doc)["pipeline.ratio"]->as_double(), 0.5);
    EXPECT_TRUE((*doc)["pipeline.enabled"]->as_bool());
    EXPECT_EQ((*doc)["pipeline.mode"]->as_string(), "on");
    EXPECT_EQ((*doc)["pipeline.label"]->as_string(), "a # b");
}

TEST(YamlTest, ListsInBothStyles) {
    auto doc = yaml::parse_yaml(
        "flow: [/usr, /lib, /bin]\n"
        "block:\n"
        "  - first\n"
        "  - second\n"
        "maps:\n"
        "  - { extension: .py, interpreter: /usr/bin/python3 }\n"
        "  - extension: .rb\n"
        "    interpreter: /usr/bin/ruby\n");
    EXPECT_TRUE(doc->get("flow")->is_list());
    auto flow = doc->get("flow")->as_string_list();
    ASSERT_EQ(flow.size(), 3u);
    EXPECT_EQ(flow[1], "/lib");

    auto block = doc->get("block")->as_string_list();
    ASSERT_EQ(block.size(), 2u);
    EXPECT_EQ(block[0], "first");

    auto maps = doc->get("maps")->as_list();
    ASSERT_EQ(maps.size(), 2u);
    EXPECT_EQ(maps[0]->get("extension")->as_string(), ".py");
    EXPECT_EQ(maps[1]->get("interpreter")->as_string(), "/usr/bin/ruby");
}

//==============================================================================
// 平台配置
//==============================================================================

TEST(ConfigTest, EmptyDocumentGivesDefaults) {
    auto cfg = parse_config(yaml::parse_yaml(""));
    ASSERT_TRUE(cfg.ok());
    EXPECT_EQ(cfg.value().pipeline.max_concurrent_sandboxes, 4);
    EXPECT_EQ(cfg.value().pipeline.max_queue_depth, 64);
    EXPECT_EQ(cfg.value().sandbox.time_limit_ms, 10000);
    EXPECT_TRUE(cfg.value().sandbox.use_seccomp);
    EXPECT_EQ(cfg.value().session.idle_timeout_seconds, 600);
    EXPECT_EQ(cfg.value().log.level, LogLevel::INFO);
}

TEST(ConfigTest, ParsesAllSections) {
    auto cfg = parse_config(yaml::parse_yaml(
        "log:\n"
        "  level: debug\n"
        "  console: off\n"
        "mazes:\n"
        "  dir: /opt/mazes\n"
        "pipeline:\n"
        "  max_concurrent_sandboxes: 2\n"
        "  rate_limit_submissions: 3\n"
        "  max_artifact_bytes: 5000000000\n"
        "  store_dir: /var/lib/labyrinth\n"
        "sandbox:\n"
        "  time_limit_ms: 2000\n"
        "  wall_time_limit_ms: 20000\n"
        "  use_namespace: false\n"
        "  readonly: [/usr, /opt/runtime]\n"
        "  extra_syscalls: [getrusage]\n"
        "  runtimes:\n"
        "    - { extension: .js, interpreter: /usr/bin/node }\n"
        "session:\n"
        "  idle_timeout_seconds: 30\n"));
    ASSERT_TRUE(cfg.ok()) << cfg.error().to_string();
    const auto &c = cfg.value();
    EXPECT_EQ(c.log.level, LogLevel::DEBUG);
    EXPECT_FALSE(c.log.console);
    EXPECT_EQ(c.maze_dir, "/opt/mazes");
    EXPECT_EQ(c.pipeline.max_concurrent_sandboxes, 2);
    EXPECT_EQ(c.pipeline.rate_limit_submissions, 3);
    EXPECT_EQ(c.pipeline.max_artifact_bytes, 5000000000LL);
    EXPECT_EQ(c.pipeline.store_dir, "/var/lib/labyrinth");
    EXPECT_EQ(c.sandbox.time_limit_ms, 2000);
    EXPECT_FALSE(c.sandbox.use_namespace);
    EXPECT_TRUE(c.sandbox.use_cgroup);
    ASSERT_EQ(c.sandbox.readonly.size(), 2u);
    EXPECT_EQ(c.sandbox.readonly[1], "/opt/runtime");
    ASSERT_EQ(c.sandbox.extra_syscalls.size(), 1u);
    EXPECT_EQ(c.sandbox.extra_syscalls[0], syscall_name_to_nr("getrusage"));
    EXPECT_EQ(c.sandbox.interpreter_for("main.js"), "/usr/bin/node");
    EXPECT_EQ(c.sandbox.interpreter_for("main.py"), "");
    EXPECT_EQ(c.session.idle_timeout_seconds, 30);
}

TEST(ConfigTest, RejectsInvalidValues) {
    for (const char *text : {
             "pipeline:\n  max_queue_depth: 0\n",
             "pipeline:\n  max_concurrent_sandboxes: many\n",
             "sandbox:\n  use_seccomp: maybe\n",
             "sandbox:\n  extra_syscalls: [not_a_syscall]\n",
             "sandbox:\n  runtimes:\n    - { extension: .py }\n",
             "sandbox:\n  runtimes:\n    - { extension: .py, interpreter: /usr/bin/python3, checks: strict }\n",
             "sandbox:\n  runtimes:\n    - extension: .py\n      interpreter: /usr/bin/python3\n"
             "      blocked_patterns:\n        - 'eval('\n",
             "sandbox:\n  wall_time_limit_ms: 120000\nsession:\n  idle_timeout_seconds: 60\n",
             "sandbox:\n  wall_time_limit_ms: 0\n  time_limit_ms: 30000\nsession:\n  idle_timeout_seconds: 90\n",
             "log:\n  level: loud\n"}) {
        auto cfg = parse_config(yaml::parse_yaml(text));
        ASSERT_FALSE(cfg.ok()) << text;
        EXPECT_EQ(cfg.error().code(), ErrorCode::CONFIG_INVALID_VALUE) << text;
    }
}

TEST(ConfigTest, TopLevelMustBeMap) {
    auto cfg = parse_config(yaml::parse_yaml("- a\n- b\n"));
    ASSERT_FALSE(cfg.ok());
    EXPECT_EQ(cfg.error().code(), ErrorCode::CONFIG_PARSE_ERROR);
}

TEST(ConfigTest, MissingFile) {
    auto cfg = load_config("/nonexistent/labyrinth.yml");
    ASSERT_FALSE(cfg.ok());
    EXPECT_EQ(cfg.error().code(), ErrorCode::FILE_NOT_FOUND);
}

// 测试：仓库自带的配置文件可以加载
TEST(ConfigTest, ShippedConfigLoads) {
    auto cfg = load_config(std::string(LABYRINTH_SOURCE_DIR) + "/config/labyrinth.yml");
    ASSERT_TRUE(cfg.ok()) << cfg.error().to_string();
    EXPECT_EQ(cfg.value().maze_dir, "config/mazes");
    EXPECT_TRUE(cfg.value().pipeline.store_dir.empty());
    EXPECT_TRUE(cfg.value().log.dir.empty());
    ASSERT_EQ(cfg.value().sandbox.runtimes.size(), 1u);
    EXPECT_EQ(cfg.value().sandbox.interpreter_for("bot.py"), "/usr/bin/python3");
    EXPECT_FALSE(cfg.value().sandbox.runtimes[0].rules.empty());
}

// 测试：空闲超时可以等于墙钟上限；未设墙钟时按 CPU 时限推算
TEST(ConfigTest, IdleTimeoutCoversWallTime) {
    auto equal = parse_config(yaml::parse_yaml(
        "sandbox:\n  wall_time_limit_ms: 60000\nsession:\n  idle_timeout_seconds: 60\n"));
    ASSERT_TRUE(equal.ok()) << equal.error().to_string();

    auto derived = parse_config(yaml::parse_yaml(
        "sandbox:\n  wall_time_limit_ms: 0\n  time_limit_ms: 1000\nsession:\n  idle_timeout_seconds: 4\n"));
    ASSERT_TRUE(derived.ok()) << derived.error().to_string();
    EXPECT_EQ(derived.value().sandbox.effective_wall_ms(), 4000);
}

TEST(ConfigTest, RuntimeChecks) {
    auto cfg = parse_config(yaml::parse_yaml(
        "sandbox:\n"
        "  runtimes:\n"
        "    - { extension: .py, interpreter: /usr/bin/python3, checks: python }\n"
        "    - extension: .rb\n"
        "      interpreter: /usr/bin/ruby\n"
        "      blocked_imports: [net]\n"
        "      blocked_patterns:\n"
        "        - 'system\\s*\\('\n"
        "    - { extension: .sh, interpreter: /bin/sh }\n"));
    ASSERT_TRUE(cfg.ok()) << cfg.error().to_string();
    const auto &rts = cfg.value().sandbox.runtimes;
    ASSERT_EQ(rts.size(), 3u);
    EXPECT_EQ(rts[0].rules.blocked_imports, default_python_rules().blocked_imports);
    ASSERT_EQ(rts[1].rules.blocked_imports.size(), 1u);
    EXPECT_EQ(rts[1].rules.blocked_imports[0], "net");
    ASSERT_EQ(rts[1].rules.blocked_patterns.size(), 1u);
    EXPECT_EQ(rts[1].rules.blocked_patterns[0], "system\\s*\\(");
    EXPECT_TRUE(rts[2].rules.empty());

    ASSERT_NE(cfg.value().sandbox.runtime_for("a.rb"), nullptr);
    EXPECT_EQ(cfg.value().sandbox.runtime_for("a.out"), nullptr);
}

//==============================================================================
// 脚本检查
//==============================================================================

class ScriptCheckTest : public ::testing::Test {
protected:
    ScriptCheck python;

    void SetUp() override {
        auto compiled = ScriptCheck::compile(default_python_rules());
        ASSERT_TRUE(compiled.ok()) << compiled.error().to_string();
        python = compiled.value();
    }

    std::string rejection(const std::string &source) {
        auto r = python.check(source);
        if (r.ok()) return "";
        EXPECT_EQ(r.error().code(), ErrorCode::ARTIFACT_INVALID);
        return r.error().message();
    }
};

// 测试：通过 fd 3 对话的普通玩家程序可以通过
TEST_F(ScriptCheckTest, AcceptsChannelPlayer) {
    EXPECT_EQ(rejection(
        "import os, sys\n"
        "from collections import deque\n"
        "import re as regex\n"
        "token = os.environ['LABYRINTH_SESSION_TOKEN']\n"
        "os.write(3, ('LOOK ' + token + '\\n').encode())\n"
        "pattern = regex.compile(r'\\d+')\n"
        "evaluation = 1\n"), "");
    EXPECT_EQ(rejection("import os\nos.write(3, b'LOOK t\\n')\nprint(os.read(3, 64))\n"), "");
}

TEST_F(ScriptCheckTest, RejectsBlockedImports) {
    EXPECT_EQ(rejection("import subprocess\n"), "blocked import 'subprocess' at line 1");
    EXPECT_EQ(rejection("x = 1\nimport json, socket as s\n"), "blocked import 'socket' at line 2");
    EXPECT_EQ(rejection("from urllib.request import urlopen\n"), "blocked import 'urllib' at line 1");
    EXPECT_EQ(rejection("    import ctypes.util\n"), "blocked import 'ctypes' at line 1");
    EXPECT_EQ(rejection("important = 3\nfrom_here = 4\n"), "");
}

TEST_F(ScriptCheckTest, RejectsDangerousPatterns) {
    EXPECT_NE(rejection("eval('1+1')\n"), "");
    EXPECT_NE(rejection("x = exec (code)\n"), "");
    EXPECT_NE(rejection("().__class__.__bases__[0].__subclasses__()\n"), "");
    EXPECT_NE(rejection("import os\nos.system('ls')\n"), "");
    EXPECT_NE(rejection("OS.FORK()\n"), "");
    EXPECT_NE(rejection("f = os.open('../../secret', 0)\n"), "");
    EXPECT_NE(rejection("data = os.open('/etc/passwd', 0)\n"), "");
}

TEST(ScriptCheckRulesTest, BadPatternIsConfigError) {
    ScriptRules rules;
    rules.blocked_patterns = {"(unclosed"};
    auto compiled = ScriptCheck::compile(rules);
    ASSERT_FALSE(compiled.ok());
    EXPECT_EQ(compiled.error().code(), ErrorCode::CONFIG_INVALID_VALUE);

    auto none = ScriptCheck::compile(ScriptRules());
    ASSERT_TRUE(none.ok());
    EXPECT_TRUE(none.value().empty());
    EXPECT_TRUE(none.value().check("import subprocess\n").ok());
}

TEST(ConfigTest, SandboxConfigFromSettings) {
    SandboxSettings settings;
    settings.time_limit_ms = 1500;
    settings.use_cgroup = false;
    auto cfg = settings.to_sandbox_config("/tmp/bot.py");
    EXPECT_EQ(cfg.time_limit_ms, 1500);
    EXPECT_FALSE(cfg.use_cgroup);
    EXPECT_EQ(cfg.program, "/usr/bin/python3");
    EXPECT_EQ(cfg.artifact, "/tmp/bot.py");

    auto native = settings.to_sandbox_config("/tmp/bot");
    EXPECT_TRUE(native.program.empty());
}

TEST(SyscallMapTest, KnownNames) {
    EXPECT_GE(syscall_name_to_nr("read"), 0);
    EXPECT_EQ(syscall_nr_to_name(syscall_name_to_nr("openat")), "openat");
    EXPECT_EQ(syscall_name_to_nr("definitely_not"), -1);
}

//==============================================================================
// 提交记录
//==============================================================================

TEST(SubmissionTest, TransitionsOnlyForward) {
    Submission s;
    EXPECT_FALSE(s.transition(SubmissionStatus::Completed).ok());
    ASSERT_TRUE(s.transition(SubmissionStatus::Running).ok());
    EXPECT_TRUE(s.started_at.has_value());
    EXPECT_FALSE(s.transition(SubmissionStatus::Pending).ok());
    ASSERT_TRUE(s.transition(SubmissionStatus::Timeout).ok());
    EXPECT_TRUE(s.finished_at.has_value());

    auto again = s.transition(SubmissionStatus::Completed);
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error().code(), ErrorCode::INVALID_TRANSITION);
    EXPECT_EQ(s.status, SubmissionStatus::Timeout);
}

TEST(SubmissionTest, YamlRecordKeepsFields) {
    Submission s;
    s.id = "sub_0011aabb";
    s.user = "alice";
    s.maze_id = "challenge_bog";
    s.artifact = "/tmp/my bot.py";
    s.created_at = from_unix_ms(1700000000123);
    ASSERT_TRUE(s.transition(SubmissionStatus::Running).ok());
    ASSERT_TRUE(s.transition(SubmissionStatus::Failed).ok());
    s.failure = FailureKind::Crashed;
    s.error = "Exit code: 3 \"quoted\" # not a comment";
    s.cpu_ms = 12;
    s.stdout_preview = "not persisted";

    auto back = submission_from_yaml(yaml::parse_yaml(to_yaml(s)));
    ASSERT_TRUE(back.ok()) << back.error().to_string();
    const auto &r = back.value();
    EXPECT_EQ(r.id, s.id);
    EXPECT_EQ(r.artifact, "/tmp/my bot.py");
    EXPECT_EQ(r.status, SubmissionStatus::Failed);
    EXPECT_EQ(r.failure, FailureKind::Crashed);
    EXPECT_EQ(r.error, "Exit code: 3 'quoted' # not a comment");
    EXPECT_FALSE(r.score.has_value());
    EXPECT_EQ(to_unix_ms(r.created_at), 1700000000123);
    EXPECT_TRUE(r.finished_at.has_value());
    EXPECT_EQ(r.cpu_ms, 12u);
    EXPECT_TRUE(r.stdout_preview.empty());
}

TEST(SubmissionTest, RejectsBrokenRecords) {
    EXPECT_FALSE(submission_from_yaml(yaml::parse_yaml("user: alice\n")).ok());
    EXPECT_FALSE(submission_from_yaml(yaml::parse_yaml("id: x\nstatus: exploded\n")).ok());
    EXPECT_FALSE(submission_from_yaml(yaml::parse_yaml("id: x\nstatus: failed\nfailure: boom\n")).ok());
}

//==============================================================================
// 文件存储
//==============================================================================

class FileStoreTest : public ::testing::Test {
protected:
    std::string dir;

    void SetUp() override {
        dir = ::testing::TempDir() + "labyrinth_store_" +
              ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::filesystem::remove_all(dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    static Submission make(const std::string &id, int score) {
        Submission s;
        s.id = id;
        s.user = "alice";
        s.maze_id = "tutorial";
        s.created_at = Clock::now();
        EXPECT_TRUE(s.transition(SubmissionStatus::Running).ok());
        EXPECT_TRUE(s.transition(SubmissionStatus::Completed).ok());
        s.score = score;
        return s;
    }
};

TEST_F(FileStoreTest, SaveLoadAndOverwrite) {
    FileStore store(dir);
    ASSERT_TRUE(store.init().ok());
    ASSERT_TRUE(store.save(make("sub_a", 30)).ok());
    ASSERT_TRUE(store.save(make("sub_a", 20)).ok());
    ASSERT_TRUE(store.save(make("sub_b", 10)).ok());

    auto a = store.load("sub_a");
    ASSERT_TRUE(a.ok());
    EXPECT_EQ(*a.value().score, 20);
    EXPECT_FALSE(std::filesystem::exists(dir + "/sub_a.yml.tmp"));

    auto all = store.load_all();
    ASSERT_TRUE(all.ok());
    EXPECT_EQ(all.value().size(), 2u);

    auto missing = store.load("sub_zzz");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code(), ErrorCode::SUBMISSION_NOT_FOUND);
}

TEST_F(FileStoreTest, LoadAllSkipsCorruptFiles) {
    FileStore store(dir);
    ASSERT_TRUE(store.init().ok());
    ASSERT_TRUE(store.save(make("sub_ok", 5)).ok());
    {
        std::ofstream bad(dir + "/sub_bad.yml");
        bad << "status: nonsense\n";
    }
    auto all = store.load_all();
    ASSERT_TRUE(all.ok());
    ASSERT_EQ(all.value().size(), 1u);
    EXPECT_EQ(all.value()[0].id, "sub_ok");
}

TEST_F(FileStoreTest, MissingDirectoryIsEmpty) {
    FileStore store(dir + "/never_created");
    auto all = store.load_all();
    ASSERT_TRUE(all.ok());
    EXPECT_TRUE(all.value().empty());
}

// 测试：不可写的目录返回可重试的错误，save_with_retry 用尽次数后放弃
TEST_F(FileStoreTest, UnwritableDirectoryIsTransient) {
    FileStore store(dir + "/missing_parent/store");
    auto r = save_with_retry(store, make("sub_x", 1), 2, std::chrono::milliseconds(1));
    ASSERT_FALSE(r.ok());
    EXPECT_TRUE(is_transient(r.error().code()));
}

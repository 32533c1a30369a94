/**
 * @file config.h
 * @brief 平台配置
 *
 * 从 YAML 加载为强类型的 LabyrinthConfig。缺失的键取默认值，
 * 类型或取值非法时返回 CONFIG_INVALID_VALUE。
 *
 *   log:      { level: info, dir: "", console: true }
 *   mazes:    { dir: "" }
 *   pipeline: { max_concurrent_sandboxes, max_queue_depth, ... }
 *   sandbox:  { time_limit_ms, memory_limit_mb, readonly, runtimes, ... }
 *   session:  { idle_timeout_seconds }
 *
 * 空闲超时不得短于沙箱墙钟上限，否则慢但合法的玩家会在运行中途失去会话。
 */

#ifndef LABYRINTH_CORE_CONFIG_H
#define LABYRINTH_CORE_CONFIG_H

#include <string>
#include <vector>
#include <cstdint>

#include "error.h"
#include "logger.h"
#include "utils.h"
#include "syscall_map.h"
#include "script_check.h"
#include "yaml_config.h"
#include "sandbox/sandbox.h"

namespace labyrinth {

struct LogConfig {
    LogLevel level = LogLevel::INFO;
    std::string dir;
    bool console = true;
};

struct PipelineConfig {
    int max_concurrent_sandboxes = 4;
    int max_queue_depth = 64;
    int rate_limit_submissions = 10;
    int rate_limit_window_seconds = 60;
    int64_t max_artifact_bytes = 100000;
    std::string store_dir;              ///< 空表示只保存在内存
    int persist_retries = 5;
    int persist_backoff_ms = 50;
};

/**
 * @brief 脚本扩展名到解释器的映射，附带受理时的检查规则
 */
struct Runtime {
    std::string extension;
    std::string interpreter;
    ScriptRules rules;
};

struct SandboxSettings {
    int time_limit_ms = 10000;
    int wall_time_limit_ms = 300000;
    int memory_limit_mb = 256;
    int output_limit_kb = 1024;
    int max_processes = 8;
    std::string scratch_root = "/tmp";
    bool use_seccomp = true;
    bool use_cgroup = true;
    bool use_namespace = true;
    std::vector<std::string> readonly = {"/usr", "/lib", "/lib64", "/bin"};
    std::vector<int> extra_syscalls;
    std::vector<Runtime> runtimes = {{".py", "/usr/bin/python3", default_python_rules()}};

    /// artifact 对应的运行时；可直接执行时返回 nullptr
    const Runtime* runtime_for(const std::string &artifact) const {
        for (const auto &rt : runtimes) {
            if (!rt.extension.empty() && ends_with(artifact, rt.extension)) {
                return &rt;
            }
        }
        return nullptr;
    }

    std::string interpreter_for(const std::string &artifact) const {
        const Runtime *rt = runtime_for(artifact);
        return rt ? rt->interpreter : "";
    }

    int64_t effective_wall_ms() const {
        return wall_time_limit_ms > 0 ? wall_time_limit_ms
                                      : static_cast<int64_t>(time_limit_ms) * 3 + 1000;
    }

    sandbox::SandboxConfig to_sandbox_config(const std::string &artifact) const {
        sandbox::SandboxConfig cfg;
        cfg.time_limit_ms = time_limit_ms;
        cfg.wall_time_limit_ms = wall_time_limit_ms;
        cfg.memory_limit_mb = memory_limit_mb;
        cfg.output_limit_kb = output_limit_kb;
        cfg.max_processes = max_processes;
        cfg.scratch_root = scratch_root;
        cfg.use_seccomp = use_seccomp;
        cfg.use_cgroup = use_cgroup;
        cfg.use_namespace = use_namespace;
        cfg.readonly = readonly;
        cfg.extra_syscalls = extra_syscalls;
        cfg.program = interpreter_for(artifact);
        cfg.artifact = artifact;
        return cfg;
    }
};

struct SessionConfig {
    int idle_timeout_seconds = 600;
};

struct LabyrinthConfig {
    LogConfig log;
    std::string maze_dir;
    PipelineConfig pipeline;
    SandboxSettings sandbox;
    SessionConfig session;
};

//==============================================================================
// 加载
//==============================================================================

namespace detail {

inline Result<void> read_int(const yaml::YamlNodePtr &section, const std::string &key,
                             int64_t min, int64_t &out) {
    if (!section) return Ok();
    auto node = section->get(key);
    if (!node || node->is_null()) return Ok();
    if (!node->is_int()) {
        return LABYRINTH_ERROR(ErrorCode::CONFIG_INVALID_VALUE,
                               key + " must be an integer, got '" + node->as_string() + "'");
    }
    int64_t v = node->as_int();
    if (v < min) {
        return LABYRINTH_ERROR(ErrorCode::CONFIG_INVALID_VALUE,
                               key + " must be >= " + std::to_string(min));
    }
    out = v;
    return Ok();
}

inline Result<void> read_int(const yaml::YamlNodePtr &section, const std::string &key,
                             int64_t min, int &out) {
    int64_t v = out;
    LABYRINTH_TRY(read_int(section, key, min, v));
    LABYRINTH_ENSURE(v <= INT32_MAX, ErrorCode::CONFIG_INVALID_VALUE, key + " is too large");
    out = static_cast<int>(v);
    return Ok();
}

inline Result<void> read_bool(const yaml::YamlNodePtr &section, const std::string &key, bool &out) {
    if (!section) return Ok();
    auto node = section->get(key);
    if (!node || node->is_null()) return Ok();
    if (node->is_bool()) {
        out = node->as_bool();
        return Ok();
    }
    std::string s = yaml::detail::to_lower(node->as_string());
    if (s == "on") { out = true; return Ok(); }
    if (s == "off") { out = false; return Ok(); }
    return LABYRINTH_ERROR(ErrorCode::CONFIG_INVALID_VALUE,
                           key + " must be a boolean, got '" + node->as_string() + "'");
}

inline void read_string(const yaml::YamlNodePtr &section, const std::string &key, std::string &out) {
    if (!section) return;
    auto node = section->get(key);
    if (node && !node->is_null()) {
        out = node->as_string();
    }
}

} // namespace detail

inline Result<void> load_log_config(const yaml::YamlNodePtr &node, LogConfig &cfg) {
    if (!node) return Ok();
    if (node->has("level")) {
        std::string name = node->get("level")->as_string();
        if (!level_from_string(name, cfg.level)) {
            return LABYRINTH_ERROR(ErrorCode::CONFIG_INVALID_VALUE, "unknown log level " + name);
        }
    }
    detail::read_string(node, "dir", cfg.dir);
    LABYRINTH_TRY(detail::read_bool(node, "console", cfg.console));
    return Ok();
}

inline Result<void> load_pipeline_config(const yaml::YamlNodePtr &node, PipelineConfig &cfg) {
    LABYRINTH_TRY(detail::read_int(node, "max_concurrent_sandboxes", 1, cfg.max_concurrent_sandboxes));
    LABYRINTH_TRY(detail::read_int(node, "max_queue_depth", 1, cfg.max_queue_depth));
    LABYRINTH_TRY(detail::read_int(node, "rate_limit_submissions", 1, cfg.rate_limit_submissions));
    LABYRINTH_TRY(detail::read_int(node, "rate_limit_window_seconds", 1, cfg.rate_limit_window_seconds));
    LABYRINTH_TRY(detail::read_int(node, "max_artifact_bytes", 1, cfg.max_artifact_bytes));
    LABYRINTH_TRY(detail::read_int(node, "persist_retries", 0, cfg.persist_retries));
    LABYRINTH_TRY(detail::read_int(node, "persist_backoff_ms", 0, cfg.persist_backoff_ms));
    detail::read_string(node, "store_dir", cfg.store_dir);
    return Ok();
}

inline Result<void> load_sandbox_settings(const yaml::YamlNodePtr &node, SandboxSettings &cfg) {
    if (!node) return Ok();
    LABYRINTH_TRY(detail::read_int(node, "time_limit_ms", 1, cfg.time_limit_ms));
    LABYRINTH_TRY(detail::read_int(node, "wall_time_limit_ms", 0, cfg.wall_time_limit_ms));
    LABYRINTH_TRY(detail::read_int(node, "memory_limit_mb", 1, cfg.memory_limit_mb));
    LABYRINTH_TRY(detail::read_int(node, "output_limit_kb", 1, cfg.output_limit_kb));
    LABYRINTH_TRY(detail::read_int(node, "max_processes", 1, cfg.max_processes));
    detail::read_string(node, "scratch_root", cfg.scratch_root);
    LABYRINTH_TRY(detail::read_bool(node, "use_seccomp", cfg.use_seccomp));
    LABYRINTH_TRY(detail::read_bool(node, "use_cgroup", cfg.use_cgroup));
    LABYRINTH_TRY(detail::read_bool(node, "use_namespace", cfg.use_namespace));

    if (node->has("readonly")) {
        cfg.readonly = node->get("readonly")->as_string_list();
    }

    if (node->has("extra_syscalls")) {
        cfg.extra_syscalls.clear();
        for (const auto &name : node->get("extra_syscalls")->as_string_list()) {
            int nr = syscall_name_to_nr(name);
            if (nr < 0) {
                return LABYRINTH_ERROR(ErrorCode::CONFIG_INVALID_VALUE, "unknown syscall " + name);
            }
            cfg.extra_syscalls.push_back(nr);
        }
    }

    if (node->has("runtimes")) {
        cfg.runtimes.clear();
        for (const auto &item : node->get("runtimes")->as_list()) {
            if (!item || !item->is_map()) {
                return LABYRINTH_ERROR(ErrorCode::CONFIG_INVALID_VALUE,
                                       "runtimes entries must be maps");
            }
            Runtime rt;
            detail::read_string(item, "extension", rt.extension);
            detail::read_string(item, "interpreter", rt.interpreter);
            if (rt.extension.empty() || rt.interpreter.empty()) {
                return LABYRINTH_ERROR(ErrorCode::CONFIG_INVALID_VALUE,
                                       "runtime needs extension and interpreter");
            }
            // checks: 内置规则集；blocked_imports / blocked_patterns 追加在其后
            std::string checks = "none";
            detail::read_string(item, "checks", checks);
            if (checks == "python") {
                rt.rules = default_python_rules();
            } else if (checks != "none") {
                return LABYRINTH_ERROR(ErrorCode::CONFIG_INVALID_VALUE,
                                       "unknown checks '" + checks + "' for runtime " + rt.extension);
            }
            if (item->has("blocked_imports")) {
                for (const auto &name : item->get("blocked_imports")->as_string_list()) {
                    rt.rules.blocked_imports.push_back(name);
                }
            }
            if (item->has("blocked_patterns")) {
                for (const auto &pattern : item->get("blocked_patterns")->as_string_list()) {
                    rt.rules.blocked_patterns.push_back(pattern);
                }
            }
            auto compiled = ScriptCheck::compile(rt.rules);
            if (!compiled.ok()) {
                return compiled.error().with_context("runtime " + rt.extension);
            }
            cfg.runtimes.push_back(rt);
        }
    }
    return Ok();
}

inline Result<LabyrinthConfig> parse_config(const yaml::YamlNodePtr &doc) {
    LabyrinthConfig config;
    if (!doc) return config;
    if (!doc->is_map()) {
        return LABYRINTH_ERROR(ErrorCode::CONFIG_PARSE_ERROR, "top level must be a map");
    }

    LABYRINTH_TRY(load_log_config(doc->get("log"), config.log));
    detail::read_string(doc->get("mazes"), "dir", config.maze_dir);
    LABYRINTH_TRY(load_pipeline_config(doc->get("pipeline"), config.pipeline));
    LABYRINTH_TRY(load_sandbox_settings(doc->get("sandbox"), config.sandbox));
    LABYRINTH_TRY(detail::read_int(doc->get("session"), "idle_timeout_seconds", 1,
                                   config.session.idle_timeout_seconds));
    int64_t wall_ms = config.sandbox.effective_wall_ms();
    if (static_cast<int64_t>(config.session.idle_timeout_seconds) * 1000 < wall_ms) {
        return LABYRINTH_ERROR(ErrorCode::CONFIG_INVALID_VALUE,
            "session.idle_timeout_seconds (" + std::to_string(config.session.idle_timeout_seconds) +
            "s) is shorter than the sandbox wall time limit (" + std::to_string(wall_ms) + "ms)");
    }
    return config;
}

inline Result<LabyrinthConfig> load_config(const std::string &path) {
    LABYRINTH_TRY_UNWRAP(doc, yaml::load_yaml(path));
    auto config = parse_config(doc);
    if (!config.ok()) {
        config.error().with_context(path);
    }
    return config;
}

} // namespace labyrinth

#endif // LABYRINTH_CORE_CONFIG_H

/**
 * @file cgroup.h
 * @brief cgroups v2：每次运行一个子 cgroup，限制内存与进程数，并读取用量
 *
 * 目录布局：
 *
 *   <self>/supervisor/      平台进程自己搬进这里
 *   <self>/sandbox/run_N/   沙箱运行，放在池里复用
 *
 * 平台进程必须先离开 <self>，否则 <self> 的 subtree_control 写入返回 EBUSY。
 */

#ifndef LABYRINTH_SANDBOX_CGROUP_H
#define LABYRINTH_SANDBOX_CGROUP_H

#include <string>
#include <fstream>
#include <sstream>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <cstdint>
#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/vfs.h>
#include <linux/magic.h>

#include "core/error.h"
#include "core/labyrinth_logger.h"

namespace labyrinth {
namespace sandbox {

constexpr const char* CGROUP_MOUNT = "/sys/fs/cgroup";

inline bool is_cgroup_v2_available() {
    struct statfs st;
    return statfs(CGROUP_MOUNT, &st) == 0 && st.f_type == CGROUP2_SUPER_MAGIC;
}

namespace detail {

inline Result<void> write_knob(const std::string &dir, const char *knob, const std::string &value) {
    std::string path = dir + "/" + knob;
    std::ofstream out(path);
    out << value;
    out.flush();
    if (!out) {
        return LABYRINTH_ERROR(ErrorCode::CGROUP_ERROR, std::string("write ") + path + ": " + strerror(errno));
    }
    return Ok();
}

inline std::optional<std::string> read_knob(const std::string &dir, const char *knob) {
    std::ifstream in(dir + "/" + knob);
    if (!in) return std::nullopt;
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

/// cpu.stat、memory.events 这类 "name value" 行
inline uint64_t keyed_value(const std::optional<std::string> &text, const char *key) {
    if (!text) return 0;
    std::istringstream in(*text);
    std::string name;
    uint64_t value;
    while (in >> name >> value) {
        if (name == key) return value;
    }
    return 0;
}

/// /proc/self/cgroup 中 v2 层级（"0::"）的路径
inline std::string own_cgroup() {
    std::ifstream in("/proc/self/cgroup");
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("0::", 0) == 0) return line.substr(3);
    }
    return "";
}

} // namespace detail

/**
 * @brief 一次读数；计数器字段从 cgroup 创建起累计
 */
struct CgroupStats {
    uint64_t cpu_user_usec = 0;
    uint64_t memory_peak = 0;       ///< bytes，不能清零
    uint64_t oom_kills = 0;

    CgroupStats since(const CgroupStats &before) const {
        CgroupStats d = *this;
        d.cpu_user_usec -= before.cpu_user_usec;
        d.oom_kills -= before.oom_kills;
        return d;
    }
};

class CgroupController {
private:
    std::string dir_;
    int uses_ = 0;

public:
    explicit CgroupController(std::string dir) : dir_(std::move(dir)) {}

    CgroupController(const CgroupController&) = delete;
    CgroupController& operator=(const CgroupController&) = delete;

    const std::string& path() const { return dir_; }

    /// 放入过进程的次数，0 表示 memory.peak 可信
    int uses() const { return uses_; }

    Result<void> limit(uint64_t memory_mb, uint64_t max_pids) {
        if (memory_mb > 0) {
            LABYRINTH_TRY(detail::write_knob(dir_, "memory.max", std::to_string(memory_mb << 20)));
        }
        auto swap = detail::write_knob(dir_, "memory.swap.max", "0");
        if (!swap.ok()) {
            XLOG_DEBUG << "no swap control: " << swap.error().message();
        }
        if (max_pids > 0) {
            LABYRINTH_TRY(detail::write_knob(dir_, "pids.max", std::to_string(max_pids)));
        }
        return Ok();
    }

    Result<void> add_process(pid_t pid) {
        uses_++;
        return detail::write_knob(dir_, "cgroup.procs", std::to_string(pid));
    }

    CgroupStats get_stats() const {
        CgroupStats s;
        s.cpu_user_usec = detail::keyed_value(detail::read_knob(dir_, "cpu.stat"), "user_usec");
        s.oom_kills = detail::keyed_value(detail::read_knob(dir_, "memory.events"), "oom_kill");
        auto peak = detail::read_knob(dir_, "memory.peak");
        if (peak && peak->rfind("max", 0) != 0) {
            s.memory_peak = std::strtoull(peak->c_str(), nullptr, 10);
        }
        return s;
    }

    /**
     * @brief 杀掉残留进程并等到 cgroup.procs 为空，约 100ms 为限
     */
    Result<void> drain() {
        LABYRINTH_TRY(detail::write_knob(dir_, "cgroup.kill", "1"));
        for (int attempt = 0; attempt < 100; attempt++) {
            auto procs = detail::read_knob(dir_, "cgroup.procs");
            if (procs && procs->find_first_not_of(" \n") == std::string::npos) {
                return Ok();
            }
            usleep(1000);
        }
        return LABYRINTH_ERROR(ErrorCode::CGROUP_ERROR, "cgroup not empty: " + dir_);
    }

    Result<void> remove() {
        if (rmdir(dir_.c_str()) != 0 && errno != ENOENT) {
            return LABYRINTH_ERROR(ErrorCode::CGROUP_ERROR, "rmdir " + dir_ + ": " + strerror(errno));
        }
        return Ok();
    }
};

/**
 * @brief 建立 supervisor/ 与 sandbox/ 两层（单例，只做一次）
 */
class CgroupManager {
private:
    std::mutex mutex_;
    std::string sandbox_root_;

    CgroupManager() = default;

    static Result<void> make_dir(const std::string &dir) {
        if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
            return LABYRINTH_ERROR(ErrorCode::CGROUP_ERROR, "mkdir " + dir + ": " + strerror(errno));
        }
        return Ok();
    }

    static void delegate_controllers(const std::string &dir) {
        auto enabled = detail::write_knob(dir, "cgroup.subtree_control", "+memory +cpu +pids");
        if (!enabled.ok()) {
            XLOG_WARN << "controllers not enabled: " << enabled.error().message();
        }
    }

public:
    static CgroupManager& instance() {
        static CgroupManager manager;
        return manager;
    }

    Result<void> initialize() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!sandbox_root_.empty()) return Ok();

        LABYRINTH_ENSURE(is_cgroup_v2_available(), ErrorCode::CGROUP_ERROR,
                         "cgroup v2 is not mounted");
        std::string own = detail::own_cgroup();
        std::string base = CGROUP_MOUNT;
        if (own.size() > 1) base += own;

        LABYRINTH_TRY(make_dir(base + "/supervisor"));
        LABYRINTH_TRY(detail::write_knob(base + "/supervisor", "cgroup.procs", std::to_string(getpid())));
        delegate_controllers(base);

        std::string root = base + "/sandbox";
        LABYRINTH_TRY(make_dir(root));
        delegate_controllers(root);

        XLOG_INFO << "cgroup hierarchy ready under " << base;
        sandbox_root_ = root;
        return Ok();
    }

    std::string sandbox_root() {
        std::lock_guard<std::mutex> lock(mutex_);
        return sandbox_root_;
    }
};

/**
 * @brief 空闲 cgroup 的池
 *
 * 归还时先 drain；drain 失败或池已满时删除目录。
 */
class CgroupPool {
private:
    std::mutex mutex_;
    std::vector<std::unique_ptr<CgroupController>> idle_;
    int next_id_ = 0;
    static constexpr size_t MAX_IDLE = 8;

    CgroupPool() = default;

    static void discard(std::unique_ptr<CgroupController> cg) {
        auto removed = cg->remove();
        if (!removed.ok()) XLOG_WARN << removed.error().to_string();
    }

public:
    static CgroupPool& instance() {
        static CgroupPool pool;
        return pool;
    }

    ~CgroupPool() {
        for (auto &cg : idle_) discard(std::move(cg));
    }

    Result<std::unique_ptr<CgroupController>> acquire(uint64_t memory_mb, uint64_t max_pids) {
        LABYRINTH_TRY(CgroupManager::instance().initialize());

        std::unique_ptr<CgroupController> cg;
        std::string name;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!idle_.empty()) {
                cg = std::move(idle_.back());
                idle_.pop_back();
            } else {
                name = "run_" + std::to_string(getpid()) + "_" + std::to_string(next_id_++);
            }
        }
        if (!cg) {
            std::string dir = CgroupManager::instance().sandbox_root() + "/" + name;
            if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
                return LABYRINTH_ERROR(ErrorCode::CGROUP_ERROR, "mkdir " + dir + ": " + strerror(errno));
            }
            cg = std::make_unique<CgroupController>(dir);
        }

        auto limited = cg->limit(memory_mb, max_pids);
        if (!limited.ok()) {
            discard(std::move(cg));
            return limited.error();
        }
        return cg;
    }

    void release(std::unique_ptr<CgroupController> cg) {
        if (!cg) return;
        auto drained = cg->drain();
        if (!drained.ok()) {
            XLOG_WARN << "discarding cgroup: " << drained.error().to_string();
            discard(std::move(cg));
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (idle_.size() < MAX_IDLE) {
            idle_.push_back(std::move(cg));
            return;
        }
        discard(std::move(cg));
    }
};

} // namespace sandbox
} // namespace labyrinth

#endif // LABYRINTH_SANDBOX_CGROUP_H

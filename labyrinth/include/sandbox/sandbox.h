/**
 * @file sandbox.h
 * @brief 玩家程序执行沙箱
 *
 * 整合 namespaces + pivot_root、cgroups v2、rlimit 和 seccomp-bpf。
 * 与会话引擎之间只有一条通道：继承到子进程 fd 3 的 AF_UNIX socketpair，
 * 监督循环逐行读取请求、交给处理器、写回应答，同时负责墙钟超时。
 *
 * 各隔离层可按配置关闭（无特权的宿主机），此时退化为 rlimit + 监督超时。
 */

#ifndef LABYRINTH_SANDBOX_SANDBOX_H
#define LABYRINTH_SANDBOX_SANDBOX_H

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <thread>
#include <functional>
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <ostream>
#include <cstring>
#include <cstdio>
#include <cstdlib>
#include <climits>

#include <unistd.h>
#include <poll.h>
#include <sched.h>
#include <fcntl.h>
#include <errno.h>
#include <signal.h>
#include <sys/wait.h>
#include <sys/mount.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/syscall.h>

#include "core/error.h"
#include "core/utils.h"
#include "core/labyrinth_logger.h"
#include "maze/protocol.h"
#include "sandbox/seccomp.h"
#include "sandbox/cgroup.h"

namespace labyrinth {
namespace sandbox {

//==============================================================================
// 执行结果
//==============================================================================

enum class RunStatus {
    OK,
    TIMED_OUT,            ///< 墙钟超时，被监督方 SIGKILL
    CPU_LIMIT,
    MEMORY_LIMIT,
    OUTPUT_LIMIT,
    RUNTIME_ERROR,        ///< 非零退出或无法执行
    KILLED_BY_SIGNAL,
    SECURITY_VIOLATION,   ///< seccomp 拦截 (SIGSYS) 或会话 token 不匹配
    INTERNAL_ERROR
};

inline const char* status_to_string(RunStatus status) {
    switch (status) {
        case RunStatus::OK: return "OK";
        case RunStatus::TIMED_OUT: return "TIMED_OUT";
        case RunStatus::CPU_LIMIT: return "CPU_LIMIT";
        case RunStatus::MEMORY_LIMIT: return "MEMORY_LIMIT";
        case RunStatus::OUTPUT_LIMIT: return "OUTPUT_LIMIT";
        case RunStatus::RUNTIME_ERROR: return "RUNTIME_ERROR";
        case RunStatus::KILLED_BY_SIGNAL: return "KILLED_BY_SIGNAL";
        case RunStatus::SECURITY_VIOLATION: return "SECURITY_VIOLATION";
        case RunStatus::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

inline std::ostream& operator<<(std::ostream &os, RunStatus status) {
    return os << status_to_string(status);
}

struct SandboxResult {
    RunStatus status;
    int exit_code;
    int signal;
    uint64_t cpu_ms;
    uint64_t wall_ms;
    uint64_t memory_kb;
    std::string stdout_preview;
    std::string stderr_preview;
    std::string message;          ///< 面向用户的简短说明，不含隔离层细节
    size_t requests;              ///< 通道上处理过的请求行数

    SandboxResult()
        : status(RunStatus::INTERNAL_ERROR), exit_code(-1), signal(0),
          cpu_ms(0), wall_ms(0), memory_kb(0), requests(0) {}

    bool ok() const { return status == RunStatus::OK && exit_code == 0; }
};

//==============================================================================
// 沙箱配置
//==============================================================================

struct SandboxConfig {
    // 资源限制
    int time_limit_ms = 10000;          ///< CPU 时间
    int wall_time_limit_ms = 300000;    ///< 0 = time_limit_ms * 3 + 1000
    int memory_limit_mb = 256;
    int output_limit_kb = 1024;
    int max_processes = 8;
    size_t preview_bytes = 1024;

    // 程序：program 为空时直接执行暂存后的 artifact；
    // 否则 argv = program [artifact] args...
    std::string program;
    std::string artifact;
    std::vector<std::string> args;
    std::vector<std::string> env;

    // 文件系统
    std::vector<std::string> readonly = {"/usr", "/lib", "/lib64", "/bin"};
    std::string scratch_root = "/tmp";

    // 隔离层
    bool use_seccomp = true;
    bool use_cgroup = true;
    bool use_namespace = true;
    std::vector<int> extra_syscalls;

    int effective_wall_ms() const {
        return wall_time_limit_ms > 0 ? wall_time_limit_ms : time_limit_ms * 3 + 1000;
    }

    SandboxConfig& set_program(const std::string &prog) { program = prog; return *this; }
    SandboxConfig& set_artifact(const std::string &path) { artifact = path; return *this; }
    SandboxConfig& add_arg(const std::string &arg) { args.push_back(arg); return *this; }
    SandboxConfig& add_env(const std::string &kv) { env.push_back(kv); return *this; }
    SandboxConfig& disable_isolation() {
        use_seccomp = use_cgroup = use_namespace = false;
        return *this;
    }
};

/// 通道请求处理器：一行请求进，一行应答出
using ChannelHandler = std::function<protocol::Reply(const std::string&)>;

//==============================================================================
// 每次运行独占的暂存目录
//==============================================================================

/**
 * @brief mkdtemp 创建，析构时整体删除
 *
 *   <scratch>/work     子进程工作目录（唯一可写路径）
 *   <scratch>/root     pivot_root 的新根（tmpfs 挂载点）
 *   <scratch>/stdout   标准输出（子进程不可见）
 *   <scratch>/stderr
 */
class ScratchDir {
private:
    std::string path_;

public:
    ScratchDir() = default;
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    ~ScratchDir() {
        if (path_.empty()) return;
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            XLOG_WARN << "cannot remove scratch dir " << path_ << ": " << ec.message();
        }
    }

    Result<void> create(const std::string &root) {
        std::string tmpl = root + "/labyrinth_XXXXXX";
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()) == nullptr) {
            return LABYRINTH_ERROR(ErrorCode::SANDBOX_SETUP_FAILED,
                                   "mkdtemp under " + root + ": " + strerror(errno));
        }
        path_ = get_realpath(buf.data());
        if (path_.empty()) {
            path_ = buf.data();
        }
        for (const char *sub : {"/work", "/root"}) {
            if (mkdir((path_ + sub).c_str(), 0755) < 0) {
                return LABYRINTH_ERROR(ErrorCode::SANDBOX_SETUP_FAILED,
                                       "mkdir " + path_ + sub + ": " + strerror(errno));
            }
        }
        return Ok();
    }

    /**
     * @brief 把 artifact 复制进工作目录并设为可执行
     */
    Result<std::string> stage(const std::string &artifact) {
        std::filesystem::path src(artifact);
        std::string dst = work() + "/" + src.filename().string();
        std::error_code ec;
        std::filesystem::copy_file(src, dst, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            return LABYRINTH_ERROR(ErrorCode::SANDBOX_SETUP_FAILED,
                                   "cannot stage " + artifact + ": " + ec.message());
        }
        if (chmod(dst.c_str(), 0755) < 0) {
            return LABYRINTH_ERROR(ErrorCode::SANDBOX_SETUP_FAILED,
                                   "chmod " + dst + ": " + strerror(errno));
        }
        return dst;
    }

    const std::string& path() const { return path_; }
    std::string work() const { return path_ + "/work"; }
    std::string root() const { return path_ + "/root"; }
    std::string stdout_file() const { return path_ + "/stdout"; }
    std::string stderr_file() const { return path_ + "/stderr"; }
};

//==============================================================================
// 沙箱执行器
//==============================================================================

class Sandbox {
private:
    SandboxConfig config_;

    /// 子进程 fork 前准备好的全部数据，子进程中不再分配
    struct ChildPlan {
        std::vector<std::string> argv_store;
        std::vector<std::string> env_store;
        std::vector<char*> argv;
        std::vector<char*> envp;
        std::string work_dir;
        std::string new_root;
        std::string stdout_file;
        std::string stderr_file;
        int channel_fd = -1;
        int report_fd = -1;
        uid_t uid = 0;
        gid_t gid = 0;
        SeccompFilter filter;

        /// 指针数组指向 *_store，必须在 plan 定型之后再生成
        void finalize() {
            argv.clear();
            envp.clear();
            for (auto &s : argv_store) argv.push_back(&s[0]);
            argv.push_back(nullptr);
            for (auto &s : env_store) envp.push_back(&s[0]);
            envp.push_back(nullptr);
        }
    };

    /// 子进程向父进程报告失败阶段：'S' 隔离层搭建失败，'E' execve 失败
    [[noreturn]] static void child_fail(int report_fd, char stage, const char *what) {
        char buf[256];
        int n = snprintf(buf, sizeof(buf), "%c%s: %s", stage, what, strerror(errno));
        if (n > 0) {
            size_t len = std::min(static_cast<size_t>(n), sizeof(buf) - 1);
            if (write(report_fd, buf, len) < 0) {
                _exit(127);
            }
        }
        _exit(127);
    }

    static bool write_proc_file(const char *path, const char *content) {
        int fd = open(path, O_WRONLY | O_CLOEXEC);
        if (fd < 0) return false;
        size_t len = strlen(content);
        bool ok = write(fd, content, len) == static_cast<ssize_t>(len);
        close(fd);
        return ok;
    }

    static void mkpath(const char *path) {
        char dir[PATH_MAX];
        snprintf(dir, sizeof(dir), "%s", path);
        for (char *p = dir + 1; *p; p++) {
            if (*p == '/') { *p = '\0'; mkdir(dir, 0755); *p = '/'; }
        }
        mkdir(dir, 0755);
    }

    /**
     * @brief 把宿主机路径按原路径 bind 到新根下
     *
     * 源不存在时跳过；符号链接原样重建（/lib64 -> usr/lib64 这类）。
     */
    static bool bind_into(const char *new_root, const std::string &src, bool readonly) {
        struct stat lst;
        if (lstat(src.c_str(), &lst) != 0) {
            return true;
        }
        char target[PATH_MAX];
        snprintf(target, sizeof(target), "%s%s", new_root, src.c_str());

        char parent[PATH_MAX];
        snprintf(parent, sizeof(parent), "%s", target);
        char *slash = strrchr(parent, '/');
        if (slash && slash != parent) {
            *slash = '\0';
            mkpath(parent);
        }

        if (S_ISLNK(lst.st_mode)) {
            char link[PATH_MAX];
            ssize_t len = readlink(src.c_str(), link, sizeof(link) - 1);
            if (len <= 0) return false;
            link[len] = '\0';
            return symlink(link, target) == 0 || errno == EEXIST;
        }

        if (S_ISDIR(lst.st_mode)) {
            if (mkdir(target, 0755) != 0 && errno != EEXIST) return false;
        } else {
            int fd = open(target, O_CREAT | O_RDONLY | O_CLOEXEC, 0644);
            if (fd < 0) return false;
            close(fd);
        }

        if (mount(src.c_str(), target, nullptr, MS_BIND | MS_REC, nullptr) != 0) {
            return false;
        }
        if (readonly &&
            mount(nullptr, target, nullptr, MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID, nullptr) != 0) {
            return false;
        }
        return true;
    }

    /**
     * @brief 新的 user/mount/ipc/uts/net namespace，pivot_root 到 tmpfs 新根
     *
     * 新根上只有只读运行库和可写工作目录。非 root 运行时借助 user namespace
     * 获得挂载能力。
     */
    static void setup_isolation(const SandboxConfig &config, const ChildPlan &plan) {
        int flags = CLONE_NEWNS | CLONE_NEWIPC | CLONE_NEWUTS | CLONE_NEWNET;
        bool rootless = plan.uid != 0;
        if (rootless) {
            flags |= CLONE_NEWUSER;
        }
        if (unshare(flags) != 0) {
            child_fail(plan.report_fd, 'S', "unshare");
        }
        if (rootless) {
            char map[64];
            if (!write_proc_file("/proc/self/setgroups", "deny")) {
                child_fail(plan.report_fd, 'S', "setgroups");
            }
            snprintf(map, sizeof(map), "%u %u 1\n", plan.uid, plan.uid);
            if (!write_proc_file("/proc/self/uid_map", map)) {
                child_fail(plan.report_fd, 'S', "uid_map");
            }
            snprintf(map, sizeof(map), "%u %u 1\n", plan.gid, plan.gid);
            if (!write_proc_file("/proc/self/gid_map", map)) {
                child_fail(plan.report_fd, 'S', "gid_map");
            }
        }
        if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
            child_fail(plan.report_fd, 'S', "make / private");
        }

        const char *new_root = plan.new_root.c_str();
        if (mount("tmpfs", new_root, "tmpfs", MS_NOSUID | MS_NODEV, "size=16m") != 0) {
            child_fail(plan.report_fd, 'S', "mount tmpfs root");
        }
        for (const auto &path : config.readonly) {
            if (!bind_into(new_root, path, true)) {
                child_fail(plan.report_fd, 'S', "bind readonly path");
            }
        }
        if (!bind_into(new_root, plan.work_dir, false)) {
            child_fail(plan.report_fd, 'S', "bind work dir");
        }

        if (syscall(__NR_pivot_root, new_root, new_root) != 0) {
            child_fail(plan.report_fd, 'S', "pivot_root");
        }
        if (umount2("/", MNT_DETACH) != 0) {
            child_fail(plan.report_fd, 'S', "detach old root");
        }
        if (chdir("/") != 0) {
            child_fail(plan.report_fd, 'S', "chdir /");
        }
    }

    static void setup_rlimits(const SandboxConfig &config, int report_fd) {
        struct rlimit rl;

        // CPU 时间：软限制触发 SIGXCPU
        rl.rlim_cur = static_cast<rlim_t>((config.time_limit_ms + 999) / 1000 + 1);
        rl.rlim_max = rl.rlim_cur + 1;
        if (setrlimit(RLIMIT_CPU, &rl) != 0) {
            child_fail(report_fd, 'S', "setrlimit");
        }

        // 地址空间留两倍余量，真实内存由 cgroup 控制
        rl.rlim_cur = rl.rlim_max = static_cast<rlim_t>(config.memory_limit_mb) * 1024 * 1024 * 2;
        if (setrlimit(RLIMIT_AS, &rl) != 0) {
            child_fail(report_fd, 'S', "setrlimit");
        }

        rl.rlim_cur = rl.rlim_max = static_cast<rlim_t>(config.output_limit_kb) * 1024;
        if (setrlimit(RLIMIT_FSIZE, &rl) != 0) {
            child_fail(report_fd, 'S', "setrlimit");
        }

        rl.rlim_cur = rl.rlim_max = 0;
        if (setrlimit(RLIMIT_CORE, &rl) != 0) {
            child_fail(report_fd, 'S', "setrlimit");
        }
    }

    static void redirect(const ChildPlan &plan) {
        int in = open("/dev/null", O_RDONLY | O_CLOEXEC);
        int out = open(plan.stdout_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        int err = open(plan.stderr_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (in < 0 || out < 0 || err < 0) {
            child_fail(plan.report_fd, 'S', "open standard streams");
        }
        if (dup2(in, STDIN_FILENO) < 0 || dup2(out, STDOUT_FILENO) < 0 ||
            dup2(err, STDERR_FILENO) < 0) {
            child_fail(plan.report_fd, 'S', "dup2 standard streams");
        }
        close(in);
        close(out);
        close(err);

        if (plan.channel_fd < 0) return;
        if (plan.channel_fd == protocol::SESSION_FD) {
            if (fcntl(protocol::SESSION_FD, F_SETFD, 0) < 0) {
                child_fail(plan.report_fd, 'S', "session channel");
            }
        } else if (dup2(plan.channel_fd, protocol::SESSION_FD) < 0) {
            child_fail(plan.report_fd, 'S', "session channel");
        }
    }

    [[noreturn]] static void child_exec(const SandboxConfig &config, ChildPlan &plan) {
        // 进程组，超时和违规时整组杀死
        if (setpgid(0, 0) != 0) {
            child_fail(plan.report_fd, 'S', "setpgid");
        }

        // 标准流在切换根之前打开，输出文件对子进程不可见
        redirect(plan);

        if (config.use_namespace) {
            setup_isolation(config, plan);
        }
        if (chdir(plan.work_dir.c_str()) != 0) {
            child_fail(plan.report_fd, 'S', "chdir work dir");
        }

        setup_rlimits(config, plan.report_fd);

        if (config.use_seccomp && !plan.filter.install()) {
            child_fail(plan.report_fd, 'S', "seccomp");
        }

        execve(plan.argv[0], plan.argv.data(), plan.envp.data());
        child_fail(plan.report_fd, 'E', "execve");
    }

    Result<ChildPlan> make_plan(const ScratchDir &scratch, const std::string &staged) const {
        ChildPlan plan;
        if (!config_.program.empty()) {
            plan.argv_store.push_back(config_.program);
        }
        if (!staged.empty()) {
            plan.argv_store.push_back(staged);
        }
        for (const auto &arg : config_.args) {
            plan.argv_store.push_back(arg);
        }
        LABYRINTH_ENSURE(!plan.argv_store.empty(), ErrorCode::SANDBOX_SETUP_FAILED,
                         "nothing to execute");

        plan.env_store = config_.env;
        plan.env_store.push_back("PATH=/usr/bin:/bin");
        plan.env_store.push_back("HOME=" + scratch.work());
        plan.env_store.push_back(std::string(protocol::ENV_SESSION_FD) + "=" +
                                 std::to_string(protocol::SESSION_FD));

        plan.work_dir = scratch.work();
        plan.new_root = scratch.root();
        plan.stdout_file = scratch.stdout_file();
        plan.stderr_file = scratch.stderr_file();
        plan.uid = getuid();
        plan.gid = getgid();

        if (config_.use_seccomp) {
            plan.filter = create_player_filter(config_.extra_syscalls);
            LABYRINTH_TRY(plan.filter.build());
        }
        return plan;
    }

    /**
     * @brief 发送一行应答；对端不读或已关闭时返回 false
     */
    static bool send_reply(int fd, const std::string &line) {
        std::string data = line + "\n";
        size_t off = 0;
        while (off < data.size()) {
            ssize_t n = send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL | MSG_DONTWAIT);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            off += static_cast<size_t>(n);
        }
        return true;
    }

    static void kill_group(pid_t pid) {
        if (kill(-pid, SIGKILL) < 0 && errno != ESRCH) {
            XLOG_WARN << "kill process group " << pid << ": " << strerror(errno);
        }
    }

    static std::string read_report(int fd) {
        std::string report;
        char buf[256];
        ssize_t n;
        while ((n = read(fd, buf, sizeof(buf))) > 0) {
            report.append(buf, static_cast<size_t>(n));
        }
        return report;
    }

public:
    explicit Sandbox(const SandboxConfig &config) : config_(config) {}

    /**
     * @brief 执行一次
     *
     * 返回错误只表示沙箱本身无法搭建（目录、socketpair、fork）；
     * 程序的任何结局都体现在 SandboxResult::status 中。
     *
     * @param handler 通道请求处理器；为空时子进程没有会话通道
     */
    Result<SandboxResult> run(const ChannelHandler &handler = nullptr) {
        SandboxResult result;

        ScratchDir scratch;
        LABYRINTH_TRY(scratch.create(config_.scratch_root));
        std::string staged;
        if (!config_.artifact.empty()) {
            LABYRINTH_TRY_UNWRAP(path, scratch.stage(config_.artifact));
            staged = path;
        }
        LABYRINTH_TRY_UNWRAP(plan, make_plan(scratch, staged));

        // 1. cgroup
        std::unique_ptr<CgroupController> cgroup;
        CgroupStats before;
        bool fresh_cgroup = false;
        if (config_.use_cgroup) {
            auto acquired = CgroupPool::instance().acquire(
                static_cast<uint64_t>(config_.memory_limit_mb),
                static_cast<uint64_t>(config_.max_processes));
            if (!acquired.ok()) {
                return acquired.error();
            }
            cgroup = std::move(acquired.value());
            before = cgroup->get_stats();
            fresh_cgroup = cgroup->uses() == 0;
        }
        auto release_cgroup = [&cgroup]() {
            if (cgroup) CgroupPool::instance().release(std::move(cgroup));
        };

        // 2. 会话通道 + 同步管道 + 失败报告管道
        int channel[2] = {-1, -1};
        if (handler && socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, channel) < 0) {
            release_cgroup();
            return LABYRINTH_ERROR(ErrorCode::PIPE_FAILED, std::string("socketpair: ") + strerror(errno));
        }
        int sync_pipe[2];
        int report_pipe[2];
        if (pipe2(sync_pipe, O_CLOEXEC) < 0) {
            if (handler) { close(channel[0]); close(channel[1]); }
            release_cgroup();
            return LABYRINTH_ERROR(ErrorCode::PIPE_FAILED, std::string("pipe: ") + strerror(errno));
        }
        if (pipe2(report_pipe, O_CLOEXEC) < 0) {
            close(sync_pipe[0]);
            close(sync_pipe[1]);
            if (handler) { close(channel[0]); close(channel[1]); }
            release_cgroup();
            return LABYRINTH_ERROR(ErrorCode::PIPE_FAILED, std::string("pipe: ") + strerror(errno));
        }
        plan.channel_fd = channel[1];
        plan.report_fd = report_pipe[1];
        plan.finalize();

        auto start_time = std::chrono::steady_clock::now();

        // 3. fork
        pid_t pid = fork();
        if (pid < 0) {
            int saved = errno;
            close(sync_pipe[0]);
            close(sync_pipe[1]);
            close(report_pipe[0]);
            close(report_pipe[1]);
            if (handler) { close(channel[0]); close(channel[1]); }
            release_cgroup();
            return LABYRINTH_ERROR(ErrorCode::FORK_FAILED, std::string("fork: ") + strerror(saved));
        }

        if (pid == 0) {
            close(sync_pipe[1]);
            char go;
            if (read(sync_pipe[0], &go, 1) != 1) {
                _exit(127);
            }
            close(sync_pipe[0]);
            child_exec(config_, plan);
        }

        close(sync_pipe[0]);
        close(report_pipe[1]);
        if (handler) close(channel[1]);
        int channel_fd = handler ? channel[0] : -1;

        // 4. 放入 cgroup 后放行子进程
        if (cgroup) {
            auto added = cgroup->add_process(pid);
            if (!added.ok()) {
                XLOG_ERROR << "cannot add " << pid << " to cgroup: " << added.error().to_string();
                kill(pid, SIGKILL);
            }
        }
        if (write(sync_pipe[1], "x", 1) != 1) {
            XLOG_ERROR << "cannot release child " << pid << ": " << strerror(errno);
            kill(pid, SIGKILL);
        }
        close(sync_pipe[1]);

        // 5. 监督循环：通道请求、子进程状态、墙钟
        auto deadline = start_time + std::chrono::milliseconds(config_.effective_wall_ms());
        int status = 0;
        struct rusage usage;
        memset(&usage, 0, sizeof(usage));
        bool timed_out = false;
        bool violation = false;
        bool wait_failed = false;
        std::string pending;

        while (true) {
            if (channel_fd >= 0) {
                struct pollfd pfd;
                pfd.fd = channel_fd;
                pfd.events = POLLIN;
                pfd.revents = 0;
                int ready = poll(&pfd, 1, 5);
                if (ready > 0) {
                    char buf[512];
                    ssize_t n = recv(channel_fd, buf, sizeof(buf), MSG_DONTWAIT);
                    if (n > 0) {
                        pending.append(buf, static_cast<size_t>(n));
                    } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                        close(channel_fd);
                        channel_fd = -1;
                    }
                }
                // 逐行处理；没有换行的超长请求也交给处理器拒绝
                while (channel_fd >= 0 && !violation) {
                    size_t nl = pending.find('\n');
                    std::string line;
                    if (nl != std::string::npos) {
                        line = pending.substr(0, nl);
                        pending.erase(0, nl + 1);
                    } else if (pending.size() > protocol::MAX_LINE) {
                        line.swap(pending);
                    } else {
                        break;
                    }
                    if (!line.empty() && line.back() == '\r') line.pop_back();
                    result.requests++;
                    protocol::Reply reply = handler(line);
                    if (reply.violation) {
                        violation = true;
                    }
                    if (!send_reply(channel_fd, reply.line)) {
                        XLOG_WARN << "child " << pid << " stopped reading the session channel";
                        close(channel_fd);
                        channel_fd = -1;
                    }
                }
                if (violation) {
                    XLOG_WARN << "session token mismatch from " << pid << ", killing run";
                    kill_group(pid);
                }
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }

            // 只探测不回收：僵尸状态的组长仍占着 pgid，此时清理残留的组员
            siginfo_t info;
            memset(&info, 0, sizeof(info));
            int ret = waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
            if (ret == 0 && info.si_pid == pid) {
                kill_group(pid);
                if (wait4(pid, &status, 0, &usage) < 0) {
                    XLOG_ERROR << "wait4 " << pid << ": " << strerror(errno);
                    wait_failed = true;
                }
                break;
            }
            if (ret < 0 && errno != EINTR) {
                XLOG_ERROR << "waitid " << pid << ": " << strerror(errno);
                kill_group(pid);
                wait_failed = true;
                break;
            }

            if (std::chrono::steady_clock::now() >= deadline) {
                timed_out = true;
                kill_group(pid);
                if (wait4(pid, &status, 0, &usage) < 0) {
                    XLOG_ERROR << "wait4 " << pid << ": " << strerror(errno);
                }
                break;
            }
        }

        if (channel_fd >= 0) close(channel_fd);
        std::string report = read_report(report_pipe[0]);
        close(report_pipe[0]);

        // 6. 资源使用
        auto end_time = std::chrono::steady_clock::now();
        result.wall_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count());
        result.cpu_ms = static_cast<uint64_t>(usage.ru_utime.tv_sec) * 1000 +
                        static_cast<uint64_t>(usage.ru_utime.tv_usec) / 1000;
        result.memory_kb = static_cast<uint64_t>(usage.ru_maxrss);

        bool oom = false;
        if (cgroup) {
            auto stats = cgroup->get_stats().since(before);
            if (stats.cpu_user_usec > 0) {
                result.cpu_ms = stats.cpu_user_usec / 1000;
            }
            // memory.peak 不能清零，复用的 cgroup 只能用 rusage
            if (fresh_cgroup && stats.memory_peak > 0) {
                result.memory_kb = stats.memory_peak / 1024;
            }
            oom = stats.oom_kills > 0;
        }
        release_cgroup();

        result.stdout_preview = file_preview(scratch.stdout_file(), config_.preview_bytes);
        result.stderr_preview = file_preview(scratch.stderr_file(), config_.preview_bytes);

        // 7. 分类
        classify(result, status, timed_out, violation, oom, wait_failed, report);

        XLOG_INFO << "run " << pid << " finished: " << result.status
                  << " exit=" << result.exit_code << " signal=" << result.signal
                  << " cpu=" << result.cpu_ms << "ms wall=" << result.wall_ms
                  << "ms mem=" << result.memory_kb << "KB requests=" << result.requests;
        return result;
    }

    const SandboxConfig& config() const { return config_; }

private:
    void classify(SandboxResult &result, int status, bool timed_out, bool violation,
                  bool oom, bool wait_failed, const std::string &report) const {
        uint64_t time_limit = static_cast<uint64_t>(config_.time_limit_ms);
        uint64_t memory_limit_kb = static_cast<uint64_t>(config_.memory_limit_mb) * 1024;

        if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
        if (WIFSIGNALED(status)) result.signal = WTERMSIG(status);

        if (wait_failed) {
            result.status = RunStatus::INTERNAL_ERROR;
            result.message = "Internal error";
            return;
        }
        if (!report.empty() && report[0] == 'S') {
            XLOG_ERROR << "sandbox setup failed: " << report.substr(1);
            result.status = RunStatus::INTERNAL_ERROR;
            result.message = "Internal error";
            return;
        }
        if (violation) {
            result.status = RunStatus::SECURITY_VIOLATION;
            result.message = "Session token mismatch";
            return;
        }
        if (timed_out) {
            result.status = RunStatus::TIMED_OUT;
            result.message = "Wall time limit exceeded";
            return;
        }
        if (oom) {
            result.status = RunStatus::MEMORY_LIMIT;
            result.message = "Memory limit exceeded";
            return;
        }
        if (!report.empty() && report[0] == 'E') {
            XLOG_WARN << "exec failed: " << report.substr(1);
            result.status = RunStatus::RUNTIME_ERROR;
            result.message = "Program could not be executed";
            return;
        }

        if (WIFSIGNALED(status)) {
            switch (result.signal) {
                case SIGSYS:
                    result.status = RunStatus::SECURITY_VIOLATION;
                    result.message = "Forbidden system call";
                    return;
                case SIGXFSZ:
                    result.status = RunStatus::OUTPUT_LIMIT;
                    result.message = "Output limit exceeded";
                    return;
                case SIGXCPU:
                    result.status = RunStatus::CPU_LIMIT;
                    result.message = "CPU time limit exceeded";
                    return;
                case SIGKILL:
                case SIGSEGV:
                case SIGBUS:
                    if (result.signal == SIGKILL && result.cpu_ms >= time_limit) {
                        result.status = RunStatus::CPU_LIMIT;
                        result.message = "CPU time limit exceeded";
                        return;
                    }
                    if (result.memory_kb >= memory_limit_kb) {
                        result.status = RunStatus::MEMORY_LIMIT;
                        result.message = "Memory limit exceeded";
                        return;
                    }
                    break;
                default:
                    break;
            }
            result.status = RunStatus::KILLED_BY_SIGNAL;
            result.message = std::string("Killed by signal ") + std::to_string(result.signal);
            return;
        }

        if (result.exit_code != 0) {
            result.status = RunStatus::RUNTIME_ERROR;
            result.message = "Exit code: " + std::to_string(result.exit_code);
        } else {
            result.status = RunStatus::OK;
        }

        if (result.cpu_ms > time_limit) {
            result.status = RunStatus::CPU_LIMIT;
            result.message = "CPU time limit exceeded";
        } else if (result.memory_kb > memory_limit_kb) {
            result.status = RunStatus::MEMORY_LIMIT;
            result.message = "Memory limit exceeded";
        }
    }
};

//==============================================================================
// 执行器接口
//==============================================================================

/**
 * @brief 提交流水线看到的执行器
 *
 * 测试中替换为脚本化实现，不必真正 fork。
 */
class SandboxRunner {
public:
    virtual ~SandboxRunner() = default;
    virtual Result<SandboxResult> run(const SandboxConfig &config,
                                      const ChannelHandler &handler) = 0;
};

class ProcessSandboxRunner : public SandboxRunner {
public:
    Result<SandboxResult> run(const SandboxConfig &config,
                              const ChannelHandler &handler) override {
        Sandbox sandbox(config);
        return sandbox.run(handler);
    }
};

/**
 * @brief 启动时打印宿主机支持的隔离层
 */
inline void check_sandbox_features() {
    XLOG_INFO << "seccomp-bpf: available";
    if (is_cgroup_v2_available()) {
        XLOG_INFO << "cgroups v2: available";
    } else {
        XLOG_WARN << "cgroups v2: not available";
    }
    if (file_exists("/proc/self/ns/user")) {
        XLOG_INFO << "user namespaces: available";
    } else {
        XLOG_WARN << "user namespaces: not available";
    }
}

} // namespace sandbox
} // namespace labyrinth

#endif // LABYRINTH_SANDBOX_SANDBOX_H

/**
 * @file seccomp.h
 * @brief seccomp-bpf 系统调用白名单
 *
 * 玩家程序只能读写已经打开的 fd（标准流和会话通道）、管理自己的内存、
 * 读取时间，然后退出。网络、fork/clone、ptrace、mount 都不在白名单内，
 * 命中即 SECCOMP_RET_KILL_PROCESS，子进程以 SIGSYS 结束，监督方判为安全违规。
 *
 * 过滤器在父进程中编译好（build），fork 后的子进程里只做 install，
 * 不分配内存。
 */

#ifndef LABYRINTH_SANDBOX_SECCOMP_H
#define LABYRINTH_SANDBOX_SECCOMP_H

#include <vector>
#include <string>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>

#include <sys/prctl.h>
#include <sys/syscall.h>
#include <linux/seccomp.h>
#include <linux/filter.h>
#include <linux/audit.h>

#include "core/error.h"

namespace labyrinth {
namespace sandbox {

#if defined(__x86_64__)
constexpr uint32_t SECCOMP_AUDIT_ARCH = AUDIT_ARCH_X86_64;
#elif defined(__aarch64__)
constexpr uint32_t SECCOMP_AUDIT_ARCH = AUDIT_ARCH_AARCH64;
#else
#error "seccomp filter: unsupported architecture"
#endif

class SeccompFilter {
private:
    std::vector<int> allowed_;          ///< 有序、去重
    std::vector<sock_filter> program_;

    static sock_filter op(uint16_t code, uint32_t k, uint8_t jt = 0, uint8_t jf = 0) {
        sock_filter f;
        f.code = code;
        f.jt = jt;
        f.jf = jf;
        f.k = k;
        return f;
    }

public:
    SeccompFilter& allow(int nr) {
        if (nr < 0) return *this;
        auto it = std::lower_bound(allowed_.begin(), allowed_.end(), nr);
        if (it == allowed_.end() || *it != nr) {
            allowed_.insert(it, nr);
            program_.clear();
        }
        return *this;
    }

    SeccompFilter& allow(std::initializer_list<int> nrs) {
        for (int nr : nrs) allow(nr);
        return *this;
    }

    bool allows(int nr) const {
        return std::binary_search(allowed_.begin(), allowed_.end(), nr);
    }

    /**
     * @brief 编译 BPF 程序
     *
     *   ld arch; jeq NATIVE ? next : kill
     *   ld nr;   jeq n1 ? allow : next; jeq n2 ? allow : next; ...
     *   kill
     *   allow
     */
    Result<void> build() {
        // 条件跳转的偏移只有 8 位
        LABYRINTH_ENSURE(allowed_.size() < 255, ErrorCode::SECCOMP_ERROR,
                         "too many allowed syscalls: " + std::to_string(allowed_.size()));
        program_.clear();
        program_.push_back(op(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
        program_.push_back(op(BPF_JMP | BPF_JEQ | BPF_K, SECCOMP_AUDIT_ARCH, 1, 0));
        program_.push_back(op(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
        program_.push_back(op(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));
        for (size_t i = 0; i < allowed_.size(); i++) {
            auto to_allow = static_cast<uint8_t>(allowed_.size() - i);
            program_.push_back(op(BPF_JMP | BPF_JEQ | BPF_K,
                                  static_cast<uint32_t>(allowed_[i]), to_allow, 0));
        }
        program_.push_back(op(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
        program_.push_back(op(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
        return Ok();
    }

    bool built() const { return !program_.empty(); }
    size_t size() const { return program_.size(); }

    /**
     * @brief 安装到当前进程；失败时返回 false，errno 保留
     *
     * 必须先 build。只在子进程 execve 之前调用。
     */
    bool install() const {
        if (program_.empty()) return false;
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) return false;
        struct sock_fprog prog;
        prog.len = static_cast<unsigned short>(program_.size());
        prog.filter = const_cast<sock_filter*>(program_.data());
        return prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog) == 0;
    }
};

/**
 * @brief 玩家程序的白名单
 *
 * 覆盖动态链接的 C/C++ 程序启动路径；解释器需要的其余调用
 * 由配置项 sandbox.extra_syscalls 补充。
 */
inline SeccompFilter create_player_filter(const std::vector<int> &extra = {}) {
    SeccompFilter filter;

    // 已打开的 fd 与只读挂载的运行库
    filter.allow({__NR_read, __NR_write, __NR_readv, __NR_writev, __NR_pread64,
                  __NR_lseek, __NR_openat, __NR_close, __NR_fstat, __NR_faccessat,
                  __NR_readlinkat, __NR_getdents64, __NR_getcwd, __NR_dup, __NR_fcntl,
                  __NR_ioctl});
#ifdef __NR_newfstatat
    filter.allow(__NR_newfstatat);
#endif
#ifdef __NR_statx
    filter.allow(__NR_statx);
#endif
#ifdef __NR_stat
    filter.allow({__NR_stat, __NR_lstat});
#endif
#ifdef __NR_access
    filter.allow(__NR_access);
#endif
#ifdef __NR_readlink
    filter.allow(__NR_readlink);
#endif

    // 内存
    filter.allow({__NR_brk, __NR_mmap, __NR_munmap, __NR_mprotect, __NR_mremap, __NR_madvise});

    // 进程自身，不含 fork/clone
    filter.allow({__NR_execve, __NR_exit, __NR_exit_group, __NR_getpid, __NR_gettid,
                  __NR_getuid, __NR_geteuid, __NR_getgid, __NR_getegid,
                  __NR_set_tid_address, __NR_set_robust_list, __NR_prlimit64,
                  __NR_uname, __NR_sysinfo, __NR_sched_getaffinity, __NR_sched_yield});
#ifdef __NR_arch_prctl
    filter.allow(__NR_arch_prctl);
#endif
#ifdef __NR_rseq
    filter.allow(__NR_rseq);
#endif

    // 信号、时间、等待
    filter.allow({__NR_rt_sigaction, __NR_rt_sigprocmask, __NR_rt_sigreturn,
                  __NR_sigaltstack, __NR_clock_gettime, __NR_clock_getres,
                  __NR_clock_nanosleep, __NR_gettimeofday, __NR_nanosleep, __NR_futex,
                  __NR_getrandom, __NR_ppoll});
#ifdef __NR_poll
    filter.allow(__NR_poll);
#endif

    for (int nr : extra) filter.allow(nr);
    return filter;
}

} // namespace sandbox
} // namespace labyrinth

#endif // LABYRINTH_SANDBOX_SECCOMP_H

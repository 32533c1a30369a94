/**
 * @file syscall_map.h
 * @brief syscall 名称与编号互查
 *
 * 配置文件中的 sandbox.extra_syscalls 按名称书写，经这里转换成编号；
 * 日志中打印被拦截的调用时也用这里反查名称。
 */

#ifndef LABYRINTH_CORE_SYSCALL_MAP_H
#define LABYRINTH_CORE_SYSCALL_MAP_H

#include <string>
#include <map>
#include <sys/syscall.h>

namespace labyrinth {

class SyscallMap {
public:
    static const SyscallMap& instance() {
        static const SyscallMap inst;
        return inst;
    }

    /**
     * @return syscall 编号，未知名称返回 -1
     */
    int name_to_nr(const std::string& name) const {
        auto it = by_name_.find(name);
        return it != by_name_.end() ? it->second : -1;
    }

    /**
     * @return syscall 名称，未知编号返回 "syscall_<nr>"
     */
    std::string nr_to_name(int nr) const {
        auto it = by_nr_.find(nr);
        return it != by_nr_.end() ? it->second : "syscall_" + std::to_string(nr);
    }

private:
    std::map<std::string, int> by_name_;
    std::map<int, std::string> by_nr_;

    void add(const char *name, int nr) {
        by_name_[name] = nr;
        by_nr_[nr] = name;
    }

    SyscallMap() {
#define LABYRINTH_SYSCALL(name) add(#name, __NR_##name)
        // 文件 I/O
        LABYRINTH_SYSCALL(read);
        LABYRINTH_SYSCALL(write);
        LABYRINTH_SYSCALL(readv);
        LABYRINTH_SYSCALL(writev);
        LABYRINTH_SYSCALL(pread64);
        LABYRINTH_SYSCALL(pwrite64);
        LABYRINTH_SYSCALL(openat);
        LABYRINTH_SYSCALL(close);
        LABYRINTH_SYSCALL(lseek);
        LABYRINTH_SYSCALL(fstat);
        LABYRINTH_SYSCALL(newfstatat);
        LABYRINTH_SYSCALL(statx);
        LABYRINTH_SYSCALL(faccessat);
        LABYRINTH_SYSCALL(readlinkat);
        LABYRINTH_SYSCALL(getdents64);
        LABYRINTH_SYSCALL(getcwd);
        LABYRINTH_SYSCALL(dup);
        LABYRINTH_SYSCALL(dup3);
        LABYRINTH_SYSCALL(fcntl);
        LABYRINTH_SYSCALL(ioctl);
        LABYRINTH_SYSCALL(pipe2);
        LABYRINTH_SYSCALL(unlinkat);
        LABYRINTH_SYSCALL(mkdirat);
        LABYRINTH_SYSCALL(ftruncate);
#ifdef __NR_open
        LABYRINTH_SYSCALL(open);
        LABYRINTH_SYSCALL(stat);
        LABYRINTH_SYSCALL(lstat);
        LABYRINTH_SYSCALL(access);
        LABYRINTH_SYSCALL(readlink);
        LABYRINTH_SYSCALL(dup2);
        LABYRINTH_SYSCALL(pipe);
        LABYRINTH_SYSCALL(unlink);
        LABYRINTH_SYSCALL(mkdir);
        LABYRINTH_SYSCALL(poll);
        LABYRINTH_SYSCALL(select);
        LABYRINTH_SYSCALL(fork);
        LABYRINTH_SYSCALL(vfork);
#endif

        // 内存
        LABYRINTH_SYSCALL(brk);
        LABYRINTH_SYSCALL(mmap);
        LABYRINTH_SYSCALL(munmap);
        LABYRINTH_SYSCALL(mprotect);
        LABYRINTH_SYSCALL(mremap);
        LABYRINTH_SYSCALL(madvise);

        // 进程
        LABYRINTH_SYSCALL(execve);
        LABYRINTH_SYSCALL(exit);
        LABYRINTH_SYSCALL(exit_group);
        LABYRINTH_SYSCALL(clone);
        LABYRINTH_SYSCALL(wait4);
        LABYRINTH_SYSCALL(kill);
        LABYRINTH_SYSCALL(tgkill);
        LABYRINTH_SYSCALL(getpid);
        LABYRINTH_SYSCALL(gettid);
        LABYRINTH_SYSCALL(getppid);
        LABYRINTH_SYSCALL(getuid);
        LABYRINTH_SYSCALL(geteuid);
        LABYRINTH_SYSCALL(getgid);
        LABYRINTH_SYSCALL(getegid);
        LABYRINTH_SYSCALL(set_tid_address);
        LABYRINTH_SYSCALL(set_robust_list);
        LABYRINTH_SYSCALL(prlimit64);
        LABYRINTH_SYSCALL(getrusage);
        LABYRINTH_SYSCALL(uname);
        LABYRINTH_SYSCALL(sysinfo);
        LABYRINTH_SYSCALL(prctl);
        LABYRINTH_SYSCALL(ptrace);
        LABYRINTH_SYSCALL(mount);
        LABYRINTH_SYSCALL(unshare);
        LABYRINTH_SYSCALL(setns);
#ifdef __NR_arch_prctl
        LABYRINTH_SYSCALL(arch_prctl);
#endif
#ifdef __NR_rseq
        LABYRINTH_SYSCALL(rseq);
#endif
#ifdef __NR_clone3
        LABYRINTH_SYSCALL(clone3);
#endif

        // 信号与时间
        LABYRINTH_SYSCALL(rt_sigaction);
        LABYRINTH_SYSCALL(rt_sigprocmask);
        LABYRINTH_SYSCALL(rt_sigreturn);
        LABYRINTH_SYSCALL(sigaltstack);
        LABYRINTH_SYSCALL(clock_gettime);
        LABYRINTH_SYSCALL(clock_getres);
        LABYRINTH_SYSCALL(clock_nanosleep);
        LABYRINTH_SYSCALL(gettimeofday);
        LABYRINTH_SYSCALL(nanosleep);

        // 同步
        LABYRINTH_SYSCALL(futex);
        LABYRINTH_SYSCALL(sched_yield);
        LABYRINTH_SYSCALL(sched_getaffinity);
        LABYRINTH_SYSCALL(getrandom);
        LABYRINTH_SYSCALL(ppoll);
        LABYRINTH_SYSCALL(pselect6);

        // 网络（默认全部禁止，只用于日志反查）
        LABYRINTH_SYSCALL(socket);
        LABYRINTH_SYSCALL(socketpair);
        LABYRINTH_SYSCALL(connect);
        LABYRINTH_SYSCALL(bind);
        LABYRINTH_SYSCALL(listen);
        LABYRINTH_SYSCALL(accept);
        LABYRINTH_SYSCALL(accept4);
        LABYRINTH_SYSCALL(sendto);
        LABYRINTH_SYSCALL(recvfrom);
        LABYRINTH_SYSCALL(sendmsg);
        LABYRINTH_SYSCALL(recvmsg);
#undef LABYRINTH_SYSCALL
    }
};

inline int syscall_name_to_nr(const std::string& name) {
    return SyscallMap::instance().name_to_nr(name);
}

inline std::string syscall_nr_to_name(int nr) {
    return SyscallMap::instance().nr_to_name(nr);
}

} // namespace labyrinth

#endif // LABYRINTH_CORE_SYSCALL_MAP_H

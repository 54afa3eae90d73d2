#include "codemode/seccomp.h"

#if defined(__linux__)

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/syscall.h>

#if defined(__x86_64__)
  #define CODEMODE_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
  #define CODEMODE_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
  #define CODEMODE_AUDIT_ARCH 0
#endif

namespace codemode {

namespace {

sock_filter stmt(unsigned short code, unsigned int k) {
    return sock_filter{code, 0, 0, k};
}

sock_filter jump(unsigned short code, unsigned int k, unsigned char jt, unsigned char jf) {
    return sock_filter{code, jt, jf, k};
}

// Low 32 bits of argument n (both supported arches are little-endian).
constexpr unsigned int arg_offset(int n) {
    return (unsigned int)(offsetof(struct seccomp_data, args) + n * sizeof(uint64_t));
}

std::vector<long> plain_allowlist() {
    std::vector<long> nrs = {
        __NR_read, __NR_write, __NR_readv, __NR_writev, __NR_close,
        __NR_fstat, __NR_lseek, __NR_pread64,
        __NR_munmap, __NR_mremap, __NR_brk, __NR_madvise,
        __NR_futex, __NR_rt_sigreturn, __NR_rt_sigprocmask,
        __NR_clock_gettime, __NR_gettimeofday, __NR_clock_nanosleep, __NR_nanosleep,
        __NR_getpid, __NR_gettid, __NR_tgkill,
        __NR_getrandom, __NR_exit, __NR_exit_group,
    };
#ifdef __NR_newfstatat
    nrs.push_back(__NR_newfstatat);
#endif
#ifdef __NR_statx
    nrs.push_back(__NR_statx);
#endif
#ifdef __NR_rseq
    nrs.push_back(__NR_rseq);
#endif
    return nrs;
}

} // namespace

std::string install_seccomp_filter() {
#if CODEMODE_AUDIT_ARCH == 0
    return "seccomp: unsupported architecture";
#else
    const sock_filter allow = stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW);
    const sock_filter kill = stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS);

    std::vector<sock_filter> prog;
    prog.push_back(stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    prog.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, CODEMODE_AUDIT_ARCH, 1, 0));
    prog.push_back(kill);
    prog.push_back(stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));

    // Each plain entry is "if nr matches, allow; else fall through".
    for (long nr : plain_allowlist()) {
        prog.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, (unsigned int)nr, 0, 1));
        prog.push_back(allow);
    }

    // mmap and mprotect: allowed unless PROT_EXEC is requested (prot is arg 2 of both).
    for (long nr : {(long)__NR_mmap, (long)__NR_mprotect}) {
        prog.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, (unsigned int)nr, 0, 4));
        prog.push_back(stmt(BPF_LD | BPF_W | BPF_ABS, arg_offset(2)));
        prog.push_back(jump(BPF_JMP | BPF_JSET | BPF_K, PROT_EXEC, 0, 1));
        prog.push_back(kill);
        prog.push_back(allow);
    }

    // openat: read-only opens only; writes fail with EACCES instead of killing
    // so a library probing for a cache file degrades gracefully.
    const unsigned int write_flags = O_WRONLY | O_RDWR | O_CREAT | O_TRUNC | O_APPEND;
    prog.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, __NR_openat, 0, 4));
    prog.push_back(stmt(BPF_LD | BPF_W | BPF_ABS, arg_offset(2)));
    prog.push_back(jump(BPF_JMP | BPF_JSET | BPF_K, write_flags, 0, 1));
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (EACCES & SECCOMP_RET_DATA)));
    prog.push_back(allow);

    prog.push_back(kill);

    struct sock_fprog fprog = {};
    fprog.len = (unsigned short)prog.size();
    fprog.filter = prog.data();

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &fprog, 0, 0) != 0) {
        return std::string("seccomp install failed: ") + std::strerror(errno);
    }
    return "";
#endif
}

bool seccomp_available() {
    // 0: available and inactive, 2: filter mode already active.
    return prctl(PR_GET_SECCOMP, 0, 0, 0, 0) >= 0;
}

} // namespace codemode

#else // !__linux__

namespace codemode {

std::string install_seccomp_filter() {
    return "";
}

bool seccomp_available() {
    return false;
}

} // namespace codemode

#endif

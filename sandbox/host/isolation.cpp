#include "isolation.hpp"

#include <fnrun/common/exceptions.hpp>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sched.h>
#include <seccomp.h>
#include <sys/capability.h>
#include <sys/prctl.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fnrun::sandbox::isolation {

  namespace {

    constexpr std::array SYSCALL_ALLOWLIST = {
        // Memory
        SCMP_SYS(brk), SCMP_SYS(mmap), SCMP_SYS(munmap), SCMP_SYS(mremap), SCMP_SYS(mprotect),
        SCMP_SYS(madvise),
        // Descriptors opened before the filter, and read-only files
        SCMP_SYS(read), SCMP_SYS(readv), SCMP_SYS(pread64), SCMP_SYS(write), SCMP_SYS(writev),
        SCMP_SYS(lseek), SCMP_SYS(close), SCMP_SYS(close_range), SCMP_SYS(dup), SCMP_SYS(dup2),
        SCMP_SYS(dup3), SCMP_SYS(fcntl), SCMP_SYS(ioctl), SCMP_SYS(pipe2),
        SCMP_SYS(fstat), SCMP_SYS(stat), SCMP_SYS(lstat), SCMP_SYS(newfstatat), SCMP_SYS(statx),
        SCMP_SYS(fstatfs), SCMP_SYS(getdents64), SCMP_SYS(readlink), SCMP_SYS(readlinkat),
        SCMP_SYS(access), SCMP_SYS(faccessat), SCMP_SYS(faccessat2), SCMP_SYS(getcwd),
        // Event loops; asyncio wakes itself up through a socketpair.
        SCMP_SYS(socketpair), SCMP_SYS(recvfrom), SCMP_SYS(recvmsg), SCMP_SYS(shutdown),
        SCMP_SYS(getsockopt), SCMP_SYS(setsockopt), SCMP_SYS(epoll_create),
        SCMP_SYS(epoll_create1), SCMP_SYS(epoll_ctl), SCMP_SYS(epoll_wait), SCMP_SYS(epoll_pwait),
        SCMP_SYS(epoll_pwait2), SCMP_SYS(poll), SCMP_SYS(ppoll), SCMP_SYS(select),
        SCMP_SYS(pselect6), SCMP_SYS(eventfd2),
        // Threads and signals
        SCMP_SYS(futex), SCMP_SYS(set_robust_list), SCMP_SYS(set_tid_address), SCMP_SYS(rseq),
        SCMP_SYS(arch_prctl), SCMP_SYS(prctl), SCMP_SYS(rt_sigaction), SCMP_SYS(rt_sigprocmask),
        SCMP_SYS(rt_sigreturn), SCMP_SYS(rt_sigpending), SCMP_SYS(rt_sigtimedwait),
        SCMP_SYS(sigaltstack), SCMP_SYS(restart_syscall), SCMP_SYS(sched_yield),
        SCMP_SYS(sched_getaffinity),
        // Process information and time
        SCMP_SYS(getpid), SCMP_SYS(gettid), SCMP_SYS(getppid), SCMP_SYS(getuid),
        SCMP_SYS(geteuid), SCMP_SYS(getgid), SCMP_SYS(getegid), SCMP_SYS(getgroups),
        SCMP_SYS(getresuid), SCMP_SYS(getresgid), SCMP_SYS(getrlimit), SCMP_SYS(prlimit64),
        SCMP_SYS(getrusage), SCMP_SYS(sysinfo), SCMP_SYS(uname), SCMP_SYS(capget),
        SCMP_SYS(getrandom), SCMP_SYS(clock_gettime), SCMP_SYS(clock_getres),
        SCMP_SYS(clock_nanosleep), SCMP_SYS(gettimeofday), SCMP_SYS(time), SCMP_SYS(nanosleep),
        SCMP_SYS(exit), SCMP_SYS(exit_group)};

    void check_rule(int ret, int syscall)
    {
      if (ret == 0) {
        return;
      }
      char* name = seccomp_syscall_resolve_num_arch(SCMP_ARCH_NATIVE, syscall);
      std::string message = fmt::format(
          "Could not add a seccomp rule for {}: {}", name ? name : std::to_string(syscall),
          strerror(-ret)
      );
      free(name);
      throw common::SandboxError{message};
    }

  } // namespace

  void make_undumpable()
  {
    if (prctl(PR_SET_DUMPABLE, 0, 0, 0, 0) != 0) {
      throw common::SandboxError{
          fmt::format("Could not mark the process as not dumpable: {}", strerror(errno))};
    }
  }

  void drop_capabilities()
  {
    // Shrinking the bounding set needs CAP_SETPCAP; without it there is nothing to shrink.
    for (int cap = 0; cap <= CAP_LAST_CAP; ++cap) {
      if (prctl(PR_CAPBSET_READ, cap, 0, 0, 0) != 1) {
        continue;
      }
      if (prctl(PR_CAPBSET_DROP, cap, 0, 0, 0) != 0 && errno != EPERM) {
        throw common::SandboxError{
            fmt::format("Could not drop capability {} from the bounding set: {}", cap, strerror(errno))};
      }
    }

    cap_t empty = cap_init();
    if (empty == nullptr) {
      throw common::SandboxError{
          fmt::format("Could not allocate a capability set: {}", strerror(errno))};
    }
    int ret = cap_set_proc(empty);
    int err = errno;
    cap_free(empty);
    if (ret != 0) {
      throw common::SandboxError{fmt::format("Could not drop capabilities: {}", strerror(err))};
    }
  }

  void restrict_syscalls()
  {
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ERRNO(EPERM));
    if (ctx == nullptr) {
      throw common::SandboxError{"Could not initialize the seccomp filter"};
    }

    try {
      for (int syscall : SYSCALL_ALLOWLIST) {
        check_rule(seccomp_rule_add(ctx, SCMP_ACT_ALLOW, syscall, 0), syscall);
      }

      // Files open read-only, nothing is created or truncated.
      check_rule(
          seccomp_rule_add(
              ctx, SCMP_ACT_ALLOW, SCMP_SYS(openat), 1,
              SCMP_A2(SCMP_CMP_MASKED_EQ, O_ACCMODE | O_CREAT | O_TRUNC, O_RDONLY)
          ),
          SCMP_SYS(openat)
      );

      // Only unaddressed sends, so a datagram socketpair cannot reach a bound socket.
      check_rule(
          seccomp_rule_add(ctx, SCMP_ACT_ALLOW, SCMP_SYS(sendto), 1, SCMP_A4(SCMP_CMP_EQ, 0)),
          SCMP_SYS(sendto)
      );

      // Threads share the address space; a new process never does. clone3 takes
      // its flags by pointer, so glibc is sent back to clone.
      check_rule(
          seccomp_rule_add(
              ctx, SCMP_ACT_ALLOW, SCMP_SYS(clone), 1,
              SCMP_A0(SCMP_CMP_MASKED_EQ, CLONE_THREAD, CLONE_THREAD)
          ),
          SCMP_SYS(clone)
      );
      check_rule(
          seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(clone3), 0), SCMP_SYS(clone3)
      );

      // abort() and raise() signal the calling thread.
      check_rule(
          seccomp_rule_add(
              ctx, SCMP_ACT_ALLOW, SCMP_SYS(tgkill), 1,
              SCMP_A0(SCMP_CMP_EQ, static_cast<scmp_datum_t>(getpid()))
          ),
          SCMP_SYS(tgkill)
      );

      int ret = seccomp_load(ctx);
      if (ret < 0) {
        throw common::SandboxError{
            fmt::format("Could not load the seccomp filter: {}", strerror(-ret))};
      }
    } catch (common::SandboxError&) {
      seccomp_release(ctx);
      throw;
    }

    seccomp_release(ctx);
    SPDLOG_DEBUG("Loaded seccomp filter with {} unconditional rules", SYSCALL_ALLOWLIST.size());
  }

} // namespace fnrun::sandbox::isolation

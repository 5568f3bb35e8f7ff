#ifndef FNRUN_SANDBOX_HOST_ISOLATION_HPP
#define FNRUN_SANDBOX_HOST_ISOLATION_HPP

namespace fnrun::sandbox::isolation {

  // Makes /proc/self/environ and ptrace unavailable to other processes of the same user.
  void make_undumpable();

  // Empties the bounding set where possible, then the effective, permitted
  // and inheritable sets. Throws common::SandboxError.
  void drop_capabilities();

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Loads the seccomp filter the deployed code runs under.
  ///
  /// Must be called after the interpreter has started and before any user code
  /// runs. Syscalls outside the allow-list fail with EPERM. The filter admits
  /// read-only opens, socketpair without network sockets, threads without new
  /// processes, and signals to the process itself only.
  /// Throws common::SandboxError.
  ////////////////////////////////////////////////////////////////////////////////
  void restrict_syscalls();

} // namespace fnrun::sandbox::isolation

#endif

#ifndef FNRUN_SANDBOX_LIMITS_HPP
#define FNRUN_SANDBOX_LIMITS_HPP

#include <chrono>
#include <cstddef>

namespace fnrun::sandbox {

  struct Limits {

    static constexpr int DEFAULT_WALL_TIME_MS = 10000;
    static constexpr int DEFAULT_CPU_TIME_S = 10;
    static constexpr size_t DEFAULT_MEMORY_MB = 512;
    static constexpr size_t DEFAULT_MAX_RESULT_BYTES = 1024 * 1024;
    static constexpr size_t DEFAULT_MAX_OUTPUT_BYTES = 64 * 1024;
    static constexpr int DEFAULT_MAX_OPEN_FILES = 64;

    // Enforced by the parent; the sandbox is killed once it passes.
    std::chrono::milliseconds wall_time{DEFAULT_WALL_TIME_MS};

    // RLIMIT_CPU, in seconds.
    int cpu_time_s = DEFAULT_CPU_TIME_S;

    // RLIMIT_AS, in MiB. Zero disables the limit.
    size_t memory_mb = DEFAULT_MEMORY_MB;

    // Size of the serialized result the sandbox may send back.
    size_t max_result_bytes = DEFAULT_MAX_RESULT_BYTES;

    // Captured stdout/stderr; anything above is dropped, not an error.
    size_t max_output_bytes = DEFAULT_MAX_OUTPUT_BYTES;

    int max_open_files = DEFAULT_MAX_OPEN_FILES;
  };

} // namespace fnrun::sandbox

#endif

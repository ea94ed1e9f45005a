#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace codegate {

struct ProcessSpec {
    std::vector<std::string> argv;          // argv[0] resolved through PATH
    std::string working_dir;                // empty = inherit
    std::chrono::milliseconds timeout{5000};
    size_t max_output_bytes = 1024 * 1024;  // per stream, excess is discarded
};

struct ProcessOutcome {
    bool launched = false;
    pid_t pid = -1;
    int exit_code = -1;                     // -1 when killed by a signal
    int term_signal = 0;
    bool timed_out = false;
    std::string stdout_data;
    std::string stderr_data;
    std::chrono::microseconds elapsed{0};
    uint64_t peak_rss_bytes = 0;
    std::string launch_error;

    [[nodiscard]] bool exited_cleanly() const {
        return launched && !timed_out && exit_code == 0;
    }
};

/**
 * @brief Spawns a host process under a supervising deadline
 *
 * The child is placed in its own process group with stdin bound to
 * /dev/null. stdout/stderr are drained with poll() so a chatty child
 * cannot deadlock on a full pipe. When the leader exits, or the deadline
 * expires first, the whole group receives SIGKILL before the leader is
 * reaped, so nothing the child spawned outlives the call. Exec failures
 * are reported through a close-on-exec pipe as launch errors, never as
 * exit code 127.
 *
 * run() is safe to call concurrently. The groups of in-flight runs are
 * kept in a lock-free table that kill_all() walks on shutdown.
 */
class ProcessRunner {
public:
    [[nodiscard]] static ProcessOutcome run(const ProcessSpec& spec);

    /// SIGKILL every in-flight process group. Async-signal-safe.
    static size_t kill_all() noexcept;

    /// Number of runs currently in flight
    [[nodiscard]] static size_t running() noexcept;

    /// True if `name` resolves to an executable (absolute path or PATH lookup)
    [[nodiscard]] static bool find_executable(const std::string& name);
};

} // namespace codegate

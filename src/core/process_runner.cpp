#include "core/process_runner.hpp"
#include "core/utils.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <format>
#include <thread>

namespace codegate {

namespace {

constexpr auto kPollSlice = std::chrono::milliseconds(20);
constexpr auto kReapSlice = std::chrono::milliseconds(5);
constexpr size_t kMaxLiveGroups = 256;

// Process groups of in-flight runs, 0 = free slot. Lock-free so the
// signal path can walk it.
std::array<std::atomic<pid_t>, kMaxLiveGroups> g_live_groups{};

class LiveGroup {
public:
    explicit LiveGroup(pid_t pgid) {
        for (size_t i = 0; i < kMaxLiveGroups; ++i) {
            pid_t expected = 0;
            if (g_live_groups[i].compare_exchange_strong(expected, pgid)) {
                slot_ = i;
                return;
            }
        }
        utils::log::warn(std::format("Live process table full, pgid {} is untracked", pgid));
    }

    ~LiveGroup() { release(); }

    LiveGroup(const LiveGroup&) = delete;
    LiveGroup& operator=(const LiveGroup&) = delete;

    void release() {
        if (slot_ < kMaxLiveGroups) {
            g_live_groups[slot_].store(0);
            slot_ = kMaxLiveGroups;
        }
    }

private:
    size_t slot_ = kMaxLiveGroups;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Reads whatever is available; returns false on EOF or hard error
bool drain_fd(int fd, std::string& sink, size_t cap) {
    char buf[4096];
    while (true) {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            const size_t room = sink.size() < cap ? cap - sink.size() : 0;
            sink.append(buf, std::min(static_cast<size_t>(n), room));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

struct Pipes {
    int out[2] = {-1, -1};
    int err[2] = {-1, -1};
    int exec_status[2] = {-1, -1};

    ~Pipes() {
        for (int* p : {out, err, exec_status}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    }
};

[[noreturn]] void exec_child(const ProcessSpec& spec, Pipes& pipes) {
    ::setpgid(0, 0);

    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::close(devnull);
    }
    ::dup2(pipes.out[1], STDOUT_FILENO);
    ::dup2(pipes.err[1], STDERR_FILENO);

    if (!spec.working_dir.empty() && ::chdir(spec.working_dir.c_str()) != 0) {
        const int e = errno;
        (void)!::write(pipes.exec_status[1], &e, sizeof(e));
        ::_exit(127);
    }

    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    ::execvp(argv[0], argv.data());

    const int e = errno;
    (void)!::write(pipes.exec_status[1], &e, sizeof(e));
    ::_exit(127);
}

} // anonymous namespace

// ============================================================================
// Run
// ============================================================================

ProcessOutcome ProcessRunner::run(const ProcessSpec& spec) {
    ProcessOutcome outcome;
    if (spec.argv.empty() || spec.argv.front().empty()) {
        outcome.launch_error = "empty command";
        return outcome;
    }

    Pipes pipes;
    if (::pipe2(pipes.out, O_CLOEXEC) != 0 ||
        ::pipe2(pipes.err, O_CLOEXEC) != 0 ||
        ::pipe2(pipes.exec_status, O_CLOEXEC) != 0) {
        outcome.launch_error = std::format("pipe failed: {}", std::strerror(errno));
        return outcome;
    }

    const utils::Timer timer;
    const auto deadline = std::chrono::steady_clock::now() + spec.timeout;

    const pid_t pid = ::fork();
    if (pid < 0) {
        outcome.launch_error = std::format("fork failed: {}", std::strerror(errno));
        return outcome;
    }
    if (pid == 0) {
        exec_child(spec, pipes);
    }

    // Also set from the parent so the group exists before any kill(-pid)
    ::setpgid(pid, pid);
    outcome.pid = pid;
    LiveGroup live(pid);

    close_fd(pipes.out[1]);
    close_fd(pipes.err[1]);
    close_fd(pipes.exec_status[1]);

    // Blocks until exec succeeds (EOF via CLOEXEC) or the child reports errno
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(pipes.exec_status[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        outcome.launch_error = std::format("exec {} failed: {}",
                                           spec.argv.front(), std::strerror(child_errno));
        return outcome;
    }
    outcome.launched = true;

    ::fcntl(pipes.out[0], F_SETFL, O_NONBLOCK);
    ::fcntl(pipes.err[0], F_SETFL, O_NONBLOCK);

    int status = 0;
    struct rusage usage {};
    bool exited = false;

    while (!exited) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            outcome.timed_out = true;
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        if (pipes.out[0] >= 0 || pipes.err[0] >= 0) {
            pollfd fds[2];
            nfds_t nfds = 0;
            if (pipes.out[0] >= 0) fds[nfds++] = {pipes.out[0], POLLIN, 0};
            if (pipes.err[0] >= 0) fds[nfds++] = {pipes.err[0], POLLIN, 0};

            const int wait_ms = static_cast<int>(std::min(remaining, kPollSlice).count()) + 1;
            const int ready = ::poll(fds, nfds, wait_ms);
            if (ready < 0 && errno != EINTR) {
                utils::log::warn(std::format("poll failed for pid {}: {}", pid, std::strerror(errno)));
                break;
            }
            for (nfds_t i = 0; i < nfds && ready > 0; ++i) {
                if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
                if (fds[i].fd == pipes.out[0]) {
                    if (!drain_fd(pipes.out[0], outcome.stdout_data, spec.max_output_bytes)) {
                        close_fd(pipes.out[0]);
                    }
                } else if (!drain_fd(pipes.err[0], outcome.stderr_data, spec.max_output_bytes)) {
                    close_fd(pipes.err[0]);
                }
            }
        } else {
            std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(kReapSlice)));
        }

        // WNOWAIT leaves the leader a zombie, which pins the pgid for the kill below
        siginfo_t info {};
        const int r = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
        if (r == 0 && info.si_pid == pid) {
            exited = true;
        } else if (r < 0 && errno != EINTR) {
            outcome.launch_error = std::format("waitid failed: {}", std::strerror(errno));
            break;
        }
    }

    // Whatever the leader left running in its group dies with the run
    ::kill(-pid, SIGKILL);
    live.release();
    while (::wait4(pid, &status, 0, &usage) < 0 && errno == EINTR) {}

    // Pick up output written before exit or before the kill
    if (pipes.out[0] >= 0) drain_fd(pipes.out[0], outcome.stdout_data, spec.max_output_bytes);
    if (pipes.err[0] >= 0) drain_fd(pipes.err[0], outcome.stderr_data, spec.max_output_bytes);

    outcome.elapsed = timer.elapsed_us();
    outcome.peak_rss_bytes = static_cast<uint64_t>(usage.ru_maxrss) * 1024;  // KB on Linux

    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.term_signal = WTERMSIG(status);
    }
    return outcome;
}

size_t ProcessRunner::kill_all() noexcept {
    size_t killed = 0;
    for (auto& slot : g_live_groups) {
        const pid_t pgid = slot.load();
        if (pgid > 0 && ::kill(-pgid, SIGKILL) == 0) ++killed;
    }
    return killed;
}

size_t ProcessRunner::running() noexcept {
    size_t count = 0;
    for (const auto& slot : g_live_groups) {
        if (slot.load() > 0) ++count;
    }
    return count;
}

bool ProcessRunner::find_executable(const std::string& name) {
    if (name.empty()) return false;
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return false;

    for (const auto& dir : utils::split(path_env, ':')) {
        if (dir.empty()) continue;
        const auto candidate = std::filesystem::path(dir) / name;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace codegate

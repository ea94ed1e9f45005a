#include "executor/container_sandbox_backend.hpp"
#include "core/process_runner.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <condition_variable>
#include <format>
#include <thread>

namespace codegate {

ContainerSandboxBackend::ContainerSandboxBackend(ContainerConfig config,
                                                 std::vector<RuntimeConfig> runtimes,
                                                 const ExecutionPolicy& policy)
    : config_(std::move(config)),
      runtimes_(std::move(runtimes)),
      policy_(policy) {}

// ============================================================================
// Availability
// ============================================================================

bool ContainerSandboxBackend::is_available() {
    if (!config_.enabled) return false;

    {
        std::lock_guard lock(probe_mutex_);
        if (available_.has_value()) {
            const bool retry_due = !*available_ &&
                std::chrono::steady_clock::now() - probed_at_ >= std::chrono::seconds(config_.probe_retry_s);
            if (!retry_due) return *available_;
        }
    }

    // Probe unlocked; concurrent callers may each probe, the last result wins
    ProcessSpec spec;
    spec.argv = {config_.runtime, "--version"};
    spec.timeout = std::chrono::seconds(config_.probe_timeout_s);
    const auto outcome = ProcessRunner::run(spec);
    const bool available = outcome.exited_cleanly();

    {
        std::lock_guard lock(probe_mutex_);
        available_ = available;
        probed_at_ = std::chrono::steady_clock::now();
    }

    if (available) {
        utils::log::info(std::format("Container runtime available: {}",
                                     utils::trim(outcome.stdout_data)));
    } else {
        utils::log::warn(std::format("Container runtime '{}' unavailable{}", config_.runtime,
                                     outcome.launch_error.empty() ? "" : ": " + outcome.launch_error));
    }
    return available;
}

void ContainerSandboxBackend::reset_availability() {
    std::lock_guard lock(probe_mutex_);
    available_.reset();
}

void ContainerSandboxBackend::mark_unavailable() {
    std::lock_guard lock(probe_mutex_);
    available_ = false;
    probed_at_ = std::chrono::steady_clock::now();
}

std::vector<std::string> ContainerSandboxBackend::active_instances() const {
    std::lock_guard lock(active_mutex_);
    return {active_.begin(), active_.end()};
}

size_t ContainerSandboxBackend::remove_active() {
    size_t removed = 0;
    for (const auto& name : active_instances()) {
        if (force_remove(name)) {
            ++removed;
        } else {
            utils::log::warn(std::format("Failed to remove in-flight container {}", name));
        }
    }
    return removed;
}

// ============================================================================
// Profile / argument construction
// ============================================================================

std::optional<ContainerSandboxBackend::Profile> ContainerSandboxBackend::make_profile(
    std::string_view language, SecurityLevel level) const {

    const auto it = std::find_if(runtimes_.begin(), runtimes_.end(),
        [language](const RuntimeConfig& rt) { return rt.language == language; });
    if (it == runtimes_.end() || it->image.empty() || it->container_command.empty()) {
        return std::nullopt;
    }

    Profile profile;
    profile.container_name = std::format("{}-{}-{}", config_.name_prefix, language,
                                         utils::random_hex(8));
    profile.image = it->image;
    profile.command = it->container_command;
    profile.memory_mb = policy_.max_memory_mb();
    profile.timeout_s = static_cast<int>(policy_.max_execution_time().count());
    profile.network_disabled = (level == SecurityLevel::MAXIMUM);
    profile.read_only_root = (level == SecurityLevel::MAXIMUM);
    return profile;
}

std::vector<std::string> ContainerSandboxBackend::build_run_args(
    const std::string& runtime, const Profile& profile, const std::string& code) {

    std::vector<std::string> args{
        runtime, "run", "--rm",
        "--name", profile.container_name,
        "--memory", std::format("{}m", profile.memory_mb),
        "--timeout", std::to_string(profile.timeout_s),
        "--network", profile.network_disabled ? "none" : "slirp4netns",
        profile.read_only_root ? "--read-only" : "--read-only=false",
        "--cap-drop", "ALL",
        profile.image,
    };
    args.insert(args.end(), profile.command.begin(), profile.command.end());
    args.push_back(code);
    return args;
}

uint64_t ContainerSandboxBackend::parse_mem_usage(std::string_view stats_line) {
    const auto slash = stats_line.find('/');
    const std::string used = utils::trim(stats_line.substr(0, slash));
    if (used.empty()) return 0;

    double value = 0.0;
    const char* begin = used.data();
    const char* end = used.data() + used.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || value < 0.0) return 0;

    const std::string unit = utils::to_lower(utils::trim(std::string_view(ptr, end - ptr)));
    double multiplier = 0.0;
    if (unit == "b" || unit.empty()) multiplier = 1.0;
    else if (unit == "kib") multiplier = 1024.0;
    else if (unit == "mib") multiplier = 1024.0 * 1024.0;
    else if (unit == "gib") multiplier = 1024.0 * 1024.0 * 1024.0;
    else if (unit == "kb") multiplier = 1e3;
    else if (unit == "mb") multiplier = 1e6;
    else if (unit == "gb") multiplier = 1e9;
    else return 0;

    return static_cast<uint64_t>(value * multiplier);
}

// ============================================================================
// Execution
// ============================================================================

ExecutionBackendResult ContainerSandboxBackend::execute(const CodeSubmission& submission,
                                                        SecurityLevel level) {
    const IsolationLevel isolation = isolation_for(level);

    if (!is_available()) {
        return ExecutionBackendResult::failure(BackendKind::CONTAINER, isolation,
            ErrorCode::BACKEND_UNAVAILABLE,
            std::format("Container runtime '{}' is not available", config_.runtime));
    }

    auto profile = make_profile(submission.language, level);
    if (!profile) {
        return ExecutionBackendResult::failure(BackendKind::CONTAINER, isolation,
            ErrorCode::INVALID_REQUEST,
            std::format("No container image configured for '{}'", submission.language));
    }

    ProcessSpec spec;
    spec.argv = build_run_args(config_.runtime, *profile, submission.code);
    spec.timeout = std::chrono::seconds(profile->timeout_s + config_.grace_period_s);

    utils::log::debug(std::format("Starting container {} ({}, {})", profile->container_name,
                                  profile->image, security_level_to_string(level)));

    {
        std::lock_guard lock(active_mutex_);
        active_.insert(profile->container_name);
    }

    // Peak memory sampler; runs until the container process returns
    std::atomic<uint64_t> peak_memory{0};
    std::mutex sampler_mutex;
    std::condition_variable sampler_cv;
    bool sampler_stop = false;

    std::thread sampler([&] {
        std::unique_lock lock(sampler_mutex);
        while (!sampler_cv.wait_for(lock, std::chrono::milliseconds(config_.stats_interval_ms),
                                    [&] { return sampler_stop; })) {
            lock.unlock();
            const uint64_t sample = sample_memory(profile->container_name);
            uint64_t current = peak_memory.load();
            while (sample > current && !peak_memory.compare_exchange_weak(current, sample)) {}
            lock.lock();
        }
    });

    const auto outcome = ProcessRunner::run(spec);

    {
        std::lock_guard lock(sampler_mutex);
        sampler_stop = true;
    }
    sampler_cv.notify_one();
    sampler.join();

    if (!outcome.launched) {
        {
            std::lock_guard lock(active_mutex_);
            active_.erase(profile->container_name);
        }
        mark_unavailable();
        return ExecutionBackendResult::failure(BackendKind::CONTAINER, isolation,
            ErrorCode::BACKEND_UNAVAILABLE,
            std::format("Failed to launch '{}': {}", config_.runtime, outcome.launch_error));
    }

    ExecutionBackendResult result;
    result.backend = BackendKind::CONTAINER;
    result.isolation = isolation;
    result.sandbox_id = profile->container_name;
    result.stdout_data = outcome.stdout_data;
    result.stderr_data = outcome.stderr_data;
    result.elapsed = outcome.elapsed;
    result.memory_used_bytes = peak_memory.load();
    result.exit_code = outcome.exit_code;

    // Runtime-side timeout surfaces as a non-zero exit at or past the limit
    const bool runtime_timeout = outcome.exit_code != 0 &&
        outcome.elapsed >= std::chrono::seconds(profile->timeout_s);

    if (outcome.timed_out || runtime_timeout) {
        if (outcome.timed_out && !force_remove(profile->container_name)) {
            utils::log::error(std::format("Failed to remove timed-out container {}",
                                          profile->container_name));
        }
        {
            std::lock_guard lock(active_mutex_);
            active_.erase(profile->container_name);
        }
        result.success = false;
        result.error_code = ErrorCode::EXECUTION_TIMEOUT;
        result.stderr_data += std::format("\nExecution timed out after {}s", profile->timeout_s);
        return result;
    }

    {
        std::lock_guard lock(active_mutex_);
        active_.erase(profile->container_name);
    }
    result.success = (outcome.exit_code == 0);
    result.error_code = result.success ? ErrorCode::NONE : ErrorCode::EXECUTION_FAILURE;
    return result;
}

// ============================================================================
// Runtime helpers
// ============================================================================

bool ContainerSandboxBackend::force_remove(const std::string& container_name) {
    ProcessSpec spec;
    spec.argv = {config_.runtime, "rm", "-f", container_name};
    spec.timeout = std::chrono::seconds(config_.probe_timeout_s + config_.grace_period_s);
    return ProcessRunner::run(spec).exited_cleanly();
}

uint64_t ContainerSandboxBackend::sample_memory(const std::string& container_name) {
    ProcessSpec spec;
    spec.argv = {config_.runtime, "stats", "--no-stream", "--format", "{{.MemUsage}}",
                 container_name};
    spec.timeout = std::chrono::seconds(config_.probe_timeout_s);
    const auto outcome = ProcessRunner::run(spec);
    if (!outcome.exited_cleanly()) return 0;
    return parse_mem_usage(outcome.stdout_data);
}

std::optional<std::string> ContainerSandboxBackend::system_info() {
    if (!is_available()) return std::nullopt;

    ProcessSpec spec;
    spec.argv = {config_.runtime, "version"};
    spec.timeout = std::chrono::seconds(config_.probe_timeout_s);
    const auto outcome = ProcessRunner::run(spec);
    if (!outcome.exited_cleanly()) return std::nullopt;
    return utils::trim(outcome.stdout_data);
}

std::vector<std::string> ContainerSandboxBackend::list_instances() {
    std::vector<std::string> names;
    if (!is_available()) return names;

    ProcessSpec spec;
    spec.argv = {config_.runtime, "ps", "-a", "--filter",
                 std::format("name={}-", config_.name_prefix), "--format", "{{.Names}}"};
    spec.timeout = std::chrono::seconds(config_.probe_timeout_s);
    const auto outcome = ProcessRunner::run(spec);
    if (!outcome.exited_cleanly()) {
        utils::log::warn(std::format("Listing containers failed: {}", utils::trim(outcome.stderr_data)));
        return names;
    }

    for (const auto& line : utils::split(outcome.stdout_data, '\n')) {
        auto name = utils::trim(line);
        if (name.starts_with(config_.name_prefix + "-")) {
            names.push_back(std::move(name));
        }
    }
    return names;
}

size_t ContainerSandboxBackend::cleanup() {
    size_t removed = 0;
    for (const auto& instance : list_instances()) {
        if (force_remove(instance)) {
            ++removed;
        } else {
            utils::log::warn(std::format("Failed to remove container {}", instance));
        }
    }
    if (removed > 0) {
        utils::log::info(std::format("Removed {} leftover container(s)", removed));
    }
    return removed;
}

} // namespace codegate

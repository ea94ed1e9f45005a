#pragma once

#include "config/config_types.hpp"
#include "executor/execution_backend.hpp"
#include "policy/execution_policy.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace codegate {

/**
 * @brief Runs code inside a throwaway rootless container (podman by default)
 *
 * Every execution gets a fresh, uniquely named container:
 *   <runtime> run --rm --name <prefix>-<lang>-<8hex> --memory <M>m
 *       --timeout <T> --network none|slirp4netns --read-only|--read-only=false
 *       --cap-drop ALL <image> <command...> <code>
 *
 * Maximum disables networking and mounts the root filesystem read-only.
 * Balanced keeps a slirp network and a writable root. Both drop all
 * capabilities and carry the policy memory and time limits.
 *
 * The host supervises with deadline = timeout + grace period; if that
 * expires the container is force-removed. Peak memory is sampled from
 * `<runtime> stats` while the container runs.
 *
 * A failed probe is cached for probe_retry_s, then the runtime is probed
 * again. The probe itself runs without holding any lock.
 */
class ContainerSandboxBackend : public IExecutionBackend {
public:
    /// Fully resolved container settings for one execution
    struct Profile {
        std::string container_name;
        std::string image;
        std::vector<std::string> command;
        uint64_t memory_mb = 256;
        int timeout_s = 30;
        bool network_disabled = true;
        bool read_only_root = true;
    };

    ContainerSandboxBackend(ContainerConfig config,
                            std::vector<RuntimeConfig> runtimes,
                            const ExecutionPolicy& policy);

    [[nodiscard]] ExecutionBackendResult execute(
        const CodeSubmission& submission, SecurityLevel level) override;

    [[nodiscard]] BackendKind kind() const override { return BackendKind::CONTAINER; }
    [[nodiscard]] bool is_available() override;
    [[nodiscard]] std::string name() const override { return config_.runtime; }

    /// Drop the cached probe result; the next is_available() probes again
    void reset_availability();

    // ---- Management (used by control directives) ----------------------

    /// Runtime version string, or std::nullopt when the runtime is missing
    [[nodiscard]] std::optional<std::string> system_info();

    /// Names of live containers created by this gateway
    [[nodiscard]] std::vector<std::string> list_instances();

    /// Force-remove every container with our name prefix; returns count removed
    size_t cleanup();

    /// Containers started by execute() that have not finished yet
    [[nodiscard]] std::vector<std::string> active_instances() const;

    /// Force-remove the in-flight containers (shutdown path)
    size_t remove_active();

    // ---- Building blocks (exposed for testing) ---------------------------

    [[nodiscard]] std::optional<Profile> make_profile(std::string_view language,
                                                      SecurityLevel level) const;

    [[nodiscard]] static std::vector<std::string> build_run_args(
        const std::string& runtime, const Profile& profile, const std::string& code);

    /// "12.5MiB / 256MiB" -> 13107200. Returns 0 when unparseable.
    [[nodiscard]] static uint64_t parse_mem_usage(std::string_view stats_line);

    [[nodiscard]] static IsolationLevel isolation_for(SecurityLevel level) {
        return level == SecurityLevel::MAXIMUM ? IsolationLevel::SANDBOX_MAXIMUM
                                               : IsolationLevel::SANDBOX_BALANCED;
    }

    [[nodiscard]] const ContainerConfig& config() const { return config_; }

private:
    bool force_remove(const std::string& container_name);
    uint64_t sample_memory(const std::string& container_name);
    void mark_unavailable();

    ContainerConfig config_;
    std::vector<RuntimeConfig> runtimes_;
    const ExecutionPolicy& policy_;

    std::mutex probe_mutex_;
    std::optional<bool> available_;
    std::chrono::steady_clock::time_point probed_at_;

    mutable std::mutex active_mutex_;
    std::set<std::string> active_;
};

} // namespace codegate

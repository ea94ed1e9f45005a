#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace codegate {

// ============================================================================
// Section Configs (mirror the TOML hierarchy)
// ============================================================================

struct PolicyConfig {
    std::string security_level = "balanced";
    std::vector<std::string> allowed_languages{"python", "javascript", "bash"};
    int max_execution_time_s = 30;
    int max_memory_mb = 256;
    bool enterprise_mode = false;
};

struct ContainerConfig {
    bool enabled = true;
    std::string runtime = "podman";
    std::string name_prefix = "codegate";
    int grace_period_s = 5;                 // host-side deadline = timeout + grace
    int probe_timeout_s = 5;
    int probe_retry_s = 30;                 // re-probe an unavailable runtime after this long
    int stats_interval_ms = 250;
};

struct SubprocessConfig {
    bool enabled = true;
    std::string temp_root;                  // empty = std::filesystem::temp_directory_path()
    size_t max_output_bytes = 1024 * 1024;
};

// How one language is launched on the host and inside a container
struct RuntimeConfig {
    std::string language;
    std::vector<std::string> host_command;
    std::string script_extension;           // used when !inline_code
    bool inline_code = false;               // code appended as the last argv element
    std::string image;
    std::vector<std::string> container_command;
};

struct AuditConfig {
    bool enabled = true;
    std::string output_file = "audit.jsonl";
    std::chrono::milliseconds flush_interval{100};

    // Rotation
    size_t rotation_max_file_size_mb = 100;
    int rotation_max_files = 10;
    int rotation_interval_hours = 24;
    bool rotation_time_based = false;
    bool rotation_size_based = true;

    // Integrity (SHA-256 hash chain)
    bool integrity_enabled = true;
};

struct PerformanceConfig {
    bool enabled = true;
    size_t history_capacity = 1000;
    std::string history_file;               // empty = in-memory only
};

struct NotificationConfig {
    bool enabled = true;
    bool security_alerts = true;
    bool backend_events = true;
    bool performance_insights = false;
    size_t queue_capacity = 256;
};

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// GatewayConfig - Complete parsed configuration
// ============================================================================

struct GatewayConfig {
    PolicyConfig policy;
    ContainerConfig container;
    SubprocessConfig subprocess;
    std::vector<RuntimeConfig> runtimes = default_runtimes();
    AuditConfig audit;
    PerformanceConfig performance;
    NotificationConfig notifications;
    LoggingConfig logging;

    [[nodiscard]] const RuntimeConfig* find_runtime(std::string_view language) const {
        for (const auto& rt : runtimes) {
            if (rt.language == language) return &rt;
        }
        return nullptr;
    }

    static std::vector<RuntimeConfig> default_runtimes() {
        return {
            {"python", {"python3"}, ".py", false, "python:3.11-alpine", {"python", "-c"}},
            {"javascript", {"node", "-e"}, ".js", true, "node:18-alpine", {"node", "-e"}},
            {"bash", {"bash"}, ".sh", false, "alpine:latest", {"sh", "-c"}},
        };
    }
};

} // namespace codegate

#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace codegate {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads gateway.toml into an immutable GatewayConfig
 *
 * Pipeline: parse -> resolve `include = [...]` (included files are the
 * base, the including file wins) -> expand ${VAR} in every string ->
 * extract typed sections -> apply GATEWAY_* environment overrides ->
 * validate. This is the only place the process environment is read.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        GatewayConfig config;

        static LoadResult ok(GatewayConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to gateway.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string (includes not resolved)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Defaults + environment overrides, for running without a config file
    [[nodiscard]] static LoadResult load_defaults();

    /// GATEWAY_* variables override file values; malformed numbers are errors
    static void apply_env_overrides(GatewayConfig& config, std::vector<std::string>& errors);

    [[nodiscard]] static std::vector<std::string> validate_config(const GatewayConfig& config);

private:
    static PolicyConfig extract_policy(const toml::table& root);
    static ContainerConfig extract_container(const toml::table& root);
    static SubprocessConfig extract_subprocess(const toml::table& root);
    static std::vector<RuntimeConfig> extract_runtimes(const toml::table& root);
    static AuditConfig extract_audit(const toml::table& root);
    static PerformanceConfig extract_performance(const toml::table& root);
    static NotificationConfig extract_notifications(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static GatewayConfig extract_all_sections(const toml::table& tbl);
    static LoadResult finalize(GatewayConfig config);
};

} // namespace codegate

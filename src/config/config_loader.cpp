#include "config/config_loader.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace codegate {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_node(toml::node& node);

void expand_table(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        expand_node(val);
    }
}

void expand_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) *s = std::move(expanded);
    } else if (auto* t = node.as_table()) {
        expand_table(*t);
    } else if (auto* a = node.as_array()) {
        for (auto& elem : *a) expand_node(elem);
    }
}

/**
 * @brief Deep-merge two tables. Overlay wins for scalars, arrays concatenate.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::filesystem::path& base_dir,
                      std::unordered_set<std::string>& visited, int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (const auto* single = inc_node.as_string()) {
        paths.emplace_back(single->get());
    } else if (const auto* arr = inc_node.as_array()) {
        for (const auto& item : *arr) {
            if (const auto* s = item.as_string()) paths.emplace_back(s->get());
        }
    }
    root.erase("include");

    namespace fs = std::filesystem;
    for (const auto& rel_path : paths) {
        const fs::path abs_path = fs::canonical(base_dir / rel_path);
        if (!visited.insert(abs_path.string()).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path.string()));
        }

        auto included = toml::parse_file(abs_path.string());
        resolve_includes(included, abs_path.parent_path(), visited, depth + 1);

        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_table(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    namespace fs = std::filesystem;
    auto result = toml::parse_file(file_path);

    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, fs::path(file_path).parent_path(), visited, 0);

    expand_table(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

int toml_int(const toml::table& tbl, std::string_view key, int fallback) {
    return static_cast<int>(tbl[key].value_or(static_cast<int64_t>(fallback)));
}

std::optional<bool> parse_bool(std::string_view value) {
    const std::string lower = utils::to_lower(utils::trim(value));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

void override_int(const char* var, int& target, std::vector<std::string>& errors) {
    const char* raw = std::getenv(var);
    if (!raw) return;
    if (const auto parsed = utils::try_parse_int<int>(utils::trim(raw))) {
        target = *parsed;
    } else {
        errors.push_back(std::format("{} must be an integer, got '{}'", var, raw));
    }
}

void override_bool(const char* var, bool& target, std::vector<std::string>& errors) {
    const char* raw = std::getenv(var);
    if (!raw) return;
    if (const auto parsed = parse_bool(raw)) {
        target = *parsed;
    } else {
        errors.push_back(std::format("{} must be true or false, got '{}'", var, raw));
    }
}

} // anonymous namespace

// ============================================================================
// Section Extraction
// ============================================================================

PolicyConfig ConfigLoader::extract_policy(const toml::table& root) {
    PolicyConfig cfg;
    const auto* policy = root["policy"].as_table();
    if (!policy) return cfg;
    const auto& p = *policy;

    cfg.security_level = p["security_level"].value_or(cfg.security_level);
    if (p.contains("allowed_languages")) {
        cfg.allowed_languages.clear();
        for (const auto& lang : toml_string_array(p, "allowed_languages")) {
            cfg.allowed_languages.push_back(normalize_language(lang));
        }
    }
    cfg.max_execution_time_s = toml_int(p, "max_execution_time", cfg.max_execution_time_s);
    cfg.max_memory_mb = toml_int(p, "max_memory_mb", cfg.max_memory_mb);
    cfg.enterprise_mode = p["enterprise_mode"].value_or(cfg.enterprise_mode);
    return cfg;
}

ContainerConfig ConfigLoader::extract_container(const toml::table& root) {
    ContainerConfig cfg;
    const auto* container = root["container"].as_table();
    if (!container) return cfg;
    const auto& c = *container;

    cfg.enabled = c["enabled"].value_or(cfg.enabled);
    cfg.runtime = c["runtime"].value_or(cfg.runtime);
    cfg.name_prefix = c["name_prefix"].value_or(cfg.name_prefix);
    cfg.grace_period_s = toml_int(c, "grace_period_s", cfg.grace_period_s);
    cfg.probe_timeout_s = toml_int(c, "probe_timeout_s", cfg.probe_timeout_s);
    cfg.probe_retry_s = toml_int(c, "probe_retry_s", cfg.probe_retry_s);
    cfg.stats_interval_ms = toml_int(c, "stats_interval_ms", cfg.stats_interval_ms);
    return cfg;
}

SubprocessConfig ConfigLoader::extract_subprocess(const toml::table& root) {
    SubprocessConfig cfg;
    const auto* sub = root["subprocess"].as_table();
    if (!sub) return cfg;
    const auto& s = *sub;

    cfg.enabled = s["enabled"].value_or(cfg.enabled);
    cfg.temp_root = s["temp_root"].value_or(""s);
    cfg.max_output_bytes = static_cast<size_t>(
        s["max_output_kb"].value_or(static_cast<int64_t>(cfg.max_output_bytes / 1024))) * 1024;
    return cfg;
}

std::vector<RuntimeConfig> ConfigLoader::extract_runtimes(const toml::table& root) {
    auto result = GatewayConfig::default_runtimes();
    const auto* arr = root["runtimes"].as_array();
    if (!arr) return result;

    for (const auto& elem : *arr) {
        const auto* tbl = elem.as_table();
        if (!tbl) continue;
        const auto& t = *tbl;

        RuntimeConfig rt;
        rt.language = normalize_language(t["language"].value_or(""s));
        rt.host_command = toml_string_array(t, "host_command");
        rt.script_extension = t["script_extension"].value_or(""s);
        rt.inline_code = t["inline"].value_or(false);
        rt.image = t["image"].value_or(""s);
        rt.container_command = toml_string_array(t, "container_command");

        const auto existing = std::find_if(result.begin(), result.end(),
            [&](const RuntimeConfig& r) { return r.language == rt.language; });
        if (existing != result.end()) {
            *existing = std::move(rt);
        } else {
            result.push_back(std::move(rt));
        }
    }
    return result;
}

AuditConfig ConfigLoader::extract_audit(const toml::table& root) {
    AuditConfig cfg;
    const auto* audit = root["audit"].as_table();
    if (!audit) return cfg;
    const auto& a = *audit;

    cfg.enabled = a["enabled"].value_or(cfg.enabled);
    cfg.output_file = a["output_file"].value_or(cfg.output_file);
    cfg.flush_interval = std::chrono::milliseconds(toml_int(a, "flush_interval_ms", 100));

    if (const auto* r = a["rotation"].as_table()) {
        cfg.rotation_max_file_size_mb = static_cast<size_t>(toml_int(*r, "max_file_size_mb", 100));
        cfg.rotation_max_files = toml_int(*r, "max_files", 10);
        cfg.rotation_interval_hours = toml_int(*r, "interval_hours", 24);
        cfg.rotation_time_based = (*r)["time_based"].value_or(cfg.rotation_time_based);
        cfg.rotation_size_based = (*r)["size_based"].value_or(cfg.rotation_size_based);
    }

    if (const auto* ig = a["integrity"].as_table()) {
        cfg.integrity_enabled = (*ig)["enabled"].value_or(true);
    }
    return cfg;
}

PerformanceConfig ConfigLoader::extract_performance(const toml::table& root) {
    PerformanceConfig cfg;
    const auto* perf = root["performance"].as_table();
    if (!perf) return cfg;
    const auto& p = *perf;

    cfg.enabled = p["enabled"].value_or(cfg.enabled);
    cfg.history_capacity = static_cast<size_t>(toml_int(p, "history_capacity", 1000));
    cfg.history_file = p["history_file"].value_or(""s);
    return cfg;
}

NotificationConfig ConfigLoader::extract_notifications(const toml::table& root) {
    NotificationConfig cfg;
    const auto* notif = root["notifications"].as_table();
    if (!notif) return cfg;
    const auto& n = *notif;

    cfg.enabled = n["enabled"].value_or(cfg.enabled);
    cfg.security_alerts = n["security_alerts"].value_or(cfg.security_alerts);
    cfg.backend_events = n["backend_events"].value_or(cfg.backend_events);
    cfg.performance_insights = n["performance_insights"].value_or(cfg.performance_insights);
    cfg.queue_capacity = static_cast<size_t>(toml_int(n, "queue_capacity", 256));
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* l = root["logging"].as_table()) {
        cfg.level = (*l)["level"].value_or(cfg.level);
    }
    return cfg;
}

GatewayConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    GatewayConfig config;
    config.policy = extract_policy(tbl);
    config.container = extract_container(tbl);
    config.subprocess = extract_subprocess(tbl);
    config.runtimes = extract_runtimes(tbl);
    config.audit = extract_audit(tbl);
    config.performance = extract_performance(tbl);
    config.notifications = extract_notifications(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

// ============================================================================
// Environment Overrides
// ============================================================================

void ConfigLoader::apply_env_overrides(GatewayConfig& config, std::vector<std::string>& errors) {
    if (const char* level = std::getenv("GATEWAY_SECURITY_LEVEL")) {
        config.policy.security_level = utils::trim(level);
    }
    if (const char* langs = std::getenv("GATEWAY_ALLOWED_LANGUAGES")) {
        config.policy.allowed_languages.clear();
        for (const auto& lang : utils::split(langs, ',')) {
            const auto normalized = normalize_language(lang);
            if (!normalized.empty()) config.policy.allowed_languages.push_back(normalized);
        }
    }
    override_int("GATEWAY_MAX_EXECUTION_TIME", config.policy.max_execution_time_s, errors);
    override_int("GATEWAY_MAX_MEMORY_MB", config.policy.max_memory_mb, errors);
    override_bool("GATEWAY_ENTERPRISE_MODE", config.policy.enterprise_mode, errors);
    override_bool("GATEWAY_CONTAINER_ENABLED", config.container.enabled, errors);
    if (const char* log_level = std::getenv("GATEWAY_LOG_LEVEL")) {
        config.logging.level = utils::to_lower(utils::trim(log_level));
    }
}

// ---- Shared finalize + validation ------------------------------------------

ConfigLoader::LoadResult ConfigLoader::finalize(GatewayConfig config) {
    std::vector<std::string> errors;
    apply_env_overrides(config, errors);

    const auto validation = validate_config(config);
    errors.insert(errors.end(), validation.begin(), validation.end());

    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) {
            combined += "\n  - ";
            combined += err;
        }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return finalize(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return finalize(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_defaults() {
    return finalize(GatewayConfig{});
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GatewayConfig& config) {
    std::vector<std::string> errors;

    if (!parse_security_level(config.policy.security_level)) {
        errors.push_back(std::format(
            "policy.security_level must be maximum|balanced|development, got '{}'",
            config.policy.security_level));
    }
    if (config.policy.allowed_languages.empty()) {
        errors.push_back("policy.allowed_languages must not be empty");
    }
    for (const auto& lang : config.policy.allowed_languages) {
        if (!config.find_runtime(lang)) {
            errors.push_back(std::format("policy.allowed_languages: unknown language '{}'", lang));
        }
    }
    if (config.policy.max_execution_time_s < 1 || config.policy.max_execution_time_s > 3600) {
        errors.push_back(std::format("policy.max_execution_time must be 1-3600, got {}",
                                     config.policy.max_execution_time_s));
    }
    if (config.policy.max_memory_mb < 16 || config.policy.max_memory_mb > 65536) {
        errors.push_back(std::format("policy.max_memory_mb must be 16-65536, got {}",
                                     config.policy.max_memory_mb));
    }

    if (config.container.enabled) {
        if (config.container.runtime.empty()) {
            errors.push_back("container.runtime required when container is enabled");
        }
        if (config.container.name_prefix.empty()) {
            errors.push_back("container.name_prefix must not be empty");
        }
        if (config.container.grace_period_s <= 0) {
            errors.push_back("container.grace_period_s must be > 0");
        }
        if (config.container.probe_retry_s < 0) {
            errors.push_back("container.probe_retry_s must be >= 0");
        }
        if (config.container.stats_interval_ms <= 0) {
            errors.push_back("container.stats_interval_ms must be > 0");
        }
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < config.runtimes.size(); ++i) {
        const auto& rt = config.runtimes[i];
        if (rt.language.empty()) {
            errors.push_back(std::format("runtimes[{}].language must not be empty", i));
            continue;
        }
        if (!seen.insert(rt.language).second) {
            errors.push_back(std::format("runtimes[{}]: duplicate language '{}'", i, rt.language));
        }
        if (rt.host_command.empty()) {
            errors.push_back(std::format("runtimes[{}].host_command must not be empty", i));
        }
        if (!rt.inline_code && rt.script_extension.empty()) {
            errors.push_back(std::format("runtimes[{}].script_extension required unless inline", i));
        }
        if (config.container.enabled && (rt.image.empty() || rt.container_command.empty())) {
            errors.push_back(std::format("runtimes[{}]: image and container_command required", i));
        }
    }

    if (config.audit.enabled) {
        if (config.audit.output_file.empty()) {
            errors.push_back("audit.output_file required when audit is enabled");
        }
        if (config.audit.rotation_max_files < 1) {
            errors.push_back("audit.rotation.max_files must be >= 1");
        }
    }

    if (config.performance.history_capacity == 0) {
        errors.push_back("performance.history_capacity must be > 0");
    }
    if (config.notifications.queue_capacity == 0) {
        errors.push_back("notifications.queue_capacity must be > 0");
    }

    static constexpr std::string_view kLevels[] = {"debug", "info", "warn", "warning", "error"};
    if (std::find(std::begin(kLevels), std::end(kLevels), config.logging.level) == std::end(kLevels)) {
        errors.push_back(std::format("logging.level must be debug|info|warn|error, got '{}'",
                                     config.logging.level));
    }

    return errors;
}

} // namespace codegate

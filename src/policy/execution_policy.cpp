#include "policy/execution_policy.hpp"

#include <algorithm>

namespace codegate {

ExecutionPolicy::ExecutionPolicy(Config config)
    : config_(std::move(config)) {
    for (auto& lang : config_.allowed_languages) {
        lang = normalize_language(lang);
    }
    std::erase_if(config_.allowed_languages, [](const std::string& l) { return l.empty(); });
}

ExecutionPolicy ExecutionPolicy::from_config(const PolicyConfig& cfg) {
    Config config;
    config.security_level = parse_security_level(cfg.security_level).value_or(SecurityLevel::BALANCED);
    config.allowed_languages = cfg.allowed_languages;
    config.max_execution_time = std::chrono::seconds(cfg.max_execution_time_s);
    config.max_memory_mb = static_cast<uint64_t>(cfg.max_memory_mb);
    config.enterprise_mode = cfg.enterprise_mode;
    return ExecutionPolicy(std::move(config));
}

bool ExecutionPolicy::allows(std::string_view language) const {
    const std::string normalized = normalize_language(language);
    return std::find(config_.allowed_languages.begin(), config_.allowed_languages.end(),
                     normalized) != config_.allowed_languages.end();
}

} // namespace codegate

#include "alerting/notifier.hpp"
#include "analyzer/security_analyzer.hpp"
#include "audit/audit_recorder.hpp"
#include "config/config_loader.hpp"
#include "core/performance_tracker.hpp"
#include "core/pipeline.hpp"
#include "core/process_runner.hpp"
#include "core/utils.hpp"
#include "executor/container_sandbox_backend.hpp"
#include "executor/subprocess_backend.hpp"
#include "policy/execution_policy.hpp"
#include "transport/contract.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

using namespace codegate;

std::shared_ptr<AuditRecorder> g_audit;
std::shared_ptr<AsyncNotifier> g_notifier;
std::shared_ptr<ContainerSandboxBackend> g_container;

namespace {

constexpr const char* kDefaultConfig = "config/gateway.toml";

struct CliOptions {
    std::string config_file = kDefaultConfig;
    bool config_explicit = false;
    std::string request_file;           // empty = stdin, one JSON request per line
    bool scan_only = false;
    bool cleanup = false;
};

void print_usage() {
    std::cerr <<
        "Usage: code_gateway [options]\n"
        "  --config FILE    gateway configuration (default: config/gateway.toml)\n"
        "  --request FILE   read one JSON request from FILE instead of stdin\n"
        "  --scan           analyze only, never execute\n"
        "  --cleanup        remove leftover sandbox containers and exit\n"
        "  --help           show this message\n";
}

bool parse_args(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_file = argv[++i];
            opts.config_explicit = true;
        } else if (arg == "--request" && i + 1 < argc) {
            opts.request_file = argv[++i];
        } else if (arg == "--scan") {
            opts.scan_only = true;
        } else if (arg == "--cleanup") {
            opts.cleanup = true;
        } else {
            return false;
        }
    }
    return true;
}

ConfigLoader::LoadResult load_config(const CliOptions& opts) {
    if (!opts.config_explicit && !std::filesystem::exists(opts.config_file)) {
        utils::log::info(std::format("{} not found, using built-in defaults", opts.config_file));
        return ConfigLoader::load_defaults();
    }
    return ConfigLoader::load_from_file(opts.config_file);
}

nlohmann::json handle_request(ExecutionPipeline& pipeline, std::string_view text, bool scan_only) {
    const auto parsed = contract::parse_request(text);
    if (!parsed.success) {
        return contract::error_response(ErrorCode::INVALID_REQUEST, parsed.error_message);
    }
    if (scan_only) {
        return {{"success", true},
                {"risk_assessment", contract::to_json(pipeline.scan(parsed.submission))}};
    }
    return contract::to_json(pipeline.execute(parsed.submission));
}

void signal_handler(int signal) {
    // In-flight runs first, so no submitted code outlives the gateway
    const size_t killed = ProcessRunner::kill_all();
    utils::log::info(std::format("Received signal {}, shutting down ({} run(s) killed)...",
                                 signal, killed));
    if (g_container) g_container->remove_active();
    if (g_notifier) g_notifier->stop();
    if (g_audit) g_audit->shutdown();
    std::_Exit(0);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        if (std::string_view(argv[i]) == "--help") {
            print_usage();
            return 0;
        }
    }
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return 2;
    }

    try {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // [1/4] Configuration
        auto config_result = load_config(opts);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const GatewayConfig& cfg = config_result.config;
        utils::log::set_level(utils::log::parse_level(cfg.logging.level));
        utils::log::info(std::format("Code gateway starting (security level {}, languages {})",
                                     cfg.policy.security_level,
                                     utils::join(cfg.policy.allowed_languages, ",")));

        // [2/4] Policy + analyzer
        auto policy = std::make_shared<const ExecutionPolicy>(ExecutionPolicy::from_config(cfg.policy));
        auto analyzer = std::make_shared<const SecurityAnalyzer>();

        // [3/4] Backends
        auto container = std::make_shared<ContainerSandboxBackend>(cfg.container, cfg.runtimes, *policy);
        g_container = container;
        auto subprocess = std::make_shared<SubprocessBackend>(cfg.subprocess, cfg.runtimes, *policy);

        if (opts.cleanup) {
            const size_t removed = container->cleanup();
            std::cout << nlohmann::json{{"success", true}, {"removed", removed}}.dump() << '\n';
            return 0;
        }

        // [4/4] Audit, performance, notifications
        g_audit = std::make_shared<AuditRecorder>(cfg.audit);

        std::shared_ptr<PerformanceTracker> performance;
        if (cfg.performance.enabled) {
            PerformanceTracker::Config perf_cfg;
            perf_cfg.capacity = cfg.performance.history_capacity;
            perf_cfg.history_file = cfg.performance.history_file;
            performance = std::make_shared<PerformanceTracker>(perf_cfg);
        }

        g_notifier = std::make_shared<AsyncNotifier>(cfg.notifications,
                                                     std::make_shared<LogNotificationSink>());

        auto pipeline = PipelineBuilder()
            .with_policy(policy)
            .with_analyzer(analyzer)
            .with_audit(g_audit)
            .with_container(cfg.container.enabled ? container : nullptr)
            .with_subprocess(subprocess)
            .with_performance(performance)
            .with_notifier(g_notifier)
            .build();

        if (!opts.request_file.empty()) {
            std::ifstream in(opts.request_file);
            if (!in.is_open()) {
                utils::log::error(std::format("Cannot open request file {}", opts.request_file));
                return 1;
            }
            std::stringstream buffer;
            buffer << in.rdbuf();
            std::cout << handle_request(*pipeline, buffer.str(), opts.scan_only).dump() << '\n';
        } else {
            std::string line;
            while (std::getline(std::cin, line)) {
                if (utils::trim(line).empty()) continue;
                std::cout << handle_request(*pipeline, line, opts.scan_only).dump() << std::endl;
            }
        }

        g_notifier->stop();
        g_audit->shutdown();
        g_container.reset();

        const auto stats = pipeline->get_stats();
        utils::log::info(std::format("Processed {} request(s): {} denied, {} fallback(s), {} alert(s)",
                                     stats.total_requests, stats.requests_denied,
                                     stats.fallbacks, stats.alerts));

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}

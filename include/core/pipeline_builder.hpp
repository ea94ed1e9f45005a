#pragma once

#include <memory>

namespace codegate {

// Forward declarations
class ExecutionPolicy;
class SecurityAnalyzer;
class IExecutionBackend;
class ContainerSandboxBackend;
class AuditRecorder;
class PerformanceTracker;
class AsyncNotifier;
class ExecutionPipeline;

/**
 * @brief All components that ExecutionPipeline needs, grouped in a single struct.
 */
struct PipelineComponents {
    // Required
    std::shared_ptr<const ExecutionPolicy> policy;
    std::shared_ptr<const SecurityAnalyzer> analyzer;
    std::shared_ptr<AuditRecorder> audit;

    // Optional (nullptr = disabled)
    std::shared_ptr<IExecutionBackend> container;
    std::shared_ptr<IExecutionBackend> subprocess;
    std::shared_ptr<ContainerSandboxBackend> container_admin;   // directives only
    std::shared_ptr<PerformanceTracker> performance;
    std::shared_ptr<AsyncNotifier> notifier;
};

/**
 * @brief Builder for ExecutionPipeline.
 *
 * Usage:
 *   auto pipeline = PipelineBuilder()
 *       .with_policy(policy)
 *       .with_analyzer(analyzer)
 *       .with_audit(recorder)
 *       .with_container(container)        // optional
 *       .with_subprocess(subprocess)      // optional
 *       .build();
 */
class PipelineBuilder {
public:
    PipelineBuilder& with_policy(std::shared_ptr<const ExecutionPolicy> p)      { c_.policy = std::move(p); return *this; }
    PipelineBuilder& with_analyzer(std::shared_ptr<const SecurityAnalyzer> p)   { c_.analyzer = std::move(p); return *this; }
    PipelineBuilder& with_audit(std::shared_ptr<AuditRecorder> p)               { c_.audit = std::move(p); return *this; }
    PipelineBuilder& with_container_backend(std::shared_ptr<IExecutionBackend> p) { c_.container = std::move(p); return *this; }
    PipelineBuilder& with_subprocess(std::shared_ptr<IExecutionBackend> p)      { c_.subprocess = std::move(p); return *this; }
    PipelineBuilder& with_performance(std::shared_ptr<PerformanceTracker> p)    { c_.performance = std::move(p); return *this; }
    PipelineBuilder& with_notifier(std::shared_ptr<AsyncNotifier> p)            { c_.notifier = std::move(p); return *this; }

    /// Sets both the execution backend and the directive target
    PipelineBuilder& with_container(std::shared_ptr<ContainerSandboxBackend> p);

    /**
     * @brief Build the pipeline from accumulated components.
     * @throws std::runtime_error if required components are missing.
     */
    [[nodiscard]] std::shared_ptr<ExecutionPipeline> build();

private:
    PipelineComponents c_;
};

} // namespace codegate

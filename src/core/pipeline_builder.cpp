#include "core/pipeline_builder.hpp"
#include "core/pipeline.hpp"
#include "executor/container_sandbox_backend.hpp"
#include <stdexcept>

namespace codegate {

PipelineBuilder& PipelineBuilder::with_container(std::shared_ptr<ContainerSandboxBackend> p) {
    c_.container = p;
    c_.container_admin = std::move(p);
    return *this;
}

std::shared_ptr<ExecutionPipeline> PipelineBuilder::build() {
    if (!c_.policy) throw std::runtime_error("PipelineBuilder: policy is required");
    if (!c_.analyzer) throw std::runtime_error("PipelineBuilder: analyzer is required");
    if (!c_.audit) throw std::runtime_error("PipelineBuilder: audit recorder is required");
    if (!c_.container && !c_.subprocess) {
        throw std::runtime_error("PipelineBuilder: at least one execution backend is required");
    }

    return std::make_shared<ExecutionPipeline>(std::move(c_));
}

} // namespace codegate

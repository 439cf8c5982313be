#include "backup/transporter.hpp"
#include "common/logger.hpp"

Transporter::Transporter(std::shared_ptr<CopyProvider> copier)
    : copier_(std::move(copier)) {
}

StageResult Transporter::execute(const OperationContext& context) {
    if (!context.target) {
        throw PipelineError(StageKind::Transfer, context.label(), "no target given");
    }

    try {
        Logger::info("Transferring " + context.source.path + " to " + context.target->path);
        const uint64_t files = copier_->copyTree(context.source.path, context.target->path);
        Logger::info("Transferred " + std::to_string(files) + " files to " + context.target->path);
    } catch (const std::exception& e) {
        throw PipelineError(StageKind::Transfer, context.label(), e.what());
    }
    return StageResult();
}

#include "backup/verifier.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>

namespace fs = std::filesystem;

Verifier::Verifier(std::shared_ptr<ChecksumProvider> checksums)
    : checksums_(std::move(checksums)) {
}

StageResult Verifier::execute(const OperationContext& context) {
    if (!context.target) {
        throw PipelineError(StageKind::Verify, context.label(), "no target given");
    }
    if (!context.source.hashFile) {
        throw PipelineError(StageKind::Verify, context.label(), "source has no checksum file");
    }

    const fs::path sourcePath = utils::normalizePath(context.source.path);
    const fs::path targetPath = utils::normalizePath(context.target->path);
    // The checksum file lives inside the source, so it was copied with the data
    const fs::path hashFile = targetPath / fs::path(*context.source.hashFile).lexically_relative(sourcePath);
    const std::string logName = utils::sanitizeFilename(targetPath.filename().string()) +
                                "_verify_" + utils::fileTimestamp() + ".log";
    const std::string logFile = (targetPath.parent_path() / logName).string();

    try {
        Logger::info("Verifying " + targetPath.string());
        StageResult result;
        result.verified = checksums_->verifyChecksums(hashFile.string(), targetPath.string(), logFile);
        return result;
    } catch (const std::exception& e) {
        throw PipelineError(StageKind::Verify, context.label(), e.what());
    }
}

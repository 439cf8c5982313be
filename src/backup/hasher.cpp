#include "backup/hasher.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>

Hasher::Hasher(std::shared_ptr<ChecksumProvider> checksums)
    : checksums_(std::move(checksums)) {
}

StageResult Hasher::execute(const OperationContext& context) {
    const Source& source = context.source;

    ChecksumOptions options;
    options.algorithm = source.hashAlgorithm;
    options.forceSingleHash = source.forceSingleHash;
    options.allowlist = source.allowlist;
    options.blocklist = source.blocklist;

    const std::string logName = utils::sanitizeFilename(source.path) + "_inc_" + utils::fileTimestamp() + ".log";
    const std::string logFile = (std::filesystem::path(context.logDirectory) / logName).string();

    try {
        Logger::info("Hashing " + source.path + " (" + source.hashAlgorithm + ")");
        ChecksumFileInfo info = checksums_->createChecksums(source.path, options, logFile);

        StageResult result;
        result.hashFile = info.hashFile;
        result.hashLogFile = logFile;
        return result;
    } catch (const std::exception& e) {
        throw PipelineError(StageKind::Hash, context.label(), e.what());
    }
}

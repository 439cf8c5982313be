#include "backup/stage_executor.hpp"
#include "backup/copy_provider.hpp"
#include "backup/hasher.hpp"
#include "backup/transporter.hpp"
#include "backup/verifier.hpp"

std::string OperationContext::label() const {
    std::string result = stageKindToString(kind) + "(" + source.label();
    if (target) {
        result += "," + target->label();
    }
    return result + ")";
}

StageExecutors StageExecutors::standard() {
    auto checksums = std::make_shared<OpenSslChecksumProvider>();

    StageExecutors executors;
    executors.hasher = std::make_shared<Hasher>(checksums);
    executors.transporter = std::make_shared<Transporter>(std::make_shared<FilesystemCopyProvider>());
    executors.verifier = std::make_shared<Verifier>(checksums);
    return executors;
}

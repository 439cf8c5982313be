#pragma once

#include "common/errors.hpp"
#include "state/entities.hpp"
#include <memory>
#include <optional>
#include <string>

// Everything a stage needs to run one operation, copied out of the state store
struct OperationContext {
    StageKind kind = StageKind::Hash;
    Source source;
    std::optional<Target> target;
    std::string logDirectory;

    std::string label() const;
};

struct StageResult {
    std::optional<std::string> hashFile;
    std::optional<std::string> hashLogFile;
    std::optional<VerifiedInfo> verified;
};

// Performs one pipeline stage. Failures are thrown as PipelineError; any other
// exception is wrapped into one by the scheduler.
class StageExecutor {
public:
    virtual ~StageExecutor() = default;

    virtual StageResult execute(const OperationContext& context) = 0;
};

struct StageExecutors {
    std::shared_ptr<StageExecutor> hasher;
    std::shared_ptr<StageExecutor> transporter;
    std::shared_ptr<StageExecutor> verifier;

    // OpenSSL checksums and filesystem copies
    static StageExecutors standard();
};

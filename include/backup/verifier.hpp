#pragma once

#include "backup/checksum_provider.hpp"
#include "backup/stage_executor.hpp"
#include <memory>

// Checks a transferred copy against the checksum file that travelled with it.
// Mismatches are returned in the result, not thrown.
class Verifier : public StageExecutor {
public:
    explicit Verifier(std::shared_ptr<ChecksumProvider> checksums);

    StageResult execute(const OperationContext& context) override;

private:
    std::shared_ptr<ChecksumProvider> checksums_;
};

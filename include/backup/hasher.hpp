#pragma once

#include "backup/checksum_provider.hpp"
#include "backup/stage_executor.hpp"
#include <memory>

// Writes the checksum file of a source and a hash log beside the state file
class Hasher : public StageExecutor {
public:
    explicit Hasher(std::shared_ptr<ChecksumProvider> checksums);

    StageResult execute(const OperationContext& context) override;

private:
    std::shared_ptr<ChecksumProvider> checksums_;
};

#pragma once

#include "backup/copy_provider.hpp"
#include "backup/stage_executor.hpp"
#include <memory>

class Transporter : public StageExecutor {
public:
    explicit Transporter(std::shared_ptr<CopyProvider> copier);

    StageResult execute(const OperationContext& context) override;

private:
    std::shared_ptr<CopyProvider> copier_;
};

#include "common/errors.hpp"

std::string stageKindToString(StageKind kind) {
    switch (kind) {
        case StageKind::Hash:     return "Hash";
        case StageKind::Transfer: return "Transfer";
        case StageKind::Verify:   return "Verify";
    }
    return "Unknown";
}

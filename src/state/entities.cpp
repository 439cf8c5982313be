#include "state/entities.hpp"
#include <stdexcept>

std::string toString(SourceStatus status) {
    switch (status) {
        case SourceStatus::Unhashed:   return "Unhashed";
        case SourceStatus::Hashing:    return "Hashing";
        case SourceStatus::Hashed:     return "Hashed";
        case SourceStatus::HashFailed: return "HashFailed";
    }
    return "Unknown";
}

std::string toString(TargetStatus status) {
    switch (status) {
        case TargetStatus::Pending:        return "Pending";
        case TargetStatus::Transferring:   return "Transferring";
        case TargetStatus::Transferred:    return "Transferred";
        case TargetStatus::TransferFailed: return "TransferFailed";
        case TargetStatus::Verifying:      return "Verifying";
        case TargetStatus::Verified:       return "Verified";
        case TargetStatus::VerifyFailed:   return "VerifyFailed";
    }
    return "Unknown";
}

SourceStatus sourceStatusFromString(const std::string& name) {
    for (auto status : {SourceStatus::Unhashed, SourceStatus::Hashing,
                        SourceStatus::Hashed, SourceStatus::HashFailed}) {
        if (toString(status) == name) {
            return status;
        }
    }
    throw std::invalid_argument("Unknown source status: " + name);
}

TargetStatus targetStatusFromString(const std::string& name) {
    for (auto status : {TargetStatus::Pending, TargetStatus::Transferring,
                        TargetStatus::Transferred, TargetStatus::TransferFailed,
                        TargetStatus::Verifying, TargetStatus::Verified,
                        TargetStatus::VerifyFailed}) {
        if (toString(status) == name) {
            return status;
        }
    }
    throw std::invalid_argument("Unknown target status: " + name);
}

bool Target::isTransferred() const {
    return status == TargetStatus::Transferred ||
           status == TargetStatus::Verifying ||
           status == TargetStatus::Verified ||
           status == TargetStatus::VerifyFailed;
}

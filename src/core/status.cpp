// NODEREWARD - Operation Status Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/core/status.h"

namespace nodereward {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::InvalidOperator: return "InvalidOperator";
        case ErrorCode::InvalidNodeId: return "InvalidNodeId";
        case ErrorCode::NodeNotFound: return "NodeNotFound";
        case ErrorCode::NodeNotActive: return "NodeNotActive";
        case ErrorCode::InvalidScore: return "InvalidScore";
        case ErrorCode::InvalidRewardType: return "InvalidRewardType";
        case ErrorCode::InvalidAmount: return "InvalidAmount";
        case ErrorCode::InvalidPeriod: return "InvalidPeriod";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::RecordNotFound: return "RecordNotFound";
        case ErrorCode::AlreadyDistributed: return "AlreadyDistributed";
        case ErrorCode::RateLimitExceeded: return "RateLimitExceeded";
        case ErrorCode::CircuitOpen: return "CircuitOpen";
        case ErrorCode::SubsystemPaused: return "SubsystemPaused";
        case ErrorCode::TooRecent: return "TooRecent";
        case ErrorCode::NotEligible: return "NotEligible";
        case ErrorCode::ThresholdNotMet: return "ThresholdNotMet";
        case ErrorCode::ProposalExists: return "ProposalExists";
        case ErrorCode::ProposalNotFound: return "ProposalNotFound";
        case ErrorCode::DelayOutOfRange: return "DelayOutOfRange";
        case ErrorCode::TimelockNotReady: return "TimelockNotReady";
        case ErrorCode::AlreadyExecuted: return "AlreadyExecuted";
        case ErrorCode::AlreadyPaused: return "AlreadyPaused";
        case ErrorCode::NotPaused: return "NotPaused";
        case ErrorCode::EntityBusy: return "EntityBusy";
        case ErrorCode::DailyCapExceeded: return "DailyCapExceeded";
        case ErrorCode::MonthlyCapExceeded: return "MonthlyCapExceeded";
        case ErrorCode::InsufficientBalance: return "InsufficientBalance";
        case ErrorCode::ExcessiveSlashing: return "ExcessiveSlashing";
        case ErrorCode::DuplicateRewardId: return "DuplicateRewardId";
        case ErrorCode::BatchEmpty: return "BatchEmpty";
        case ErrorCode::BatchTooLarge: return "BatchTooLarge";
        case ErrorCode::BatchLengthMismatch: return "BatchLengthMismatch";
        case ErrorCode::BatchFailedCompletely: return "BatchFailedCompletely";
        case ErrorCode::TransferFailed: return "TransferFailed";
        case ErrorCode::StorageError: return "StorageError";
        case ErrorCode::CommandFailed: return "CommandFailed";
        case ErrorCode::PaymentUnreconciled: return "PaymentUnreconciled";
        default: return "Unknown";
    }
}

const char* ErrorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::Validation: return "Validation";
        case ErrorCategory::Precondition: return "Precondition";
        case ErrorCategory::Capacity: return "Capacity";
        case ErrorCategory::Collision: return "Collision";
        case ErrorCategory::Infrastructure: return "Infrastructure";
        default: return "Unknown";
    }
}

ErrorCategory ErrorCategoryOf(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return ErrorCategory::None;

        case ErrorCode::Unauthorized:
        case ErrorCode::InvalidOperator:
        case ErrorCode::InvalidNodeId:
        case ErrorCode::NodeNotFound:
        case ErrorCode::NodeNotActive:
        case ErrorCode::InvalidScore:
        case ErrorCode::InvalidRewardType:
        case ErrorCode::InvalidAmount:
        case ErrorCode::InvalidPeriod:
        case ErrorCode::InvalidArgument:
        case ErrorCode::BatchEmpty:
        case ErrorCode::BatchTooLarge:
        case ErrorCode::BatchLengthMismatch:
            return ErrorCategory::Validation;

        case ErrorCode::DailyCapExceeded:
        case ErrorCode::MonthlyCapExceeded:
        case ErrorCode::InsufficientBalance:
        case ErrorCode::ExcessiveSlashing:
            return ErrorCategory::Capacity;

        case ErrorCode::DuplicateRewardId:
            return ErrorCategory::Collision;

        case ErrorCode::TransferFailed:
        case ErrorCode::StorageError:
        case ErrorCode::CommandFailed:
        case ErrorCode::PaymentUnreconciled:
            return ErrorCategory::Infrastructure;

        default:
            return ErrorCategory::Precondition;
    }
}

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result = ErrorCodeToString(code_);
    if (!message_.empty()) {
        result += ": ";
        result += message_;
    }
    return result;
}

} // namespace nodereward

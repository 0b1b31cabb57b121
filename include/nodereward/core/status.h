// NODEREWARD - Operation Status
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Result type returned by every reward and resilience operation.

#ifndef NODEREWARD_CORE_STATUS_H
#define NODEREWARD_CORE_STATUS_H

#include <cstdint>
#include <string>
#include <utility>

namespace nodereward {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : uint8_t {
    OK = 0,

    // Input validation
    Unauthorized,
    InvalidOperator,
    InvalidNodeId,
    NodeNotFound,
    NodeNotActive,
    InvalidScore,
    InvalidRewardType,
    InvalidAmount,
    InvalidPeriod,
    InvalidArgument,

    // Preconditions
    RecordNotFound,
    AlreadyDistributed,
    RateLimitExceeded,
    CircuitOpen,
    SubsystemPaused,
    TooRecent,
    NotEligible,
    ThresholdNotMet,
    ProposalExists,
    ProposalNotFound,
    DelayOutOfRange,
    TimelockNotReady,
    AlreadyExecuted,
    AlreadyPaused,
    NotPaused,
    EntityBusy,

    // Capacity
    DailyCapExceeded,
    MonthlyCapExceeded,
    InsufficientBalance,
    ExcessiveSlashing,

    // Collision
    DuplicateRewardId,

    // Batch shape and outcome
    BatchEmpty,
    BatchTooLarge,
    BatchLengthMismatch,
    BatchFailedCompletely,

    // Infrastructure
    TransferFailed,
    StorageError,
    CommandFailed,
    /// Paid but neither settled nor reclaimed; needs manual reconciliation
    PaymentUnreconciled,
};

/// Failure taxonomy used for logging severity and batch tallies
enum class ErrorCategory : uint8_t {
    None,
    Validation,
    Precondition,
    Capacity,
    Collision,
    Infrastructure,
};

const char* ErrorCodeToString(ErrorCode code);
const char* ErrorCategoryToString(ErrorCategory category);
ErrorCategory ErrorCategoryOf(ErrorCode code);

// ============================================================================
// Status
// ============================================================================

/**
 * Outcome of an operation: OK, or an error code with a human-readable reason.
 */
class Status {
public:
    Status() : code_(ErrorCode::OK) {}
    Status(ErrorCode code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    static Status Ok() { return Status(); }
    static Status Error(ErrorCode code, const std::string& message = "") {
        return Status(code, message);
    }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return ok(); }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    ErrorCategory category() const { return ErrorCategoryOf(code_); }

    bool Is(ErrorCode code) const { return code_ == code; }

    /// "OK" or "<Code>: <message>"
    std::string ToString() const;

private:
    ErrorCode code_;
    std::string message_;
};

} // namespace nodereward

#endif // NODEREWARD_CORE_STATUS_H

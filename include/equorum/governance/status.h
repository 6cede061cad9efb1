// EQUORUM - Governance Status
// Copyright (c) 2024 EQUORUM Developers
// MIT License
//
// Result type returned by every governance operation. A failed Status
// carries a specific code, the error category it belongs to, and whether
// retrying later without any state change could succeed.

#ifndef EQUORUM_GOVERNANCE_STATUS_H
#define EQUORUM_GOVERNANCE_STATUS_H

#include <string>

namespace equorum {
namespace governance {

/// Broad class of a failure
enum class ErrorCategory {
    None,                  ///< Not an error
    InputValidation,       ///< Malformed arguments
    AuthorizationDenied,   ///< Caller lacks standing or role
    StateConflict,         ///< Wrong lifecycle state for the transition
    TimingViolation        ///< Wall-clock precondition not met
};

const char* ErrorCategoryToString(ErrorCategory category);

class Status {
public:
    enum Code {
        OK = 0,

        // Input validation
        INVALID_AMOUNT,
        INSUFFICIENT_BALANCE,
        BELOW_MINIMUM_LOCK,
        INVALID_ADDRESS,
        EMPTY_ACTIONS,
        TOO_MANY_ACTIONS,
        EMPTY_DESCRIPTION,
        INVALID_ETA,
        UNKNOWN_PROPOSAL,

        // Authorization
        BELOW_THRESHOLD,
        NO_VOTING_POWER,
        LOCK_TOO_NEW,
        EXCLUDED_PRINCIPAL,
        NOT_ADMIN,
        NOT_PENDING_ADMIN,
        NOT_PROPOSER,

        // State conflicts
        ALREADY_VOTED,
        ALREADY_QUEUED,
        ALREADY_EXECUTED,
        WRONG_STATE,
        NO_LOCK,
        LOCK_IN_USE,
        MISSING,
        CALL_REVERTED,

        // Timing
        VOTING_NOT_STARTED,
        VOTING_CLOSED,
        ETA_TOO_SOON,
        ETA_TOO_LATE,
        NOT_READY,
        STALE_TRANSACTION,
    };

    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status Error(Code code, const std::string& msg = "") { return Status(code, msg); }

    bool ok() const { return code_ == OK; }
    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    ErrorCategory Category() const { return CategoryOf(code_); }

    /// True if the same call may succeed later once time has passed
    bool IsRetryable() const { return IsRetryable(code_); }

    /// "AlreadyVoted: principal 0x... already voted on proposal 3"
    std::string ToString() const;

    static ErrorCategory CategoryOf(Code code);
    static bool IsRetryable(Code code);
    static const char* CodeToString(Code code);

private:
    Code code_;
    std::string message_;
};

} // namespace governance
} // namespace equorum

#endif // EQUORUM_GOVERNANCE_STATUS_H

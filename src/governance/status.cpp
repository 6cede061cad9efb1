// EQUORUM - Governance Status Implementation
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#include "equorum/governance/status.h"

namespace equorum {
namespace governance {

const char* ErrorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::InputValidation: return "InputValidation";
        case ErrorCategory::AuthorizationDenied: return "AuthorizationDenied";
        case ErrorCategory::StateConflict: return "StateConflict";
        case ErrorCategory::TimingViolation: return "TimingViolation";
    }
    return "Unknown";
}

ErrorCategory Status::CategoryOf(Code code) {
    switch (code) {
        case OK:
            return ErrorCategory::None;

        case INVALID_AMOUNT:
        case INSUFFICIENT_BALANCE:
        case BELOW_MINIMUM_LOCK:
        case INVALID_ADDRESS:
        case EMPTY_ACTIONS:
        case TOO_MANY_ACTIONS:
        case EMPTY_DESCRIPTION:
        case INVALID_ETA:
        case UNKNOWN_PROPOSAL:
            return ErrorCategory::InputValidation;

        case BELOW_THRESHOLD:
        case NO_VOTING_POWER:
        case LOCK_TOO_NEW:
        case EXCLUDED_PRINCIPAL:
        case NOT_ADMIN:
        case NOT_PENDING_ADMIN:
        case NOT_PROPOSER:
            return ErrorCategory::AuthorizationDenied;

        case ALREADY_VOTED:
        case ALREADY_QUEUED:
        case ALREADY_EXECUTED:
        case WRONG_STATE:
        case NO_LOCK:
        case LOCK_IN_USE:
        case MISSING:
        case CALL_REVERTED:
            return ErrorCategory::StateConflict;

        case VOTING_NOT_STARTED:
        case VOTING_CLOSED:
        case ETA_TOO_SOON:
        case ETA_TOO_LATE:
        case NOT_READY:
        case STALE_TRANSACTION:
            return ErrorCategory::TimingViolation;
    }
    return ErrorCategory::None;
}

bool Status::IsRetryable(Code code) {
    switch (code) {
        case VOTING_NOT_STARTED:
        case ETA_TOO_LATE:
        case NOT_READY:
            return true;
        default:
            return false;
    }
}

const char* Status::CodeToString(Code code) {
    switch (code) {
        case OK: return "OK";
        case INVALID_AMOUNT: return "InvalidAmount";
        case INSUFFICIENT_BALANCE: return "InsufficientBalance";
        case BELOW_MINIMUM_LOCK: return "BelowMinimumLock";
        case INVALID_ADDRESS: return "InvalidAddress";
        case EMPTY_ACTIONS: return "EmptyActions";
        case TOO_MANY_ACTIONS: return "TooManyActions";
        case EMPTY_DESCRIPTION: return "EmptyDescription";
        case INVALID_ETA: return "InvalidEta";
        case UNKNOWN_PROPOSAL: return "UnknownProposal";
        case BELOW_THRESHOLD: return "BelowThreshold";
        case NO_VOTING_POWER: return "NoVotingPower";
        case LOCK_TOO_NEW: return "LockTooNew";
        case EXCLUDED_PRINCIPAL: return "ExcludedPrincipal";
        case NOT_ADMIN: return "NotAdmin";
        case NOT_PENDING_ADMIN: return "NotPendingAdmin";
        case NOT_PROPOSER: return "NotProposer";
        case ALREADY_VOTED: return "AlreadyVoted";
        case ALREADY_QUEUED: return "AlreadyQueued";
        case ALREADY_EXECUTED: return "AlreadyExecuted";
        case WRONG_STATE: return "WrongState";
        case NO_LOCK: return "NoLock";
        case LOCK_IN_USE: return "LockInUse";
        case MISSING: return "Missing";
        case CALL_REVERTED: return "CallReverted";
        case VOTING_NOT_STARTED: return "VotingNotStarted";
        case VOTING_CLOSED: return "VotingClosed";
        case ETA_TOO_SOON: return "EtaTooSoon";
        case ETA_TOO_LATE: return "EtaTooLate";
        case NOT_READY: return "NotReady";
        case STALE_TRANSACTION: return "StaleTransaction";
    }
    return "Unknown";
}

std::string Status::ToString() const {
    if (ok()) {
        return "OK";
    }
    std::string result = CodeToString(code_);
    if (!message_.empty()) {
        result += ": " + message_;
    }
    return result;
}

} // namespace governance
} // namespace equorum

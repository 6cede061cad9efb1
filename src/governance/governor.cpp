// EQUORUM - Governance Orchestrator Implementation
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#include "equorum/governance/governor.h"
#include "equorum/util/logging.h"
#include "equorum/util/time.h"

#include <set>
#include <sstream>

namespace equorum {
namespace governance {

// ============================================================================
// Events
// ============================================================================

const char* GovernanceEventTypeToString(GovernanceEventType type) {
    switch (type) {
        case GovernanceEventType::TokensLocked: return "TokensLocked";
        case GovernanceEventType::TokensUnlocked: return "TokensUnlocked";
        case GovernanceEventType::ProposalCreated: return "ProposalCreated";
        case GovernanceEventType::VoteCast: return "VoteCast";
        case GovernanceEventType::ProposalQueued: return "ProposalQueued";
        case GovernanceEventType::ProposalExecuted: return "ProposalExecuted";
        case GovernanceEventType::ProposalCanceled: return "ProposalCanceled";
    }
    return "Unknown";
}

std::string GovernanceEvent::ToString() const {
    std::ostringstream oss;
    oss << GovernanceEventTypeToString(type) << " " << ShortAddress(principal);
    switch (type) {
        case GovernanceEventType::TokensLocked:
        case GovernanceEventType::TokensUnlocked:
            oss << " amount=" << amount;
            break;
        case GovernanceEventType::VoteCast:
            oss << " #" << proposalId << " " << (support ? "for" : "against")
                << " weight=" << weight;
            break;
        case GovernanceEventType::ProposalQueued:
            oss << " #" << proposalId << " eta=" << eta;
            break;
        default:
            oss << " #" << proposalId;
            break;
    }
    return oss.str();
}

// ============================================================================
// GovernanceOrchestrator
// ============================================================================

GovernanceOrchestrator::GovernanceOrchestrator(const Address& self,
                                               const GovernanceParams& params,
                                               std::shared_ptr<VotingPowerLedger> ledger,
                                               std::shared_ptr<ProposalStore> store,
                                               std::shared_ptr<TimelockQueue> timelock)
    : self_(self),
      params_(params),
      ledger_(std::move(ledger)),
      store_(std::move(store)),
      timelock_(std::move(timelock)) {
    timelock_->RegisterTarget(self_, this);
}

GovernanceOrchestrator::~GovernanceOrchestrator() {
    timelock_->UnregisterTarget(self_);
}

void GovernanceOrchestrator::SetEventCallback(GovernanceEventCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    callback_ = std::move(callback);
}

void GovernanceOrchestrator::Emit(const GovernanceEvent& event) const {
    LOG_INFO(util::LogCategory::GOV) << event.ToString();
    if (callback_) {
        callback_(event);
    }
}

Status GovernanceOrchestrator::CheckTimelockAdmin() const {
    if (timelock_->GetAdmin() != self_) {
        return Status::Error(Status::NOT_ADMIN, "orchestrator is not the timelock admin");
    }
    return Status::Ok();
}

// === Locking ===

Status GovernanceOrchestrator::Lock(const Address& principal, Amount amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Status s = ledger_->Lock(principal, amount, util::GetTime());
    if (!s.ok()) {
        LOG_DEBUG(util::LogCategory::GOV) << "Lock rejected: " << s.ToString();
        return s;
    }

    GovernanceEvent event{GovernanceEventType::TokensLocked, principal};
    event.amount = amount;
    Emit(event);
    return Status::Ok();
}

Status GovernanceOrchestrator::Unlock(const Address& principal, Amount* released) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!ledger_->GetLockInfo(principal)) {
        return Status::Error(Status::NO_LOCK, ShortAddress(principal) + " has no lock");
    }
    if (store_->HasLiveCommitments(principal, util::GetTime())) {
        return Status::Error(Status::LOCK_IN_USE,
                             ShortAddress(principal) + " backs a live proposal or vote");
    }

    Amount amount = 0;
    Status s = ledger_->Unlock(principal, &amount);
    if (!s.ok()) {
        return s;
    }
    if (released) {
        *released = amount;
    }

    GovernanceEvent event{GovernanceEventType::TokensUnlocked, principal};
    event.amount = amount;
    Emit(event);
    return Status::Ok();
}

// === Proposal Lifecycle ===

Status GovernanceOrchestrator::ValidateProposal(const std::vector<ProposalAction>& actions,
                                                const std::string& description) const {
    if (actions.empty()) {
        return Status::Error(Status::EMPTY_ACTIONS, "proposal has no actions");
    }
    if (actions.size() > params_.maxActions) {
        return Status::Error(Status::TOO_MANY_ACTIONS,
                             std::to_string(actions.size()) + " actions exceed limit of " +
                             std::to_string(params_.maxActions));
    }
    for (size_t i = 0; i < actions.size(); ++i) {
        if (actions[i].target.IsNull()) {
            return Status::Error(Status::INVALID_ADDRESS,
                                 "action " + std::to_string(i) + " has a null target");
        }
        if (actions[i].value < 0) {
            return Status::Error(Status::INVALID_AMOUNT,
                                 "action " + std::to_string(i) + " has a negative value");
        }
    }
    if (description.empty()) {
        return Status::Error(Status::EMPTY_DESCRIPTION, "proposal needs a description");
    }
    return Status::Ok();
}

Status GovernanceOrchestrator::Propose(const Address& proposer,
                                       const std::vector<ProposalAction>& actions,
                                       const std::string& description,
                                       ProposalId* outId) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Timestamp now = util::GetTime();

    Status s = ValidateProposal(actions, description);
    if (s.ok() && ledger_->IsExcluded(proposer)) {
        s = Status::Error(Status::EXCLUDED_PRINCIPAL, ShortAddress(proposer) + " cannot propose");
    }
    // Below-threshold proposers are reported by the store
    if (s.ok() && ledger_->GetVotingPower(proposer) >= params_.proposalThreshold) {
        s = ledger_->CheckStanding(proposer, now);
    }
    ProposalId id = 0;
    if (s.ok()) {
        s = store_->Propose(proposer, actions, description, now, &id);
    }
    if (!s.ok()) {
        LOG_DEBUG(util::LogCategory::GOV) << "Propose rejected: " << s.ToString();
        return s;
    }

    if (outId) {
        *outId = id;
    }
    GovernanceEvent event{GovernanceEventType::ProposalCreated, proposer};
    event.proposalId = id;
    Emit(event);
    return Status::Ok();
}

Status GovernanceOrchestrator::CastVote(const Address& voter, ProposalId id, bool support,
                                        uint64_t* outWeight) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Timestamp now = util::GetTime();

    // A missing lock is reported by the store after the state checks
    Status s = ledger_->CheckStanding(voter, now);
    if (s.code() == Status::NO_VOTING_POWER) {
        s = Status::Ok();
    }
    uint64_t weight = 0;
    if (s.ok()) {
        s = store_->CastVote(voter, id, support, now, &weight);
    }
    if (!s.ok()) {
        LOG_DEBUG(util::LogCategory::GOV) << "Vote rejected: " << s.ToString();
        return s;
    }

    if (outWeight) {
        *outWeight = weight;
    }
    GovernanceEvent event{GovernanceEventType::VoteCast, voter};
    event.proposalId = id;
    event.weight = weight;
    event.support = support;
    Emit(event);
    return Status::Ok();
}

Status GovernanceOrchestrator::Queue(ProposalId id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Timestamp now = util::GetTime();

    ProposalState state = ProposalState::Pending;
    Status s = store_->GetState(id, now, &state);
    if (!s.ok()) {
        return s;
    }
    if (state != ProposalState::Succeeded) {
        return Status::Error(Status::WRONG_STATE,
                             std::string("proposal is ") + ProposalStateToString(state));
    }
    s = CheckTimelockAdmin();
    if (!s.ok()) {
        return s;
    }

    auto proposal = store_->GetProposal(id);
    Timestamp eta = now + timelock_->GetDelay();

    std::vector<TimelockCall> calls;
    std::vector<Hash256> hashes;
    std::set<Hash256> seen;
    for (const auto& action : proposal->actions) {
        TimelockCall call{action.target, action.value, action.signature, action.args, eta};
        Hash256 hash = call.GetHash();
        if (!seen.insert(hash).second) {
            return Status::Error(Status::ALREADY_QUEUED,
                                 "proposal contains the same action twice");
        }
        s = timelock_->CheckQueue(self_, call, now);
        if (!s.ok()) {
            LOG_DEBUG(util::LogCategory::GOV) << "Queue of #" << id << " rejected: "
                                              << s.ToString();
            return s;
        }
        calls.push_back(std::move(call));
        hashes.push_back(hash);
    }

    for (size_t i = 0; i < calls.size(); ++i) {
        s = timelock_->QueueEntry(self_, calls[i], now, nullptr);
        if (!s.ok()) {
            for (size_t j = 0; j < i; ++j) {
                Status undo = timelock_->CancelEntry(self_, hashes[j]);
                if (!undo.ok()) {
                    LOG_ERROR(util::LogCategory::GOV) << "Rollback of entry " << j
                                                      << " failed: " << undo.ToString();
                }
            }
            return s;
        }
    }

    s = store_->MarkQueued(id, eta, hashes, now);
    if (!s.ok()) {
        for (const auto& hash : hashes) {
            Status undo = timelock_->CancelEntry(self_, hash);
            if (!undo.ok()) {
                LOG_ERROR(util::LogCategory::GOV) << "Rollback failed: " << undo.ToString();
            }
        }
        return s;
    }

    GovernanceEvent event{GovernanceEventType::ProposalQueued, proposal->proposer};
    event.proposalId = id;
    event.eta = eta;
    Emit(event);
    return Status::Ok();
}

Status GovernanceOrchestrator::Execute(ProposalId id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Timestamp now = util::GetTime();

    ProposalState state = ProposalState::Pending;
    Status s = store_->GetState(id, now, &state);
    if (!s.ok()) {
        return s;
    }
    if (state == ProposalState::Expired) {
        return Status::Error(Status::STALE_TRANSACTION, "proposal grace period has passed");
    }
    if (state != ProposalState::Queued) {
        return Status::Error(Status::WRONG_STATE,
                             std::string("proposal is ") + ProposalStateToString(state));
    }

    auto proposal = store_->GetProposal(id);
    std::vector<Hash256> remaining;
    for (const auto& hash : proposal->entryHashes) {
        if (timelock_->GetEntryState(hash) == TimelockEntryState::Executed) {
            continue;
        }
        s = timelock_->CheckExecute(self_, hash, now);
        if (!s.ok()) {
            LOG_DEBUG(util::LogCategory::GOV) << "Execute of #" << id << " rejected: "
                                              << s.ToString();
            return s;
        }
        remaining.push_back(hash);
    }

    for (const auto& hash : remaining) {
        s = timelock_->ExecuteEntry(self_, hash, now);
        if (!s.ok()) {
            LOG_WARN(util::LogCategory::GOV) << "Proposal #" << id
                                             << " stays queued: " << s.ToString();
            return s;
        }
    }

    s = store_->MarkExecuted(id, now);
    if (!s.ok()) {
        return s;
    }

    GovernanceEvent event{GovernanceEventType::ProposalExecuted, proposal->proposer};
    event.proposalId = id;
    Emit(event);
    return Status::Ok();
}

Status GovernanceOrchestrator::Cancel(const Address& caller, ProposalId id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Timestamp now = util::GetTime();

    Status s = store_->CheckCancel(caller, id, now);
    if (!s.ok()) {
        LOG_DEBUG(util::LogCategory::GOV) << "Cancel rejected: " << s.ToString();
        return s;
    }

    auto proposal = store_->GetProposal(id);
    std::vector<Hash256> pending;
    for (const auto& hash : proposal->entryHashes) {
        TimelockEntryState entryState = timelock_->GetEntryState(hash);
        if (entryState == TimelockEntryState::Queued || entryState == TimelockEntryState::Expired) {
            pending.push_back(hash);
        }
    }
    if (!pending.empty()) {
        s = CheckTimelockAdmin();
        if (!s.ok()) {
            return s;
        }
    }

    for (const auto& hash : pending) {
        s = timelock_->CancelEntry(self_, hash);
        if (!s.ok()) {
            return s;
        }
    }

    s = store_->Cancel(caller, id, now);
    if (!s.ok()) {
        return s;
    }

    GovernanceEvent event{GovernanceEventType::ProposalCanceled, caller};
    event.proposalId = id;
    Emit(event);
    return Status::Ok();
}

Status GovernanceOrchestrator::AcceptTimelockAdmin() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return timelock_->AcceptAdmin(self_);
}

Status GovernanceOrchestrator::CheckCall(const Address& caller, Amount /*value*/,
                                         const std::string& signature,
                                         const std::vector<Byte>& args) const {
    if (caller != timelock_->GetSelf()) {
        return Status::Error(Status::NOT_ADMIN, "only the timelock may call the orchestrator");
    }
    if (signature != ACCEPT_ADMIN_SIGNATURE || !args.empty()) {
        return Status::Error(Status::CALL_REVERTED, "unknown call " + signature);
    }
    return Status::Ok();
}

Status GovernanceOrchestrator::Call(const Address& caller, Amount value,
                                    const std::string& signature,
                                    const std::vector<Byte>& args) {
    Status s = CheckCall(caller, value, signature, args);
    if (!s.ok()) {
        return s;
    }
    return AcceptTimelockAdmin();
}

// === Queries ===

Status GovernanceOrchestrator::GetState(ProposalId id, ProposalState* out) const {
    return store_->GetState(id, util::GetTime(), out);
}

std::optional<Proposal> GovernanceOrchestrator::GetProposal(ProposalId id) const {
    return store_->GetProposal(id);
}

uint64_t GovernanceOrchestrator::GetQuorum() const {
    return store_->GetQuorum();
}

uint64_t GovernanceOrchestrator::GetVotingPower(const Address& principal,
                                                bool* canParticipate) const {
    if (canParticipate) {
        *canParticipate = ledger_->CheckStanding(principal, util::GetTime()).ok();
    }
    return ledger_->GetVotingPower(principal);
}

std::optional<VoteReceipt> GovernanceOrchestrator::GetReceipt(ProposalId id,
                                                              const Address& voter) const {
    return store_->GetReceipt(id, voter);
}

uint64_t GovernanceOrchestrator::GetProposalCount() const {
    return store_->GetProposalCount();
}

// === Persistence ===

GovernanceSnapshot GovernanceOrchestrator::Snapshot() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    GovernanceSnapshot snapshot;
    snapshot.locks = ledger_->GetLocks();
    snapshot.proposals = store_->GetProposals();
    snapshot.entries = timelock_->GetEntries();
    snapshot.admin = timelock_->GetAdmin();
    snapshot.pendingAdmin = timelock_->GetPendingAdmin();
    return snapshot;
}

void GovernanceOrchestrator::Restore(const GovernanceSnapshot& snapshot) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ledger_->RestoreLocks(snapshot.locks);
    store_->Restore(snapshot.proposals);
    timelock_->Restore(snapshot.admin, snapshot.pendingAdmin, snapshot.entries);

    LOG_INFO(util::LogCategory::GOV) << "Restored " << snapshot.locks.size() << " locks, "
                                     << snapshot.proposals.size() << " proposals, "
                                     << snapshot.entries.size() << " timelock entries";
}

} // namespace governance
} // namespace equorum

// EQUORUM - Governance Orchestrator
// Copyright (c) 2024 EQUORUM Developers
// MIT License
//
// Composition root of the governance engine. Exposes lock, propose, vote,
// queue, execute and cancel to external callers and drives the timelock
// on behalf of succeeded proposals. The orchestrator must hold the
// timelock admin role for queue, execute and queued-cancel to work.

#ifndef EQUORUM_GOVERNANCE_GOVERNOR_H
#define EQUORUM_GOVERNANCE_GOVERNOR_H

#include "equorum/core/types.h"
#include "equorum/governance/collaborator.h"
#include "equorum/governance/params.h"
#include "equorum/governance/proposal.h"
#include "equorum/governance/status.h"
#include "equorum/governance/timelock.h"
#include "equorum/governance/votingpower.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace equorum {
namespace governance {

/// Signature the orchestrator accepts from executed timelock entries
constexpr const char* ACCEPT_ADMIN_SIGNATURE = "acceptAdmin()";

// ============================================================================
// Events
// ============================================================================

enum class GovernanceEventType {
    TokensLocked,
    TokensUnlocked,
    ProposalCreated,
    VoteCast,
    ProposalQueued,
    ProposalExecuted,
    ProposalCanceled
};

const char* GovernanceEventTypeToString(GovernanceEventType type);

struct GovernanceEvent {
    GovernanceEventType type;

    /// Locker, proposer, voter or canceler
    Address principal;

    /// Zero for lock events
    ProposalId proposalId{0};

    /// Locked or released amount
    Amount amount{0};

    /// Vote weight
    uint64_t weight{0};
    bool support{false};

    /// Eta of a queued proposal
    Timestamp eta{0};

    std::string ToString() const;
};

using GovernanceEventCallback = std::function<void(const GovernanceEvent&)>;

// ============================================================================
// Snapshot
// ============================================================================

/// Complete engine state, moved in and out of persistent storage as a unit
struct GovernanceSnapshot {
    std::map<Address, LockInfo> locks;
    std::vector<Proposal> proposals;
    std::vector<TimelockEntry> entries;
    Address admin;
    Address pendingAdmin;
};

// ============================================================================
// Governance Orchestrator
// ============================================================================

class GovernanceOrchestrator : public CallTarget {
public:
    /**
     * Registers itself with the timelock as the call target for self.
     * The timelock must outlive the orchestrator.
     */
    GovernanceOrchestrator(const Address& self,
                           const GovernanceParams& params,
                           std::shared_ptr<VotingPowerLedger> ledger,
                           std::shared_ptr<ProposalStore> store,
                           std::shared_ptr<TimelockQueue> timelock);
    ~GovernanceOrchestrator() override;

    GovernanceOrchestrator(const GovernanceOrchestrator&) = delete;
    GovernanceOrchestrator& operator=(const GovernanceOrchestrator&) = delete;

    // === Locking ===

    Status Lock(const Address& principal, Amount amount);

    /**
     * Release the principal's lock. Refused with LockInUse while the
     * principal has a live proposal or a vote on an active proposal.
     */
    Status Unlock(const Address& principal, Amount* released = nullptr);

    // === Proposal Lifecycle ===

    /**
     * Validate inputs and open a proposal.
     *
     * Fails with EmptyActions, TooManyActions, InvalidAddress (null target),
     * InvalidAmount (negative value), EmptyDescription, ExcludedPrincipal,
     * LockTooNew or BelowThreshold.
     */
    Status Propose(const Address& proposer,
                   const std::vector<ProposalAction>& actions,
                   const std::string& description,
                   ProposalId* outId = nullptr);

    Status CastVote(const Address& voter, ProposalId id, bool support,
                    uint64_t* outWeight = nullptr);

    /**
     * Push every action of a succeeded proposal into the timelock with
     * eta = now + delay. Either all entries are queued or none are.
     */
    Status Queue(ProposalId id);

    /**
     * Execute the remaining entries of a queued proposal in order.
     *
     * Every remaining entry is checked first, timing and the target's own
     * CheckCall included, so a proposal with any failing action applies
     * nothing. A call that still reverts because an earlier action changed
     * the state it depends on leaves the proposal Queued; a later Execute
     * resumes from the first unexecuted entry.
     */
    Status Execute(ProposalId id);

    /// Cancel a proposal and any of its pending timelock entries
    Status Cancel(const Address& caller, ProposalId id);

    /// Complete a handover in which this orchestrator was nominated
    Status AcceptTimelockAdmin();

    // === Queries ===

    Status GetState(ProposalId id, ProposalState* out) const;
    std::optional<Proposal> GetProposal(ProposalId id) const;
    uint64_t GetQuorum() const;

    /// @param canParticipate Set to whether the principal may propose/vote now
    uint64_t GetVotingPower(const Address& principal, bool* canParticipate = nullptr) const;

    std::optional<VoteReceipt> GetReceipt(ProposalId id, const Address& voter) const;
    uint64_t GetProposalCount() const;

    const Address& GetSelf() const { return self_; }
    const GovernanceParams& GetParams() const { return params_; }

    Status CheckCall(const Address& caller, Amount value,
                     const std::string& signature,
                     const std::vector<Byte>& args) const override;

    /// Accepts acceptAdmin() from the timelock
    Status Call(const Address& caller, Amount value,
                const std::string& signature,
                const std::vector<Byte>& args) override;

    void SetEventCallback(GovernanceEventCallback callback);

    // === Persistence ===

    GovernanceSnapshot Snapshot() const;
    void Restore(const GovernanceSnapshot& snapshot);

private:
    Status ValidateProposal(const std::vector<ProposalAction>& actions,
                            const std::string& description) const;
    Status CheckTimelockAdmin() const;
    void Emit(const GovernanceEvent& event) const;

    const Address self_;
    const GovernanceParams params_;
    std::shared_ptr<VotingPowerLedger> ledger_;
    std::shared_ptr<ProposalStore> store_;
    std::shared_ptr<TimelockQueue> timelock_;

    mutable std::recursive_mutex mutex_;
    GovernanceEventCallback callback_;
};

} // namespace governance
} // namespace equorum

#endif // EQUORUM_GOVERNANCE_GOVERNOR_H

// EQUORUM - Proposal Store
// Copyright (c) 2024 EQUORUM Developers
// MIT License
//
// Holds every proposal and its voting record. The lifecycle state of a
// proposal is never stored: it is derived from the stored tallies, the
// voting window, the queue/execute/cancel markers and the current time.

#ifndef EQUORUM_GOVERNANCE_PROPOSAL_H
#define EQUORUM_GOVERNANCE_PROPOSAL_H

#include "equorum/core/types.h"
#include "equorum/governance/params.h"
#include "equorum/governance/status.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace equorum {
namespace governance {

class VotingPowerLedger;

/// Sequential proposal identifier, starting at 1
using ProposalId = uint64_t;

// ============================================================================
// Proposal Types
// ============================================================================

/// One call a proposal asks the timelock to perform
struct ProposalAction {
    /// Collaborator receiving the call
    Address target;

    /// Opaque value forwarded to the target
    Amount value{0};

    /// Human-readable function signature, e.g. "acceptAdmin()"
    std::string signature;

    /// Encoded arguments
    std::vector<Byte> args;

    std::string ToString() const;

    bool operator==(const ProposalAction& other) const {
        return target == other.target && value == other.value &&
               signature == other.signature && args == other.args;
    }
};

enum class ProposalState {
    Pending,     ///< Voting window not yet open
    Active,      ///< Within the voting window
    Canceled,
    Defeated,    ///< Window closed without majority or quorum
    Succeeded,   ///< Window closed with majority and quorum
    Queued,      ///< Actions sit in the timelock
    Expired,     ///< Grace window lapsed before execution
    Executed
};

const char* ProposalStateToString(ProposalState state);

/// A single cast vote
struct VoteReceipt {
    bool support{false};
    uint64_t weight{0};
    Timestamp castAt{0};
};

struct Proposal {
    ProposalId id{0};
    Address proposer;
    std::vector<ProposalAction> actions;
    std::string description;

    Timestamp createdAt{0};
    Timestamp votingStart{0};
    Timestamp votingEnd{0};

    uint64_t forVotes{0};
    uint64_t againstVotes{0};
    std::map<Address, VoteReceipt> receipts;

    /// Earliest execution time; zero until queued
    Timestamp eta{0};

    /// Content hashes of the timelock entries, one per action
    std::vector<Hash256> entryHashes;

    bool canceled{false};
    bool executed{false};

    bool HasVoted(const Address& voter) const { return receipts.count(voter) > 0; }

    std::vector<Byte> Serialize() const;
    static std::optional<Proposal> Deserialize(const Byte* data, size_t len);

    std::string ToString() const;
};

/**
 * Lifecycle state of a proposal at time now.
 *
 * Success requires for-votes strictly greater than against-votes and
 * for-votes >= quorum; a tie is Defeated.
 */
ProposalState DeriveProposalState(const Proposal& proposal, uint64_t quorum,
                                  Timestamp now, Timestamp gracePeriod);

// ============================================================================
// Proposal Store
// ============================================================================

class ProposalStore {
public:
    ProposalStore(const GovernanceParams& params,
                  std::shared_ptr<const VotingPowerLedger> ledger);

    /**
     * Open a new proposal with voting window
     * [now + votingDelay, now + votingDelay + votingPeriod].
     *
     * Fails with BelowThreshold, EmptyActions or TooManyActions.
     */
    Status Propose(const Address& proposer,
                   const std::vector<ProposalAction>& actions,
                   const std::string& description,
                   Timestamp now, ProposalId* outId);

    /**
     * Record a vote weighted by the voter's power at this moment.
     *
     * Fails with UnknownProposal, VotingNotStarted, VotingClosed (also for
     * canceled proposals), AlreadyVoted or NoVotingPower.
     */
    Status CastVote(const Address& voter, ProposalId id, bool support,
                    Timestamp now, uint64_t* outWeight = nullptr);

    Status GetState(ProposalId id, Timestamp now, ProposalState* out) const;

    /**
     * Quorum in voting-power units: the square root of quorumBps of the
     * current total locked amount. It depends on the locked sum only, so
     * splitting a lock across principals does not move it.
     */
    uint64_t GetQuorum() const;

    /// Succeeded -> Queued
    Status MarkQueued(ProposalId id, Timestamp eta,
                      const std::vector<Hash256>& entryHashes, Timestamp now);

    /// Queued -> Executed
    Status MarkExecuted(ProposalId id, Timestamp now);

    /**
     * Check whether caller may cancel: the proposer always may, anyone may
     * once the proposer's power fell below the threshold. Executed and
     * already canceled proposals cannot be canceled.
     */
    Status CheckCancel(const Address& caller, ProposalId id, Timestamp now) const;

    /// CheckCancel, then mark canceled
    Status Cancel(const Address& caller, ProposalId id, Timestamp now);

    std::optional<Proposal> GetProposal(ProposalId id) const;
    std::optional<VoteReceipt> GetReceipt(ProposalId id, const Address& voter) const;
    bool HasVoted(ProposalId id, const Address& voter) const;

    uint64_t GetProposalCount() const;

    /**
     * True if the principal has a Pending or Active proposal of their own,
     * or has voted on a proposal that is still Active.
     */
    bool HasLiveCommitments(const Address& principal, Timestamp now) const;

    /// All proposals ordered by id
    std::vector<Proposal> GetProposals() const;

    /// Replace the contents from persisted state
    void Restore(const std::vector<Proposal>& proposals);

private:
    ProposalState StateLocked(const Proposal& proposal, Timestamp now) const;
    Status CheckCancelLocked(const Address& caller, ProposalId id, Timestamp now) const;

    const GovernanceParams params_;
    std::shared_ptr<const VotingPowerLedger> ledger_;

    mutable std::mutex mutex_;
    std::map<ProposalId, Proposal> proposals_;
    ProposalId nextId_{1};
};

} // namespace governance
} // namespace equorum

#endif // EQUORUM_GOVERNANCE_PROPOSAL_H

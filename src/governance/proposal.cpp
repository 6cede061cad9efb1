// EQUORUM - Proposal Store Implementation
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#include "equorum/governance/proposal.h"
#include "equorum/governance/votingpower.h"
#include "equorum/core/hex.h"
#include "equorum/core/serialize.h"
#include "equorum/util/logging.h"

#include <sstream>

namespace equorum {
namespace governance {

namespace {

/// Bumped when the persisted proposal layout changes
constexpr uint8_t PROPOSAL_FORMAT_VERSION = 1;

} // namespace

// ============================================================================
// Proposal Types
// ============================================================================

const char* ProposalStateToString(ProposalState state) {
    switch (state) {
        case ProposalState::Pending: return "Pending";
        case ProposalState::Active: return "Active";
        case ProposalState::Canceled: return "Canceled";
        case ProposalState::Defeated: return "Defeated";
        case ProposalState::Succeeded: return "Succeeded";
        case ProposalState::Queued: return "Queued";
        case ProposalState::Expired: return "Expired";
        case ProposalState::Executed: return "Executed";
    }
    return "Unknown";
}

std::string ProposalAction::ToString() const {
    std::ostringstream oss;
    oss << ShortAddress(target) << "." << (signature.empty() ? "<raw>" : signature);
    if (!args.empty()) {
        oss << " args=0x" << BytesToHex(args);
    }
    if (value != 0) {
        oss << " value=" << value;
    }
    return oss.str();
}

std::vector<Byte> Proposal::Serialize() const {
    DataStream ss;
    ss << PROPOSAL_FORMAT_VERSION << id << proposer;

    WriteCompactSize(ss, actions.size());
    for (const auto& action : actions) {
        ss << action.target << action.value << action.signature << action.args;
    }

    ss << description << createdAt << votingStart << votingEnd
       << forVotes << againstVotes;

    WriteCompactSize(ss, receipts.size());
    for (const auto& [voter, receipt] : receipts) {
        ss << voter << receipt.support << receipt.weight << receipt.castAt;
    }

    ss << eta;
    WriteCompactSize(ss, entryHashes.size());
    for (const auto& hash : entryHashes) {
        ss << hash;
    }
    ss << canceled << executed;
    return ss.Bytes();
}

std::optional<Proposal> Proposal::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }

    try {
        DataStream ss(data, len);
        Proposal p;

        uint8_t version = 0;
        ss >> version;
        if (version != PROPOSAL_FORMAT_VERSION) {
            return std::nullopt;
        }
        ss >> p.id >> p.proposer;

        uint64_t actionCount = ReadCompactSize(ss);
        for (uint64_t i = 0; i < actionCount; ++i) {
            ProposalAction action;
            ss >> action.target >> action.value >> action.signature >> action.args;
            p.actions.push_back(std::move(action));
        }

        ss >> p.description >> p.createdAt >> p.votingStart >> p.votingEnd
           >> p.forVotes >> p.againstVotes;

        uint64_t receiptCount = ReadCompactSize(ss);
        for (uint64_t i = 0; i < receiptCount; ++i) {
            Address voter;
            VoteReceipt receipt;
            ss >> voter >> receipt.support >> receipt.weight >> receipt.castAt;
            p.receipts[voter] = receipt;
        }

        ss >> p.eta;
        uint64_t hashCount = ReadCompactSize(ss);
        for (uint64_t i = 0; i < hashCount; ++i) {
            Hash256 hash;
            ss >> hash;
            p.entryHashes.push_back(hash);
        }
        ss >> p.canceled >> p.executed;

        if (!ss.empty() || p.id == 0) {
            return std::nullopt;
        }
        return p;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string Proposal::ToString() const {
    std::ostringstream oss;
    oss << "Proposal #" << id << " by " << ShortAddress(proposer)
        << " (" << actions.size() << " action" << (actions.size() == 1 ? "" : "s")
        << ", for=" << forVotes << ", against=" << againstVotes
        << ", voters=" << receipts.size() << ")";
    return oss.str();
}

ProposalState DeriveProposalState(const Proposal& proposal, uint64_t quorum,
                                  Timestamp now, Timestamp gracePeriod) {
    if (proposal.canceled) {
        return ProposalState::Canceled;
    }
    if (proposal.executed) {
        return ProposalState::Executed;
    }
    if (proposal.eta != 0) {
        return now > proposal.eta + gracePeriod ? ProposalState::Expired
                                                : ProposalState::Queued;
    }
    if (now < proposal.votingStart) {
        return ProposalState::Pending;
    }
    if (now <= proposal.votingEnd) {
        return ProposalState::Active;
    }
    if (proposal.forVotes > proposal.againstVotes && proposal.forVotes >= quorum) {
        return ProposalState::Succeeded;
    }
    return ProposalState::Defeated;
}

// ============================================================================
// ProposalStore
// ============================================================================

ProposalStore::ProposalStore(const GovernanceParams& params,
                             std::shared_ptr<const VotingPowerLedger> ledger)
    : params_(params), ledger_(std::move(ledger)) {}

uint64_t ProposalStore::GetQuorum() const {
    Amount locked = ledger_->GetTotalLocked();
    if (locked <= 0) {
        return 0;
    }
    uint64_t total = static_cast<uint64_t>(locked);
    // floor(total * bps / 10000) without the intermediate product
    uint64_t share = (total / MAX_BPS) * params_.quorumBps +
                     (total % MAX_BPS) * params_.quorumBps / MAX_BPS;
    return IntegerSqrt(share);
}

ProposalState ProposalStore::StateLocked(const Proposal& proposal, Timestamp now) const {
    return DeriveProposalState(proposal, GetQuorum(), now, params_.gracePeriod);
}

Status ProposalStore::Propose(const Address& proposer,
                              const std::vector<ProposalAction>& actions,
                              const std::string& description,
                              Timestamp now, ProposalId* outId) {
    uint64_t power = ledger_->GetVotingPower(proposer);
    if (power < params_.proposalThreshold) {
        return Status::Error(Status::BELOW_THRESHOLD,
                             "power " + std::to_string(power) + " < threshold " +
                             std::to_string(params_.proposalThreshold));
    }
    if (actions.empty()) {
        return Status::Error(Status::EMPTY_ACTIONS, "proposal has no actions");
    }
    if (actions.size() > params_.maxActions) {
        return Status::Error(Status::TOO_MANY_ACTIONS,
                             std::to_string(actions.size()) + " actions exceed limit of " +
                             std::to_string(params_.maxActions));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Proposal proposal;
    proposal.id = nextId_++;
    proposal.proposer = proposer;
    proposal.actions = actions;
    proposal.description = description;
    proposal.createdAt = now;
    proposal.votingStart = now + params_.votingDelay;
    proposal.votingEnd = proposal.votingStart + params_.votingPeriod;

    if (outId) {
        *outId = proposal.id;
    }

    LOG_INFO(util::LogCategory::GOV) << "Created " << proposal.ToString()
                                     << ", voting ends at " << proposal.votingEnd;
    proposals_.emplace(proposal.id, std::move(proposal));
    return Status::Ok();
}

Status ProposalStore::CastVote(const Address& voter, ProposalId id, bool support,
                               Timestamp now, uint64_t* outWeight) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return Status::Error(Status::UNKNOWN_PROPOSAL, "no proposal " + std::to_string(id));
    }
    Proposal& proposal = it->second;

    switch (StateLocked(proposal, now)) {
        case ProposalState::Active:
            break;
        case ProposalState::Pending:
            return Status::Error(Status::VOTING_NOT_STARTED,
                                 "voting opens at " + std::to_string(proposal.votingStart));
        case ProposalState::Canceled:
            return Status::Error(Status::VOTING_CLOSED, "proposal is canceled");
        default:
            return Status::Error(Status::VOTING_CLOSED,
                                 "voting closed at " + std::to_string(proposal.votingEnd));
    }

    if (proposal.HasVoted(voter)) {
        return Status::Error(Status::ALREADY_VOTED,
                             ShortAddress(voter) + " already voted on #" + std::to_string(id));
    }

    uint64_t weight = ledger_->GetVotingPower(voter);
    if (weight == 0) {
        return Status::Error(Status::NO_VOTING_POWER, ShortAddress(voter) + " has no power");
    }

    if (support) {
        proposal.forVotes += weight;
    } else {
        proposal.againstVotes += weight;
    }
    proposal.receipts[voter] = VoteReceipt{support, weight, now};

    if (outWeight) {
        *outWeight = weight;
    }

    LOG_INFO(util::LogCategory::GOV) << ShortAddress(voter) << " voted "
        << (support ? "for" : "against") << " #" << id << " with weight " << weight;
    return Status::Ok();
}

Status ProposalStore::GetState(ProposalId id, Timestamp now, ProposalState* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return Status::Error(Status::UNKNOWN_PROPOSAL, "no proposal " + std::to_string(id));
    }
    *out = StateLocked(it->second, now);
    return Status::Ok();
}

Status ProposalStore::MarkQueued(ProposalId id, Timestamp eta,
                                 const std::vector<Hash256>& entryHashes, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return Status::Error(Status::UNKNOWN_PROPOSAL, "no proposal " + std::to_string(id));
    }

    ProposalState state = StateLocked(it->second, now);
    if (state != ProposalState::Succeeded) {
        return Status::Error(Status::WRONG_STATE,
                             std::string("proposal is ") + ProposalStateToString(state));
    }

    it->second.eta = eta;
    it->second.entryHashes = entryHashes;
    return Status::Ok();
}

Status ProposalStore::MarkExecuted(ProposalId id, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return Status::Error(Status::UNKNOWN_PROPOSAL, "no proposal " + std::to_string(id));
    }

    ProposalState state = StateLocked(it->second, now);
    if (state == ProposalState::Expired) {
        return Status::Error(Status::STALE_TRANSACTION, "proposal expired");
    }
    if (state != ProposalState::Queued) {
        return Status::Error(Status::WRONG_STATE,
                             std::string("proposal is ") + ProposalStateToString(state));
    }

    it->second.executed = true;
    return Status::Ok();
}

Status ProposalStore::CheckCancelLocked(const Address& caller, ProposalId id,
                                        Timestamp now) const {
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return Status::Error(Status::UNKNOWN_PROPOSAL, "no proposal " + std::to_string(id));
    }
    const Proposal& proposal = it->second;

    ProposalState state = StateLocked(proposal, now);
    if (state == ProposalState::Executed || state == ProposalState::Canceled) {
        return Status::Error(Status::WRONG_STATE,
                             std::string("proposal is ") + ProposalStateToString(state));
    }

    if (caller != proposal.proposer &&
        ledger_->GetVotingPower(proposal.proposer) >= params_.proposalThreshold) {
        return Status::Error(Status::NOT_PROPOSER,
                             "only the proposer may cancel while above threshold");
    }
    return Status::Ok();
}

Status ProposalStore::CheckCancel(const Address& caller, ProposalId id, Timestamp now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CheckCancelLocked(caller, id, now);
}

Status ProposalStore::Cancel(const Address& caller, ProposalId id, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    Status s = CheckCancelLocked(caller, id, now);
    if (!s.ok()) {
        return s;
    }
    proposals_[id].canceled = true;

    LOG_INFO(util::LogCategory::GOV) << "Proposal #" << id << " canceled by "
                                     << ShortAddress(caller);
    return Status::Ok();
}

std::optional<Proposal> ProposalStore::GetProposal(ProposalId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<VoteReceipt> ProposalStore::GetReceipt(ProposalId id, const Address& voter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return std::nullopt;
    }
    auto rit = it->second.receipts.find(voter);
    if (rit == it->second.receipts.end()) {
        return std::nullopt;
    }
    return rit->second;
}

bool ProposalStore::HasVoted(ProposalId id, const Address& voter) const {
    return GetReceipt(id, voter).has_value();
}

uint64_t ProposalStore::GetProposalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proposals_.size();
}

bool ProposalStore::HasLiveCommitments(const Address& principal, Timestamp now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, proposal] : proposals_) {
        ProposalState state = StateLocked(proposal, now);
        if (proposal.proposer == principal &&
            (state == ProposalState::Pending || state == ProposalState::Active)) {
            return true;
        }
        if (state == ProposalState::Active && proposal.HasVoted(principal)) {
            return true;
        }
    }
    return false;
}

std::vector<Proposal> ProposalStore::GetProposals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Proposal> result;
    result.reserve(proposals_.size());
    for (const auto& [id, proposal] : proposals_) {
        result.push_back(proposal);
    }
    return result;
}

void ProposalStore::Restore(const std::vector<Proposal>& proposals) {
    std::lock_guard<std::mutex> lock(mutex_);
    proposals_.clear();
    nextId_ = 1;
    for (const auto& proposal : proposals) {
        proposals_[proposal.id] = proposal;
        if (proposal.id >= nextId_) {
            nextId_ = proposal.id + 1;
        }
    }
}

} // namespace governance
} // namespace equorum

// EQUORUM - Voting Power Ledger
// Copyright (c) 2024 EQUORUM Developers
// MIT License
//
// Tracks locked token balances per principal and derives quadratic
// voting power from them: power = floor(sqrt(locked amount)).

#ifndef EQUORUM_GOVERNANCE_VOTINGPOWER_H
#define EQUORUM_GOVERNANCE_VOTINGPOWER_H

#include "equorum/core/types.h"
#include "equorum/governance/collaborator.h"
#include "equorum/governance/params.h"
#include "equorum/governance/status.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace equorum {
namespace governance {

// ============================================================================
// Power Functions
// ============================================================================

/// floor(sqrt(n)), exact for the whole uint64_t range
uint64_t IntegerSqrt(uint64_t n);

/// Quadratic voting power of a locked amount; zero for non-positive amounts
uint64_t CalculateVotingPower(Amount locked);

// ============================================================================
// Lock Record
// ============================================================================

struct LockInfo {
    /// Tokens held in custody
    Amount amount{0};

    /// Time of the first lock; not reset when the lock grows
    Timestamp createdAt{0};

    bool IsNull() const { return amount == 0; }

    std::vector<Byte> Serialize() const;
    static std::optional<LockInfo> Deserialize(const Byte* data, size_t len);
};

// ============================================================================
// Voting Power Ledger
// ============================================================================

/**
 * Locked-balance ledger.
 *
 * Locking pulls tokens from the principal into the custody address on the
 * token ledger; unlocking returns the whole lock. Voting power is never
 * stored, it is derived from the current lock on every query.
 */
class VotingPowerLedger {
public:
    VotingPowerLedger(const Address& custody,
                      std::shared_ptr<TokenLedger> token,
                      const GovernanceParams& params);

    /**
     * Lock additional tokens.
     *
     * Fails with InvalidAmount (amount <= 0), InvalidAddress, ExcludedPrincipal,
     * InsufficientBalance, or BelowMinimumLock when the resulting lock would
     * be smaller than the configured minimum.
     */
    Status Lock(const Address& principal, Amount amount, Timestamp now);

    /// Release the whole lock back to the principal. Fails with NoLock.
    Status Unlock(const Address& principal, Amount* released = nullptr);

    uint64_t GetVotingPower(const Address& principal) const;

    /// Sum of every principal's current voting power
    uint64_t GetTotalVotingPower() const;

    Amount GetTotalLocked() const;

    std::optional<LockInfo> GetLockInfo(const Address& principal) const;

    /**
     * Check that a principal may take part in governance right now:
     * not excluded, holding a lock, and the lock at least minLockAge old.
     */
    Status CheckStanding(const Address& principal, Timestamp now) const;

    bool IsExcluded(const Address& principal) const;

    const Address& GetCustody() const { return custody_; }

    size_t GetLockCount() const;

    /// Copy of all locks, for persistence
    std::map<Address, LockInfo> GetLocks() const;

    /// Replace all locks from persisted state (custody balances are not touched)
    void RestoreLocks(const std::map<Address, LockInfo>& locks);

private:
    const Address custody_;
    std::shared_ptr<TokenLedger> token_;
    const GovernanceParams params_;

    mutable std::mutex mutex_;
    std::map<Address, LockInfo> locks_;
    Amount totalLocked_{0};
    uint64_t totalPower_{0};
};

} // namespace governance
} // namespace equorum

#endif // EQUORUM_GOVERNANCE_VOTINGPOWER_H

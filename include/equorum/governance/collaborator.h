// EQUORUM - External Collaborators
// Copyright (c) 2024 EQUORUM Developers
// MIT License
//
// Contracts of the components the governance engine talks to but does
// not implement: the fungible-token ledger it pulls locked tokens from,
// and the call targets that executed timelock entries are delivered to.

#ifndef EQUORUM_GOVERNANCE_COLLABORATOR_H
#define EQUORUM_GOVERNANCE_COLLABORATOR_H

#include "equorum/core/types.h"
#include "equorum/governance/status.h"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace equorum {
namespace governance {

// ============================================================================
// Token Ledger
// ============================================================================

/// Balance source for locked tokens
class TokenLedger {
public:
    virtual ~TokenLedger() = default;

    virtual Amount BalanceOf(const Address& holder) const = 0;

    /// Move amount from one holder to another. Returns false and changes
    /// nothing if the transfer is not possible.
    virtual bool TransferFrom(const Address& from, const Address& to, Amount amount) = 0;
};

/// In-process token ledger for tests and the standalone host
class MemoryTokenLedger : public TokenLedger {
public:
    /// Credit new tokens to holder
    void Mint(const Address& holder, Amount amount);

    Amount BalanceOf(const Address& holder) const override;
    bool TransferFrom(const Address& from, const Address& to, Amount amount) override;

    Amount TotalSupply() const;

private:
    mutable std::mutex mutex_;
    std::map<Address, Amount> balances_;
    Amount totalSupply_{0};
};

// ============================================================================
// Call Target
// ============================================================================

/**
 * Receiver of an executed timelock entry.
 *
 * A target interprets (signature, args) itself. Returning a failed Status
 * reverts the call: the entry that carried it stays queued.
 */
class CallTarget {
public:
    virtual ~CallTarget() = default;

    /**
     * Validate a call without applying it. A call that passes must not
     * fail in Call() unless state the call depends on changed in between.
     */
    virtual Status CheckCall(const Address& caller, Amount value,
                             const std::string& signature,
                             const std::vector<Byte>& args) const = 0;

    virtual Status Call(const Address& caller, Amount value,
                        const std::string& signature,
                        const std::vector<Byte>& args) = 0;
};

} // namespace governance
} // namespace equorum

#endif // EQUORUM_GOVERNANCE_COLLABORATOR_H

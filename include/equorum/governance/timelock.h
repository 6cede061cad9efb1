// EQUORUM - Timelock Queue
// Copyright (c) 2024 EQUORUM Developers
// MIT License
//
// Delayed-execution gate. Calls are queued under their content hash with
// an earliest execution time (eta) and stay executable only inside
// [eta, eta + grace period]. Queue, execute and cancel are reserved to a
// single admin, which changes hands through a two-step handover.

#ifndef EQUORUM_GOVERNANCE_TIMELOCK_H
#define EQUORUM_GOVERNANCE_TIMELOCK_H

#include "equorum/core/types.h"
#include "equorum/governance/collaborator.h"
#include "equorum/governance/params.h"
#include "equorum/governance/status.h"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace equorum {
namespace governance {

/// Signature the timelock accepts from its own executed entries
constexpr const char* SET_PENDING_ADMIN_SIGNATURE = "setPendingAdmin(address)";

/// Encode a single address argument
std::vector<Byte> EncodeAddressArg(const Address& addr);

/// Decode a single address argument; nullopt unless exactly one address
std::optional<Address> DecodeAddressArg(const std::vector<Byte>& args);

// ============================================================================
// Timelock Entries
// ============================================================================

/// Call descriptor; every field takes part in the content hash
struct TimelockCall {
    Address target;
    Amount value{0};
    std::string signature;
    std::vector<Byte> args;
    Timestamp eta{0};

    /// Canonical encoding of (target, value, signature, args, eta)
    std::vector<Byte> Serialize() const;

    /// SHA-256 of Serialize()
    Hash256 GetHash() const;
};

enum class TimelockEntryState {
    Unqueued,
    Queued,
    Executed,
    Canceled,
    Expired    ///< Still queued but past eta + grace period
};

const char* TimelockEntryStateToString(TimelockEntryState state);

struct TimelockEntry {
    TimelockCall call;
    Hash256 hash;
    Timestamp queuedAt{0};
    bool executed{false};
    bool canceled{false};

    std::vector<Byte> Serialize() const;

    /// Rebuilds the hash from the decoded call
    static std::optional<TimelockEntry> Deserialize(const Byte* data, size_t len);
};

// ============================================================================
// Events
// ============================================================================

enum class TimelockEventType {
    QueueTransaction,
    ExecuteTransaction,
    CancelTransaction,
    NewPendingAdmin,
    NewAdmin
};

const char* TimelockEventTypeToString(TimelockEventType type);

struct TimelockEvent {
    TimelockEventType type;

    /// Entry hash, null for admin events
    Hash256 hash;

    /// Entry call, empty for admin events
    TimelockCall call;

    /// New (pending) admin for admin events
    Address admin;

    std::string ToString() const;
};

using TimelockListener = std::function<void(const TimelockEvent&)>;

// ============================================================================
// Timelock Queue
// ============================================================================

class TimelockQueue : public CallTarget {
public:
    /**
     * @param self   Address of the timelock itself; caller of every executed entry
     * @param admin  Initial admin (typically the deployer)
     * @param params Source of the delay and grace period
     */
    TimelockQueue(const Address& self, const Address& admin, const GovernanceParams& params);
    ~TimelockQueue() override;

    TimelockQueue(const TimelockQueue&) = delete;
    TimelockQueue& operator=(const TimelockQueue&) = delete;

    /**
     * Queue a call. Requires the admin, a non-null target and
     * now + delay <= eta <= now + delay + grace.
     *
     * Fails with NotAdmin, InvalidAddress, EtaTooSoon, EtaTooLate,
     * AlreadyQueued or AlreadyExecuted.
     */
    Status QueueEntry(const Address& caller, const TimelockCall& call,
                      Hash256* outHash = nullptr);

    /// QueueEntry against a caller-supplied clock reading
    Status QueueEntry(const Address& caller, const TimelockCall& call,
                      Timestamp now, Hash256* outHash);

    /// Every check QueueEntry performs, without queuing
    Status CheckQueue(const Address& caller, const TimelockCall& call) const;
    Status CheckQueue(const Address& caller, const TimelockCall& call, Timestamp now) const;

    /**
     * Perform a queued call against its registered target.
     *
     * Fails with NotAdmin, Missing, NotReady, StaleTransaction, or
     * CallReverted when the target is unknown or rejects the call; in
     * that case the entry stays queued.
     */
    Status ExecuteEntry(const Address& caller, const Hash256& hash);
    Status ExecuteEntry(const Address& caller, const Hash256& hash, Timestamp now);

    /// Every check ExecuteEntry performs before making the call, including
    /// the target's own CheckCall
    Status CheckExecute(const Address& caller, const Hash256& hash) const;
    Status CheckExecute(const Address& caller, const Hash256& hash, Timestamp now) const;

    /// Cancel a queued entry. Fails with NotAdmin or Missing.
    Status CancelEntry(const Address& caller, const Hash256& hash);

    /// Nominate a new admin. Only the current admin may do this.
    Status ChangeAdmin(const Address& caller, const Address& newAdmin);

    /// Complete the handover. Only the nominee may do this.
    Status AcceptAdmin(const Address& caller);

    Address GetAdmin() const;

    /// Null when no handover is in progress
    Address GetPendingAdmin() const;

    const Address& GetSelf() const { return self_; }
    Timestamp GetDelay() const { return params_.timelockDelay; }
    Timestamp GetGracePeriod() const { return params_.gracePeriod; }

    TimelockEntryState GetEntryState(const Hash256& hash) const;
    std::optional<TimelockEntry> GetEntry(const Hash256& hash) const;

    /// Number of entries currently queued (including expired ones)
    size_t GetQueuedCount() const;

    /// Route executed calls for address to target. Not owned.
    void RegisterTarget(const Address& address, CallTarget* target);
    void UnregisterTarget(const Address& address);
    bool HasTarget(const Address& address) const;

    void SetListener(TimelockListener listener);

    Status CheckCall(const Address& caller, Amount value,
                     const std::string& signature,
                     const std::vector<Byte>& args) const override;

    /// Accepts setPendingAdmin(address) from the timelock itself
    Status Call(const Address& caller, Amount value,
                const std::string& signature,
                const std::vector<Byte>& args) override;

    /// All entries, for persistence
    std::vector<TimelockEntry> GetEntries() const;

    /// Replace admin state and entries from persisted state
    void Restore(const Address& admin, const Address& pendingAdmin,
                 const std::vector<TimelockEntry>& entries);

private:
    Status CheckAdmin(const Address& caller) const;
    Status CheckQueueLocked(const Address& caller, const TimelockCall& call,
                            const Hash256& hash, Timestamp now) const;
    Status CheckExecuteLocked(const Address& caller, const Hash256& hash,
                              Timestamp now) const;
    void SetPendingAdminLocked(const Address& newAdmin);
    void Notify(const TimelockEvent& event) const;

    const Address self_;
    const GovernanceParams params_;

    mutable std::recursive_mutex mutex_;
    Address admin_;
    Address pendingAdmin_;
    std::map<Hash256, TimelockEntry> entries_;
    std::map<Address, CallTarget*> targets_;
    TimelockListener listener_;
};

} // namespace governance
} // namespace equorum

#endif // EQUORUM_GOVERNANCE_TIMELOCK_H

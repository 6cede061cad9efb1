// EQUORUM - Timelock Queue Implementation
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#include "equorum/governance/timelock.h"
#include "equorum/core/serialize.h"
#include "equorum/crypto/sha256.h"
#include "equorum/util/logging.h"
#include "equorum/util/time.h"

#include <sstream>

namespace equorum {
namespace governance {

namespace {

constexpr uint8_t ENTRY_FORMAT_VERSION = 1;

template<typename Stream>
void WriteCall(Stream& s, const TimelockCall& call) {
    s << call.target << call.value << call.signature << call.args << call.eta;
}

template<typename Stream>
void ReadCall(Stream& s, TimelockCall& call) {
    s >> call.target >> call.value >> call.signature >> call.args >> call.eta;
}

/// A target failure surfaces as CallReverted, keeping the target's reason
Status AsRevert(const Status& result) {
    if (result.code() == Status::CALL_REVERTED) {
        return result;
    }
    return Status::Error(Status::CALL_REVERTED, result.ToString());
}

} // namespace

std::vector<Byte> EncodeAddressArg(const Address& addr) {
    DataStream ss;
    ss << addr;
    return ss.Bytes();
}

std::optional<Address> DecodeAddressArg(const std::vector<Byte>& args) {
    if (args.size() != Address::SIZE) {
        return std::nullopt;
    }
    return Address(args.data(), args.size());
}

// ============================================================================
// Entries and Events
// ============================================================================

const char* TimelockEntryStateToString(TimelockEntryState state) {
    switch (state) {
        case TimelockEntryState::Unqueued: return "Unqueued";
        case TimelockEntryState::Queued: return "Queued";
        case TimelockEntryState::Executed: return "Executed";
        case TimelockEntryState::Canceled: return "Canceled";
        case TimelockEntryState::Expired: return "Expired";
    }
    return "Unknown";
}

const char* TimelockEventTypeToString(TimelockEventType type) {
    switch (type) {
        case TimelockEventType::QueueTransaction: return "QueueTransaction";
        case TimelockEventType::ExecuteTransaction: return "ExecuteTransaction";
        case TimelockEventType::CancelTransaction: return "CancelTransaction";
        case TimelockEventType::NewPendingAdmin: return "NewPendingAdmin";
        case TimelockEventType::NewAdmin: return "NewAdmin";
    }
    return "Unknown";
}

std::vector<Byte> TimelockCall::Serialize() const {
    DataStream ss;
    WriteCall(ss, *this);
    return ss.Bytes();
}

Hash256 TimelockCall::GetHash() const {
    return SHA256Hash(Serialize());
}

std::vector<Byte> TimelockEntry::Serialize() const {
    DataStream ss;
    ss << ENTRY_FORMAT_VERSION;
    WriteCall(ss, call);
    ss << queuedAt << executed << canceled;
    return ss.Bytes();
}

std::optional<TimelockEntry> TimelockEntry::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }
    try {
        DataStream ss(data, len);
        uint8_t version = 0;
        ss >> version;
        if (version != ENTRY_FORMAT_VERSION) {
            return std::nullopt;
        }

        TimelockEntry entry;
        ReadCall(ss, entry.call);
        ss >> entry.queuedAt >> entry.executed >> entry.canceled;
        if (!ss.empty()) {
            return std::nullopt;
        }
        entry.hash = entry.call.GetHash();
        return entry;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string TimelockEvent::ToString() const {
    std::ostringstream oss;
    oss << TimelockEventTypeToString(type);
    if (type == TimelockEventType::NewPendingAdmin || type == TimelockEventType::NewAdmin) {
        oss << " admin=" << ShortAddress(admin);
    } else {
        oss << " hash=" << hash.ToHex().substr(0, 16)
            << " target=" << ShortAddress(call.target)
            << " sig=" << call.signature
            << " eta=" << call.eta;
    }
    return oss.str();
}

// ============================================================================
// TimelockQueue
// ============================================================================

TimelockQueue::TimelockQueue(const Address& self, const Address& admin,
                             const GovernanceParams& params)
    : self_(self), params_(params), admin_(admin) {
    targets_[self_] = this;
}

TimelockQueue::~TimelockQueue() = default;

Status TimelockQueue::CheckAdmin(const Address& caller) const {
    if (caller != admin_) {
        return Status::Error(Status::NOT_ADMIN, ShortAddress(caller) + " is not the timelock admin");
    }
    return Status::Ok();
}

Status TimelockQueue::CheckQueueLocked(const Address& caller, const TimelockCall& call,
                                       const Hash256& hash, Timestamp now) const {
    Status s = CheckAdmin(caller);
    if (!s.ok()) {
        return s;
    }
    if (call.target.IsNull()) {
        return Status::Error(Status::INVALID_ADDRESS, "null call target");
    }
    if (call.eta < now + params_.timelockDelay) {
        return Status::Error(Status::ETA_TOO_SOON,
                             "eta " + std::to_string(call.eta) + " before " +
                             std::to_string(now + params_.timelockDelay));
    }
    if (call.eta > now + params_.timelockDelay + params_.gracePeriod) {
        return Status::Error(Status::ETA_TOO_LATE,
                             "eta " + std::to_string(call.eta) + " after " +
                             std::to_string(now + params_.timelockDelay + params_.gracePeriod));
    }

    auto it = entries_.find(hash);
    if (it != entries_.end()) {
        if (it->second.executed) {
            return Status::Error(Status::ALREADY_EXECUTED, "entry was already executed");
        }
        if (!it->second.canceled) {
            return Status::Error(Status::ALREADY_QUEUED, "entry is already queued");
        }
    }
    return Status::Ok();
}

Status TimelockQueue::CheckQueue(const Address& caller, const TimelockCall& call) const {
    return CheckQueue(caller, call, util::GetTime());
}

Status TimelockQueue::CheckQueue(const Address& caller, const TimelockCall& call,
                                 Timestamp now) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return CheckQueueLocked(caller, call, call.GetHash(), now);
}

Status TimelockQueue::QueueEntry(const Address& caller, const TimelockCall& call,
                                 Hash256* outHash) {
    return QueueEntry(caller, call, util::GetTime(), outHash);
}

Status TimelockQueue::QueueEntry(const Address& caller, const TimelockCall& call,
                                 Timestamp now, Hash256* outHash) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Hash256 hash = call.GetHash();
    Status s = CheckQueueLocked(caller, call, hash, now);
    if (!s.ok()) {
        LOG_DEBUG(util::LogCategory::TIMELOCK) << "Queue rejected: " << s.ToString();
        return s;
    }

    TimelockEntry entry;
    entry.call = call;
    entry.hash = hash;
    entry.queuedAt = now;
    entries_[hash] = entry;

    if (outHash) {
        *outHash = hash;
    }

    TimelockEvent event{TimelockEventType::QueueTransaction, hash, call, Address()};
    LOG_INFO(util::LogCategory::TIMELOCK) << event.ToString();
    Notify(event);
    return Status::Ok();
}

Status TimelockQueue::CheckExecuteLocked(const Address& caller, const Hash256& hash,
                                         Timestamp now) const {
    Status s = CheckAdmin(caller);
    if (!s.ok()) {
        return s;
    }

    auto it = entries_.find(hash);
    if (it == entries_.end() || it->second.executed || it->second.canceled) {
        return Status::Error(Status::MISSING, "no queued entry " + hash.ToHex().substr(0, 16));
    }

    const TimelockCall& call = it->second.call;
    if (now < call.eta) {
        return Status::Error(Status::NOT_READY,
                             "executable in " + util::FormatDuration(call.eta - now));
    }
    if (now > call.eta + params_.gracePeriod) {
        return Status::Error(Status::STALE_TRANSACTION,
                             "grace period ended at " + std::to_string(call.eta + params_.gracePeriod));
    }

    auto tit = targets_.find(call.target);
    if (tit == targets_.end() || tit->second == nullptr) {
        return Status::Error(Status::CALL_REVERTED,
                             "no target at " + ShortAddress(call.target));
    }
    s = tit->second->CheckCall(self_, call.value, call.signature, call.args);
    if (!s.ok()) {
        return AsRevert(s);
    }
    return Status::Ok();
}

Status TimelockQueue::CheckExecute(const Address& caller, const Hash256& hash) const {
    return CheckExecute(caller, hash, util::GetTime());
}

Status TimelockQueue::CheckExecute(const Address& caller, const Hash256& hash,
                                   Timestamp now) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return CheckExecuteLocked(caller, hash, now);
}

Status TimelockQueue::ExecuteEntry(const Address& caller, const Hash256& hash) {
    return ExecuteEntry(caller, hash, util::GetTime());
}

Status TimelockQueue::ExecuteEntry(const Address& caller, const Hash256& hash, Timestamp now) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Status s = CheckExecuteLocked(caller, hash, now);
    if (!s.ok()) {
        LOG_DEBUG(util::LogCategory::TIMELOCK) << "Execute rejected: " << s.ToString();
        return s;
    }

    TimelockCall call = entries_[hash].call;
    CallTarget* target = targets_[call.target];

    // Latch before the call so a re-entrant execute sees the entry as gone
    entries_[hash].executed = true;
    Status result = target->Call(self_, call.value, call.signature, call.args);
    if (!result.ok()) {
        entries_[hash].executed = false;
        LOG_WARN(util::LogCategory::TIMELOCK) << "Call " << call.signature << " on "
                                              << ShortAddress(call.target)
                                              << " reverted: " << result.ToString();
        return AsRevert(result);
    }

    TimelockEvent event{TimelockEventType::ExecuteTransaction, hash, call, Address()};
    LOG_INFO(util::LogCategory::TIMELOCK) << event.ToString();
    Notify(event);
    return Status::Ok();
}

Status TimelockQueue::CancelEntry(const Address& caller, const Hash256& hash) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Status s = CheckAdmin(caller);
    if (!s.ok()) {
        return s;
    }
    auto it = entries_.find(hash);
    if (it == entries_.end() || it->second.executed || it->second.canceled) {
        return Status::Error(Status::MISSING, "no queued entry " + hash.ToHex().substr(0, 16));
    }

    it->second.canceled = true;

    TimelockEvent event{TimelockEventType::CancelTransaction, hash, it->second.call, Address()};
    LOG_INFO(util::LogCategory::TIMELOCK) << event.ToString();
    Notify(event);
    return Status::Ok();
}

void TimelockQueue::SetPendingAdminLocked(const Address& newAdmin) {
    pendingAdmin_ = newAdmin;

    TimelockEvent event{TimelockEventType::NewPendingAdmin, Hash256(), TimelockCall(), newAdmin};
    LOG_INFO(util::LogCategory::TIMELOCK) << event.ToString();
    Notify(event);
}

Status TimelockQueue::ChangeAdmin(const Address& caller, const Address& newAdmin) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Status s = CheckAdmin(caller);
    if (!s.ok()) {
        return s;
    }
    if (newAdmin.IsNull()) {
        return Status::Error(Status::INVALID_ADDRESS, "null admin");
    }
    SetPendingAdminLocked(newAdmin);
    return Status::Ok();
}

Status TimelockQueue::AcceptAdmin(const Address& caller) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (pendingAdmin_.IsNull() || caller != pendingAdmin_) {
        return Status::Error(Status::NOT_PENDING_ADMIN,
                             ShortAddress(caller) + " is not the pending admin");
    }
    admin_ = pendingAdmin_;
    pendingAdmin_.SetNull();

    TimelockEvent event{TimelockEventType::NewAdmin, Hash256(), TimelockCall(), admin_};
    LOG_INFO(util::LogCategory::TIMELOCK) << event.ToString();
    Notify(event);
    return Status::Ok();
}

Status TimelockQueue::CheckCall(const Address& caller, Amount /*value*/,
                                const std::string& signature,
                                const std::vector<Byte>& args) const {
    if (caller != self_) {
        return Status::Error(Status::NOT_ADMIN, "only the timelock may call itself");
    }
    if (signature != SET_PENDING_ADMIN_SIGNATURE) {
        return Status::Error(Status::CALL_REVERTED, "unknown signature " + signature);
    }
    auto newAdmin = DecodeAddressArg(args);
    if (!newAdmin || newAdmin->IsNull()) {
        return Status::Error(Status::INVALID_ADDRESS, "bad admin argument");
    }
    return Status::Ok();
}

Status TimelockQueue::Call(const Address& caller, Amount value,
                           const std::string& signature,
                           const std::vector<Byte>& args) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Status s = CheckCall(caller, value, signature, args);
    if (!s.ok()) {
        return s;
    }
    SetPendingAdminLocked(*DecodeAddressArg(args));
    return Status::Ok();
}

Address TimelockQueue::GetAdmin() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return admin_;
}

Address TimelockQueue::GetPendingAdmin() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return pendingAdmin_;
}

TimelockEntryState TimelockQueue::GetEntryState(const Hash256& hash) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = entries_.find(hash);
    if (it == entries_.end()) {
        return TimelockEntryState::Unqueued;
    }
    const TimelockEntry& entry = it->second;
    if (entry.executed) {
        return TimelockEntryState::Executed;
    }
    if (entry.canceled) {
        return TimelockEntryState::Canceled;
    }
    if (util::GetTime() > entry.call.eta + params_.gracePeriod) {
        return TimelockEntryState::Expired;
    }
    return TimelockEntryState::Queued;
}

std::optional<TimelockEntry> TimelockQueue::GetEntry(const Hash256& hash) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = entries_.find(hash);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t TimelockQueue::GetQueuedCount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [hash, entry] : entries_) {
        if (!entry.executed && !entry.canceled) {
            ++count;
        }
    }
    return count;
}

void TimelockQueue::RegisterTarget(const Address& address, CallTarget* target) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    targets_[address] = target;
}

void TimelockQueue::UnregisterTarget(const Address& address) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    targets_.erase(address);
}

bool TimelockQueue::HasTarget(const Address& address) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return targets_.count(address) > 0;
}

void TimelockQueue::SetListener(TimelockListener listener) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void TimelockQueue::Notify(const TimelockEvent& event) const {
    if (listener_) {
        listener_(event);
    }
}

std::vector<TimelockEntry> TimelockQueue::GetEntries() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<TimelockEntry> result;
    result.reserve(entries_.size());
    for (const auto& [hash, entry] : entries_) {
        result.push_back(entry);
    }
    return result;
}

void TimelockQueue::Restore(const Address& admin, const Address& pendingAdmin,
                            const std::vector<TimelockEntry>& entries) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    admin_ = admin;
    pendingAdmin_ = pendingAdmin;
    entries_.clear();
    for (const auto& entry : entries) {
        entries_[entry.hash] = entry;
    }
}

} // namespace governance
} // namespace equorum

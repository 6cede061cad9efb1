// EQUORUM - Voting Power Ledger Implementation
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#include "equorum/governance/votingpower.h"
#include "equorum/core/serialize.h"
#include "equorum/util/logging.h"

#include <limits>

namespace equorum {
namespace governance {

// ============================================================================
// Power Functions
// ============================================================================

uint64_t IntegerSqrt(uint64_t n) {
    if (n < 2) {
        return n;
    }

    // Newton iteration from an overestimate converges monotonically downward
    uint64_t x = n;
    uint64_t y = x / 2 + (x & 1);
    while (y < x) {
        x = y;
        y = (x + n / x) / 2;
    }
    return x;
}

uint64_t CalculateVotingPower(Amount locked) {
    if (locked <= 0) {
        return 0;
    }
    return IntegerSqrt(static_cast<uint64_t>(locked));
}

// ============================================================================
// LockInfo
// ============================================================================

std::vector<Byte> LockInfo::Serialize() const {
    DataStream ss;
    ss << amount << createdAt;
    return ss.Bytes();
}

std::optional<LockInfo> LockInfo::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }
    try {
        DataStream ss(data, len);
        LockInfo info;
        ss >> info.amount >> info.createdAt;
        if (!ss.empty() || info.amount <= 0) {
            return std::nullopt;
        }
        return info;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

// ============================================================================
// VotingPowerLedger
// ============================================================================

VotingPowerLedger::VotingPowerLedger(const Address& custody,
                                     std::shared_ptr<TokenLedger> token,
                                     const GovernanceParams& params)
    : custody_(custody), token_(std::move(token)), params_(params) {}

Status VotingPowerLedger::Lock(const Address& principal, Amount amount, Timestamp now) {
    if (amount <= 0) {
        return Status::Error(Status::INVALID_AMOUNT, "lock amount must be positive");
    }
    if (principal.IsNull() || principal == custody_) {
        return Status::Error(Status::INVALID_ADDRESS, "invalid principal");
    }
    if (params_.excluded.count(principal)) {
        return Status::Error(Status::EXCLUDED_PRINCIPAL,
                             ShortAddress(principal) + " cannot participate");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Amount current = 0;
    auto it = locks_.find(principal);
    if (it != locks_.end()) {
        current = it->second.amount;
    }

    if (current > std::numeric_limits<Amount>::max() - amount) {
        return Status::Error(Status::INVALID_AMOUNT, "lock amount overflows");
    }
    Amount balance = token_->BalanceOf(principal);
    if (balance < amount) {
        return Status::Error(Status::INSUFFICIENT_BALANCE,
                             "balance " + std::to_string(balance) + " < " + std::to_string(amount));
    }
    if (current + amount < params_.minLockAmount) {
        return Status::Error(Status::BELOW_MINIMUM_LOCK,
                             "minimum lock is " + std::to_string(params_.minLockAmount));
    }
    if (!token_->TransferFrom(principal, custody_, amount)) {
        return Status::Error(Status::INSUFFICIENT_BALANCE, "token transfer refused");
    }

    uint64_t oldPower = CalculateVotingPower(current);
    if (it == locks_.end()) {
        it = locks_.emplace(principal, LockInfo{0, now}).first;
    }
    it->second.amount = current + amount;
    uint64_t newPower = CalculateVotingPower(it->second.amount);

    totalLocked_ += amount;
    totalPower_ = totalPower_ - oldPower + newPower;

    LOG_INFO(util::LogCategory::LEDGER) << "Locked " << amount << " for "
        << ShortAddress(principal) << " (total " << it->second.amount
        << ", power " << newPower << ")";
    return Status::Ok();
}

Status VotingPowerLedger::Unlock(const Address& principal, Amount* released) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = locks_.find(principal);
    if (it == locks_.end()) {
        return Status::Error(Status::NO_LOCK, ShortAddress(principal) + " has no lock");
    }

    Amount amount = it->second.amount;
    if (!token_->TransferFrom(custody_, principal, amount)) {
        return Status::Error(Status::INSUFFICIENT_BALANCE, "custody cannot cover release");
    }

    totalLocked_ -= amount;
    totalPower_ -= CalculateVotingPower(amount);
    locks_.erase(it);

    if (released) {
        *released = amount;
    }

    LOG_INFO(util::LogCategory::LEDGER) << "Unlocked " << amount << " for "
                                        << ShortAddress(principal);
    return Status::Ok();
}

uint64_t VotingPowerLedger::GetVotingPower(const Address& principal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(principal);
    return it != locks_.end() ? CalculateVotingPower(it->second.amount) : 0;
}

uint64_t VotingPowerLedger::GetTotalVotingPower() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalPower_;
}

Amount VotingPowerLedger::GetTotalLocked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalLocked_;
}

std::optional<LockInfo> VotingPowerLedger::GetLockInfo(const Address& principal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(principal);
    if (it == locks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Status VotingPowerLedger::CheckStanding(const Address& principal, Timestamp now) const {
    if (params_.excluded.count(principal)) {
        return Status::Error(Status::EXCLUDED_PRINCIPAL,
                             ShortAddress(principal) + " cannot participate");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(principal);
    if (it == locks_.end()) {
        return Status::Error(Status::NO_VOTING_POWER, ShortAddress(principal) + " has no lock");
    }
    if (now - it->second.createdAt < params_.minLockAge) {
        return Status::Error(Status::LOCK_TOO_NEW,
                             "lock matures at " + std::to_string(it->second.createdAt +
                                                                 params_.minLockAge));
    }
    return Status::Ok();
}

bool VotingPowerLedger::IsExcluded(const Address& principal) const {
    return params_.excluded.count(principal) > 0;
}

size_t VotingPowerLedger::GetLockCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locks_.size();
}

std::map<Address, LockInfo> VotingPowerLedger::GetLocks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locks_;
}

void VotingPowerLedger::RestoreLocks(const std::map<Address, LockInfo>& locks) {
    std::lock_guard<std::mutex> lock(mutex_);
    locks_.clear();
    totalLocked_ = 0;
    totalPower_ = 0;
    for (const auto& [principal, info] : locks) {
        if (info.IsNull()) {
            continue;
        }
        locks_[principal] = info;
        totalLocked_ += info.amount;
        totalPower_ += CalculateVotingPower(info.amount);
    }
}

} // namespace governance
} // namespace equorum

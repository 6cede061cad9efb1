// EQUORUM - External Collaborators Implementation
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#include "equorum/governance/collaborator.h"

namespace equorum {
namespace governance {

void MemoryTokenLedger::Mint(const Address& holder, Amount amount) {
    if (amount <= 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    balances_[holder] += amount;
    totalSupply_ += amount;
}

Amount MemoryTokenLedger::BalanceOf(const Address& holder) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(holder);
    return it != balances_.end() ? it->second : 0;
}

bool MemoryTokenLedger::TransferFrom(const Address& from, const Address& to, Amount amount) {
    if (amount <= 0) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }
    it->second -= amount;
    balances_[to] += amount;
    return true;
}

Amount MemoryTokenLedger::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

} // namespace governance
} // namespace equorum

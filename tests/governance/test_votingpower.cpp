// EQUORUM - Voting Power Ledger Tests
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#include <gtest/gtest.h>

#include "equorum/governance/votingpower.h"

#include <array>
#include <limits>
#include <memory>

namespace equorum {
namespace governance {
namespace test {

// ============================================================================
// Power Function
// ============================================================================

TEST(IntegerSqrtTest, SmallValues) {
    EXPECT_EQ(IntegerSqrt(0), 0u);
    EXPECT_EQ(IntegerSqrt(1), 1u);
    EXPECT_EQ(IntegerSqrt(2), 1u);
    EXPECT_EQ(IntegerSqrt(3), 1u);
    EXPECT_EQ(IntegerSqrt(4), 2u);
    EXPECT_EQ(IntegerSqrt(15), 3u);
    EXPECT_EQ(IntegerSqrt(16), 4u);
    EXPECT_EQ(IntegerSqrt(10000), 100u);
}

TEST(IntegerSqrtTest, LargeValues) {
    const uint64_t root = 0xFFFFFFFFULL;
    EXPECT_EQ(IntegerSqrt(root * root), root);
    EXPECT_EQ(IntegerSqrt(root * root - 1), root - 1);
    EXPECT_EQ(IntegerSqrt(std::numeric_limits<uint64_t>::max()), root);
    EXPECT_EQ(IntegerSqrt(10000000000ULL), 100000u);
}

TEST(IntegerSqrtTest, Monotonic) {
    uint64_t prev = 0;
    for (uint64_t n = 0; n < 5000; ++n) {
        uint64_t r = IntegerSqrt(n);
        EXPECT_GE(r, prev);
        EXPECT_LE(r * r, n);
        EXPECT_GT((r + 1) * (r + 1), n);
        prev = r;
    }
}

TEST(IntegerSqrtTest, NonPositiveLocksHaveNoPower) {
    EXPECT_EQ(CalculateVotingPower(0), 0u);
    EXPECT_EQ(CalculateVotingPower(-100), 0u);
    EXPECT_EQ(CalculateVotingPower(3600), 60u);
}

// ============================================================================
// Ledger Fixture
// ============================================================================

class VotingPowerLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        params_.minLockAmount = 100;
        params_.minLockAge = SECONDS_PER_DAY;
        params_.excluded.insert(MakeAddress(99));

        token_ = std::make_shared<MemoryTokenLedger>();
        custody_ = MakeAddress(200);
        ledger_ = std::make_unique<VotingPowerLedger>(custody_, token_, params_);

        alice_ = MakeAddress(1);
        bob_ = MakeAddress(2);
        token_->Mint(alice_, 1000000);
        token_->Mint(bob_, 1000000);
        token_->Mint(MakeAddress(99), 1000000);
    }

    static Address MakeAddress(uint8_t id) {
        std::array<Byte, 20> data{};
        data[0] = id;
        data[19] = id;
        return Address(data);
    }

    static constexpr Timestamp T0 = 1700000000;

    GovernanceParams params_;
    std::shared_ptr<MemoryTokenLedger> token_;
    Address custody_;
    std::unique_ptr<VotingPowerLedger> ledger_;
    Address alice_;
    Address bob_;
};

// ============================================================================
// Locking
// ============================================================================

TEST_F(VotingPowerLedgerTest, LockMovesTokensIntoCustody) {
    ASSERT_TRUE(ledger_->Lock(alice_, 10000, T0).ok());

    EXPECT_EQ(token_->BalanceOf(alice_), 990000);
    EXPECT_EQ(token_->BalanceOf(custody_), 10000);
    EXPECT_EQ(ledger_->GetVotingPower(alice_), 100u);
    EXPECT_EQ(ledger_->GetTotalLocked(), 10000);

    auto info = ledger_->GetLockInfo(alice_);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->amount, 10000);
    EXPECT_EQ(info->createdAt, T0);
}

TEST_F(VotingPowerLedgerTest, IncrementalLockEqualsSingleLock) {
    ASSERT_TRUE(ledger_->Lock(alice_, 2500, T0).ok());
    EXPECT_EQ(ledger_->GetVotingPower(alice_), 50u);

    ASSERT_TRUE(ledger_->Lock(alice_, 7500, T0 + 100).ok());
    EXPECT_EQ(ledger_->GetVotingPower(alice_), 100u);

    // Creation time survives a top-up
    EXPECT_EQ(ledger_->GetLockInfo(alice_)->createdAt, T0);
}

TEST_F(VotingPowerLedgerTest, PowerIsSquareRootOfLock) {
    ASSERT_TRUE(ledger_->Lock(alice_, 1000, T0).ok());
    EXPECT_EQ(ledger_->GetVotingPower(alice_), 31u);
    EXPECT_EQ(ledger_->GetVotingPower(bob_), 0u);
}

TEST_F(VotingPowerLedgerTest, TotalPowerSumsIndividualPowers) {
    ASSERT_TRUE(ledger_->Lock(alice_, 10000, T0).ok());
    ASSERT_TRUE(ledger_->Lock(bob_, 3600, T0).ok());
    EXPECT_EQ(ledger_->GetTotalVotingPower(), 160u);

    ASSERT_TRUE(ledger_->Lock(bob_, 2800, T0).ok());
    EXPECT_EQ(ledger_->GetTotalVotingPower(), 180u);
    EXPECT_EQ(ledger_->GetLockCount(), 2u);
}

TEST_F(VotingPowerLedgerTest, RejectsNonPositiveAmounts) {
    EXPECT_EQ(ledger_->Lock(alice_, 0, T0).code(), Status::INVALID_AMOUNT);
    EXPECT_EQ(ledger_->Lock(alice_, -5, T0).code(), Status::INVALID_AMOUNT);
    EXPECT_EQ(ledger_->GetLockCount(), 0u);
}

TEST_F(VotingPowerLedgerTest, RejectsInsufficientBalance) {
    Status s = ledger_->Lock(alice_, 2000000, T0);
    EXPECT_EQ(s.code(), Status::INSUFFICIENT_BALANCE);
    EXPECT_EQ(token_->BalanceOf(alice_), 1000000);
    EXPECT_FALSE(ledger_->GetLockInfo(alice_).has_value());
}

TEST_F(VotingPowerLedgerTest, RejectsLockBelowMinimum) {
    EXPECT_EQ(ledger_->Lock(alice_, 99, T0).code(), Status::BELOW_MINIMUM_LOCK);

    // A top-up only needs the resulting total to clear the minimum
    ASSERT_TRUE(ledger_->Lock(alice_, 100, T0).ok());
    EXPECT_TRUE(ledger_->Lock(alice_, 1, T0).ok());
}

TEST_F(VotingPowerLedgerTest, RejectsInvalidPrincipals) {
    EXPECT_EQ(ledger_->Lock(Address(), 1000, T0).code(), Status::INVALID_ADDRESS);
    EXPECT_EQ(ledger_->Lock(custody_, 1000, T0).code(), Status::INVALID_ADDRESS);
    EXPECT_EQ(ledger_->Lock(MakeAddress(99), 1000, T0).code(), Status::EXCLUDED_PRINCIPAL);
    EXPECT_TRUE(ledger_->IsExcluded(MakeAddress(99)));
}

// ============================================================================
// Unlocking
// ============================================================================

TEST_F(VotingPowerLedgerTest, UnlockReturnsWholeLock) {
    ASSERT_TRUE(ledger_->Lock(alice_, 10000, T0).ok());
    ASSERT_TRUE(ledger_->Lock(bob_, 400, T0).ok());

    Amount released = 0;
    ASSERT_TRUE(ledger_->Unlock(alice_, &released).ok());
    EXPECT_EQ(released, 10000);
    EXPECT_EQ(token_->BalanceOf(alice_), 1000000);
    EXPECT_EQ(ledger_->GetVotingPower(alice_), 0u);
    EXPECT_EQ(ledger_->GetTotalVotingPower(), 20u);
    EXPECT_EQ(ledger_->GetTotalLocked(), 400);
}

TEST_F(VotingPowerLedgerTest, UnlockWithoutLockFails) {
    EXPECT_EQ(ledger_->Unlock(alice_).code(), Status::NO_LOCK);
}

// ============================================================================
// Standing
// ============================================================================

TEST_F(VotingPowerLedgerTest, StandingRequiresMatureLock) {
    EXPECT_EQ(ledger_->CheckStanding(alice_, T0).code(), Status::NO_VOTING_POWER);

    ASSERT_TRUE(ledger_->Lock(alice_, 10000, T0).ok());
    EXPECT_EQ(ledger_->CheckStanding(alice_, T0).code(), Status::LOCK_TOO_NEW);
    EXPECT_EQ(ledger_->CheckStanding(alice_, T0 + SECONDS_PER_DAY - 1).code(),
              Status::LOCK_TOO_NEW);
    EXPECT_TRUE(ledger_->CheckStanding(alice_, T0 + SECONDS_PER_DAY).ok());

    EXPECT_EQ(ledger_->CheckStanding(MakeAddress(99), T0).code(), Status::EXCLUDED_PRINCIPAL);
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(VotingPowerLedgerTest, LockInfoSerialization) {
    LockInfo info{12345, T0};
    auto bytes = info.Serialize();
    auto decoded = LockInfo::Deserialize(bytes.data(), bytes.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->amount, 12345);
    EXPECT_EQ(decoded->createdAt, T0);

    bytes.push_back(0);
    EXPECT_FALSE(LockInfo::Deserialize(bytes.data(), bytes.size()).has_value());
    EXPECT_FALSE(LockInfo::Deserialize(bytes.data(), 4).has_value());
    EXPECT_FALSE(LockInfo::Deserialize(nullptr, 0).has_value());
}

TEST_F(VotingPowerLedgerTest, RestoreRecomputesTotals) {
    std::map<Address, LockInfo> locks;
    locks[alice_] = LockInfo{10000, T0};
    locks[bob_] = LockInfo{900, T0 + 5};

    ledger_->RestoreLocks(locks);
    EXPECT_EQ(ledger_->GetLockCount(), 2u);
    EXPECT_EQ(ledger_->GetTotalLocked(), 10900);
    EXPECT_EQ(ledger_->GetTotalVotingPower(), 130u);
    auto restored = ledger_->GetLocks();
    ASSERT_EQ(restored.size(), 2u);
    EXPECT_EQ(restored[bob_].amount, 900);
    EXPECT_EQ(restored[bob_].createdAt, T0 + 5);
}

} // namespace test
} // namespace governance
} // namespace equorum

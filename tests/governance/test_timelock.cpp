// EQUORUM - Timelock Queue Tests
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#include <gtest/gtest.h>

#include "equorum/governance/timelock.h"
#include "equorum/util/time.h"

#include <array>
#include <vector>

namespace equorum {
namespace governance {
namespace test {

// ============================================================================
// Recording Target
// ============================================================================

class RecordingTarget : public CallTarget {
public:
    struct Received {
        Address caller;
        Amount value;
        std::string signature;
        std::vector<Byte> args;
    };

    Status CheckCall(const Address& /*caller*/, Amount /*value*/,
                     const std::string& /*signature*/,
                     const std::vector<Byte>& /*args*/) const override {
        if (refuseCheck) {
            return Status::Error(Status::WRONG_STATE, "target refused");
        }
        return Status::Ok();
    }

    Status Call(const Address& caller, Amount value,
                const std::string& signature,
                const std::vector<Byte>& args) override {
        if (fail) {
            return Status::Error(Status::CALL_REVERTED, "target failed");
        }
        calls.push_back({caller, value, signature, args});
        return Status::Ok();
    }

    /// Refuse in the dry run
    bool refuseCheck{false};

    /// Pass the dry run, then fail the call itself
    bool fail{false};
    std::vector<Received> calls;
};

// ============================================================================
// Test Fixture
// ============================================================================

class TimelockQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        util::EnableMockTime();
        util::SetMockTime(T0);

        params_.timelockDelay = 48 * SECONDS_PER_HOUR;
        params_.gracePeriod = 7 * SECONDS_PER_DAY;

        self_ = MakeAddress(10);
        admin_ = MakeAddress(1);
        targetAddr_ = MakeAddress(20);

        timelock_ = std::make_unique<TimelockQueue>(self_, admin_, params_);
        timelock_->RegisterTarget(targetAddr_, &target_);
        timelock_->SetListener([this](const TimelockEvent& e) { events_.push_back(e); });
    }

    void TearDown() override {
        util::DisableMockTime();
    }

    static Address MakeAddress(uint8_t id) {
        std::array<Byte, 20> data{};
        data[0] = id;
        data[19] = id;
        return Address(data);
    }

    TimelockCall MakeCall(Timestamp eta) const {
        TimelockCall call;
        call.target = targetAddr_;
        call.value = 5;
        call.signature = "setParameter(string,int64)";
        call.args = {0x01, 0x02};
        call.eta = eta;
        return call;
    }

    Hash256 QueueOrFail(const TimelockCall& call) {
        Hash256 hash;
        Status s = timelock_->QueueEntry(admin_, call, &hash);
        EXPECT_TRUE(s.ok()) << s.ToString();
        return hash;
    }

    static constexpr Timestamp T0 = 1700000000;

    GovernanceParams params_;
    Address self_;
    Address admin_;
    Address targetAddr_;
    RecordingTarget target_;
    std::unique_ptr<TimelockQueue> timelock_;
    std::vector<TimelockEvent> events_;
};

// ============================================================================
// Hashing
// ============================================================================

TEST_F(TimelockQueueTest, HashCoversEveryField) {
    TimelockCall base = MakeCall(T0 + params_.timelockDelay);
    Hash256 h = base.GetHash();
    EXPECT_FALSE(h.IsNull());
    EXPECT_EQ(h, MakeCall(T0 + params_.timelockDelay).GetHash());

    TimelockCall other = base;
    other.eta += 1;
    EXPECT_NE(other.GetHash(), h);

    other = base;
    other.value = 6;
    EXPECT_NE(other.GetHash(), h);

    other = base;
    other.signature = "setParameter(string,uint64)";
    EXPECT_NE(other.GetHash(), h);

    other = base;
    other.args.push_back(0x03);
    EXPECT_NE(other.GetHash(), h);

    other = base;
    other.target = MakeAddress(21);
    EXPECT_NE(other.GetHash(), h);
}

TEST_F(TimelockQueueTest, AddressArgCodec) {
    Address a = MakeAddress(7);
    auto encoded = EncodeAddressArg(a);
    EXPECT_EQ(encoded.size(), 20u);
    EXPECT_EQ(DecodeAddressArg(encoded).value_or(Address()), a);

    encoded.push_back(0);
    EXPECT_FALSE(DecodeAddressArg(encoded).has_value());
    EXPECT_FALSE(DecodeAddressArg({}).has_value());
}

// ============================================================================
// Queue
// ============================================================================

TEST_F(TimelockQueueTest, QueueWithinEtaBounds) {
    Timestamp earliest = T0 + params_.timelockDelay;
    Timestamp latest = earliest + params_.gracePeriod;

    EXPECT_EQ(timelock_->QueueEntry(admin_, MakeCall(earliest - 1)).code(), Status::ETA_TOO_SOON);
    EXPECT_EQ(timelock_->QueueEntry(admin_, MakeCall(latest + 1)).code(), Status::ETA_TOO_LATE);

    Hash256 first = QueueOrFail(MakeCall(earliest));
    Hash256 last = QueueOrFail(MakeCall(latest));
    EXPECT_NE(first, last);
    EXPECT_EQ(timelock_->GetQueuedCount(), 2u);
    EXPECT_EQ(timelock_->GetEntryState(first), TimelockEntryState::Queued);

    auto entry = timelock_->GetEntry(first);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->queuedAt, T0);
    EXPECT_EQ(entry->call.eta, earliest);

    ASSERT_EQ(events_.size(), 2u);
    EXPECT_EQ(events_[0].type, TimelockEventType::QueueTransaction);
    EXPECT_EQ(events_[0].hash, first);
}

TEST_F(TimelockQueueTest, QueueRequiresAdmin) {
    Status s = timelock_->QueueEntry(MakeAddress(2), MakeCall(T0 + params_.timelockDelay));
    EXPECT_EQ(s.code(), Status::NOT_ADMIN);
    EXPECT_EQ(timelock_->GetQueuedCount(), 0u);
    EXPECT_TRUE(events_.empty());
}

TEST_F(TimelockQueueTest, QueueRejectsNullTarget) {
    TimelockCall call = MakeCall(T0 + params_.timelockDelay);
    call.target.SetNull();
    EXPECT_EQ(timelock_->QueueEntry(admin_, call).code(), Status::INVALID_ADDRESS);
}

TEST_F(TimelockQueueTest, SameCallCannotBeQueuedTwice) {
    TimelockCall call = MakeCall(T0 + params_.timelockDelay);
    QueueOrFail(call);
    EXPECT_EQ(timelock_->QueueEntry(admin_, call).code(), Status::ALREADY_QUEUED);
    EXPECT_EQ(timelock_->CheckQueue(admin_, call).code(), Status::ALREADY_QUEUED);
    EXPECT_EQ(timelock_->GetQueuedCount(), 1u);
}

TEST_F(TimelockQueueTest, ExecutedCallCannotBeQueuedAgain) {
    TimelockCall call = MakeCall(T0 + params_.timelockDelay + SECONDS_PER_HOUR);
    Hash256 hash = QueueOrFail(call);

    util::SetMockTime(call.eta);
    ASSERT_TRUE(timelock_->ExecuteEntry(admin_, hash).ok());

    // Still inside the eta window from this vantage point
    util::SetMockTime(T0 + SECONDS_PER_HOUR);
    EXPECT_EQ(timelock_->QueueEntry(admin_, call).code(), Status::ALREADY_EXECUTED);
}

TEST_F(TimelockQueueTest, CanceledCallMayBeQueuedAgain) {
    TimelockCall call = MakeCall(T0 + params_.timelockDelay);
    Hash256 hash = QueueOrFail(call);
    ASSERT_TRUE(timelock_->CancelEntry(admin_, hash).ok());
    EXPECT_EQ(timelock_->GetEntryState(hash), TimelockEntryState::Canceled);

    EXPECT_EQ(QueueOrFail(call), hash);
    EXPECT_EQ(timelock_->GetEntryState(hash), TimelockEntryState::Queued);
}

// ============================================================================
// Execute
// ============================================================================

TEST_F(TimelockQueueTest, ExecuteOnlyInsideWindow) {
    TimelockCall call = MakeCall(T0 + params_.timelockDelay);
    Hash256 hash = QueueOrFail(call);

    util::SetMockTime(T0 + SECONDS_PER_HOUR);
    Status early = timelock_->ExecuteEntry(admin_, hash);
    EXPECT_EQ(early.code(), Status::NOT_READY);
    EXPECT_TRUE(early.IsRetryable());
    EXPECT_TRUE(target_.calls.empty());

    util::SetMockTime(call.eta + 8 * SECONDS_PER_DAY);
    Status late = timelock_->ExecuteEntry(admin_, hash);
    EXPECT_EQ(late.code(), Status::STALE_TRANSACTION);
    EXPECT_FALSE(late.IsRetryable());
    EXPECT_EQ(timelock_->GetEntryState(hash), TimelockEntryState::Expired);

    util::SetMockTime(call.eta + params_.gracePeriod);
    ASSERT_TRUE(timelock_->ExecuteEntry(admin_, hash).ok());
    EXPECT_EQ(timelock_->GetEntryState(hash), TimelockEntryState::Executed);
    EXPECT_EQ(timelock_->GetQueuedCount(), 0u);

    ASSERT_EQ(target_.calls.size(), 1u);
    EXPECT_EQ(target_.calls[0].caller, self_);
    EXPECT_EQ(target_.calls[0].value, 5);
    EXPECT_EQ(target_.calls[0].signature, call.signature);
    EXPECT_EQ(target_.calls[0].args, call.args);

    EXPECT_EQ(events_.back().type, TimelockEventType::ExecuteTransaction);
}

TEST_F(TimelockQueueTest, ExecuteTwiceIsMissing) {
    TimelockCall call = MakeCall(T0 + params_.timelockDelay);
    Hash256 hash = QueueOrFail(call);
    util::SetMockTime(call.eta);
    ASSERT_TRUE(timelock_->ExecuteEntry(admin_, hash).ok());
    EXPECT_EQ(timelock_->ExecuteEntry(admin_, hash).code(), Status::MISSING);
    EXPECT_EQ(target_.calls.size(), 1u);
}

TEST_F(TimelockQueueTest, ExecuteRequiresAdmin) {
    TimelockCall call = MakeCall(T0 + params_.timelockDelay);
    Hash256 hash = QueueOrFail(call);
    util::SetMockTime(call.eta);
    EXPECT_EQ(timelock_->ExecuteEntry(MakeAddress(2), hash).code(), Status::NOT_ADMIN);
    EXPECT_EQ(timelock_->GetEntryState(hash), TimelockEntryState::Queued);
}

TEST_F(TimelockQueueTest, RevertedCallStaysQueued) {
    TimelockCall call = MakeCall(T0 + params_.timelockDelay);
    Hash256 hash = QueueOrFail(call);
    util::SetMockTime(call.eta);

    target_.fail = true;
    Status s = timelock_->ExecuteEntry(admin_, hash);
    EXPECT_EQ(s.code(), Status::CALL_REVERTED);
    EXPECT_EQ(s.ToString(), "CallReverted: target failed");
    EXPECT_EQ(timelock_->GetEntryState(hash), TimelockEntryState::Queued);

    target_.fail = false;
    EXPECT_TRUE(timelock_->ExecuteEntry(admin_, hash).ok());
    EXPECT_EQ(target_.calls.size(), 1u);
}

TEST_F(TimelockQueueTest, TargetRefusalReportedBeforeCall) {
    TimelockCall call = MakeCall(T0 + params_.timelockDelay);
    Hash256 hash = QueueOrFail(call);
    util::SetMockTime(call.eta);

    target_.refuseCheck = true;
    Status check = timelock_->CheckExecute(admin_, hash);
    EXPECT_EQ(check.code(), Status::CALL_REVERTED);
    EXPECT_EQ(check.ToString(), "CallReverted: WrongState: target refused");

    EXPECT_EQ(timelock_->ExecuteEntry(admin_, hash).code(), Status::CALL_REVERTED);
    EXPECT_TRUE(target_.calls.empty());
    EXPECT_EQ(timelock_->GetEntryState(hash), TimelockEntryState::Queued);
}

TEST_F(TimelockQueueTest, SuppliedClockIsUsedThroughout) {
    Timestamp now = T0 + 5;
    TimelockCall call = MakeCall(now + params_.timelockDelay);

    // The mock clock still reads T0, which would allow this eta too
    EXPECT_EQ(timelock_->CheckQueue(admin_, MakeCall(T0 + params_.timelockDelay), now).code(),
              Status::ETA_TOO_SOON);

    Hash256 hash;
    ASSERT_TRUE(timelock_->QueueEntry(admin_, call, now, &hash).ok());
    EXPECT_EQ(timelock_->GetEntry(hash)->queuedAt, now);

    EXPECT_EQ(timelock_->CheckExecute(admin_, hash, call.eta - 1).code(), Status::NOT_READY);
    EXPECT_EQ(timelock_->CheckExecute(admin_, hash, call.eta + params_.gracePeriod + 1).code(),
              Status::STALE_TRANSACTION);

    // Executable at eta even though the mock clock is two days behind
    ASSERT_TRUE(timelock_->ExecuteEntry(admin_, hash, call.eta).ok());
    EXPECT_EQ(target_.calls.size(), 1u);
}

TEST_F(TimelockQueueTest, UnknownTargetReverts) {
    TimelockCall call = MakeCall(T0 + params_.timelockDelay);
    call.target = MakeAddress(77);
    Hash256 hash = QueueOrFail(call);
    util::SetMockTime(call.eta);

    EXPECT_FALSE(timelock_->HasTarget(call.target));
    EXPECT_EQ(timelock_->ExecuteEntry(admin_, hash).code(), Status::CALL_REVERTED);
    EXPECT_EQ(timelock_->GetEntryState(hash), TimelockEntryState::Queued);
}

// ============================================================================
// Cancel
// ============================================================================

TEST_F(TimelockQueueTest, CanceledEntryCannotExecute) {
    TimelockCall call = MakeCall(T0 + params_.timelockDelay);
    Hash256 hash = QueueOrFail(call);

    EXPECT_EQ(timelock_->CancelEntry(MakeAddress(2), hash).code(), Status::NOT_ADMIN);
    ASSERT_TRUE(timelock_->CancelEntry(admin_, hash).ok());
    EXPECT_EQ(events_.back().type, TimelockEventType::CancelTransaction);

    util::SetMockTime(call.eta);
    EXPECT_EQ(timelock_->ExecuteEntry(admin_, hash).code(), Status::MISSING);
    EXPECT_EQ(timelock_->CancelEntry(admin_, hash).code(), Status::MISSING);
    EXPECT_TRUE(target_.calls.empty());
}

TEST_F(TimelockQueueTest, CancelUnknownIsMissing) {
    EXPECT_EQ(timelock_->CancelEntry(admin_, Hash256()).code(), Status::MISSING);
}

// ============================================================================
// Admin Handover
// ============================================================================

TEST_F(TimelockQueueTest, TwoStepHandover) {
    Address next = MakeAddress(3);

    EXPECT_EQ(timelock_->ChangeAdmin(next, next).code(), Status::NOT_ADMIN);
    EXPECT_EQ(timelock_->ChangeAdmin(admin_, Address()).code(), Status::INVALID_ADDRESS);
    EXPECT_EQ(timelock_->AcceptAdmin(next).code(), Status::NOT_PENDING_ADMIN);

    ASSERT_TRUE(timelock_->ChangeAdmin(admin_, next).ok());
    EXPECT_EQ(timelock_->GetPendingAdmin(), next);
    EXPECT_EQ(timelock_->GetAdmin(), admin_);
    EXPECT_EQ(events_.back().type, TimelockEventType::NewPendingAdmin);
    EXPECT_EQ(events_.back().admin, next);

    // The old admin keeps full rights until the handover completes
    EXPECT_TRUE(timelock_->QueueEntry(admin_, MakeCall(T0 + params_.timelockDelay)).ok());

    EXPECT_EQ(timelock_->AcceptAdmin(MakeAddress(4)).code(), Status::NOT_PENDING_ADMIN);
    ASSERT_TRUE(timelock_->AcceptAdmin(next).ok());
    EXPECT_EQ(timelock_->GetAdmin(), next);
    EXPECT_TRUE(timelock_->GetPendingAdmin().IsNull());
    EXPECT_EQ(events_.back().type, TimelockEventType::NewAdmin);

    EXPECT_EQ(timelock_->QueueEntry(admin_, MakeCall(T0 + params_.timelockDelay + 1)).code(),
              Status::NOT_ADMIN);
}

TEST_F(TimelockQueueTest, SetPendingAdminThroughQueuedSelfCall) {
    Address next = MakeAddress(3);

    TimelockCall call;
    call.target = self_;
    call.signature = SET_PENDING_ADMIN_SIGNATURE;
    call.args = EncodeAddressArg(next);
    call.eta = T0 + params_.timelockDelay;
    Hash256 hash = QueueOrFail(call);

    util::SetMockTime(call.eta);
    ASSERT_TRUE(timelock_->ExecuteEntry(admin_, hash).ok());
    EXPECT_EQ(timelock_->GetPendingAdmin(), next);
    EXPECT_TRUE(timelock_->AcceptAdmin(next).ok());
    EXPECT_EQ(timelock_->GetAdmin(), next);
}

TEST_F(TimelockQueueTest, SelfCallOnlyFromTimelock) {
    Address next = MakeAddress(3);
    EXPECT_EQ(timelock_->Call(admin_, 0, SET_PENDING_ADMIN_SIGNATURE,
                              EncodeAddressArg(next)).code(),
              Status::NOT_ADMIN);
    EXPECT_EQ(timelock_->Call(self_, 0, "acceptAdmin()", {}).code(), Status::CALL_REVERTED);
    EXPECT_EQ(timelock_->Call(self_, 0, SET_PENDING_ADMIN_SIGNATURE, {0x01}).code(),
              Status::INVALID_ADDRESS);
    EXPECT_TRUE(timelock_->GetPendingAdmin().IsNull());
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(TimelockQueueTest, EntrySerialization) {
    TimelockCall call = MakeCall(T0 + params_.timelockDelay);
    Hash256 hash = QueueOrFail(call);
    auto entry = timelock_->GetEntry(hash);
    ASSERT_TRUE(entry.has_value());

    auto bytes = entry->Serialize();
    auto decoded = TimelockEntry::Deserialize(bytes.data(), bytes.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->hash, hash);
    EXPECT_EQ(decoded->queuedAt, T0);
    EXPECT_EQ(decoded->call.args, call.args);
    EXPECT_FALSE(decoded->executed);
    EXPECT_FALSE(decoded->canceled);
}

TEST_F(TimelockQueueTest, RestoreReplacesState) {
    TimelockCall call = MakeCall(T0 + params_.timelockDelay);
    Hash256 hash = QueueOrFail(call);
    auto entries = timelock_->GetEntries();

    TimelockQueue restored(self_, MakeAddress(9), params_);
    restored.Restore(admin_, MakeAddress(3), entries);
    EXPECT_EQ(restored.GetAdmin(), admin_);
    EXPECT_EQ(restored.GetPendingAdmin(), MakeAddress(3));
    EXPECT_EQ(restored.GetEntryState(hash), TimelockEntryState::Queued);
    EXPECT_EQ(restored.QueueEntry(admin_, call).code(), Status::ALREADY_QUEUED);
}

} // namespace test
} // namespace governance
} // namespace equorum

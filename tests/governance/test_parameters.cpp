// EQUORUM - Parameter Registry Tests
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#include <gtest/gtest.h>

#include "equorum/governance/parameters.h"

#include <array>
#include <memory>

namespace equorum {
namespace governance {
namespace test {

class ParameterRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::array<Byte, 20> data{};
        data[0] = 0x42;
        timelock_ = Address(data);
        registry_ = std::make_unique<ParameterRegistry>(timelock_);
        ASSERT_TRUE(registry_->DefineParameter("staking.maxapy", 800, 0, 2000));
        ASSERT_TRUE(registry_->DefineParameter("faucet.cap", 50, 1, 1000));
    }

    Status Set(const std::string& name, int64_t value) {
        return registry_->Call(timelock_, 0, SET_PARAMETER_SIGNATURE,
                               EncodeSetParameterArgs(name, value));
    }

    Address timelock_;
    std::unique_ptr<ParameterRegistry> registry_;
};

TEST_F(ParameterRegistryTest, DefineRejectsDuplicatesAndBadBounds) {
    EXPECT_FALSE(registry_->DefineParameter("faucet.cap", 10, 1, 100));
    EXPECT_FALSE(registry_->DefineParameter("inverted", 5, 10, 1));
    EXPECT_FALSE(registry_->DefineParameter("outside", 50, 1, 10));
    EXPECT_FALSE(registry_->DefineParameter("", 0, 0, 0));

    auto names = registry_->GetNames();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "faucet.cap");
    EXPECT_EQ(names[1], "staking.maxapy");
}

TEST_F(ParameterRegistryTest, AuthorizedSetWithinBounds) {
    ASSERT_TRUE(Set("faucet.cap", 1000).ok());
    EXPECT_EQ(registry_->Get("faucet.cap").value_or(-1), 1000);

    auto def = registry_->GetDefinition("faucet.cap");
    ASSERT_TRUE(def.has_value());
    EXPECT_EQ(def->updates, 1u);
    EXPECT_EQ(def->minValue, 1);
    EXPECT_EQ(def->maxValue, 1000);
}

TEST_F(ParameterRegistryTest, OutOfBoundsReverts) {
    EXPECT_EQ(Set("faucet.cap", 1001).code(), Status::CALL_REVERTED);
    EXPECT_EQ(Set("faucet.cap", 0).code(), Status::CALL_REVERTED);
    EXPECT_EQ(registry_->Get("faucet.cap").value_or(-1), 50);
}

TEST_F(ParameterRegistryTest, CheckCallDoesNotApply) {
    EXPECT_TRUE(registry_->CheckCall(timelock_, 0, SET_PARAMETER_SIGNATURE,
                                     EncodeSetParameterArgs("faucet.cap", 500)).ok());
    EXPECT_EQ(registry_->Get("faucet.cap").value_or(-1), 50);
    EXPECT_EQ(registry_->GetDefinition("faucet.cap")->updates, 0u);

    // Same verdicts as Call
    EXPECT_EQ(registry_->CheckCall(timelock_, 0, SET_PARAMETER_SIGNATURE,
                                   EncodeSetParameterArgs("faucet.cap", 5000)).code(),
              Status::CALL_REVERTED);
    EXPECT_EQ(registry_->CheckCall(Address(), 0, SET_PARAMETER_SIGNATURE,
                                   EncodeSetParameterArgs("faucet.cap", 500)).code(),
              Status::NOT_ADMIN);
    EXPECT_EQ(registry_->CheckCall(timelock_, 0, SET_PARAMETER_SIGNATURE,
                                   EncodeSetParameterArgs("unknown", 1)).code(),
              Status::CALL_REVERTED);
}

TEST_F(ParameterRegistryTest, UnauthorizedCallerRejected) {
    Status s = registry_->Call(Address(), 0, SET_PARAMETER_SIGNATURE,
                               EncodeSetParameterArgs("faucet.cap", 60));
    EXPECT_EQ(s.code(), Status::NOT_ADMIN);
    EXPECT_EQ(registry_->Get("faucet.cap").value_or(-1), 50);
}

TEST_F(ParameterRegistryTest, MalformedCallsRevert) {
    EXPECT_EQ(Set("unknown", 1).code(), Status::CALL_REVERTED);
    EXPECT_EQ(registry_->Call(timelock_, 0, "setParameter(string)",
                              EncodeSetParameterArgs("faucet.cap", 60)).code(),
              Status::CALL_REVERTED);

    auto args = EncodeSetParameterArgs("faucet.cap", 60);
    args.pop_back();
    EXPECT_EQ(registry_->Call(timelock_, 0, SET_PARAMETER_SIGNATURE, args).code(),
              Status::CALL_REVERTED);

    args = EncodeSetParameterArgs("faucet.cap", 60);
    args.push_back(0);
    EXPECT_EQ(registry_->Call(timelock_, 0, SET_PARAMETER_SIGNATURE, args).code(),
              Status::CALL_REVERTED);

    EXPECT_FALSE(registry_->Get("unknown").has_value());
    EXPECT_EQ(registry_->GetDefinition("faucet.cap")->updates, 0u);
}

} // namespace test
} // namespace governance
} // namespace equorum

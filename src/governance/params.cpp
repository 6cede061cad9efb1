// EQUORUM - Governance Parameters Implementation
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#include "equorum/governance/params.h"
#include "equorum/util/config.h"
#include "equorum/util/time.h"

#include <sstream>
#include <stdexcept>

namespace equorum {
namespace governance {

namespace {

bool ReadDuration(const util::ConfigManager& config, const char* key,
                  Timestamp& out, std::string* error) {
    if (!config.HasKey(key, CONFIG_SECTION)) {
        return true;
    }
    auto value = config.TryGetDuration(key, CONFIG_SECTION);
    if (!value) {
        if (error) *error = std::string("invalid duration for ") + key;
        return false;
    }
    out = *value;
    return true;
}

template<typename T>
bool ReadInt(const util::ConfigManager& config, const char* key,
             T& out, std::string* error) {
    if (!config.HasKey(key, CONFIG_SECTION)) {
        return true;
    }
    auto value = config.TryGetInt(key, CONFIG_SECTION);
    if (!value || *value < 0) {
        if (error) *error = std::string("invalid non-negative integer for ") + key;
        return false;
    }
    out = static_cast<T>(*value);
    return true;
}

} // namespace

bool GovernanceParams::FromConfig(const util::ConfigManager& config,
                                  GovernanceParams& params, std::string* error) {
    if (!ReadInt(config, "proposalthreshold", params.proposalThreshold, error) ||
        !ReadInt(config, "minlockamount", params.minLockAmount, error) ||
        !ReadDuration(config, "minlockage", params.minLockAge, error) ||
        !ReadDuration(config, "votingdelay", params.votingDelay, error) ||
        !ReadDuration(config, "votingperiod", params.votingPeriod, error) ||
        !ReadInt(config, "quorumbps", params.quorumBps, error) ||
        !ReadDuration(config, "timelockdelay", params.timelockDelay, error) ||
        !ReadDuration(config, "graceperiod", params.gracePeriod, error) ||
        !ReadInt(config, "maxactions", params.maxActions, error)) {
        return false;
    }

    for (const auto& hex : config.GetList("excluded", CONFIG_SECTION)) {
        try {
            params.excluded.insert(Address::FromHex(hex));
        } catch (const std::invalid_argument&) {
            if (error) *error = "invalid excluded address: " + hex;
            return false;
        }
    }

    return params.Validate(error);
}

bool GovernanceParams::Validate(std::string* error) const {
    auto fail = [error](const std::string& msg) {
        if (error) *error = msg;
        return false;
    };

    if (minLockAmount <= 0) return fail("minlockamount must be positive");
    if (minLockAge < 0) return fail("minlockage must not be negative");
    if (votingDelay < 0) return fail("votingdelay must not be negative");
    if (votingPeriod <= 0) return fail("votingperiod must be positive");
    if (quorumBps == 0 || quorumBps > MAX_BPS) return fail("quorumbps must be in 1..10000");
    if (timelockDelay < 0) return fail("timelockdelay must not be negative");
    if (gracePeriod <= 0) return fail("graceperiod must be positive");
    if (maxActions == 0) return fail("maxactions must be at least 1");
    return true;
}

std::string GovernanceParams::ToString() const {
    std::ostringstream oss;
    oss << "GovernanceParams{threshold=" << proposalThreshold
        << ", minLock=" << minLockAmount
        << ", minLockAge=" << util::FormatDuration(minLockAge)
        << ", votingDelay=" << util::FormatDuration(votingDelay)
        << ", votingPeriod=" << util::FormatDuration(votingPeriod)
        << ", quorum=" << quorumBps << "bps"
        << ", timelockDelay=" << util::FormatDuration(timelockDelay)
        << ", grace=" << util::FormatDuration(gracePeriod)
        << ", maxActions=" << maxActions
        << ", excluded=" << excluded.size() << "}";
    return oss.str();
}

} // namespace governance
} // namespace equorum

// EQUORUM - Governance Parameters
// Copyright (c) 2024 EQUORUM Developers
// MIT License
//
// Tunables of the proposal and timelock pipeline. Every value is
// configurable through the [governance] section of equorum.conf.

#ifndef EQUORUM_GOVERNANCE_PARAMS_H
#define EQUORUM_GOVERNANCE_PARAMS_H

#include "equorum/core/types.h"

#include <cstdint>
#include <set>
#include <string>

namespace equorum {

namespace util {
class ConfigManager;
}

namespace governance {

// ============================================================================
// Governance Defaults
// ============================================================================

/// Voting power needed to propose (= sqrt(10,000 tokens in minor units))
constexpr uint64_t DEFAULT_PROPOSAL_THRESHOLD = 1000000;

/// Minimum size of a lock (100 tokens)
constexpr Amount DEFAULT_MIN_LOCK_AMOUNT = 100 * COIN;

/// Age a lock must reach before it confers standing (7 days)
constexpr Timestamp DEFAULT_MIN_LOCK_AGE = 7 * SECONDS_PER_DAY;

/// Gap between proposal creation and the start of voting
constexpr Timestamp DEFAULT_VOTING_DELAY = 0;

/// Length of the voting window (7 days)
constexpr Timestamp DEFAULT_VOTING_PERIOD = 7 * SECONDS_PER_DAY;

/// Share of the total locked amount whose square root is the quorum (4%)
constexpr uint32_t DEFAULT_QUORUM_BPS = 400;

/// Minimum timelock delay (48 hours)
constexpr Timestamp DEFAULT_TIMELOCK_DELAY = 48 * SECONDS_PER_HOUR;

/// Window after eta during which an entry stays executable (7 days)
constexpr Timestamp DEFAULT_GRACE_PERIOD = 7 * SECONDS_PER_DAY;

/// Maximum number of actions in one proposal
constexpr uint32_t DEFAULT_MAX_ACTIONS = 10;

constexpr uint32_t MAX_BPS = 10000;

/// Config section holding governance keys
constexpr const char* CONFIG_SECTION = "governance";

// ============================================================================
// Parameters
// ============================================================================

struct GovernanceParams {
    uint64_t proposalThreshold{DEFAULT_PROPOSAL_THRESHOLD};
    Amount minLockAmount{DEFAULT_MIN_LOCK_AMOUNT};
    Timestamp minLockAge{DEFAULT_MIN_LOCK_AGE};
    Timestamp votingDelay{DEFAULT_VOTING_DELAY};
    Timestamp votingPeriod{DEFAULT_VOTING_PERIOD};
    uint32_t quorumBps{DEFAULT_QUORUM_BPS};
    Timestamp timelockDelay{DEFAULT_TIMELOCK_DELAY};
    Timestamp gracePeriod{DEFAULT_GRACE_PERIOD};
    uint32_t maxActions{DEFAULT_MAX_ACTIONS};

    /// Principals that may never lock, propose or vote (e.g. the genesis vesting reserve)
    std::set<Address> excluded;

    /**
     * Overlay values from the [governance] config section onto the defaults.
     * @param error Receives a description of the first bad key
     * @return false if a key is present but malformed
     */
    static bool FromConfig(const util::ConfigManager& config,
                           GovernanceParams& params, std::string* error);

    /// Check internal consistency
    bool Validate(std::string* error) const;

    std::string ToString() const;
};

} // namespace governance
} // namespace equorum

#endif // EQUORUM_GOVERNANCE_PARAMS_H

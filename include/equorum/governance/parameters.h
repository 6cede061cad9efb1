// EQUORUM - Governed Parameter Registry
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#ifndef EQUORUM_GOVERNANCE_PARAMETERS_H
#define EQUORUM_GOVERNANCE_PARAMETERS_H

#include "equorum/core/types.h"
#include "equorum/governance/collaborator.h"
#include "equorum/governance/status.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace equorum {
namespace governance {

constexpr const char* SET_PARAMETER_SIGNATURE = "setParameter(string,int64)";

/// Encode the arguments of setParameter(string,int64)
std::vector<Byte> EncodeSetParameterArgs(const std::string& name, int64_t value);

/// A named protocol parameter with inclusive bounds
struct ParameterDefinition {
    std::string name;
    int64_t value{0};
    int64_t minValue{0};
    int64_t maxValue{0};

    /// Number of governed updates applied
    uint32_t updates{0};
};

/**
 * Bounded protocol parameters owned by governance.
 *
 * External collaborators (staking APY bounds, faucet caps, ...) read their
 * settings from here. Values only change through setParameter calls made
 * by the authorized caller, which in a deployment is the timelock.
 */
class ParameterRegistry : public CallTarget {
public:
    explicit ParameterRegistry(const Address& authorizedCaller);

    /// Add a parameter. Returns false if the name exists or the bounds are inconsistent.
    bool DefineParameter(const std::string& name, int64_t initial,
                         int64_t minValue, int64_t maxValue);

    std::optional<int64_t> Get(const std::string& name) const;
    std::optional<ParameterDefinition> GetDefinition(const std::string& name) const;
    std::vector<std::string> GetNames() const;

    const Address& GetAuthorizedCaller() const { return authorized_; }

    /// Decodes and bounds-checks setParameter(string,int64) without applying it
    Status CheckCall(const Address& caller, Amount value,
                     const std::string& signature,
                     const std::vector<Byte>& args) const override;

    /// Handles setParameter(string,int64); out-of-bounds values revert
    Status Call(const Address& caller, Amount value,
                const std::string& signature,
                const std::vector<Byte>& args) override;

private:
    Status CheckCallLocked(const Address& caller, const std::string& signature,
                           const std::vector<Byte>& args,
                           std::string* name, int64_t* newValue) const;

    const Address authorized_;

    mutable std::mutex mutex_;
    std::map<std::string, ParameterDefinition> params_;
};

} // namespace governance
} // namespace equorum

#endif // EQUORUM_GOVERNANCE_PARAMETERS_H

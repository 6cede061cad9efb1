// EQUORUM - Governed Parameter Registry Implementation
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#include "equorum/governance/parameters.h"
#include "equorum/core/serialize.h"
#include "equorum/util/logging.h"

namespace equorum {
namespace governance {

std::vector<Byte> EncodeSetParameterArgs(const std::string& name, int64_t value) {
    DataStream ss;
    ss << name << value;
    return ss.Bytes();
}

ParameterRegistry::ParameterRegistry(const Address& authorizedCaller)
    : authorized_(authorizedCaller) {}

bool ParameterRegistry::DefineParameter(const std::string& name, int64_t initial,
                                        int64_t minValue, int64_t maxValue) {
    if (name.empty() || minValue > maxValue || initial < minValue || initial > maxValue) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (params_.count(name)) {
        return false;
    }
    params_[name] = ParameterDefinition{name, initial, minValue, maxValue, 0};
    return true;
}

std::optional<int64_t> ParameterRegistry::Get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = params_.find(name);
    if (it == params_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

std::optional<ParameterDefinition> ParameterRegistry::GetDefinition(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = params_.find(name);
    if (it == params_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> ParameterRegistry::GetNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, def] : params_) {
        names.push_back(name);
    }
    return names;
}

Status ParameterRegistry::CheckCallLocked(const Address& caller, const std::string& signature,
                                          const std::vector<Byte>& args,
                                          std::string* name, int64_t* newValue) const {
    if (caller != authorized_) {
        return Status::Error(Status::NOT_ADMIN, ShortAddress(caller) + " may not set parameters");
    }
    if (signature != SET_PARAMETER_SIGNATURE) {
        return Status::Error(Status::CALL_REVERTED, "unknown signature " + signature);
    }

    try {
        DataStream ss(args);
        ss >> *name >> *newValue;
        if (!ss.empty()) {
            return Status::Error(Status::CALL_REVERTED, "trailing argument data");
        }
    } catch (const std::ios_base::failure& e) {
        return Status::Error(Status::CALL_REVERTED, std::string("malformed arguments: ") + e.what());
    }

    auto it = params_.find(*name);
    if (it == params_.end()) {
        return Status::Error(Status::CALL_REVERTED, "unknown parameter " + *name);
    }
    const ParameterDefinition& def = it->second;
    if (*newValue < def.minValue || *newValue > def.maxValue) {
        return Status::Error(Status::CALL_REVERTED,
                             *name + "=" + std::to_string(*newValue) + " outside [" +
                             std::to_string(def.minValue) + ", " +
                             std::to_string(def.maxValue) + "]");
    }
    return Status::Ok();
}

Status ParameterRegistry::CheckCall(const Address& caller, Amount /*value*/,
                                    const std::string& signature,
                                    const std::vector<Byte>& args) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string name;
    int64_t newValue = 0;
    return CheckCallLocked(caller, signature, args, &name, &newValue);
}

Status ParameterRegistry::Call(const Address& caller, Amount /*value*/,
                               const std::string& signature,
                               const std::vector<Byte>& args) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string name;
    int64_t newValue = 0;
    Status s = CheckCallLocked(caller, signature, args, &name, &newValue);
    if (!s.ok()) {
        return s;
    }

    ParameterDefinition& def = params_[name];
    LOG_INFO(util::LogCategory::GOV) << "Parameter " << name << ": " << def.value
                                     << " -> " << newValue;
    def.value = newValue;
    ++def.updates;
    return Status::Ok();
}

} // namespace governance
} // namespace equorum

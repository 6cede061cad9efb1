// EQUORUM - Serialization Implementation
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#include "equorum/core/serialize.h"
#include "equorum/core/hex.h"

namespace equorum {

std::string DataStream::ToHex() const {
    return BytesToHex(data(), size());
}

} // namespace equorum

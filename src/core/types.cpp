// EQUORUM - Core Types Implementation
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#include "equorum/core/types.h"
#include "equorum/core/hex.h"

#include <stdexcept>

namespace equorum {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }

    std::vector<Byte> bytes = HexToBytes(digits);
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

std::string ShortAddress(const Address& addr) {
    return "0x" + addr.ToHex().substr(0, 8) + "...";
}

} // namespace equorum

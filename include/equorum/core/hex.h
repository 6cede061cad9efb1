// EQUORUM - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#ifndef EQUORUM_CORE_HEX_H
#define EQUORUM_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace equorum {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Convert hex string to bytes.
/// @throws std::invalid_argument on odd length or a non-hex character
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Check if string is non-empty, even-length hex
bool IsValidHex(const std::string& str);

} // namespace equorum

#endif // EQUORUM_CORE_HEX_H

// EQUORUM - Core Types Header
// Copyright (c) 2024 EQUORUM Developers
// MIT License
//
// This file defines fundamental types used throughout EQUORUM.

#ifndef EQUORUM_CORE_TYPES_H
#define EQUORUM_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace equorum {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token amount in minor units. Signed so that negative inputs are detectable.
using Amount = int64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// One whole token in minor units
constexpr Amount COIN = 100000000LL;

/// Common durations in seconds
constexpr Timestamp SECONDS_PER_HOUR = 60 * 60;
constexpr Timestamp SECONDS_PER_DAY = 24 * SECONDS_PER_HOUR;

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-width opaque byte string used for content hashes and identities
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes; short input is zero-padded
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    /// Lexicographic byte order, so that map iteration matches hex order
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Lowercase hex in storage byte order
    std::string ToHex() const;

    /// Parse hex (an optional "0x" prefix is accepted).
    /// @throws std::invalid_argument on bad length or characters
    static BaseHash FromHex(const std::string& hex);

    std::vector<Byte> ToVector() const {
        return std::vector<Byte>(data_.begin(), data_.end());
    }

private:
    std::array<Byte, SIZE> data_;
};

/// 256-bit hash (content hashes of timelock entries)
using Hash256 = BaseHash<256>;

/// 160-bit identifier
using Hash160 = BaseHash<160>;

/// Identity of a principal, a call target or a governance component
using Address = Hash160;

/// Short form of an address for log output ("0x1234abcd...")
std::string ShortAddress(const Address& addr);

} // namespace equorum

#endif // EQUORUM_CORE_TYPES_H

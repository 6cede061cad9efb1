// EQUORUM - SHA256 Hash Function
// Copyright (c) 2024 EQUORUM Developers
// MIT License
//
// Incremental SHA-256 backed by the OpenSSL EVP digest interface.

#ifndef EQUORUM_CRYPTO_SHA256_H
#define EQUORUM_CRYPTO_SHA256_H

#include "equorum/core/types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace equorum {

/// SHA-256 hasher class
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// @throws std::runtime_error if the digest context cannot be created
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Append data to the running digest
    SHA256& Write(const Byte* data, size_t len);

    /// Finalize the hash into hash[OUTPUT_SIZE]. The hasher is reset afterwards.
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

} // namespace equorum

#endif // EQUORUM_CRYPTO_SHA256_H

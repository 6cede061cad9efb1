// EQUORUM - SHA256 Tests
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#include <gtest/gtest.h>

#include "equorum/crypto/sha256.h"

#include <string>

namespace equorum {
namespace test {

namespace {

std::vector<Byte> Bytes(const std::string& s) {
    return std::vector<Byte>(s.begin(), s.end());
}

} // namespace

TEST(SHA256Test, EmptyInput) {
    EXPECT_EQ(SHA256Hash(std::vector<Byte>()).ToHex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, KnownVector) {
    EXPECT_EQ(SHA256Hash(Bytes("abc")).ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, IncrementalMatchesOneShot) {
    std::vector<Byte> a = Bytes("abcdbcdecdefdefgefghfghighij");
    std::vector<Byte> b = Bytes("hijkijkljklmklmnlmnomnopnopq");

    SHA256 hasher;
    hasher.Write(a.data(), a.size()).Write(b.data(), b.size());
    Byte out[SHA256::OUTPUT_SIZE];
    hasher.Finalize(out);

    EXPECT_EQ(Hash256(out, sizeof(out)).ToHex(),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256Test, FinalizeResets) {
    std::vector<Byte> data = Bytes("abc");
    SHA256 hasher;

    Byte first[SHA256::OUTPUT_SIZE];
    hasher.Write(data.data(), data.size());
    hasher.Finalize(first);

    Byte second[SHA256::OUTPUT_SIZE];
    hasher.Write(data.data(), data.size());
    hasher.Finalize(second);

    EXPECT_EQ(Hash256(first, sizeof(first)), Hash256(second, sizeof(second)));
}

TEST(SHA256Test, ResetDiscardsInput) {
    std::vector<Byte> junk = Bytes("junk");
    std::vector<Byte> data = Bytes("abc");

    SHA256 hasher;
    hasher.Write(junk.data(), junk.size());
    hasher.Reset().Write(data.data(), data.size());
    Byte out[SHA256::OUTPUT_SIZE];
    hasher.Finalize(out);

    EXPECT_EQ(Hash256(out, sizeof(out)), SHA256Hash(data));
}

} // namespace test
} // namespace equorum

// NODEREWARD - SHA256 Tests
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include <gtest/gtest.h>
#include "nodereward/crypto/sha256.h"
#include "nodereward/core/types.h"

#include <string>
#include <vector>

namespace nodereward {
namespace test {

namespace {

std::vector<Byte> Bytes(const std::string& text) {
    return std::vector<Byte>(text.begin(), text.end());
}

} // namespace

TEST(SHA256Test, EmptyInput) {
    EXPECT_EQ(SHA256Hash(std::vector<Byte>()).ToHex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    EXPECT_EQ(SHA256Hash(Bytes("abc")).ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, IncrementalMatchesOneShot) {
    std::vector<Byte> data = Bytes("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq");

    SHA256 hasher;
    hasher.Write(data.data(), 10).Write(data.data() + 10, data.size() - 10);
    Byte out[SHA256::OUTPUT_SIZE];
    hasher.Finalize(out);

    Hash256 incremental(out, sizeof(out));
    EXPECT_EQ(incremental, SHA256Hash(data));
    EXPECT_EQ(incremental.ToHex(),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256Test, ResetStartsOver) {
    SHA256 hasher;
    std::vector<Byte> junk = Bytes("junk");
    hasher.Write(junk.data(), junk.size());
    hasher.Reset();

    std::vector<Byte> abc = Bytes("abc");
    hasher.Write(abc.data(), abc.size());
    Byte out[SHA256::OUTPUT_SIZE];
    hasher.Finalize(out);
    EXPECT_EQ(Hash256(out, sizeof(out)), SHA256Hash(abc));
}

} // namespace test
} // namespace nodereward

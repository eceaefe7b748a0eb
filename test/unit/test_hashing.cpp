// test/unit/test_hashing.cpp
// -----------------------------------------------------------
// SHA-256 digests and file id derivation.

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "util/hashing.hpp"

namespace {

using namespace portal::util::hashing;

TEST(HashingTest, KnownDigests) {
    std::string abc = "abc";
    EXPECT_EQ(sha256(reinterpret_cast<const uint8_t*>(abc.data()), abc.size()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256(std::vector<uint8_t>()),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashingTest, FileDigestMatchesBufferDigest) {
    const std::string file = "hashing_test_input.bin";
    std::vector<uint8_t> content(5000);
    for (size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<uint8_t>(i % 251);
    }
    {
        std::ofstream out(file, std::ios::binary);
        out.write(reinterpret_cast<const char*>(content.data()), (std::streamsize)content.size());
    }
    EXPECT_EQ(sha256File(file), sha256(content));
    std::remove(file.c_str());
}

TEST(HashingTest, MissingFileThrows) {
    EXPECT_THROW(sha256File("no_such_file_for_hashing.bin"), std::runtime_error);
}

// The id is the first digest byte
TEST(HashingTest, FileIdFromDigest) {
    EXPECT_EQ(fileIdFromDigest("ba7816bf8f01cfea"), 0xba);
    EXPECT_EQ(fileIdFromDigest("e3b0c442"), 0xe3);
    EXPECT_EQ(fileIdFromDigest("00ff"), 0x00);
    EXPECT_EQ(fileIdFromDigest("FF"), 0xff);
    EXPECT_THROW(fileIdFromDigest("a"), std::invalid_argument);
    EXPECT_THROW(fileIdFromDigest("zz00"), std::invalid_argument);
}

} // namespace

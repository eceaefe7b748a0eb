// test/unit/test_slave.cpp
// -----------------------------------------------------------
// Receiver state machine: reassembly order, digest gate, unknown ids,
// drop idempotence and the atomic commit into the storage directory.

#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

#include "network/framed.hpp"
#include "network/socket.hpp"
#include "protocol/messages.hpp"
#include "transfer/slave.hpp"
#include "util/hashing.hpp"

namespace {

namespace fs = std::filesystem;
using namespace portal::protocol;
using portal::transfer::Slave;

class SlaveTest : public ::testing::Test {
  protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("portal_slave_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
               "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    static std::vector<uint8_t> bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    static FileMetadata metadataFor(const std::string& name, const std::vector<uint8_t>& content) {
        std::string digest = portal::util::hashing::sha256(content);
        return FileMetadata{portal::util::hashing::fileIdFromDigest(digest), name, digest};
    }

    std::string readFile(const std::string& name) const {
        std::ifstream in(dir / name, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    fs::path dir;
};

TEST_F(SlaveTest, PingAnswersPong) {
    Slave slave(dir.string());
    EXPECT_TRUE(std::holds_alternative<Pong>(slave.handleRequest(Ping{})));
}

// Fragments are concatenated by index, not by arrival
TEST_F(SlaveTest, ReassemblesOutOfOrderFragments) {
    std::vector<uint8_t> content = bytes("hello world");
    FileMetadata meta = metadataFor("hello.txt", content);
    Slave slave(dir.string());

    EXPECT_EQ(slave.handleRequest(meta), Response(Ok{}));
    EXPECT_TRUE(slave.hasTransfer(meta.fileId));
    EXPECT_EQ(slave.handleRequest(FileFragment{meta.fileId, 1, bytes(" world")}), Response(Ok{}));
    EXPECT_EQ(slave.handleRequest(FileFragment{meta.fileId, 0, bytes("hello")}), Response(Ok{}));
    EXPECT_EQ(slave.handleRequest(EndOfFile{meta.fileId}), Response(Ok{}));

    EXPECT_EQ(readFile("hello.txt"), "hello world");
    EXPECT_FALSE(slave.hasTransfer(meta.fileId));
    EXPECT_FALSE(fs::exists(dir / ".hello.txt.part"));
}

// Every arrival order of a 1477/1477/1477/569 split yields the in-order bytes
TEST_F(SlaveTest, ReassemblesEveryArrivalOrder) {
    std::vector<uint8_t> content(5000);
    for (size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<uint8_t>((i * 7 + i / 251) % 256);
    }
    std::vector<FileFragment> fragments;
    for (size_t offset = 0, index = 0; offset < content.size(); offset += 1477, ++index) {
        size_t end = std::min(content.size(), offset + 1477);
        fragments.push_back(FileFragment{0, (uint32_t)index,
                                         std::vector<uint8_t>(content.begin() + offset,
                                                              content.begin() + end)});
    }
    ASSERT_EQ(fragments.size(), (size_t)4);
    ASSERT_EQ(fragments.back().data.size(), (size_t)569);

    FileMetadata meta = metadataFor("shuffled.bin", content);
    const std::string expected(content.begin(), content.end());
    Slave slave(dir.string());

    std::vector<size_t> order = {0, 1, 2, 3};
    size_t permutations = 0;
    do {
        ASSERT_EQ(slave.handleRequest(meta), Response(Ok{}));
        for (size_t i : order) {
            FileFragment fragment = fragments[i];
            fragment.fileId = meta.fileId;
            ASSERT_EQ(slave.handleRequest(fragment), Response(Ok{}));
        }
        ASSERT_EQ(slave.handleRequest(EndOfFile{meta.fileId}), Response(Ok{}))
            << "order " << order[0] << order[1] << order[2] << order[3];
        EXPECT_EQ(readFile("shuffled.bin"), expected);
        ++permutations;
    } while (std::next_permutation(order.begin(), order.end()));
    EXPECT_EQ(permutations, (size_t)24);
}

TEST_F(SlaveTest, EmptyFileIsCommitted) {
    std::vector<uint8_t> content;
    FileMetadata meta = metadataFor("empty.bin", content);
    Slave slave(dir.string());

    slave.handleRequest(meta);
    EXPECT_EQ(slave.handleRequest(EndOfFile{meta.fileId}), Response(Ok{}));
    ASSERT_TRUE(fs::exists(dir / "empty.bin"));
    EXPECT_EQ(fs::file_size(dir / "empty.bin"), (uintmax_t)0);
}

// Nothing is written unless the digest matches
TEST_F(SlaveTest, ChecksumMismatchWritesNothing) {
    FileMetadata meta = metadataFor("bad.txt", bytes("expected"));
    Slave slave(dir.string());

    slave.handleRequest(meta);
    slave.handleRequest(FileFragment{meta.fileId, 0, bytes("tampered")});
    EXPECT_EQ(slave.handleRequest(EndOfFile{meta.fileId}), Response(ChecksumNotMatched{meta.fileId}));

    EXPECT_FALSE(fs::exists(dir / "bad.txt"));
    EXPECT_FALSE(slave.hasTransfer(meta.fileId));
    // The id is forgotten, so a late fragment is unknown
    EXPECT_EQ(slave.handleRequest(FileFragment{meta.fileId, 1, bytes("x")}),
              Response(FileIdNotFound{meta.fileId}));
}

TEST_F(SlaveTest, UnknownIdsAreReported) {
    Slave slave(dir.string());
    EXPECT_EQ(slave.handleRequest(FileFragment{42, 0, bytes("data")}), Response(FileIdNotFound{42}));
    EXPECT_EQ(slave.handleRequest(EndOfFile{42}), Response(FileIdNotFound{42}));
    EXPECT_EQ(slave.openTransfers(), (size_t)0);
}

TEST_F(SlaveTest, DropIsIdempotent) {
    FileMetadata meta = metadataFor("drop.txt", bytes("abc"));
    Slave slave(dir.string());

    slave.handleRequest(meta);
    slave.handleRequest(FileFragment{meta.fileId, 0, bytes("ab")});
    EXPECT_EQ(slave.handleRequest(DropFile{meta.fileId}), Response(Ok{}));
    EXPECT_EQ(slave.handleRequest(DropFile{meta.fileId}), Response(Ok{}));
    EXPECT_EQ(slave.handleRequest(DropFile{77}), Response(Ok{}));
    EXPECT_EQ(slave.openTransfers(), (size_t)0);
    EXPECT_FALSE(fs::exists(dir / "drop.txt"));
}

// A dropped id can be reused from scratch
TEST_F(SlaveTest, AbortThenReuseId) {
    std::vector<uint8_t> content = bytes("second attempt");
    FileMetadata meta = metadataFor("retry.txt", content);
    Slave slave(dir.string());

    slave.handleRequest(meta);
    slave.handleRequest(FileFragment{meta.fileId, 0, bytes("stale bytes")});
    slave.handleRequest(DropFile{meta.fileId});

    slave.handleRequest(meta);
    slave.handleRequest(FileFragment{meta.fileId, 0, content});
    EXPECT_EQ(slave.handleRequest(EndOfFile{meta.fileId}), Response(Ok{}));
    EXPECT_EQ(readFile("retry.txt"), "second attempt");
}

// Metadata for an id already open starts over
TEST_F(SlaveTest, MetadataResetsOpenTransfer) {
    std::vector<uint8_t> content = bytes("fresh");
    FileMetadata meta = metadataFor("reset.txt", content);
    Slave slave(dir.string());

    slave.handleRequest(meta);
    slave.handleRequest(FileFragment{meta.fileId, 0, bytes("old")});
    slave.handleRequest(meta);
    slave.handleRequest(FileFragment{meta.fileId, 0, content});
    EXPECT_EQ(slave.handleRequest(EndOfFile{meta.fileId}), Response(Ok{}));
    EXPECT_EQ(readFile("reset.txt"), "fresh");
}

TEST_F(SlaveTest, ExistingFileIsReplaced) {
    fs::create_directories(dir);
    {
        std::ofstream out(dir / "notes.txt");
        out << "previous version";
    }
    std::vector<uint8_t> content = bytes("new");
    FileMetadata meta = metadataFor("notes.txt", content);
    Slave slave(dir.string());

    slave.handleRequest(meta);
    slave.handleRequest(FileFragment{meta.fileId, 0, content});
    EXPECT_EQ(slave.handleRequest(EndOfFile{meta.fileId}), Response(Ok{}));
    EXPECT_EQ(readFile("notes.txt"), "new");
}

// Path components sent by the peer never leave the storage directory
TEST_F(SlaveTest, DisplayNameIsSanitized) {
    EXPECT_EQ(Slave::sanitizeFileName("a/b/c.txt"), "c.txt");
    EXPECT_EQ(Slave::sanitizeFileName("../../etc/passwd"), "passwd");
    EXPECT_EQ(Slave::sanitizeFileName(""), "Untitled");
    EXPECT_EQ(Slave::sanitizeFileName(".."), "Untitled");
    EXPECT_EQ(Slave::sanitizeFileName("dir/"), "Untitled");

    std::vector<uint8_t> content = bytes("payload");
    FileMetadata meta = metadataFor("../escape.txt", content);
    Slave slave(dir.string());
    slave.handleRequest(meta);
    slave.handleRequest(FileFragment{meta.fileId, 0, content});
    EXPECT_EQ(slave.handleRequest(EndOfFile{meta.fileId}), Response(Ok{}));
    EXPECT_TRUE(fs::exists(dir / "escape.txt"));
    EXPECT_FALSE(fs::exists(dir.parent_path() / "escape.txt"));
}

TEST_F(SlaveTest, UnwritableDirectoryReportsCannotSave) {
    fs::create_directories(dir);
    fs::path blocker = dir / "not_a_dir";
    {
        std::ofstream out(blocker);
        out << "x";
    }
    std::vector<uint8_t> content = bytes("data");
    FileMetadata meta = metadataFor("file.txt", content);
    Slave slave((blocker / "inbox").string());

    slave.handleRequest(meta);
    slave.handleRequest(FileFragment{meta.fileId, 0, content});
    EXPECT_EQ(slave.handleRequest(EndOfFile{meta.fileId}), Response(CannotSaveFile{meta.fileId}));
}

// One response per request, in request order, over a real stream
TEST_F(SlaveTest, RunAnswersEveryRequest) {
    auto pair = portal::network::Stream::connectedPair();
    std::thread server([&]() {
        Slave slave(dir.string());
        slave.run(pair.second);
    });

    auto halves = pair.first.split();
    portal::network::FramedWriter<Request> writer(std::move(halves.second));
    portal::network::FramedReader<Response> reader(std::move(halves.first));

    std::vector<uint8_t> content = bytes("over the wire");
    FileMetadata meta = metadataFor("wire.txt", content);
    writer.send(Ping{});
    writer.send(meta);
    writer.send(FileFragment{meta.fileId, 0, content});
    writer.send(EndOfFile{meta.fileId});
    writer.send(EndOfFile{meta.fileId});
    writer.shutdownWrite();

    std::vector<Response> expected = {Pong{}, Ok{}, Ok{}, Ok{}, FileIdNotFound{meta.fileId}};
    for (const auto& want : expected) {
        std::optional<Response> got = reader.next();
        ASSERT_TRUE(got.has_value());
        EXPECT_EQ(*got, want);
    }
    EXPECT_FALSE(reader.next().has_value());
    server.join();

    EXPECT_EQ(readFile("wire.txt"), "over the wire");
}

} // namespace

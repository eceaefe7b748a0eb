// test/integration/test_transfer_integration.cpp
// -----------------------------------------------------------
// Sender and receiver talking over loopback TCP, the way two peers on a
// LAN would after discovery.

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

#include "network/socket.hpp"
#include "protocol/error.hpp"
#include "protocol/messages.hpp"
#include "transfer/master.hpp"
#include "transfer/slave_server.hpp"
#include "util/channel.hpp"

namespace {

namespace fs = std::filesystem;
using namespace portal::protocol;
using namespace portal::transfer;
using portal::network::SocketAddress;

// Drains responses on its own thread; a transport failure is kept in @p error
std::thread startResponseReader(Master& master, portal::util::Sender<Response> sink,
                                std::string& error) {
    return std::thread([&master, sink, &error]() {
        try {
            master.recvResponses(sink);
        } catch (const PortalError& ex) {
            error = ex.what();
        }
    });
}

class TransferIntegrationTest : public ::testing::Test {
  protected:
    void SetUp() override {
        base = fs::temp_directory_path() /
               (std::string("portal_it_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(base);
        fs::create_directories(base / "outbox");
        server = std::make_unique<SlaveServer>((base / "inbox").string());
        server->start("127.0.0.1", 0);
    }

    void TearDown() override {
        server->stop();
        std::error_code ec;
        fs::remove_all(base, ec);
    }

    std::string writeFile(const std::string& name, size_t size) {
        std::string content;
        for (size_t i = 0; i < size; ++i) {
            content.push_back(static_cast<char>('a' + (i % 26)));
        }
        fs::path path = base / "outbox" / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path.string();
    }

    std::string readInbox(const std::string& name) {
        std::ifstream in(base / "inbox" / name, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    fs::path base;
    std::unique_ptr<SlaveServer> server;
};

TEST_F(TransferIntegrationTest, FileArrivesIntact) {
    std::string path = writeFile("report.txt", 5000);
    std::unique_ptr<Master> master = Master::connect(SocketAddress{"127.0.0.1", server->port()});

    auto responses = portal::util::makeChannel<Response>();
    std::string readerError;
    std::thread reader = startResponseReader(*master, responses.first, readerError);
    responses.first = portal::util::Sender<Response>();

    TransferHandle handle = master->sendFile(path);
    std::optional<TransferOutcome> outcome = handle.result.recv();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, TransferOutcome::Status::Completed);
    EXPECT_EQ(outcome->fragmentsSent, (uint32_t)4);

    // FileMetadata, four fragments and EndOfFile are each acknowledged
    for (int i = 0; i < 6; ++i) {
        std::optional<Response> response = responses.second.recvFor(std::chrono::seconds(5));
        ASSERT_TRUE(response.has_value()) << "missing response " << i;
        EXPECT_EQ(*response, Response(Ok{}));
    }
    std::string received = readInbox("report.txt");
    EXPECT_EQ(received.size(), (size_t)5000);
    EXPECT_EQ(received.substr(0, 26), "abcdefghijklmnopqrstuvwxyz");
    EXPECT_FALSE(fs::exists(base / "inbox" / ".report.txt.part"));

    master->ping();
    std::optional<Response> pong = responses.second.recvFor(std::chrono::seconds(5));
    ASSERT_TRUE(pong.has_value());
    EXPECT_TRUE(std::holds_alternative<Pong>(*pong));

    master->close();
    reader.join();
    EXPECT_EQ(readerError, "");
    EXPECT_FALSE(responses.second.recv().has_value());
}

// An aborted transfer leaves nothing behind on the receiver
TEST_F(TransferIntegrationTest, AbortedTransferLeavesNoFile) {
    std::string path = writeFile("cancelled.bin", 8000);
    MasterOptions options;
    options.pauseBackoff = std::chrono::milliseconds(10);
    std::unique_ptr<Master> master =
        Master::connect(SocketAddress{"127.0.0.1", server->port()}, options);

    auto responses = portal::util::makeChannel<Response>();
    std::string readerError;
    std::thread reader = startResponseReader(*master, responses.first, readerError);
    responses.first = portal::util::Sender<Response>();

    auto control = portal::util::makeChannel<TaskControl>();
    control.first.send(TaskControl::Paused);
    TransferOutcome outcome;
    std::thread job([&]() { outcome = master->runTransfer(path, control.second); });

    // FileMetadata is acknowledged while the transfer sits paused
    std::optional<Response> metaAck = responses.second.recvFor(std::chrono::seconds(5));
    ASSERT_TRUE(metaAck.has_value());
    EXPECT_EQ(*metaAck, Response(Ok{}));

    control.first.send(TaskControl::Aborted);
    job.join();
    EXPECT_EQ(outcome.status, TransferOutcome::Status::Aborted);

    std::optional<Response> dropAck = responses.second.recvFor(std::chrono::seconds(5));
    ASSERT_TRUE(dropAck.has_value());
    EXPECT_EQ(*dropAck, Response(Ok{}));
    EXPECT_FALSE(fs::exists(base / "inbox" / "cancelled.bin"));

    master->close();
    reader.join();
    EXPECT_EQ(readerError, "");
}

// Disconnecting with a paused task still tells the receiver to drop it
TEST_F(TransferIntegrationTest, CloseWithOrphanedPausedTaskDropsIt) {
    std::string path = writeFile("orphan.bin", 6000);
    MasterOptions options;
    options.pauseBackoff = std::chrono::milliseconds(10);
    std::unique_ptr<Master> master =
        Master::connect(SocketAddress{"127.0.0.1", server->port()}, options);

    auto responses = portal::util::makeChannel<Response>();
    std::string readerError;
    std::thread reader = startResponseReader(*master, responses.first, readerError);
    responses.first = portal::util::Sender<Response>();

    TransferHandle handle = master->sendFile(path, TaskControl::Paused);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    handle.control = portal::util::Sender<TaskControl>();
    master->close();

    std::optional<TransferOutcome> outcome = handle.result.recvFor(std::chrono::seconds(5));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, TransferOutcome::Status::Aborted);
    EXPECT_FALSE(outcome->isError());

    reader.join();
    EXPECT_EQ(readerError, "");
    // Every request, DropFile last, was acknowledged before the receiver closed
    size_t acks = 0;
    while (std::optional<Response> response = responses.second.recv()) {
        EXPECT_EQ(*response, Response(Ok{}));
        ++acks;
    }
    // FileMetadata and DropFile
    EXPECT_EQ(acks, (size_t)2);
    EXPECT_FALSE(fs::exists(base / "inbox" / "orphan.bin"));
}

TEST_F(TransferIntegrationTest, SeveralConnectionsShareTheInbox) {
    std::vector<std::string> names = {"one.txt", "two.txt", "three.txt"};
    std::vector<std::thread> senders;
    std::vector<TransferOutcome> outcomes(names.size());
    std::vector<std::string> readerErrors(names.size());
    for (size_t i = 0; i < names.size(); ++i) {
        std::string path = writeFile(names[i], 1000 * (i + 1));
        senders.emplace_back([&, i, path]() {
            std::unique_ptr<Master> master =
                Master::connect(SocketAddress{"127.0.0.1", server->port()});
            auto responses = portal::util::makeChannel<Response>();
            std::thread reader = startResponseReader(*master, responses.first, readerErrors[i]);
            responses.first = portal::util::Sender<Response>();

            std::optional<TransferOutcome> outcome = master->sendFile(path).result.recv();
            if (outcome) {
                outcomes[i] = *outcome;
            }
            master->close();
            reader.join();
        });
    }
    for (auto& t : senders) {
        t.join();
    }

    for (size_t i = 0; i < names.size(); ++i) {
        EXPECT_EQ(outcomes[i].status, TransferOutcome::Status::Completed) << names[i];
        EXPECT_EQ(readInbox(names[i]).size(), 1000 * (i + 1));
        EXPECT_EQ(readerErrors[i], "") << names[i];
    }
}

TEST_F(TransferIntegrationTest, ConnectToClosedPortFails) {
    uint16_t port = server->port();
    server->stop();
    try {
        Master::connect(SocketAddress{"127.0.0.1", port});
        FAIL() << "expected ConnectionFailed";
    } catch (const PortalError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::ConnectionFailed);
    }
}

} // namespace

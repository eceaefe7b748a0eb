// test/unit/test_task_manager.cpp
// -----------------------------------------------------------
// Task bookkeeping over a Master: ids, state transitions and outcomes.

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

#include "network/framed.hpp"
#include "network/socket.hpp"
#include "protocol/error.hpp"
#include "protocol/messages.hpp"
#include "transfer/master.hpp"
#include "transfer/task_manager.hpp"

namespace {

namespace fs = std::filesystem;
using namespace portal::transfer;
using portal::network::Stream;

class TaskManagerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              (std::string("portal_tasks_") +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir);
        fs::create_directories(dir);

        auto pair = Stream::connectedPair();
        MasterOptions options;
        options.pauseBackoff = std::chrono::milliseconds(10);
        master = std::make_unique<Master>(pair.first, options);

        // Stand-in receiver that reads and discards every request.
        remote = pair.second;
        drain = std::thread([stream = pair.second]() {
            portal::network::FramedReader<portal::protocol::Request> reader(stream.split().first);
            try {
                while (reader.next()) {
                }
            } catch (const portal::protocol::PortalError&) {
            }
        });
    }

    void TearDown() override {
        master.reset();
        remote.shutdown();
        drain.join();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string writeFile(const std::string& name, size_t size) {
        fs::path path = dir / name;
        std::ofstream out(path, std::ios::binary);
        out << std::string(size, 'q');
        return path.string();
    }

    // Poll until @p id reports an outcome or two seconds pass.
    std::optional<TaskInfo> waitFinished(TaskManager& tasks, uint32_t id) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (std::chrono::steady_clock::now() < deadline) {
            tasks.poll();
            std::optional<TaskInfo> info = tasks.find(id);
            if (info && info->outcome) {
                return info;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return std::nullopt;
    }

    fs::path dir;
    std::unique_ptr<Master> master;
    Stream remote;
    std::thread drain;
};

TEST_F(TaskManagerTest, CompletedTaskIsReported) {
    TaskManager tasks(*master);
    uint32_t id = tasks.send(writeFile("a.txt", 3000));
    EXPECT_EQ(id, (uint32_t)1);

    std::optional<TaskInfo> info = waitFinished(tasks, id);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, TaskState::Completed);
    EXPECT_EQ(info->outcome->fragmentsSent, (uint32_t)3);
    EXPECT_EQ(tasks.pending(), (size_t)0);

    // Finished tasks no longer accept control
    EXPECT_FALSE(tasks.pause(id));
    EXPECT_FALSE(tasks.abort(id));
}

TEST_F(TaskManagerTest, IdsAreSequential) {
    TaskManager tasks(*master);
    uint32_t first = tasks.send(writeFile("one.txt", 10));
    uint32_t second = tasks.send(writeFile("two.txt", 10));
    EXPECT_EQ(second, first + 1);
    EXPECT_EQ(tasks.list().size(), (size_t)2);
    waitFinished(tasks, first);
    waitFinished(tasks, second);
}

TEST_F(TaskManagerTest, UnknownIdsAreRejected) {
    TaskManager tasks(*master);
    EXPECT_FALSE(tasks.pause(99));
    EXPECT_FALSE(tasks.resume(99));
    EXPECT_FALSE(tasks.abort(99));
    EXPECT_FALSE(tasks.find(99).has_value());
}

TEST_F(TaskManagerTest, FailedTaskCarriesReason) {
    TaskManager tasks(*master);
    uint32_t id = tasks.send((dir / "missing.bin").string());

    std::optional<TaskInfo> info = waitFinished(tasks, id);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, TaskState::Failed);
    ASSERT_TRUE(info->outcome->error.has_value());
    EXPECT_EQ(*info->outcome->error, portal::protocol::ErrorKind::FileAccess);
    EXPECT_FALSE(info->outcome->message.empty());
}

// resume only applies to a paused task and pause only to a running one
TEST_F(TaskManagerTest, StateTransitions) {
    TaskManager tasks(*master);
    uint32_t id = tasks.send(writeFile("large.bin", 200000));

    if (tasks.pause(id)) {
        EXPECT_EQ(tasks.find(id)->state, TaskState::Paused);
        EXPECT_FALSE(tasks.pause(id));
        EXPECT_TRUE(tasks.resume(id));
        EXPECT_FALSE(tasks.resume(id));
        EXPECT_TRUE(tasks.abort(id));
        EXPECT_EQ(tasks.find(id)->state, TaskState::Aborted);
    }

    std::optional<TaskInfo> info = waitFinished(tasks, id);
    ASSERT_TRUE(info.has_value());
    EXPECT_NE(info->state, TaskState::Failed);
}

} // namespace

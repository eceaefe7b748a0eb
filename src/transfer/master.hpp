#ifndef PORTAL_TRANSFER_MASTER_HPP
#define PORTAL_TRANSFER_MASTER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "network/framed.hpp"
#include "network/socket.hpp"
#include "protocol/error.hpp"
#include "protocol/messages.hpp"
#include "util/channel.hpp"
#include "util/thread_pool.hpp"

/**
 * @file master.hpp
 * @brief The sender role: pushes files over one connection with cooperative
 *        pause/resume/abort and reports a terminal outcome per transfer.
 *
 * SAMPLE USAGE:
 *   @code
 *   using namespace portal::transfer;
 *
 *   auto master = Master::connect(portal::network::SocketAddress{"192.168.1.7", 11451});
 *
 *   auto [respTx, respRx] = portal::util::makeChannel<portal::protocol::Response>();
 *   std::thread reader([&] { master->recvResponses(respTx); });
 *
 *   TransferHandle handle = master->sendFile("notes.txt");
 *   handle.control.send(TaskControl::Paused);
 *   handle.control.send(TaskControl::Running);
 *   std::optional<TransferOutcome> outcome = handle.result.recv();
 *   @endcode
 */

namespace portal {
namespace transfer {

/**
 * @brief External control signal for one running transfer.
 */
enum class TaskControl {
    Running,
    Paused,
    Aborted
};

const char *taskControlName(TaskControl control);

/**
 * @struct TransferOutcome
 * @brief Terminal result of one sendFile() job.
 *
 * Aborted is a clean early stop (DropFile was sent), not a failure.
 */
struct TransferOutcome
{
    enum class Status {
        Completed,
        Aborted,
        Failed
    };

    Status status = Status::Failed;
    std::string path;
    std::string fileName;
    uint8_t fileId = 0;
    uint32_t fragmentsSent = 0;
    uint64_t bytesSent = 0;
    std::optional<protocol::ErrorKind> error; ///< set when status is Failed
    std::string message;

    bool isError() const { return status == Status::Failed; }
    std::string summary() const;
};

/**
 * @struct TransferHandle
 * @brief What sendFile() hands back: the control sender and the result receiver.
 *
 * Dropping @c control before the transfer ends aborts it.
 */
struct TransferHandle
{
    util::Sender<TaskControl> control;
    util::Receiver<TransferOutcome> result;
};

struct MasterOptions
{
    /// Sleep between control polls while paused.
    std::chrono::milliseconds pauseBackoff{1000};

    /// Worker threads available for concurrent sendFile() jobs.
    size_t workers = 4;
};

/**
 * @class Master
 * @brief Owns one connection: the write half carries requests from transfer
 *        jobs and ping(); the read half is drained by recvResponses().
 */
class Master
{
public:
    /**
     * @brief Dial @p address and wrap the connection.
     * @throw protocol::PortalError(ConnectionFailed) if the dial fails.
     */
    static std::unique_ptr<Master> connect(const network::SocketAddress &address,
                                           MasterOptions options = MasterOptions());

    explicit Master(const network::Stream &stream, MasterOptions options = MasterOptions());

    /// Aborts paused transfers and waits for running jobs to finish.
    ~Master();

    Master(const Master&) = delete;
    Master& operator=(const Master&) = delete;

    /**
     * @brief Start transferring @p path on a worker thread and return at once.
     *        The outcome arrives on the handle's result receiver. A job queued
     *        with @p initial Paused sends only FileMetadata until resumed.
     * @throw protocol::PortalError(Disconnected) after close().
     */
    TransferHandle sendFile(const std::string &path, TaskControl initial = TaskControl::Running);

    /**
     * @brief Send Ping; the matching Pong is delivered by recvResponses().
     * @throw protocol::PortalError on transport failure.
     */
    void ping();

    /**
     * @brief Forward every decoded response to @p sink until the peer closes
     *        the stream or the sink's receiver is gone. Call from one thread only.
     * @throw protocol::PortalError on decode or transport failure.
     */
    void recvResponses(util::Sender<protocol::Response> sink);

    /**
     * @brief Finish sending. Refuses new transfers, waits for queued and
     *        running ones (paused or uncontrolled ones abort with DropFile),
     *        then half-closes. The peer closes its side in turn, which ends
     *        recvResponses() cleanly.
     */
    void close();

    const network::SocketAddress& peer() const { return peer_; }

    /**
     * @brief The transfer pipeline itself, run synchronously on the caller's thread.
     *        sendFile() runs this on a worker.
     */
    TransferOutcome runTransfer(const std::string &path, util::Receiver<TaskControl> &control);

private:
    enum class Gate {
        Send,
        Stop
    };

    /// Marks one sendFile() job done for close().
    struct JobGuard {
        explicit JobGuard(Master &master) : master_(master) {}
        ~JobGuard() { master_.jobFinished(); }
        JobGuard(const JobGuard&) = delete;
        JobGuard& operator=(const JobGuard&) = delete;
        Master &master_;
    };

    void jobFinished();

    /// Block while paused; decide whether the next fragment may go out.
    Gate awaitPermission(util::Receiver<TaskControl> &control, TaskControl &status,
                         const std::string &name);

    network::SocketAddress peer_;
    MasterOptions options_;
    network::Stream stream_;
    std::unique_ptr<network::FramedWriter<protocol::Request>> writer_;
    std::unique_ptr<network::FramedReader<protocol::Response>> reader_;
    std::atomic<bool> shuttingDown_{false};

    std::mutex jobsMutex_;
    std::condition_variable jobsDone_;
    size_t jobsInFlight_ = 0;

    // Declared last: destroyed first, joining jobs while the writer is alive.
    util::ThreadPool pool_;
};

} // namespace transfer
} // namespace portal

#endif // PORTAL_TRANSFER_MASTER_HPP

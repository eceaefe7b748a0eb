#include "transfer/master.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <thread>
#include <vector>

#include "util/hashing.hpp"
#include "util/logger.hpp"

namespace portal {
namespace transfer {

namespace fs = std::filesystem;
using namespace portal::protocol;
using portal::util::logger::Logger;

const char *taskControlName(TaskControl control)
{
    switch (control) {
    case TaskControl::Running: return "running";
    case TaskControl::Paused:  return "paused";
    case TaskControl::Aborted: return "aborted";
    }
    return "unknown";
}

std::string TransferOutcome::summary() const
{
    std::string text = "'" + fileName + "' (file_id " + std::to_string(fileId) + "): ";
    switch (status) {
    case Status::Completed:
        text += "sent " + std::to_string(bytesSent) + " bytes in " +
                std::to_string(fragmentsSent) + " fragment(s)";
        break;
    case Status::Aborted:
        text += "aborted after " + std::to_string(fragmentsSent) + " fragment(s)";
        break;
    case Status::Failed:
        text += "failed, " + message;
        break;
    }
    return text;
}

std::unique_ptr<Master> Master::connect(const network::SocketAddress &address, MasterOptions options)
{
    network::Stream stream = network::Stream::connectTo(address);
    Logger::getInstance().info("[Master] Connected to " + address.toString());
    return std::make_unique<Master>(stream, options);
}

Master::Master(const network::Stream &stream, MasterOptions options)
    : peer_(stream.peer())
    , options_(options)
    , stream_(stream)
    , pool_(options.workers)
{
    auto halves = stream_.split();
    reader_ = std::make_unique<network::FramedReader<Response>>(std::move(halves.first));
    writer_ = std::make_unique<network::FramedWriter<Request>>(std::move(halves.second));
}

Master::~Master()
{
    std::lock_guard<std::mutex> lock(jobsMutex_);
    shuttingDown_ = true;
}

TransferHandle Master::sendFile(const std::string &path, TaskControl initial)
{
    auto control = util::makeChannel<TaskControl>();
    auto result = util::makeChannel<TransferOutcome>();
    if (initial != TaskControl::Running) {
        control.first.send(initial);
    }

    {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        if (shuttingDown_) {
            throw PortalError(ErrorKind::Disconnected, "connection to " + peer_.toString() +
                                                       " is closing, cannot send " + path);
        }
        ++jobsInFlight_;
    }

    util::Sender<TransferOutcome> resultTx = result.first;
    auto job = [this, path, resultTx, controlRx = std::move(control.second)]() mutable {
        JobGuard guard(*this);
        TransferOutcome outcome = runTransfer(path, controlRx);
        if (!resultTx.send(std::move(outcome))) {
            Logger::getInstance().debug("[Master] Nobody waiting for the outcome of " + path);
        }
    };
    try {
        pool_.enqueue(std::move(job));
    } catch (...) {
        jobFinished();
        throw;
    }

    return TransferHandle{std::move(control.first), std::move(result.second)};
}

void Master::ping()
{
    writer_->send(Ping{});
}

void Master::recvResponses(util::Sender<Response> sink)
{
    Logger &logger = Logger::getInstance();
    while (true) {
        std::optional<Response> response = reader_->next();
        if (!response) {
            logger.info("[Master] " + peer_.toString() + " closed the connection");
            return;
        }
        logger.debug("[Master] Response: " + describe(*response));
        if (!sink.send(std::move(*response))) {
            logger.debug("[Master] Response consumer gone, stop reading");
            return;
        }
    }
}

void Master::close()
{
    std::unique_lock<std::mutex> lock(jobsMutex_);
    shuttingDown_ = true;
    if (jobsInFlight_ > 0) {
        Logger::getInstance().info("[Master] Closing " + peer_.toString() + ", waiting for " +
                                   std::to_string(jobsInFlight_) + " transfer(s)");
    }
    jobsDone_.wait(lock, [this] { return jobsInFlight_ == 0; });
    lock.unlock();

    writer_->shutdownWrite();
}

void Master::jobFinished()
{
    {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        --jobsInFlight_;
    }
    jobsDone_.notify_all();
}

Master::Gate Master::awaitPermission(util::Receiver<TaskControl> &control, TaskControl &status,
                                     const std::string &name)
{
    Logger &logger = Logger::getInstance();
    while (true) {
        TaskControl next;
        util::RecvStatus polled;
        while ((polled = control.tryRecv(next)) == util::RecvStatus::Value) {
            if (next != status) {
                logger.info("[Master] '" + name + "' " + taskControlName(next));
            }
            status = next;
        }
        if (polled == util::RecvStatus::Disconnected) {
            // The controller went away; nobody can resume us.
            logger.info("[Master] Control for '" + name + "' dropped, aborting");
            status = TaskControl::Aborted;
        }
        if (shuttingDown_ && status == TaskControl::Paused) {
            status = TaskControl::Aborted;
        }

        switch (status) {
        case TaskControl::Running:
            return Gate::Send;
        case TaskControl::Aborted:
            return Gate::Stop;
        case TaskControl::Paused:
            std::this_thread::sleep_for(options_.pauseBackoff);
            break;
        }
    }
}

TransferOutcome Master::runTransfer(const std::string &path, util::Receiver<TaskControl> &control)
{
    Logger &logger = Logger::getInstance();

    TransferOutcome outcome;
    outcome.path = path;
    outcome.fileName = fs::path(path).filename().string();
    if (outcome.fileName.empty()) {
        outcome.fileName = "Untitled";
    }

    auto fail = [&](ErrorKind kind, const std::string &detail) {
        outcome.status = TransferOutcome::Status::Failed;
        outcome.error = kind;
        outcome.message = PortalError(kind, detail).what();
        logger.warn("[Master] " + outcome.summary());
        return outcome;
    };

    std::error_code ec;
    fs::file_status st = fs::status(path, ec);
    if (ec || !fs::exists(st)) {
        return fail(ErrorKind::FileAccess, "cannot open " + path);
    }
    if (!fs::is_regular_file(st)) {
        return fail(ErrorKind::NotAFile, path);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return fail(ErrorKind::FileAccess, "cannot open " + path);
    }

    std::string digest;
    try {
        digest = util::hashing::sha256File(path);
        outcome.fileId = util::hashing::fileIdFromDigest(digest);
    } catch (const std::exception &ex) {
        return fail(ErrorKind::DigestFailed, ex.what());
    }

    try {
        writer_->send(FileMetadata{outcome.fileId, outcome.fileName, digest});
        logger.info("[Master] Sending '" + outcome.fileName + "' as file_id " +
                    std::to_string(outcome.fileId));

        TaskControl status = TaskControl::Running;
        std::vector<uint8_t> chunk(kMaxFragmentSize);
        uint32_t index = 0;
        while (true) {
            in.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
            std::streamsize got = in.gcount();
            if (got <= 0) {
                if (in.bad()) {
                    return fail(ErrorKind::FileAccess, "read failed on " + path);
                }
                break;
            }

            if (awaitPermission(control, status, outcome.fileName) == Gate::Stop) {
                writer_->send(DropFile{outcome.fileId});
                outcome.status = TransferOutcome::Status::Aborted;
                logger.info("[Master] " + outcome.summary());
                return outcome;
            }

            FileFragment fragment;
            fragment.fileId = outcome.fileId;
            fragment.index = index++;
            fragment.data.assign(chunk.begin(), chunk.begin() + got);
            writer_->send(fragment);

            ++outcome.fragmentsSent;
            outcome.bytesSent += static_cast<uint64_t>(got);
        }

        writer_->send(EndOfFile{outcome.fileId});
    } catch (const PortalError &ex) {
        outcome.status = TransferOutcome::Status::Failed;
        outcome.error = ex.kind();
        outcome.message = ex.what();
        logger.error("[Master] " + outcome.summary());
        return outcome;
    }

    outcome.status = TransferOutcome::Status::Completed;
    logger.info("[Master] " + outcome.summary());
    return outcome;
}

} // namespace transfer
} // namespace portal

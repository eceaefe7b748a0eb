#include "transfer/slave.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "network/framed.hpp"
#include "protocol/error.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

namespace portal {
namespace transfer {

namespace fs = std::filesystem;
using namespace portal::protocol;
using portal::util::logger::Logger;

Slave::Slave(std::string storageDirectory)
    : storageDirectory_(std::move(storageDirectory)) {}

void Slave::run(const network::Stream& stream) {
    Logger& logger = Logger::getInstance();
    const std::string peer = stream.peer().toString();

    auto halves = stream.split();
    network::FramedReader<Request> reader(std::move(halves.first));
    network::FramedWriter<Response> writer(std::move(halves.second));

    logger.info("[Slave] Serving " + peer);
    while (true) {
        std::optional<Request> request;
        try {
            request = reader.next();
        } catch (const PortalError& ex) {
            logger.error("[Slave] Failed to receive request from " + peer + ": " + ex.what());
            throw;
        }
        if (!request) {
            logger.info("[Slave] Connection closed by " + peer);
            break;
        }

        logger.debug("[Slave] Request: " + describe(*request));
        Response response = handleRequest(*request);
        logger.debug("[Slave] Response: " + describe(response));
        writer.send(response);
    }
    writer.shutdownWrite();

    if (!transfers_.empty()) {
        logger.warn("[Slave] Discarding " + std::to_string(transfers_.size()) +
                    " unfinished transfer(s) from " + peer);
        transfers_.clear();
    }
}

Response Slave::handleRequest(const Request& request) {
    if (std::holds_alternative<Ping>(request)) {
        return Pong{};
    }
    if (auto* m = std::get_if<FileMetadata>(&request)) {
        return onMetadata(*m);
    }
    if (auto* f = std::get_if<FileFragment>(&request)) {
        return onFragment(*f);
    }
    if (auto* e = std::get_if<EndOfFile>(&request)) {
        return onEndOfFile(*e);
    }
    return onDropFile(std::get<DropFile>(request));
}

Response Slave::onMetadata(const FileMetadata& msg) {
    auto it = transfers_.find(msg.fileId);
    if (it != transfers_.end()) {
        // Same id reused before the previous transfer finished; its fragments are lost.
        Logger::getInstance().warn("[Slave] file_id " + std::to_string(msg.fileId) +
                                   " reopened, dropping " +
                                   std::to_string(it->second.fragments.size()) +
                                   " fragment(s) of '" + it->second.fileName + "'");
    }

    TransferState state;
    state.fileName = msg.fileName;
    state.contentHash = msg.contentHash;
    transfers_[msg.fileId] = std::move(state);

    Logger::getInstance().info("[Slave] Receiving '" + msg.fileName + "' as file_id " +
                               std::to_string(msg.fileId));
    return Ok{};
}

Response Slave::onFragment(const FileFragment& msg) {
    auto it = transfers_.find(msg.fileId);
    if (it == transfers_.end()) {
        Logger::getInstance().warn("[Slave] Fragment " + std::to_string(msg.index) +
                                   " for unknown file_id " + std::to_string(msg.fileId));
        return FileIdNotFound{msg.fileId};
    }
    it->second.fragments.emplace_back(msg.index, msg.data);
    return Ok{};
}

Response Slave::onEndOfFile(const EndOfFile& msg) {
    Logger& logger = Logger::getInstance();

    auto it = transfers_.find(msg.fileId);
    if (it == transfers_.end()) {
        logger.warn("[Slave] EndOfFile for unknown file_id " + std::to_string(msg.fileId));
        return FileIdNotFound{msg.fileId};
    }
    TransferState state = std::move(it->second);
    transfers_.erase(it);

    // Arrival order is not reassembly order.
    std::stable_sort(state.fragments.begin(), state.fragments.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    size_t total = 0;
    for (const auto& fragment : state.fragments) {
        total += fragment.second.size();
    }
    std::vector<uint8_t> content;
    content.reserve(total);
    for (const auto& fragment : state.fragments) {
        content.insert(content.end(), fragment.second.begin(), fragment.second.end());
    }

    std::string digest;
    try {
        digest = util::hashing::sha256(content);
    } catch (const std::exception& ex) {
        logger.error(std::string("[Slave] Digest failed: ") + ex.what());
        return CannotSaveFile{msg.fileId};
    }

    if (digest != state.contentHash) {
        logger.warn("[Slave] Checksum mismatch for '" + state.fileName + "': expected " +
                    state.contentHash + ", got " + digest);
        return ChecksumNotMatched{msg.fileId};
    }

    if (!commitFile(state.fileName, content)) {
        return CannotSaveFile{msg.fileId};
    }

    logger.info("[Slave] Saved '" + state.fileName + "' (" + std::to_string(content.size()) +
                " bytes, " + std::to_string(state.fragments.size()) + " fragments)");
    return Ok{};
}

Response Slave::onDropFile(const DropFile& msg) {
    if (transfers_.erase(msg.fileId) > 0) {
        Logger::getInstance().info("[Slave] Dropped file_id " + std::to_string(msg.fileId));
    }
    return Ok{};
}

std::string Slave::sanitizeFileName(const std::string& displayName) {
    std::string name = fs::path(displayName).filename().string();
    if (name.empty() || name == "." || name == "..") {
        return "Untitled";
    }
    return name;
}

bool Slave::commitFile(const std::string& fileName, const std::vector<uint8_t>& content) {
    Logger& logger = Logger::getInstance();
    const std::string name = sanitizeFileName(fileName);

    std::error_code ec;
    fs::path dir(storageDirectory_);
    fs::create_directories(dir, ec);
    if (ec) {
        logger.error("[Slave] Cannot create " + dir.string() + ": " + ec.message());
        return false;
    }

    fs::path finalPath = dir / name;
    fs::path partPath = dir / ("." + name + ".part");

    {
        std::ofstream out(partPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            logger.error("[Slave] Cannot create " + partPath.string());
            return false;
        }
        out.write(reinterpret_cast<const char*>(content.data()),
                  static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            logger.error("[Slave] Write failed for " + partPath.string());
            out.close();
            fs::remove(partPath, ec);
            return false;
        }
    }

    fs::rename(partPath, finalPath, ec);
    if (ec) {
        logger.error("[Slave] Cannot rename into " + finalPath.string() + ": " + ec.message());
        std::error_code ignored;
        fs::remove(partPath, ignored);
        return false;
    }
    return true;
}

} // namespace transfer
} // namespace portal

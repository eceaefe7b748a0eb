#ifndef PORTAL_PROTOCOL_MESSAGES_HPP
#define PORTAL_PROTOCOL_MESSAGES_HPP

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace portal {
namespace protocol {

/*
  messages.hpp
  --------------------------------
  The closed set of messages exchanged over one connection.

   - Request  (sender role -> receiver role):
       Ping, FileMetadata, FileFragment, EndOfFile, DropFile
   - Response (receiver role -> sender role):
       Pong, Ok, FileIdNotFound, CannotSaveFile, ChecksumNotMatched

  A transfer is FileMetadata, then FileFragment x N with index 0..N-1, then
  EndOfFile (or DropFile to abort). file_id is the first byte of the content
  digest and scopes all messages of one transfer on one connection.
*/

/// Link MTU; a whole frame never exceeds this.
constexpr size_t kMaxFrameSize = 1500;

/// Size of the big-endian total_length prefix.
constexpr size_t kFrameHeaderSize = 2;

/// Largest serialized message that fits in one frame.
constexpr size_t kMaxContentSize = kMaxFrameSize - kFrameHeaderSize;

/// Largest FileFragment payload the sender produces.
constexpr size_t kMaxFragmentSize = 1477;

// ---------------------------------------------------------------------------
//  Requests
// ---------------------------------------------------------------------------

struct Ping
{
};

struct FileMetadata
{
    uint8_t fileId = 0;
    std::string fileName;
    std::string contentHash; ///< lowercase hex SHA-256
};

struct FileFragment
{
    uint8_t fileId = 0;
    uint32_t index = 0; ///< sequence number, not a byte offset
    std::vector<uint8_t> data;
};

struct EndOfFile
{
    uint8_t fileId = 0;
};

struct DropFile
{
    uint8_t fileId = 0;
};

using Request = std::variant<Ping, FileMetadata, FileFragment, EndOfFile, DropFile>;

// ---------------------------------------------------------------------------
//  Responses
// ---------------------------------------------------------------------------

struct Pong
{
};

struct Ok
{
};

struct FileIdNotFound
{
    uint8_t fileId = 0;
};

struct CannotSaveFile
{
    uint8_t fileId = 0;
};

struct ChecksumNotMatched
{
    uint8_t fileId = 0;
};

using Response = std::variant<Pong, Ok, FileIdNotFound, CannotSaveFile, ChecksumNotMatched>;

// ---------------------------------------------------------------------------
//  Equality (tests and response pairing)
// ---------------------------------------------------------------------------

inline bool operator==(const Ping&, const Ping&) { return true; }
inline bool operator==(const Pong&, const Pong&) { return true; }
inline bool operator==(const Ok&, const Ok&) { return true; }

inline bool operator==(const FileMetadata &a, const FileMetadata &b)
{
    return a.fileId == b.fileId && a.fileName == b.fileName && a.contentHash == b.contentHash;
}

inline bool operator==(const FileFragment &a, const FileFragment &b)
{
    return a.fileId == b.fileId && a.index == b.index && a.data == b.data;
}

inline bool operator==(const EndOfFile &a, const EndOfFile &b) { return a.fileId == b.fileId; }
inline bool operator==(const DropFile &a, const DropFile &b) { return a.fileId == b.fileId; }
inline bool operator==(const FileIdNotFound &a, const FileIdNotFound &b) { return a.fileId == b.fileId; }
inline bool operator==(const CannotSaveFile &a, const CannotSaveFile &b) { return a.fileId == b.fileId; }
inline bool operator==(const ChecksumNotMatched &a, const ChecksumNotMatched &b) { return a.fileId == b.fileId; }

// ---------------------------------------------------------------------------
//  Human-readable forms for logs and the CLI
// ---------------------------------------------------------------------------

inline std::string describe(const Request &request)
{
    std::ostringstream oss;
    std::visit([&](const auto &msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, Ping>) {
            oss << "Ping";
        } else if constexpr (std::is_same_v<T, FileMetadata>) {
            oss << "FileMetadata{file_id=" << unsigned(msg.fileId) << ", file_name=" << msg.fileName
                << ", hash=" << msg.contentHash << "}";
        } else if constexpr (std::is_same_v<T, FileFragment>) {
            oss << "FileFragment{file_id=" << unsigned(msg.fileId) << ", index=" << msg.index
                << ", bytes=" << msg.data.size() << "}";
        } else if constexpr (std::is_same_v<T, EndOfFile>) {
            oss << "EndOfFile{file_id=" << unsigned(msg.fileId) << "}";
        } else {
            oss << "DropFile{file_id=" << unsigned(msg.fileId) << "}";
        }
    }, request);
    return oss.str();
}

inline std::string describe(const Response &response)
{
    std::ostringstream oss;
    std::visit([&](const auto &msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, Pong>) {
            oss << "Pong";
        } else if constexpr (std::is_same_v<T, Ok>) {
            oss << "Ok";
        } else if constexpr (std::is_same_v<T, FileIdNotFound>) {
            oss << "FileIdNotFound{file_id=" << unsigned(msg.fileId) << "}";
        } else if constexpr (std::is_same_v<T, CannotSaveFile>) {
            oss << "CannotSaveFile{file_id=" << unsigned(msg.fileId) << "}";
        } else {
            oss << "ChecksumNotMatched{file_id=" << unsigned(msg.fileId) << "}";
        }
    }, response);
    return oss.str();
}

/**
 * @brief Explain a failure response to a person deciding whether to retry.
 *        Empty for Pong and Ok.
 */
inline std::string failureReason(const Response &response)
{
    if (auto *r = std::get_if<FileIdNotFound>(&response)) {
        return "receiver has no open transfer for file id " + std::to_string(r->fileId);
    }
    if (auto *r = std::get_if<CannotSaveFile>(&response)) {
        return "receiver could not save file id " + std::to_string(r->fileId);
    }
    if (auto *r = std::get_if<ChecksumNotMatched>(&response)) {
        return "checksum mismatch for file id " + std::to_string(r->fileId) + ", nothing was saved";
    }
    return std::string();
}

} // namespace protocol
} // namespace portal

#endif // PORTAL_PROTOCOL_MESSAGES_HPP

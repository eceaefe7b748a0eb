#ifndef PORTAL_PROTOCOL_CODEC_HPP
#define PORTAL_PROTOCOL_CODEC_HPP

#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <vector>
#include "protocol/error.hpp"
#include "protocol/messages.hpp"

/**
 * @file codec.hpp
 * @brief Message serialization and the length-prefixed frame codec.
 *
 * Frame format (both directions):
 *   | total_length: u16 big-endian, counts itself | serialized message |
 *   |                2 bytes                      |   <= 1498 bytes    |
 *
 * Serialized message: one tag byte, then the fields in declaration order.
 * Integers are big-endian; strings carry a u16 length and byte vectors a u32
 * length. Tag values are shared by both ends of the same build only.
 *
 *   Request  tags: 0 Ping, 1 FileMetadata, 2 FileFragment, 3 EndOfFile, 4 DropFile
 *   Response tags: 0 Pong, 1 Ok, 2 FileIdNotFound, 3 CannotSaveFile, 4 ChecksumNotMatched
 *
 * USAGE:
 *   @code
 *   using namespace portal::protocol;
 *   std::vector<uint8_t> wire;
 *   RequestCodec::encode(Ping{}, wire);
 *
 *   RequestCodec codec;
 *   std::optional<Request> msg = codec.decode(wire); // consumes one frame
 *   @endcode
 */

namespace portal {
namespace protocol {

/// Tag byte plus fileId, index and data length of a FileFragment.
constexpr size_t kFragmentEnvelopeSize = 1 + 1 + 4 + 4;

// ---------------------------------------------------------------------------
//  Byte-level helpers
// ---------------------------------------------------------------------------

class ByteWriter
{
public:
    explicit ByteWriter(std::vector<uint8_t> &out) : out_(out) {}

    void u8(uint8_t v) { out_.push_back(v); }

    void u16(uint16_t v)
    {
        out_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        out_.push_back(static_cast<uint8_t>(v & 0xFF));
    }

    void u32(uint32_t v)
    {
        out_.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
        out_.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
        out_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        out_.push_back(static_cast<uint8_t>(v & 0xFF));
    }

    void str(const std::string &s)
    {
        if (s.size() > 0xFFFF) {
            throw PortalError(ErrorKind::DataTooLarge, "string field of " + std::to_string(s.size()) + " bytes");
        }
        u16(static_cast<uint16_t>(s.size()));
        out_.insert(out_.end(), s.begin(), s.end());
    }

    void bytes(const std::vector<uint8_t> &b)
    {
        if (b.size() > 0xFFFFFFFFull) {
            throw PortalError(ErrorKind::DataTooLarge, "byte field too large");
        }
        u32(static_cast<uint32_t>(b.size()));
        out_.insert(out_.end(), b.begin(), b.end());
    }

private:
    std::vector<uint8_t> &out_;
};

/**
 * @brief Bounds-checked reader; any overrun is a MalformedFrame.
 */
class ByteReader
{
public:
    ByteReader(const uint8_t *data, size_t len) : data_(data), len_(len), pos_(0) {}

    uint8_t u8()
    {
        require(1);
        return data_[pos_++];
    }

    uint16_t u16()
    {
        require(2);
        uint16_t v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return v;
    }

    uint32_t u32()
    {
        require(4);
        uint32_t v = (static_cast<uint32_t>(data_[pos_]) << 24) |
                     (static_cast<uint32_t>(data_[pos_ + 1]) << 16) |
                     (static_cast<uint32_t>(data_[pos_ + 2]) << 8) |
                     static_cast<uint32_t>(data_[pos_ + 3]);
        pos_ += 4;
        return v;
    }

    std::string str()
    {
        uint16_t n = u16();
        require(n);
        std::string s(reinterpret_cast<const char*>(data_ + pos_), n);
        pos_ += n;
        return s;
    }

    std::vector<uint8_t> bytes()
    {
        uint32_t n = u32();
        require(n);
        std::vector<uint8_t> b(data_ + pos_, data_ + pos_ + n);
        pos_ += n;
        return b;
    }

    /// A message must consume its payload exactly.
    void finish() const
    {
        if (pos_ != len_) {
            throw PortalError(ErrorKind::MalformedFrame,
                              std::to_string(len_ - pos_) + " trailing bytes after message");
        }
    }

private:
    void require(size_t n) const
    {
        if (len_ - pos_ < n) {
            throw PortalError(ErrorKind::MalformedFrame, "message truncated");
        }
    }

    const uint8_t *data_;
    size_t len_;
    size_t pos_;
};

// ---------------------------------------------------------------------------
//  Message serialization
// ---------------------------------------------------------------------------

inline std::vector<uint8_t> serialize(const Request &request)
{
    std::vector<uint8_t> out;
    ByteWriter w(out);
    w.u8(static_cast<uint8_t>(request.index()));

    if (auto *m = std::get_if<FileMetadata>(&request)) {
        w.u8(m->fileId);
        w.str(m->fileName);
        w.str(m->contentHash);
    } else if (auto *f = std::get_if<FileFragment>(&request)) {
        out.reserve(kFragmentEnvelopeSize + f->data.size());
        w.u8(f->fileId);
        w.u32(f->index);
        w.bytes(f->data);
    } else if (auto *e = std::get_if<EndOfFile>(&request)) {
        w.u8(e->fileId);
    } else if (auto *d = std::get_if<DropFile>(&request)) {
        w.u8(d->fileId);
    }
    return out;
}

inline std::vector<uint8_t> serialize(const Response &response)
{
    std::vector<uint8_t> out;
    ByteWriter w(out);
    w.u8(static_cast<uint8_t>(response.index()));

    if (auto *r = std::get_if<FileIdNotFound>(&response)) {
        w.u8(r->fileId);
    } else if (auto *r = std::get_if<CannotSaveFile>(&response)) {
        w.u8(r->fileId);
    } else if (auto *r = std::get_if<ChecksumNotMatched>(&response)) {
        w.u8(r->fileId);
    }
    return out;
}

inline void deserialize(const uint8_t *data, size_t len, Request &out)
{
    ByteReader r(data, len);
    uint8_t tag = r.u8();
    switch (tag) {
    case 0:
        out = Ping{};
        break;
    case 1: {
        FileMetadata m;
        m.fileId = r.u8();
        m.fileName = r.str();
        m.contentHash = r.str();
        out = std::move(m);
        break;
    }
    case 2: {
        FileFragment f;
        f.fileId = r.u8();
        f.index = r.u32();
        f.data = r.bytes();
        out = std::move(f);
        break;
    }
    case 3:
        out = EndOfFile{r.u8()};
        break;
    case 4:
        out = DropFile{r.u8()};
        break;
    default:
        throw PortalError(ErrorKind::MalformedFrame, "unknown request tag " + std::to_string(tag));
    }
    r.finish();
}

inline void deserialize(const uint8_t *data, size_t len, Response &out)
{
    ByteReader r(data, len);
    uint8_t tag = r.u8();
    switch (tag) {
    case 0:
        out = Pong{};
        break;
    case 1:
        out = Ok{};
        break;
    case 2:
        out = FileIdNotFound{r.u8()};
        break;
    case 3:
        out = CannotSaveFile{r.u8()};
        break;
    case 4:
        out = ChecksumNotMatched{r.u8()};
        break;
    default:
        throw PortalError(ErrorKind::MalformedFrame, "unknown response tag " + std::to_string(tag));
    }
    r.finish();
}

// ---------------------------------------------------------------------------
//  Frame codec
// ---------------------------------------------------------------------------

/**
 * @class FrameCodec
 * @brief Streaming encoder/decoder for one message type.
 *
 * decode() works on an accumulating buffer: it returns std::nullopt while a
 * frame is incomplete and, on success, erases exactly total_length bytes from
 * the front, leaving the next frame's bytes in place.
 */
template<typename Message>
class FrameCodec
{
public:
    /**
     * @brief Append one frame carrying @p message to @p dst.
     * @throw PortalError(DataTooLarge) when the serialized message exceeds
     *        kMaxContentSize; dst is left untouched.
     */
    static void encode(const Message &message, std::vector<uint8_t> &dst)
    {
        std::vector<uint8_t> content = serialize(message);
        if (content.size() > kMaxContentSize) {
            throw PortalError(ErrorKind::DataTooLarge,
                              "serialized message is " + std::to_string(content.size()) +
                              " bytes, limit is " + std::to_string(kMaxContentSize));
        }

        uint16_t total = static_cast<uint16_t>(kFrameHeaderSize + content.size());
        dst.reserve(dst.size() + total);
        dst.push_back(static_cast<uint8_t>(total >> 8));
        dst.push_back(static_cast<uint8_t>(total & 0xFF));
        dst.insert(dst.end(), content.begin(), content.end());
    }

    static std::vector<uint8_t> encode(const Message &message)
    {
        std::vector<uint8_t> out;
        encode(message, out);
        return out;
    }

    /**
     * @brief How many more bytes @p src needs before decode() can yield a
     *        message. 0 means a full frame is buffered.
     * @throw PortalError(MalformedFrame) on an impossible length prefix.
     */
    static size_t bytesNeeded(const std::vector<uint8_t> &src)
    {
        if (src.size() < kFrameHeaderSize) {
            return kFrameHeaderSize - src.size();
        }
        size_t total = declaredLength(src);
        return src.size() >= total ? 0 : total - src.size();
    }

    /**
     * @brief Decode one message from the front of @p src.
     * @return std::nullopt if more bytes are needed.
     * @throw PortalError(MalformedFrame) if the frame does not hold a valid message.
     */
    std::optional<Message> decode(std::vector<uint8_t> &src)
    {
        if (src.size() < kFrameHeaderSize) {
            return std::nullopt;
        }

        size_t total = declaredLength(src);
        if (src.size() < total) {
            src.reserve(total);
            return std::nullopt;
        }

        Message message;
        try {
            deserialize(src.data() + kFrameHeaderSize, total - kFrameHeaderSize, message);
        } catch (...) {
            src.erase(src.begin(), src.begin() + static_cast<std::ptrdiff_t>(total));
            throw;
        }
        src.erase(src.begin(), src.begin() + static_cast<std::ptrdiff_t>(total));
        return message;
    }

private:
    static size_t declaredLength(const std::vector<uint8_t> &src)
    {
        size_t total = (static_cast<size_t>(src[0]) << 8) | src[1];
        if (total <= kFrameHeaderSize || total > kMaxFrameSize) {
            throw PortalError(ErrorKind::MalformedFrame,
                              "frame length " + std::to_string(total) + " out of range");
        }
        return total;
    }
};

using RequestCodec = FrameCodec<Request>;
using ResponseCodec = FrameCodec<Response>;

} // namespace protocol
} // namespace portal

#endif // PORTAL_PROTOCOL_CODEC_HPP

#ifndef PORTAL_NETWORK_FRAMED_HPP
#define PORTAL_NETWORK_FRAMED_HPP

#include <mutex>
#include <optional>
#include <utility>
#include <vector>
#include "network/socket.hpp"
#include "protocol/codec.hpp"
#include "protocol/error.hpp"

/**
 * @file framed.hpp
 * @brief Frame-at-a-time adapters over the two halves of a Stream.
 *
 *   - FramedReader<M> owns a ReadHalf and an accumulation buffer. It reads only
 *     as many bytes as the codec reports missing, so bytes belonging to the
 *     next frame are never pulled off the socket early.
 *   - FramedWriter<M> owns a WriteHalf and writes each frame in one locked call,
 *     so frames from different threads never interleave.
 */

namespace portal {
namespace network {

template<typename Message>
class FramedReader
{
public:
    FramedReader() = default;
    explicit FramedReader(ReadHalf half) : half_(std::move(half)) {}

    /**
     * @brief Block until one message has been decoded.
     * @return std::nullopt when the peer closed the stream on a frame boundary.
     * @throw PortalError(Disconnected) if the stream ends mid-frame,
     *        PortalError(MalformedFrame) on undecodable bytes, PortalError(Io) on read errors.
     */
    std::optional<Message> next()
    {
        while (true) {
            if (auto message = codec_.decode(buffer_)) {
                return message;
            }

            size_t want = protocol::FrameCodec<Message>::bytesNeeded(buffer_);
            size_t old = buffer_.size();
            buffer_.resize(old + want);
            size_t got = half_.read(buffer_.data() + old, want);
            buffer_.resize(old + got);

            if (got == 0) {
                if (buffer_.empty()) {
                    return std::nullopt;
                }
                throw protocol::PortalError(protocol::ErrorKind::Disconnected,
                                            "stream ended inside a frame (" +
                                            std::to_string(buffer_.size()) + " bytes buffered)");
            }
        }
    }

    /// Bytes received but not yet decoded.
    size_t buffered() const { return buffer_.size(); }

private:
    ReadHalf half_;
    protocol::FrameCodec<Message> codec_;
    std::vector<uint8_t> buffer_;
};

template<typename Message>
class FramedWriter
{
public:
    FramedWriter() = default;
    explicit FramedWriter(WriteHalf half) : half_(std::move(half)) {}

    /**
     * @brief Encode and write one message.
     * @throw PortalError(DataTooLarge) before anything is written if the
     *        message does not fit in a frame; transport errors otherwise.
     */
    void send(const Message &message)
    {
        std::vector<uint8_t> frame = protocol::FrameCodec<Message>::encode(message);
        std::lock_guard<std::mutex> lock(mutex_);
        half_.writeAll(frame.data(), frame.size());
    }

    void shutdownWrite()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        half_.shutdownWrite();
    }

    void shutdown() { half_.shutdown(); }

private:
    WriteHalf half_;
    std::mutex mutex_;
};

} // namespace network
} // namespace portal

#endif // PORTAL_NETWORK_FRAMED_HPP

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "net/buffer.h"
#include "net/buffer_pool.h"
#include "net/callbacks.h"
#include "net/io_error.h"

namespace iomux {

class StreamChannel;

/**
 * @brief Frames as a 4-byte big-endian body length followed by the body
 *
 * Header and body travel as separate buffers through one gather write, so
 * the body is never copied behind a header.
 */
class LengthFieldCodec {
public:
    static constexpr std::size_t kHeaderLength = 4;
    static constexpr std::size_t kDefaultMaxFrameLength = 16 * 1024 * 1024;

    enum class DecodeStatus { kFrame, kNeedMore, kTooLarge };

    using FrameCallback =
        std::function<void(const TcpConnectionPtr&, std::string&& frame, Timestamp receiveTime)>;

    explicit LengthFieldCodec(std::size_t maxFrameLength = kDefaultMaxFrameLength)
        : maxFrameLength_(maxFrameLength) {}

    std::size_t maxFrameLength() const { return maxFrameLength_; }

    /**
     * @brief Header buffer (read mode) announcing bodyLength bytes
     *
     * Throws IoException(kFrameTooLarge) past maxFrameLength().
     */
    BufferPtr encodeHeader(BufferPool& pool, std::size_t bodyLength) const;

    /**
     * @brief Write header then body (both read mode) with one gather write
     */
    IoResult writeFrame(StreamChannel& channel, Buffer& header, Buffer& body) const;

    /**
     * @brief Queue body as one frame on conn, copying it into pooled buffers
     */
    void send(const TcpConnectionPtr& conn, std::string_view body) const;

    /**
     * @brief Pull one frame out of a read-mode buffer
     *
     * kNeedMore leaves the buffer untouched; kTooLarge leaves the header unread.
     */
    DecodeStatus decode(Buffer& input, std::string* frame) const;

    /**
     * @brief Adapter for TcpServer::setMessageCallback
     *
     * Runs frameCallback once per complete frame. An oversized frame throws
     * IoException(kFrameTooLarge), which reaches the connection's error
     * callback and closes it.
     */
    MessageCallback messageHandler(FrameCallback frameCallback) const;

private:
    std::size_t maxFrameLength_;
};

} // namespace iomux

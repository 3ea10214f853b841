#include "codec/length_field_codec.h"
#include "net/stream_channel.h"
#include "net/tcp_connection.h"
#include "net/transfer.h"
#include "logger.h"

#include <vector>

namespace iomux {

BufferPtr LengthFieldCodec::encodeHeader(BufferPool& pool, std::size_t bodyLength) const {
    if (bodyLength > maxFrameLength_) {
        throw IoException(ErrorCode::kFrameTooLarge,
                          std::to_string(bodyLength) + " > " + std::to_string(maxFrameLength_));
    }
    BufferPtr header = pool.acquire(kHeaderLength);
    header->putUint32(static_cast<uint32_t>(bodyLength));
    header->flip();
    return header;
}

IoResult LengthFieldCodec::writeFrame(StreamChannel& channel, Buffer& header, Buffer& body) const {
    std::vector<Buffer*> frame{&header, &body};
    return gatherWrite(channel, frame);
}

void LengthFieldCodec::send(const TcpConnectionPtr& conn, std::string_view body) const {
    BufferPool& pool = *conn->pool();
    BufferPtr header = encodeHeader(pool, body.size());
    BufferPtr payload;
    try {
        payload = pool.acquire(body.size());
    } catch (const IoException&) {
        pool.release(header);
        throw;
    }
    payload->put(body);
    payload->flip();
    conn->sendBuffers({header, payload});
}

LengthFieldCodec::DecodeStatus LengthFieldCodec::decode(Buffer& input, std::string* frame) const {
    if (input.remaining() < kHeaderLength) {
        return DecodeStatus::kNeedMore;
    }
    const std::size_t length = input.peekUint32();
    if (length > maxFrameLength_) {
        return DecodeStatus::kTooLarge;
    }
    if (input.remaining() < kHeaderLength + length) {
        return DecodeStatus::kNeedMore;
    }
    input.skip(kHeaderLength);
    *frame = input.getAsString(length);
    return DecodeStatus::kFrame;
}

MessageCallback LengthFieldCodec::messageHandler(FrameCallback frameCallback) const {
    const std::size_t maxFrameLength = maxFrameLength_;
    return [maxFrameLength, frameCallback](const TcpConnectionPtr& conn, Buffer* buffer, Timestamp receiveTime) {
        LengthFieldCodec codec(maxFrameLength);
        std::string frame;
        while (true) {
            DecodeStatus status = codec.decode(*buffer, &frame);
            if (status == DecodeStatus::kNeedMore) {
                break;
            }
            if (status == DecodeStatus::kTooLarge) {
                throw IoException(ErrorCode::kFrameTooLarge,
                                  conn->name() + ": frame of " + std::to_string(buffer->peekUint32()) + " bytes");
            }
            frameCallback(conn, std::move(frame), receiveTime);
        }
    };
}

} // namespace iomux

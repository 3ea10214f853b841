#include "net/io_error.h"

#include <cerrno>
#include <cstring>

namespace iomux {

ErrorInfo ErrorInfo::fromCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kSuccess:
            return {code, "Success", "Success"};
        case ErrorCode::kWouldBlock:
            return {code, "WouldBlock", "Operation would block"};
        case ErrorCode::kPeerClosed:
            return {code, "PeerClosed", "Peer closed the stream"};
        case ErrorCode::kConnectionReset:
            return {code, "ConnectionReset", "Connection reset by peer"};
        case ErrorCode::kBrokenPipe:
            return {code, "BrokenPipe", "Broken pipe"};
        case ErrorCode::kChannelClosed:
            return {code, "ChannelClosed", "Channel is closed"};
        case ErrorCode::kCapacityExceeded:
            return {code, "CapacityExceeded", "Not enough room left in buffer"};
        case ErrorCode::kUnderflow:
            return {code, "Underflow", "Not enough bytes remaining in buffer"};
        case ErrorCode::kBufferMode:
            return {code, "BufferMode", "Buffer used in the wrong read/write mode"};
        case ErrorCode::kBufferReleased:
            return {code, "BufferReleased", "Buffer storage already released"};
        case ErrorCode::kDoubleRelease:
            return {code, "DoubleRelease", "Buffer released to the pool twice"};
        case ErrorCode::kPoolExhausted:
            return {code, "PoolExhausted", "Buffer pool exhausted"};
        case ErrorCode::kAllocationFailed:
            return {code, "AllocationFailed", "Native buffer allocation failed"};
        case ErrorCode::kAlreadyRegistered:
            return {code, "AlreadyRegistered", "Channel already registered with a multiplexer"};
        case ErrorCode::kNotRegistered:
            return {code, "NotRegistered", "Channel not registered with this multiplexer"};
        case ErrorCode::kFrameTooLarge:
            return {code, "FrameTooLarge", "Frame exceeds maximum length"};
        case ErrorCode::kSystemError:
            return {code, "SystemError", "System call failed"};
    }
    return {ErrorCode::kSystemError, "Unknown", "Unknown error"};
}

const char* errorCodeName(ErrorCode code) {
    return ErrorInfo::fromCode(code).name;
}

static std::string buildWhat(ErrorCode code, const std::string& detail, int sysErrno) {
    ErrorInfo info = ErrorInfo::fromCode(code);
    std::string what = info.name;
    what += ": ";
    what += info.message;
    if (!detail.empty()) {
        what += " (" + detail + ")";
    }
    if (sysErrno != 0) {
        what += ": ";
        what += std::strerror(sysErrno);
    }
    return what;
}

IoException::IoException(ErrorCode code, const std::string& detail, int sysErrno)
    : std::runtime_error(buildWhat(code, detail, sysErrno)),
      code_(code),
      sysErrno_(sysErrno) {
}

IoResult IoResult::fromErrno(int err, std::size_t transferred) {
    switch (err) {
        case EAGAIN:
#if EWOULDBLOCK != EAGAIN
        case EWOULDBLOCK:
#endif
            return IoResult{Status::kWouldBlock, transferred, 0};
        case ECONNRESET:
        case ECONNABORTED:
            return IoResult{Status::kConnectionReset, transferred, err};
        case EPIPE:
            return IoResult{Status::kBrokenPipe, transferred, err};
        default:
            return IoResult{Status::kError, transferred, err};
    }
}

ErrorCode IoResult::errorCode() const {
    switch (status) {
        case Status::kOk: return ErrorCode::kSuccess;
        case Status::kWouldBlock: return ErrorCode::kWouldBlock;
        case Status::kEof: return ErrorCode::kPeerClosed;
        case Status::kConnectionReset: return ErrorCode::kConnectionReset;
        case Status::kBrokenPipe: return ErrorCode::kBrokenPipe;
        case Status::kError: return ErrorCode::kSystemError;
    }
    return ErrorCode::kSystemError;
}

const char* ioStatusName(IoResult::Status status) {
    switch (status) {
        case IoResult::Status::kOk: return "ok";
        case IoResult::Status::kWouldBlock: return "would-block";
        case IoResult::Status::kEof: return "eof";
        case IoResult::Status::kConnectionReset: return "connection-reset";
        case IoResult::Status::kBrokenPipe: return "broken-pipe";
        case IoResult::Status::kError: return "error";
    }
    return "unknown";
}

std::string IoResult::describe() const {
    std::string s = ioStatusName(status);
    s += " bytes=" + std::to_string(bytes);
    if (sysErrno != 0) {
        s += " (";
        s += std::strerror(sysErrno);
        s += ")";
    }
    return s;
}

} // namespace iomux

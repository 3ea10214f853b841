#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace iomux {

enum class ErrorCode {
    kSuccess = 0,
    // Transient / terminal I/O outcomes
    kWouldBlock = 100,
    kPeerClosed = 101,
    kConnectionReset = 102,
    kBrokenPipe = 103,
    kChannelClosed = 104,
    // Buffer programming errors
    kCapacityExceeded = 200,
    kUnderflow = 201,
    kBufferMode = 202,
    kBufferReleased = 203,
    // Pool
    kDoubleRelease = 300,
    kPoolExhausted = 301,
    kAllocationFailed = 302,
    // Multiplexer
    kAlreadyRegistered = 400,
    kNotRegistered = 401,
    // Framing
    kFrameTooLarge = 500,
    kSystemError = 900
};

struct ErrorInfo {
    ErrorCode code;
    const char* name;
    const char* message;

    static ErrorInfo fromCode(ErrorCode code);
};

const char* errorCodeName(ErrorCode code);

/**
 * @brief Exception for programming errors and fatal conditions.
 *
 * Buffer capacity/underflow/mode violations, double release, pool exhaustion
 * and native allocation failure are raised as IoException. Would-block and
 * peer-closed never are; those travel as IoResult values.
 */
class IoException : public std::runtime_error {
public:
    explicit IoException(ErrorCode code, const std::string& detail = "", int sysErrno = 0);

    ErrorCode code() const noexcept { return code_; }
    int sysErrno() const noexcept { return sysErrno_; }

private:
    ErrorCode code_;
    int sysErrno_;
};

/**
 * @brief Outcome of a single channel transfer.
 *
 * kOk with bytes == 0 only happens for zero-length requests.
 */
struct IoResult {
    enum class Status {
        kOk,
        kWouldBlock,
        kEof,
        kConnectionReset,
        kBrokenPipe,
        kError
    };

    Status status = Status::kOk;
    std::size_t bytes = 0;
    int sysErrno = 0;

    static IoResult ok(std::size_t n) { return IoResult{Status::kOk, n, 0}; }
    static IoResult wouldBlock(std::size_t n) { return IoResult{Status::kWouldBlock, n, 0}; }
    static IoResult eof(std::size_t n = 0) { return IoResult{Status::kEof, n, 0}; }

    /**
     * @brief Classify a failed syscall's errno into a result.
     */
    static IoResult fromErrno(int err, std::size_t transferred = 0);

    bool isOk() const { return status == Status::kOk; }
    bool wouldBlock() const { return status == Status::kWouldBlock; }
    bool isEof() const { return status == Status::kEof; }
    // Reset, broken pipe or any other hard failure
    bool isFailure() const {
        return status == Status::kConnectionReset ||
               status == Status::kBrokenPipe ||
               status == Status::kError;
    }

    ErrorCode errorCode() const;
    std::string describe() const;
};

const char* ioStatusName(IoResult::Status status);

} // namespace iomux

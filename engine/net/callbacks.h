#pragma once

#include <cstddef>
#include <functional>
#include <memory>

#include "net/io_error.h"
#include "net/timestamp.h"

namespace iomux {

class Buffer;
class TcpConnection;

using TcpConnectionPtr = std::shared_ptr<TcpConnection>;

// TCP callbacks
using ConnectionCallback = std::function<void(const TcpConnectionPtr&)>;
// The buffer is in read mode; bytes left unread stay for the next call
using MessageCallback = std::function<void(const TcpConnectionPtr&, Buffer*, Timestamp)>;
using WriteCompleteCallback = std::function<void(const TcpConnectionPtr&)>;
using HighWaterMarkCallback = std::function<void(const TcpConnectionPtr&, std::size_t)>;
using CloseCallback = std::function<void(const TcpConnectionPtr&)>;
using ErrorCallback = std::function<void(const TcpConnectionPtr&, ErrorCode)>;

// Timer callback
using TimerCallback = std::function<void()>;

} // namespace iomux

#pragma once

#include "net/buffer.h"
#include "net/io_error.h"

#include <sys/types.h>
#include <cstddef>
#include <vector>

namespace iomux {

class FileChannel;
class StreamChannel;

/**
 * @brief Move count bytes of file, starting at offset, straight into dest
 *
 * Uses sendfile(2); the bytes never pass through a user-space buffer and the
 * file's own offset is left alone. Stops early when dest would block, so the
 * returned bytes may be short: resume at offset + result.bytes.
 *
 * @return kOk with the bytes moved (> 0), kWouldBlock when nothing could be
 *         moved, kEof when offset is at or past the end of file, or a failure
 *         with the bytes moved before it.
 */
IoResult transferFile(FileChannel& file, off_t offset, std::size_t count, StreamChannel& dest);

/**
 * @brief Fill buffers (write mode) in list order with readv(2)
 *
 * The buffers act as one contiguous region: each is filled to its limit
 * before the next receives a byte. Lists longer than IOV_MAX take one
 * syscall per chunk, continuing only while the previous chunk filled up.
 */
IoResult scatterRead(StreamChannel& channel, const std::vector<Buffer*>& buffers);
IoResult scatterRead(StreamChannel& channel, const std::vector<BufferPtr>& buffers);

/**
 * @brief Drain buffers (read mode) in list order with writev(2)
 *
 * Non-blocking channels issue one syscall per IOV_MAX chunk and stop at the
 * first short write; blocking channels write everything.
 */
IoResult gatherWrite(StreamChannel& channel, const std::vector<Buffer*>& buffers);
IoResult gatherWrite(StreamChannel& channel, const std::vector<BufferPtr>& buffers);

} // namespace iomux

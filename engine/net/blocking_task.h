#pragma once

#include <exception>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

#include "net/event_loop.h"
#include "utils/worker_pool.h"
#include "logger.h"

namespace iomux {

using BlockingFailureCallback = std::function<void(const std::string&)>;

/**
 * @brief Run work on a worker thread and deliver its result on loop
 *
 * The loop thread only enqueues; work() runs on the pool, then done(result)
 * (or done() for void work) is queued back onto loop. If work() throws,
 * failed(what) runs on loop instead. Returns false, without running anything,
 * when the pool's queue is full.
 */
template <typename Work, typename Done>
bool runBlocking(WorkerPool& pool, EventLoop* loop, Work work, Done done,
                 BlockingFailureCallback failed = BlockingFailureCallback()) {
    using Result = decltype(work());
    return pool.tryPost([loop, work = std::move(work), done = std::move(done),
                         failed = std::move(failed)]() mutable {
        try {
            if constexpr (std::is_void<Result>::value) {
                work();
                loop->queueInLoop([done]() mutable { done(); });
            } else {
                Result result = work();
                loop->queueInLoop([done, result = std::move(result)]() mutable {
                    done(std::move(result));
                });
            }
        } catch (const std::exception& e) {
            LOG_ERROR("blocking task on loop {} failed: {}", loop->loopId(), e.what());
            if (failed) {
                std::string what = e.what();
                loop->queueInLoop([failed, what]() { failed(what); });
            }
        }
    });
}

} // namespace iomux

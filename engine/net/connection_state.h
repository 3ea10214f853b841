#pragma once

#include <atomic>

namespace iomux {

enum class ConnectionState {
    kAccepting,   // accepted, not yet registered with its loop
    kConnected,   // registered, no traffic yet
    kReading,     // no output pending
    kWriting,     // output queued, write interest on
    kClosing,     // shutdown requested or terminal event seen
    kClosed
};

enum class ConnectionEvent {
    kEstablished,
    kReadable,
    kOutputQueued,
    kOutputDrained,
    kPeerClosed,
    kFailed,
    kCloseRequested,
    kClosedDone
};

const char* connectionStateName(ConnectionState state);
const char* connectionEventName(ConnectionEvent event);

/**
 * @brief Per-connection lifecycle
 *
 *   kAccepting -> kConnected -> {kReading <-> kWriting} -> kClosing -> kClosed
 *
 * Each state has its own transition function; an event the current state
 * does not accept is rejected and leaves the state untouched. fire() is
 * called from the owning loop only; state() may be read from any thread.
 */
class ConnectionStateMachine {
public:
    explicit ConnectionStateMachine(ConnectionState initial = ConnectionState::kAccepting)
        : state_(initial) {}

    ConnectionState state() const { return state_.load(std::memory_order_acquire); }

    /**
     * @brief Apply event; returns false if the current state rejects it
     */
    bool fire(ConnectionEvent event);

    /**
     * @brief Pure transition lookup
     */
    static bool next(ConnectionState from, ConnectionEvent event, ConnectionState* to);

    bool isOpen() const {
        ConnectionState s = state();
        return s == ConnectionState::kConnected || s == ConnectionState::kReading ||
               s == ConnectionState::kWriting;
    }

private:
    std::atomic<ConnectionState> state_;
};

} // namespace iomux

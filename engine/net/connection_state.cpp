#include "net/connection_state.h"
#include "logger.h"

namespace iomux {

namespace {

using State = ConnectionState;
using Event = ConnectionEvent;
using Transition = bool (*)(Event, State*);

bool fromAccepting(Event event, State* to) {
    switch (event) {
        case Event::kEstablished: *to = State::kConnected; return true;
        case Event::kFailed:
        case Event::kCloseRequested: *to = State::kClosing; return true;
        default: return false;
    }
}

bool fromConnected(Event event, State* to) {
    switch (event) {
        case Event::kReadable: *to = State::kReading; return true;
        case Event::kOutputQueued: *to = State::kWriting; return true;
        case Event::kOutputDrained: *to = State::kConnected; return true;
        case Event::kPeerClosed:
        case Event::kFailed:
        case Event::kCloseRequested: *to = State::kClosing; return true;
        default: return false;
    }
}

bool fromReading(Event event, State* to) {
    switch (event) {
        case Event::kReadable:
        case Event::kOutputDrained: *to = State::kReading; return true;
        case Event::kOutputQueued: *to = State::kWriting; return true;
        case Event::kPeerClosed:
        case Event::kFailed:
        case Event::kCloseRequested: *to = State::kClosing; return true;
        default: return false;
    }
}

bool fromWriting(Event event, State* to) {
    switch (event) {
        // Reads continue while output drains
        case Event::kReadable:
        case Event::kOutputQueued: *to = State::kWriting; return true;
        case Event::kOutputDrained: *to = State::kReading; return true;
        case Event::kPeerClosed:
        case Event::kFailed:
        case Event::kCloseRequested: *to = State::kClosing; return true;
        default: return false;
    }
}

bool fromClosing(Event event, State* to) {
    switch (event) {
        // Half-closed: pending output still drains and input is still read
        case Event::kReadable:
        case Event::kOutputDrained:
        case Event::kPeerClosed:
        case Event::kFailed:
        case Event::kCloseRequested: *to = State::kClosing; return true;
        case Event::kClosedDone: *to = State::kClosed; return true;
        default: return false;
    }
}

bool fromClosed(Event, State*) {
    return false;
}

const Transition kTransitions[] = {
    fromAccepting,
    fromConnected,
    fromReading,
    fromWriting,
    fromClosing,
    fromClosed
};

} // namespace

const char* connectionStateName(ConnectionState state) {
    switch (state) {
        case State::kAccepting: return "accepting";
        case State::kConnected: return "connected";
        case State::kReading: return "reading";
        case State::kWriting: return "writing";
        case State::kClosing: return "closing";
        case State::kClosed: return "closed";
    }
    return "unknown";
}

const char* connectionEventName(ConnectionEvent event) {
    switch (event) {
        case Event::kEstablished: return "established";
        case Event::kReadable: return "readable";
        case Event::kOutputQueued: return "output-queued";
        case Event::kOutputDrained: return "output-drained";
        case Event::kPeerClosed: return "peer-closed";
        case Event::kFailed: return "failed";
        case Event::kCloseRequested: return "close-requested";
        case Event::kClosedDone: return "closed-done";
    }
    return "unknown";
}

bool ConnectionStateMachine::next(ConnectionState from, ConnectionEvent event, ConnectionState* to) {
    State result = from;
    if (!kTransitions[static_cast<int>(from)](event, &result)) {
        return false;
    }
    *to = result;
    return true;
}

bool ConnectionStateMachine::fire(ConnectionEvent event) {
    State from = state();
    State to = from;
    if (!next(from, event, &to)) {
        LOG_TRACE("connection state {} rejects event {}",
                  connectionStateName(from), connectionEventName(event));
        return false;
    }
    state_.store(to, std::memory_order_release);
    return true;
}

} // namespace iomux

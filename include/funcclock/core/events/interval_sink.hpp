#pragma once

#include <funcclock/core/events/probe_event.hpp>

namespace FuncClock {

/**
 * @class IntervalSink
 * @brief Consumer of correlator output
 *
 * The correlator calls onInterval() for every matched call and
 * onDiscardedFrame() for every open entry it had to throw away (mismatch
 * recovery, depth limit, rejected interval, end-of-stream drain).
 *
 * Called from the correlating thread only; implementations need no locking.
 */
class IntervalSink {
public:
    virtual ~IntervalSink() = default;

    virtual void onInterval(const CallInterval& interval) = 0;

    virtual void onDiscardedFrame(const FunctionId&, ContextId) {}
};

} // namespace FuncClock

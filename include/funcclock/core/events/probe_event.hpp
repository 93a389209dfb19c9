#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace FuncClock {

    // library!symbol
    using FunctionId = std::string;
    // Thread id of the traced process
    using ContextId = uint64_t;
    // Monotonic nanoseconds
    using TimestampNs = uint64_t;

    enum struct ProbeKind : uint8_t {
        ENTRY = 0,
        EXIT = 1
    };

    inline const char* toString(ProbeKind kind) {
        return kind == ProbeKind::ENTRY ? "entry" : "exit";
    }

    /**
     * @brief Raw probe crossing as handed over by an EventSource
     *
     * Fields are kept as text; validation happens in the normalizer so
     * malformed input is counted in one place.
     */
    struct RawRecord {
        std::string comm;
        std::string context;     // "tid" or "pid/tid"
        std::string timestamp;   // "<sec>.<frac>"
        std::string event_name;  // "probe_<lib>:<symbol>[_ret]"
        uint64_t line = 0;
    };

    /**
     * @brief Canonical, validated probe crossing
     *
     * Treated as immutable once the normalizer releases it; downstream
     * stages take it by const reference.
     */
    struct ProbeEvent {
        TimestampNs timestamp = 0;
        FunctionId function_id;
        ContextId context = 0;
        ProbeKind kind = ProbeKind::ENTRY;

        ProbeEvent() = default;
        ProbeEvent(TimestampNs ts, FunctionId fn, ContextId ctx, ProbeKind k)
            : timestamp(ts), function_id(std::move(fn)), context(ctx), kind(k) {}
    };

    /**
     * @brief One matched entry/exit pair
     *
     * depth is the number of frames of the same function that were already
     * open in the context when this call was entered (0 = not recursive).
     */
    struct CallInterval {
        FunctionId function_id;
        ContextId context = 0;
        TimestampNs start_ns = 0;
        TimestampNs end_ns = 0;
        uint32_t depth = 0;

        bool valid() const { return end_ns >= start_ns; }

        // Only meaningful when valid()
        uint64_t duration_ns() const { return end_ns - start_ns; }
    };

}

#pragma once
#include "common_types.h"

// Standardized diagnostic logging.
// - Always logs to Serial
// - Keeps a bounded in-memory ring of recent events; this ring is the
//   error history the health aggregator scores against.

enum LogLevel : uint8_t { LOG_INFO=0, LOG_WARN=1, LOG_CRITICAL=2, LOG_FATAL=3 };

struct DiagEvent {
    uint32_t ms;
    LogLevel level;
    FaultCode fault;
    char msg[80];
};

namespace Diag {
    void init();
    void log(LogLevel lvl, const char* msg);
    void logf(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void fault(LogLevel lvl, FaultCode code, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

    // Access ring buffer, oldest first.
    uint8_t count();
    uint8_t capacity();
    const DiagEvent& at(uint8_t i);
    uint8_t count_at_least(LogLevel lvl);

    // A FATAL entry latches until acknowledged, even after it rotates out of the ring.
    bool fatal_latched();
    bool has_fatal();
    void acknowledge();

    // Drops all entries and the latch.
    void clear();

    const char* level_name(LogLevel l);
}

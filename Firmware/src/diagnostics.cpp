#include "diagnostics.h"
#ifndef ARDUINO
  #include "utils/native_arduino_stubs.h"
#endif
#include <stdarg.h>
#include <stdio.h>

namespace {
    constexpr uint8_t kBufN = ERROR_HISTORY_SIZE;
    DiagEvent g_buf[kBufN]{};
    uint8_t g_head = 0;
    uint8_t g_len = 0;
    bool g_fatal_latch = false;

    void push(LogLevel lvl, FaultCode fc, const char* msg) {
        DiagEvent& e = g_buf[g_head];
        e.ms = millis();
        e.level = lvl;
        e.fault = fc;
        snprintf(e.msg, sizeof(e.msg), "%s", msg ? msg : "");

        g_head = (uint8_t)((g_head + 1) % kBufN);
        if (g_len < kBufN) g_len++;
        if (lvl == LOG_FATAL) g_fatal_latch = true;
    }
}

namespace Diag {
    void init() {
        clear();
    }

    const char* level_name(LogLevel l) {
        switch (l) {
            case LOG_INFO: return "INFO";
            case LOG_WARN: return "WARN";
            case LOG_CRITICAL: return "CRIT";
            case LOG_FATAL: return "FATAL";
            default: return "LOG";
        }
    }

    void log(LogLevel lvl, const char* msg) {
        push(lvl, FAULT_NONE, msg);
        Serial.printf("[%lu][%s] %s\n", (unsigned long)millis(), level_name(lvl), msg ? msg : "");
    }

    void logf(LogLevel lvl, const char* fmt, ...) {
        char buf[80];
        va_list ap;
        va_start(ap, fmt);
        vsnprintf(buf, sizeof(buf), fmt, ap);
        va_end(ap);
        log(lvl, buf);
    }

    void fault(LogLevel lvl, FaultCode code, const char* fmt, ...) {
        char buf[80];
        va_list ap;
        va_start(ap, fmt);
        vsnprintf(buf, sizeof(buf), fmt, ap);
        va_end(ap);
        push(lvl, code, buf);
        Serial.printf("[%lu][%s:%d] %s\n", (unsigned long)millis(), level_name(lvl), (int)code, buf);
    }

    uint8_t count() { return g_len; }

    uint8_t capacity() { return kBufN; }

    const DiagEvent& at(uint8_t i) {
        // Oldest-first indexing
        if (i >= g_len) i = (uint8_t)(g_len ? g_len - 1 : 0);
        uint8_t start = (uint8_t)((g_head + kBufN - g_len) % kBufN);
        uint8_t idx = (uint8_t)((start + i) % kBufN);
        return g_buf[idx];
    }

    uint8_t count_at_least(LogLevel lvl) {
        uint8_t n = 0;
        for (uint8_t i = 0; i < g_len; ++i) {
            if (at(i).level >= lvl) n++;
        }
        return n;
    }

    bool fatal_latched() { return g_fatal_latch; }

    bool has_fatal() {
        return g_fatal_latch || count_at_least(LOG_FATAL) > 0;
    }

    void acknowledge() {
        g_fatal_latch = false;
        for (uint8_t i = 0; i < kBufN; ++i) {
            // Acknowledged fatals stay visible in the log but stop counting as active.
            if (g_buf[i].level == LOG_FATAL) g_buf[i].level = LOG_CRITICAL;
        }
    }

    void clear() {
        for (uint8_t i = 0; i < kBufN; ++i) g_buf[i] = DiagEvent{};
        g_head = 0;
        g_len = 0;
        g_fatal_latch = false;
    }
}

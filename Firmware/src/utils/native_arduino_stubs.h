#pragma once

// Host stand-ins for the Arduino Serial object and the ESP32 Preferences
// (NVS) API, so the core and its persistence paths run in host builds.

#ifndef ARDUINO

#include <cstdint>
#include <cstring>
#include <string>
#include <unordered_map>
#include <vector>
#include <cstdio>
#include <cstdarg>
#include <algorithm>

// Serial stub: prints to stdout. Tests may silence it.
struct SerialClass {
    bool muted = false;

    void println(const char* s) { if (s && !muted) std::printf("%s\n", s); }
    void print(const char* s) { if (s && !muted) std::printf("%s", s); }

    void printf(const char* fmt, ...) __attribute__((format(printf, 2, 3))) {
        if (!fmt || muted) return;
        va_list ap;
        va_start(ap, fmt);
        std::vprintf(fmt, ap);
        va_end(ap);
    }
};

// One instance for the whole program, so muting it from a test mutes the core too.
inline SerialClass Serial;

// In-memory Preferences stub.
// Stores values in a process-wide per-namespace key-value map; blobs are raw bytes.
class Preferences {
public:
    bool begin(const char* ns, bool /*readOnly*/ = false) {
        namespace_ = ns ? ns : "";
        opened_ = true;
        return true;
    }

    void end() { opened_ = false; }

    bool clear() {
        if (!opened_) return false;
        store()[namespace_].clear();
        return true;
    }

    bool remove(const char* key) {
        if (!opened_ || !key) return false;
        return store()[namespace_].erase(key) > 0;
    }

    bool isKey(const char* key) {
        if (!opened_ || !key) return false;
        auto& nsmap = store()[namespace_];
        return nsmap.find(key) != nsmap.end();
    }

    uint8_t getUChar(const char* key, uint8_t defaultValue = 0) { return get_(key, defaultValue); }
    size_t putUChar(const char* key, uint8_t value) { return put_(key, value); }

    bool getBool(const char* key, bool defaultValue = false) { return get_(key, defaultValue); }
    size_t putBool(const char* key, bool value) { return put_(key, value); }

    uint32_t getUInt(const char* key, uint32_t defaultValue = 0) { return get_(key, defaultValue); }
    size_t putUInt(const char* key, uint32_t value) { return put_(key, value); }

    float getFloat(const char* key, float defaultValue = 0.0f) { return get_(key, defaultValue); }
    size_t putFloat(const char* key, float value) { return put_(key, value); }

    size_t getBytesLength(const char* key) {
        if (!opened_ || !key) return 0;
        auto& nsmap = store()[namespace_];
        auto it = nsmap.find(key);
        if (it == nsmap.end()) return 0;
        return it->second.size();
    }

    size_t getBytes(const char* key, void* out, size_t maxLen) {
        if (!opened_ || !key || !out || maxLen == 0) return 0;
        auto& nsmap = store()[namespace_];
        auto it = nsmap.find(key);
        if (it == nsmap.end()) return 0;
        const size_t n = std::min(maxLen, it->second.size());
        std::memcpy(out, it->second.data(), n);
        return n;
    }

    size_t putBytes(const char* key, const void* data, size_t len) {
        if (!opened_ || !key) return 0;
        std::vector<uint8_t> buf(len);
        if (len && data) std::memcpy(buf.data(), data, len);
        store()[namespace_][key] = std::move(buf);
        return len;
    }

private:
    bool opened_ = false;
    std::string namespace_;

    using StoreMap = std::unordered_map<std::string,
                       std::unordered_map<std::string, std::vector<uint8_t>>>;

    static StoreMap& store() {
        static StoreMap s;
        return s;
    }

    template <typename T>
    T get_(const char* key, T defaultValue) {
        T v = defaultValue;
        if (getBytesLength(key) == sizeof(T)) getBytes(key, &v, sizeof(T));
        return v;
    }

    template <typename T>
    size_t put_(const char* key, T value) {
        return putBytes(key, &value, sizeof(T));
    }
};

#endif // !ARDUINO

#pragma once

// Compatibility layer so the control core builds both against the Arduino
// core (ESP32 firmware) and as a plain host library (simulator + unit tests).

#ifdef ARDUINO
  #include <Arduino.h>
#else
  #include <cstdint>
  #include <cstddef>
  #include <algorithm>
  #include <type_traits>
  #include <math.h>

  using uint8_t  = std::uint8_t;
  using uint16_t = std::uint16_t;
  using uint32_t = std::uint32_t;
  using int8_t   = std::int8_t;
  using int32_t  = std::int32_t;


// Arduino-like min/max/constrain that work with mixed arithmetic types (e.g., uint8_t + int).
template <typename A, typename B>
static inline constexpr auto min(A a, B b) -> typename std::common_type<A,B>::type {
  using C = typename std::common_type<A,B>::type;
  return (C)a < (C)b ? (C)a : (C)b;
}

template <typename A, typename B>
static inline constexpr auto max(A a, B b) -> typename std::common_type<A,B>::type {
  using C = typename std::common_type<A,B>::type;
  return (C)a > (C)b ? (C)a : (C)b;
}

template <typename X, typename A, typename B>
static inline constexpr auto constrain(X x, A a, B b) -> typename std::common_type<X,A,B>::type {
  using C = typename std::common_type<X,A,B>::type;
  const C xc = (C)x;
  const C ac = (C)a;
  const C bc = (C)b;
  return min(max(xc, ac), bc);
}

  // Host clock. The core itself is driven by explicit timestamps; only the
  // diagnostics log stamps entries with millis(). The simulator advances it.
  namespace compat_detail {
    inline uint32_t& host_ms() {
      static uint32_t ms = 0;
      return ms;
    }
  }

  static inline uint32_t millis() { return compat_detail::host_ms(); }
  static inline void set_host_millis(uint32_t ms) { compat_detail::host_ms() = ms; }

#endif

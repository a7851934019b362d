#pragma once
#include "utils/compat.h"
#ifndef ARDUINO
  #include "utils/native_arduino_stubs.h"
#else
  #include <Preferences.h>
#endif
#include "common_types.h"
#include "logic/profile.h"

#define MAX_STORED_PROFILES 6

// Built-in profiles by name: "classic", "ramp", "bloom". Returns false for unknown names.
bool builtin_profile(const char* name, Profile& out);

class ProfileStore {
public:
  bool begin();
  void end();
  uint8_t count() const { return _count; }

  // Only profiles that pass validate_profile() are loaded or saved.
  bool load(uint8_t idx, Profile& out);
  bool save(uint8_t idx, const Profile& in);
  bool setActive(uint8_t idx);
  uint8_t getActive();

  // convenience: ensure defaults exist
  void ensureDefaults();

private:
  Preferences _prefs;
  uint8_t _count = MAX_STORED_PROFILES;
};

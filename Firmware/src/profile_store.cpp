#include "profile_store.h"
#include "diagnostics.h"
#include <stdio.h>
#include <string.h>

static const char* NS = "profiles";
static const char* KEY_ACTIVE = "p_active";
static const char* KEY_COUNT  = "p_count";

static const char* BUILTIN_NAMES[] = { "classic", "ramp", "bloom" };
static constexpr uint8_t BUILTIN_COUNT = sizeof(BUILTIN_NAMES) / sizeof(BUILTIN_NAMES[0]);

static void make_classic(Profile& p) {
  p.set_name("CLASSIC");
  p.default_dose_g = 18.0f;
  p.default_yield_g = 36.0f;
  p.default_ratio = 2.0f;

  // Low-pressure preinfusion until the puck is saturated or first drips land.
  Phase* pi = p.add_phase("preinfuse", MODE_PRESSURE, 3.0f);
  pi->add_criterion(BREAKOUT_TIME, 8.0f);
  pi->add_criterion(BREAKOUT_WEIGHT, 2.0f, 3.0f);
  pi->max_duration_s = 15.0f;

  Phase* ex = p.add_phase("extract", MODE_PRESSURE, 9.0f);
  ex->add_criterion(BREAKOUT_WEIGHT, 34.0f);
  ex->add_criterion(BREAKOUT_TIME, 30.0f);
  ex->max_duration_s = 45.0f;
}

static void make_ramp(Profile& p) {
  p.set_name("RAMP");

  // Flow-limited fill; ends once the puck pushes back.
  Phase* fill = p.add_phase("fill", MODE_FLOW, 1.5f);
  fill->controller = CTRL_PID;
  fill->pressure_reference_bar = 3.0f;
  fill->add_criterion(BREAKOUT_PRESSURE_PERCENT, 90.0f, 1.0f);
  fill->add_criterion(BREAKOUT_TIME, 10.0f);
  fill->max_duration_s = 15.0f;

  Phase* ramp = p.add_phase("ramp", MODE_RAMP, 3.0f);
  ramp->controller = CTRL_ADAPTIVE;
  ramp->target_end = 9.0f;
  ramp->ramp_duration_s = 6.0f;
  ramp->add_criterion(BREAKOUT_TIME, 6.0f);

  Phase* hold = p.add_phase("hold", MODE_PRESSURE, 9.0f);
  hold->add_criterion(BREAKOUT_WEIGHT, 32.0f);
  hold->add_criterion(BREAKOUT_TIME, 30.0f);
  hold->max_duration_s = 45.0f;
}

static void make_bloom(Profile& p) {
  p.set_name("BLOOM");

  Phase* wet = p.add_phase("wet", MODE_PRESSURE, 3.0f);
  wet->add_criterion(BREAKOUT_TIME, 6.0f);
  wet->add_criterion(BREAKOUT_WEIGHT, 3.0f);

  Phase* bloom = p.add_phase("bloom", MODE_PAUSE, 0.0f);
  bloom->add_criterion(BREAKOUT_TIME, 8.0f);

  Phase* ex = p.add_phase("extract", MODE_PRESSURE, 8.5f);
  ex->controller = CTRL_FUZZY;
  ex->add_criterion(BREAKOUT_WEIGHT, 33.0f);
  ex->add_criterion(BREAKOUT_TIME, 35.0f);
  ex->max_duration_s = 50.0f;
}

bool builtin_profile(const char* name, Profile& out) {
  if (!name) return false;
  out = Profile{};
  if (strcmp(name, "classic") == 0) { make_classic(out); return true; }
  if (strcmp(name, "ramp") == 0)    { make_ramp(out);    return true; }
  if (strcmp(name, "bloom") == 0)   { make_bloom(out);   return true; }
  return false;
}

static const char* keyFor(uint8_t idx, char* buf, size_t len) {
  snprintf(buf, len, "p%u", (unsigned)idx);
  return buf;
}

bool ProfileStore::begin() {
  return _prefs.begin(NS, false);
}

void ProfileStore::end() {
  _prefs.end();
}

bool ProfileStore::load(uint8_t idx, Profile& out) {
  if (idx >= _count) return false;

  char key[8];
  keyFor(idx, key, sizeof(key));
  const size_t len = _prefs.getBytesLength(key);
  if (len == 0) return false;

  // Unknown size: a different firmware wrote it. Refuse to load (caller will seed defaults).
  if (len != sizeof(Profile)) {
    Diag::logf(LOG_WARN, "Profile slot %u has stale layout (%u bytes)", (unsigned)idx, (unsigned)len);
    return false;
  }

  Profile p{};
  if (_prefs.getBytes(key, &p, sizeof(Profile)) != sizeof(Profile)) return false;
  p.name[sizeof(p.name) - 1] = '\0';
  if (!validate_profile(p).ok()) {
    Diag::fault(LOG_WARN, FAULT_PROFILE_INVALID, "Stored profile %u failed validation", (unsigned)idx);
    return false;
  }
  out = p;
  return true;
}

bool ProfileStore::save(uint8_t idx, const Profile& in) {
  if (idx >= _count) return false;
  const ProfileCheck chk = validate_profile(in);
  if (!chk.ok()) {
    Diag::fault(LOG_WARN, FAULT_PROFILE_INVALID, "Profile '%s' not saved: %s", in.name, profile_issue_name(chk.issue));
    return false;
  }
  char key[8];
  const size_t w = _prefs.putBytes(keyFor(idx, key, sizeof(key)), &in, sizeof(Profile));
  return w == sizeof(Profile);
}

bool ProfileStore::setActive(uint8_t idx) {
  if (idx >= _count) return false;
  _prefs.putUChar(KEY_ACTIVE, idx);
  return true;
}

uint8_t ProfileStore::getActive() {
  const uint8_t a = _prefs.getUChar(KEY_ACTIVE, 0);
  return a < _count ? a : 0;
}

void ProfileStore::ensureDefaults() {
  // Profile format version: bump this to force re-seeding when defaults change.
  static constexpr uint8_t PROFILE_VERSION = 1;
  const uint8_t saved_ver = _prefs.getUChar("p_ver", 0);

  // If version matches AND profile 0 exists, keep user's settings
  if (saved_ver == PROFILE_VERSION) {
    Profile p{};
    if (load(0, p)) return;
  }
  Serial.printf("[PROFILES] Re-seeding defaults (saved_ver=%u, current=%u)\n", saved_ver, PROFILE_VERSION);

  for (uint8_t i = 0; i < BUILTIN_COUNT && i < _count; ++i) {
    Profile p{};
    if (builtin_profile(BUILTIN_NAMES[i], p) && !save(i, p)) {
      Diag::logf(LOG_WARN, "Failed to seed profile %s", BUILTIN_NAMES[i]);
    }
  }

  _prefs.putUChar(KEY_ACTIVE, 0);
  _prefs.putUChar(KEY_COUNT, _count);
  _prefs.putUChar("p_ver", PROFILE_VERSION);
}

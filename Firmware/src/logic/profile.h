#pragma once
#include "../common_types.h"

struct BreakoutCriterion {
    BreakoutKind kind = BREAKOUT_NONE;
    float threshold = 0.0f;     // s, g, ml/s or percent of target
    bool enabled = true;
    float min_duration_s = 0.0f; // cannot fire before this much phase time
};

struct Phase {
    char name[PHASE_NAME_LEN] = "phase";
    ControlMode mode = MODE_PRESSURE;
    ControllerType controller = CTRL_PID;

    // Scalar target uses target_start. Ramp interpolates start -> end over ramp_duration_s.
    float target_start = 0.0f;
    float target_end = 0.0f;
    float ramp_duration_s = 0.0f;

    // Reference for PressurePercent breakouts in phases that do not regulate
    // pressure (Flow, Pause). 0 = such a criterion never fires there.
    float pressure_reference_bar = 0.0f;

    BreakoutCriterion criteria[MAX_CRITERIA]{};
    uint8_t criteria_count = 0;

    // Hard fallback. <= 0 means "use the configured default".
    float max_duration_s = 0.0f;
    float min_duration_s = 0.0f;

    bool add_criterion(BreakoutKind kind, float threshold, float min_duration_s = 0.0f) {
        if (criteria_count >= MAX_CRITERIA) return false;
        BreakoutCriterion& c = criteria[criteria_count++];
        c.kind = kind;
        c.threshold = threshold;
        c.enabled = true;
        c.min_duration_s = min_duration_s;
        return true;
    }

    // Pressure/Flow hold one target for the whole phase.
    bool has_constant_target() const {
        return mode == MODE_PRESSURE || mode == MODE_FLOW;
    }

    // Target at a given time into the phase.
    float target_at(uint32_t phase_ms) const;
};

struct Profile {
    char name[PROFILE_NAME_LEN] = "UNNAMED";

    // Informational only; the shot is driven by the phases.
    float default_dose_g = 18.0f;
    float default_yield_g = 36.0f;
    float default_ratio = 2.0f;

    Phase phases[MAX_PHASES]{};
    uint8_t phase_count = 0;

    Phase* add_phase(const char* phase_name, ControlMode mode, float target);
    void set_name(const char* n);
};

enum ProfileIssue : uint8_t {
    PROFILE_OK = 0,
    PROFILE_NO_PHASES,
    PROFILE_TOO_MANY_PHASES,
    PROFILE_NO_CRITERIA,
    PROFILE_BAD_CRITERION,
    PROFILE_BAD_TARGET,
    PROFILE_BAD_DURATION
};

struct ProfileCheck {
    ProfileIssue issue = PROFILE_OK;
    uint8_t phase_index = 0;
    bool ok() const { return issue == PROFILE_OK; }
};

const char* profile_issue_name(ProfileIssue issue);

// Structural validation. A failing profile must never start executing.
ProfileCheck validate_profile(const Profile& p);

// Upper bound for one phase. Without a declared maximum it is DEFAULT_PHASE_MAX_S,
// stretched to the longest enabled Time criterion and capped at SAFETY_MAX_PHASE_S.
uint32_t phase_max_ms(const Phase& ph);

// Sum of every phase's hard maximum: the longest a shot can possibly run.
uint32_t profile_max_ms(const Profile& p);

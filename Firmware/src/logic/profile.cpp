#include "profile.h"
#include <math.h>
#include <stdio.h>

float Phase::target_at(uint32_t phase_ms) const {
    if (mode != MODE_RAMP) return target_start;
    const uint32_t ramp_ms = seconds_to_ms(ramp_duration_s);
    if (ramp_ms == 0) return target_end;
    const float t = constrain((float)phase_ms / (float)ramp_ms, 0.0f, 1.0f);
    return target_start + (target_end - target_start) * t;
}

Phase* Profile::add_phase(const char* phase_name, ControlMode mode, float target) {
    if (phase_count >= MAX_PHASES) return nullptr;
    Phase& ph = phases[phase_count++];
    ph = Phase{};
    snprintf(ph.name, sizeof(ph.name), "%s", phase_name ? phase_name : "phase");
    ph.mode = mode;
    ph.target_start = target;
    ph.target_end = target;
    return &ph;
}

void Profile::set_name(const char* n) {
    snprintf(name, sizeof(name), "%s", n ? n : "UNNAMED");
}

const char* profile_issue_name(ProfileIssue issue) {
    switch (issue) {
        case PROFILE_OK:              return "ok";
        case PROFILE_NO_PHASES:       return "no phases";
        case PROFILE_TOO_MANY_PHASES: return "too many phases";
        case PROFILE_NO_CRITERIA:     return "phase has no enabled breakout";
        case PROFILE_BAD_CRITERION:   return "bad breakout criterion";
        case PROFILE_BAD_TARGET:      return "target out of range";
        case PROFILE_BAD_DURATION:    return "bad phase duration";
        default:                      return "?";
    }
}

namespace {
    // Largest enabled Time threshold, 0 when the phase has none.
    float longest_time_s(const Phase& ph) {
        float s = 0.0f;
        const uint8_t n = min(ph.criteria_count, (uint8_t)MAX_CRITERIA);
        for (uint8_t c = 0; c < n; ++c) {
            const BreakoutCriterion& bc = ph.criteria[c];
            if (bc.enabled && bc.kind == BREAKOUT_TIME) s = max(s, bc.threshold);
        }
        return s;
    }

    bool target_ok(ControlMode mode, float v) {
        if (!isfinite(v) || v < 0.0f) return false;
        switch (mode) {
            case MODE_PRESSURE:
            case MODE_RAMP:  return v <= SAFETY_MAX_PRESSURE_BAR;
            case MODE_FLOW:  return v <= SAFETY_MAX_FLOW_ML_S;
            case MODE_PAUSE:
            default:         return true;
        }
    }

    bool criterion_ok(const BreakoutCriterion& c) {
        if (!isfinite(c.threshold) || !(c.threshold > 0.0f)) return false;
        if (!isfinite(c.min_duration_s) || c.min_duration_s < 0.0f) return false;
        switch (c.kind) {
            case BREAKOUT_TIME:
            case BREAKOUT_WEIGHT:
            case BREAKOUT_FLOW:
                return true;
            case BREAKOUT_PRESSURE_PERCENT:
                return c.threshold <= 200.0f;
            default:
                return false;
        }
    }
}

ProfileCheck validate_profile(const Profile& p) {
    ProfileCheck r;
    if (p.phase_count == 0) { r.issue = PROFILE_NO_PHASES; return r; }
    if (p.phase_count > MAX_PHASES) { r.issue = PROFILE_TOO_MANY_PHASES; return r; }

    for (uint8_t i = 0; i < p.phase_count; ++i) {
        const Phase& ph = p.phases[i];
        r.phase_index = i;

        if (ph.criteria_count > MAX_CRITERIA) { r.issue = PROFILE_BAD_CRITERION; return r; }

        uint8_t enabled = 0;
        for (uint8_t c = 0; c < ph.criteria_count; ++c) {
            const BreakoutCriterion& bc = ph.criteria[c];
            if (!bc.enabled) continue;
            if (!criterion_ok(bc)) { r.issue = PROFILE_BAD_CRITERION; return r; }
            enabled++;
        }
        if (enabled == 0) { r.issue = PROFILE_NO_CRITERIA; return r; }

        if (ph.mode != MODE_PAUSE) {
            if (!target_ok(ph.mode, ph.target_start)) { r.issue = PROFILE_BAD_TARGET; return r; }
            if (ph.mode == MODE_RAMP && !target_ok(ph.mode, ph.target_end)) { r.issue = PROFILE_BAD_TARGET; return r; }
        }

        if (!isfinite(ph.max_duration_s) || ph.max_duration_s > SAFETY_MAX_PHASE_S ||
            !isfinite(ph.min_duration_s) || ph.min_duration_s < 0.0f ||
            !isfinite(ph.ramp_duration_s) || ph.ramp_duration_s < 0.0f) {
            r.issue = PROFILE_BAD_DURATION;
            return r;
        }
        if (ph.max_duration_s > 0.0f && ph.min_duration_s > ph.max_duration_s) {
            r.issue = PROFILE_BAD_DURATION;
            return r;
        }
        // A Time criterion the hard maximum would always pre-empt.
        if (seconds_to_ms(longest_time_s(ph)) > phase_max_ms(ph)) {
            r.issue = PROFILE_BAD_DURATION;
            return r;
        }
    }
    r.phase_index = 0;
    return r;
}

uint32_t phase_max_ms(const Phase& ph) {
    if (ph.max_duration_s > 0.0f) return seconds_to_ms(ph.max_duration_s);
    // No declared maximum: long enough for the phase's own Time criteria.
    const float s = constrain(longest_time_s(ph), DEFAULT_PHASE_MAX_S, SAFETY_MAX_PHASE_S);
    return seconds_to_ms(s);
}

uint32_t profile_max_ms(const Profile& p) {
    uint32_t total = 0;
    for (uint8_t i = 0; i < p.phase_count && i < MAX_PHASES; ++i) {
        total += phase_max_ms(p.phases[i]);
    }
    return total;
}

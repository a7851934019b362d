#include "learning_engine.h"
#include <math.h>

static const char* NS = "learning";
static const char* KEY_KP = "kp";
static const char* KEY_KI = "ki";
static const char* KEY_KD = "kd";
static const char* KEY_ENABLED = "enabled";
static const char* KEY_LAST_ID = "last_id";

const char* learning_rule_name(LearningEngine::Rule r) {
    switch (r) {
        case LearningEngine::RULE_SOFTEN:  return "soften";
        case LearningEngine::RULE_TIGHTEN: return "tighten";
        case LearningEngine::RULE_NONE:
        default:                           return "none";
    }
}

LearningEngine::LearningEngine(const Config& cfg)
    : cfg_(cfg)
    , gains_(clamp(cfg.initial, cfg.bounds))
    , enabled_(cfg.enabled)
{}

ControlGains LearningEngine::clamp(const ControlGains& g, const GainBounds& b, bool* clamped) {
    ControlGains out;
    out.kp = isfinite(g.kp) ? constrain(g.kp, b.kp_min, b.kp_max) : b.kp_min;
    out.ki = isfinite(g.ki) ? constrain(g.ki, b.ki_min, b.ki_max) : b.ki_min;
    out.kd = isfinite(g.kd) ? constrain(g.kd, b.kd_min, b.kd_max) : b.kd_min;
    if (clamped) *clamped = (out.kp != g.kp) || (out.ki != g.ki) || (out.kd != g.kd);
    return out;
}

bool LearningEngine::begin() {
    if (!cfg_.persist) return true;
    if (!prefs_.begin(NS, false)) {
        Diag::logf(LOG_WARN, "Learning store unavailable, using defaults");
        return false;
    }
    open_ = true;

    if (prefs_.isKey(KEY_KP)) {
        ControlGains stored;
        stored.kp = prefs_.getFloat(KEY_KP, gains_.kp);
        stored.ki = prefs_.getFloat(KEY_KI, gains_.ki);
        stored.kd = prefs_.getFloat(KEY_KD, gains_.kd);
        bool clamped = false;
        gains_ = clamp(stored, cfg_.bounds, &clamped);
        if (clamped) {
            Diag::fault(LOG_INFO, FAULT_GAIN_OUT_OF_BOUNDS, "Stored gains outside bounds, clamped");
        }
    }
    enabled_ = prefs_.getBool(KEY_ENABLED, enabled_);
    last_adjusted_id_ = prefs_.getUInt(KEY_LAST_ID, 0);

    Serial.printf("[LEARN] Loaded Kp=%.3f Ki=%.3f Kd=%.3f (%s)\n",
                  gains_.kp, gains_.ki, gains_.kd, enabled_ ? "enabled" : "disabled");
    return true;
}

void LearningEngine::save_() {
    if (!open_) return;
    prefs_.putFloat(KEY_KP, gains_.kp);
    prefs_.putFloat(KEY_KI, gains_.ki);
    prefs_.putFloat(KEY_KD, gains_.kd);
    prefs_.putBool(KEY_ENABLED, enabled_);
    prefs_.putUInt(KEY_LAST_ID, last_adjusted_id_);
}

void LearningEngine::set_enabled(bool on) {
    if (enabled_ == on) return;
    enabled_ = on;
    save_();
    Serial.printf("[LEARN] %s\n", on ? "Enabled" : "Disabled, gains frozen");
}

void LearningEngine::set_gains(const ControlGains& g) {
    bool clamped = false;
    gains_ = clamp(g, cfg_.bounds, &clamped);
    if (clamped) {
        Diag::fault(LOG_INFO, FAULT_GAIN_OUT_OF_BOUNDS, "Requested gains clamped to Kp=%.3f Ki=%.3f Kd=%.3f",
                    gains_.kp, gains_.ki, gains_.kd);
    }
    save_();
}

void LearningEngine::reset_to_defaults() {
    gains_ = clamp(cfg_.initial, cfg_.bounds);
    last_ = Adjustment{};
    save_();
}

LearningEngine::Adjustment LearningEngine::learn(const ShotHistoryManager& history) {
    Adjustment adj;
    adj.before = gains_;
    adj.after = gains_;

    ShotSummary latest;
    if (!enabled_ || !history.getLatestShot(latest)) return adj;
    adj.shot_id = latest.shot_id;

    // One step per shot, and only shots that ran to completion teach anything.
    if (latest.shot_id <= last_adjusted_id_) return adj;
    if (latest.outcome != OUTCOME_COMPLETE || !latest.has_pressure_stats) return adj;

    float sum_over = 0.0f;
    float sum_settle = 0.0f;
    uint8_t used = 0;
    for (int i = (int)history.getCount() - 1; i >= 0 && used < cfg_.window_shots; --i) {
        ShotSummary s;
        if (!history.loadShot((uint8_t)i, s)) continue;
        if (s.outcome != OUTCOME_COMPLETE || !s.has_pressure_stats) continue;
        sum_over += s.overshoot_bar;
        sum_settle += s.settling_s;
        used++;
    }
    if (used == 0 || used < cfg_.min_shots) return adj;

    adj.evaluated = true;
    adj.shots_used = used;
    adj.mean_overshoot_bar = sum_over / used;
    adj.mean_settling_s = sum_settle / used;
    last_adjusted_id_ = latest.shot_id;

    ControlGains proposed = gains_;
    if (adj.mean_overshoot_bar > cfg_.overshoot_threshold_bar) {
        adj.rule = RULE_SOFTEN;
        proposed.kp -= cfg_.kp_step;
        proposed.kd += cfg_.kd_step;
    } else if (adj.mean_settling_s > cfg_.settling_threshold_s &&
               adj.mean_overshoot_bar < cfg_.low_overshoot_bar) {
        adj.rule = RULE_TIGHTEN;
        proposed.ki += cfg_.ki_step;
    }

    if (adj.rule != RULE_NONE) {
        gains_ = clamp(proposed, cfg_.bounds, &adj.clamped);
        if (adj.clamped) {
            Diag::fault(LOG_INFO, FAULT_GAIN_OUT_OF_BOUNDS, "Learning step clamped (%s)", learning_rule_name(adj.rule));
        }
    }
    adj.after = gains_;
    adj.applied = (adj.after.kp != adj.before.kp) || (adj.after.ki != adj.before.ki) ||
                  (adj.after.kd != adj.before.kd);

    Serial.printf("[LEARN] Shot %lu: %u shots, overshoot=%.2fbar settling=%.2fs -> %s Kp=%.3f Ki=%.3f Kd=%.3f\n",
                  (unsigned long)adj.shot_id, (unsigned)used, adj.mean_overshoot_bar, adj.mean_settling_s,
                  learning_rule_name(adj.rule), gains_.kp, gains_.ki, gains_.kd);

    last_ = adj;
    save_();
    return adj;
}

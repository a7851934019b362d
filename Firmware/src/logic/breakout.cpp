#include "breakout.h"

BreakoutEvaluator::BreakoutEvaluator(const BreakoutConfig& cfg) {
    setConfig(cfg);
}

void BreakoutEvaluator::setConfig(const BreakoutConfig& cfg) {
    cfg_ = cfg;
}

uint8_t BreakoutEvaluator::rank(BreakoutKind kind) const {
    for (uint8_t i = 0; i < BREAKOUT_KIND_COUNT; ++i) {
        if (cfg_.priority[i] == kind) return i;
    }
    return BREAKOUT_KIND_COUNT;
}

bool BreakoutEvaluator::satisfied_(const BreakoutCriterion& c, float threshold,
                                   const BreakoutInputs& in, float& value) const {
    switch (c.kind) {
        case BREAKOUT_TIME:
            value = in.phase_ms / 1000.0f;
            return in.phase_ms >= seconds_to_ms(threshold);
        case BREAKOUT_WEIGHT:
            value = in.weight_delta_g;
            return in.weight_valid && in.weight_delta_g >= threshold;
        case BREAKOUT_FLOW:
            value = in.flow_ml_s;
            return in.flow_valid && in.flow_ml_s >= threshold;
        case BREAKOUT_PRESSURE_PERCENT:
            value = in.pressure_pct;
            return in.pressure_pct_valid && in.pressure_pct >= threshold;
        default:
            return false;
    }
}

BreakoutResult BreakoutEvaluator::evaluate(const Phase& phase, const BreakoutInputs& in) const {
    BreakoutResult best;
    uint8_t best_rank = 0xFF;

    const uint8_t n = min(phase.criteria_count, (uint8_t)MAX_CRITERIA);
    const bool past_phase_min = in.phase_ms >= seconds_to_ms(phase.min_duration_s);

    if (past_phase_min) {
        for (uint8_t i = 0; i < n; ++i) {
            const BreakoutCriterion& c = phase.criteria[i];
            if (!c.enabled) continue;
            if (in.phase_ms < seconds_to_ms(c.min_duration_s)) continue;

            const float threshold = (in.threshold_override[i] > 0.0f) ? in.threshold_override[i] : c.threshold;
            float value = 0.0f;
            if (!satisfied_(c, threshold, in, value)) continue;

            // Strictly-lower rank wins, so declaration order breaks ties within a kind.
            const uint8_t r = rank(c.kind);
            if (!best.fired || r < best_rank) {
                best.fired = true;
                best.kind = c.kind;
                best.criterion_index = (int8_t)i;
                best.forced = false;
                best.value = value;
                best_rank = r;
            }
        }
    }

    if (best.fired) return best;

    // Hard maximum: guarantees termination whatever the declared criteria say.
    if (in.phase_ms >= phase_max_ms(phase)) {
        best.fired = true;
        best.kind = BREAKOUT_TIME;
        best.criterion_index = -1;
        best.forced = true;
        best.value = in.phase_ms / 1000.0f;
    }
    return best;
}

#pragma once
#include "profile.h"

// Tie-break order for criteria that are satisfied on the same tick.
struct BreakoutConfig {
    BreakoutKind priority[BREAKOUT_KIND_COUNT] = {
        BREAKOUT_WEIGHT,
        BREAKOUT_PRESSURE_PERCENT,
        BREAKOUT_FLOW,
        BREAKOUT_TIME
    };
};

// What the evaluator sees each tick. Invalid inputs cannot satisfy a criterion.
struct BreakoutInputs {
    uint32_t phase_ms = 0;

    float weight_delta_g = 0.0f;
    bool weight_valid = false;

    float flow_ml_s = 0.0f;
    bool flow_valid = false;

    float pressure_pct = 0.0f;      // actual pressure as percent of the phase target
    bool pressure_pct_valid = false;

    // Per-criterion threshold overrides (e.g. target-weight override); <= 0 keeps the declared value.
    float threshold_override[MAX_CRITERIA]{};
};

struct BreakoutResult {
    bool fired = false;
    BreakoutKind kind = BREAKOUT_NONE;
    int8_t criterion_index = -1;    // -1 for the synthetic hard-maximum breakout
    bool forced = false;
    float value = 0.0f;             // the input that satisfied it
};

class BreakoutEvaluator {
public:
    BreakoutEvaluator() : BreakoutEvaluator(BreakoutConfig{}) {}
    explicit BreakoutEvaluator(const BreakoutConfig& cfg);

    BreakoutResult evaluate(const Phase& phase, const BreakoutInputs& in) const;

    // Priority rank of a kind; lower wins. Kinds missing from the configured
    // order rank after every listed kind.
    uint8_t rank(BreakoutKind kind) const;

    void setConfig(const BreakoutConfig& cfg);
    const BreakoutConfig& config() const { return cfg_; }

private:
    bool satisfied_(const BreakoutCriterion& c, float threshold, const BreakoutInputs& in, float& value) const;

    BreakoutConfig cfg_;
};

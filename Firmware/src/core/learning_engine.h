#pragma once
#include "../common_types.h"
#include "../utils/shot_history.h"

struct GainBounds {
    float kp_min = GAIN_KP_MIN, kp_max = GAIN_KP_MAX;
    float ki_min = GAIN_KI_MIN, ki_max = GAIN_KI_MAX;
    float kd_min = GAIN_KD_MIN, kd_max = GAIN_KD_MAX;
};

// Slow cross-shot tuning of the pressure-loop gains. Sole writer of the
// learned ControlGains; the controller bank only ever reads a snapshot.
class LearningEngine {
public:
    struct Config {
        GainBounds bounds{};
        ControlGains initial{};

        uint8_t window_shots = LEARNING_WINDOW_SHOTS;
        uint8_t min_shots = LEARNING_MIN_SHOTS;

        float overshoot_threshold_bar = LEARNING_OVERSHOOT_BAR;
        float low_overshoot_bar = LEARNING_LOW_OVERSHOOT_BAR;
        float settling_threshold_s = LEARNING_SETTLING_S;

        float kp_step = LEARNING_KP_STEP;
        float ki_step = LEARNING_KI_STEP;
        float kd_step = LEARNING_KD_STEP;

        bool enabled = LEARNING_DEFAULT_ENABLED;
        bool persist = true;
    };

    enum Rule : uint8_t {
        RULE_NONE = 0,
        RULE_SOFTEN,        // overshoot: Kp down, Kd up
        RULE_TIGHTEN        // slow settling: Ki up
    };

    struct Adjustment {
        bool evaluated = false;     // enough data and allowed to run
        bool applied = false;       // gains actually changed
        bool clamped = false;
        Rule rule = RULE_NONE;
        uint32_t shot_id = 0;
        uint8_t shots_used = 0;
        float mean_overshoot_bar = 0.0f;
        float mean_settling_s = 0.0f;
        ControlGains before{};
        ControlGains after{};
    };

    LearningEngine() : LearningEngine(Config{}) {}
    explicit LearningEngine(const Config& cfg);

    // Restores persisted gains (re-clamped) and the enable flag.
    bool begin();

    // Runs once per finished shot, outside the control tick. The newest
    // history entry is the shot being learned from.
    Adjustment learn(const ShotHistoryManager& history);

    void set_enabled(bool on);
    bool enabled() const { return enabled_; }

    const ControlGains& gains() const { return gains_; }

    // Operator override; clamped like any learned step.
    void set_gains(const ControlGains& g);
    void reset_to_defaults();

    uint32_t last_adjusted_shot() const { return last_adjusted_id_; }
    const Adjustment& last_adjustment() const { return last_; }

    const Config& config() const { return cfg_; }

    static ControlGains clamp(const ControlGains& g, const GainBounds& b, bool* clamped = nullptr);

private:
    void save_();

    Config cfg_;
    ControlGains gains_{};
    bool enabled_ = true;
    uint32_t last_adjusted_id_ = 0;
    Adjustment last_{};

    Preferences prefs_;
    bool open_ = false;
};

const char* learning_rule_name(LearningEngine::Rule r);

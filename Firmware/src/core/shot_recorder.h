#pragma once
#include "../common_types.h"
#include "../logic/phase_sequencer.h"
#include <vector>

// Per-phase statistics. Overshoot/settling are only meaningful for phases
// that hold one target (Pressure, Flow).
struct PhaseStats {
    ControlMode mode = MODE_PAUSE;
    bool constant_target = false;
    float target = 0.0f;

    float peak_overshoot = 0.0f;    // max(actual - target, 0), in the loop's unit
    uint32_t settling_ms = 0;       // phase duration when it never settled
    bool settled = false;
    uint16_t samples = 0;

    uint32_t duration_ms = 0;
    BreakoutKind breakout = BREAKOUT_NONE;
    bool forced = false;
};

// Fixed-size shot summary. Trivially copyable: it is stored as a raw blob.
struct ShotSummary {
    uint32_t shot_id = 0;
    uint32_t start_ms = 0;
    uint32_t duration_ms = 0;
    char profile_name[PROFILE_NAME_LEN] = "";

    ShotOutcome outcome = OUTCOME_NONE;
    AbortReason abort_reason = ABORT_NONE;

    uint8_t phase_count = 0;        // phases actually entered
    PhaseStats phases[MAX_PHASES]{};

    // Pressure-loop aggregates, the input to gain learning.
    bool has_pressure_stats = false;
    float overshoot_bar = 0.0f;     // worst pressure-phase overshoot
    float settling_s = 0.0f;        // slowest pressure-phase settling

    float final_yield_g = 0.0f;
    float peak_pressure_bar = 0.0f;
    float avg_pressure_bar = 0.0f;
    float pressure_stability = 0.0f;  // 0..100
    float peak_flow_ml_s = 0.0f;
    float avg_flow_ml_s = 0.0f;
    float flow_stability = 0.0f;      // 0..100

    float target_weight_g = 0.0f;   // 0 = no override
    bool target_weight_reached = false;
    float weight_deviation_g = 0.0f;

    bool trace_truncated = false;   // samples past the cap were summarised but not kept

    ControlGains gains{};           // gains the shot ran with
};

struct ShotRecord {
    ShotSummary summary{};
    std::vector<TickSample> trace;
};

// Collects the per-tick trace of one shot and reduces it to a ShotSummary.
class ShotRecorder {
public:
    struct Config {
        float tolerance_pct = SETTLING_TOLERANCE_PCT;
        // Enough for the longest profile validation accepts.
        size_t max_samples = (size_t)(MAX_PHASES * SAFETY_MAX_PHASE_S * 1000 / CONTROL_TICK_MS);
    };

    ShotRecorder() : ShotRecorder(Config{}) {}
    explicit ShotRecorder(const Config& cfg);

    void begin(uint32_t shot_id, uint32_t now_ms, const char* profile_name,
               const ControlGains& gains, float target_weight_g);

    // One call per active tick.
    void record(const TickSample& s, const Phase& phase);

    // Fills phase transitions and aggregates from the sequencer's final state.
    ShotRecord finish(const PhaseSequencer& seq);

    bool recording() const { return recording_; }
    size_t sample_count() const { return record_.trace.size(); }

    void setConfig(const Config& cfg) { cfg_ = cfg; }
    const Config& config() const { return cfg_; }

private:
    struct PhaseAccum {
        bool have_candidate = false;
        uint32_t candidate_ms = 0;
    };

    // Running sums over every sample, kept or not.
    struct SignalAccum {
        float sum = 0.0f;
        float sum_sq = 0.0f;
        float peak = 0.0f;
        uint32_t n = 0;

        void add(float v) {
            sum += v;
            sum_sq += v * v;
            peak = max(peak, v);
            n++;
        }
    };

    bool in_band_(float actual, float target) const;
    void aggregate_(ShotSummary& s) const;

    Config cfg_;
    bool recording_ = false;
    ShotRecord record_{};
    PhaseAccum accum_[MAX_PHASES]{};
    SignalAccum pressure_{};
    SignalAccum flow_{};
    bool have_weight_ = false;
    float last_weight_g_ = 0.0f;
};

// Sample-standard-deviation based stability score, 0..100.
float stability_score(float sum, float sum_sq, uint32_t n);

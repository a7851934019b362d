#pragma once

#include "../common_types.h"
#include "../controllers/controller_bank.h"
#include "profile.h"
#include "breakout.h"

// Profile execution state machine.
// Decoupled from the platform: it sees timestamps and a SensorFrame, and
// produces a normalized actuator command, so every transition is testable
// on the host.

struct SequencerConfig {
    uint8_t sensor_grace_ticks = SENSOR_FAULT_GRACE_TICKS;
    uint32_t sensor_stale_ms = SENSOR_STALE_MS;
    BreakoutConfig breakout{};
};

struct PhaseTransition {
    uint8_t phase_index = 0;
    uint32_t end_shot_ms = 0;
    uint32_t duration_ms = 0;
    BreakoutKind kind = BREAKOUT_NONE;
    bool forced = false;
};

// One control-loop sample, as consumed by the shot recorder.
struct TickSample {
    uint8_t phase_index = 0;
    ControlMode mode = MODE_PAUSE;
    uint32_t shot_ms = 0;
    uint32_t phase_ms = 0;
    float target = 0.0f;
    float actual = 0.0f;
    bool actual_valid = false;
    float command = 0.0f;
    float pressure_bar = 0.0f;
    float flow_ml_s = 0.0f;
    float weight_g = 0.0f;      // weight since shot start
    bool weight_valid = false;
};

struct SeqOutputs {
    float command = 0.0f;
    bool ran = false;           // a phase was active for this tick
    bool phase_changed = false;
    bool shot_ended = false;
    BreakoutResult breakout{};
    TickSample sample{};
    TelemetryFrame telemetry{};
};

class PhaseSequencer {
public:
    explicit PhaseSequencer(ControllerBank& bank) : PhaseSequencer(bank, SequencerConfig{}) {}
    PhaseSequencer(ControllerBank& bank, const SequencerConfig& cfg);

    // Latches a profile for the next shot. Rejected while a shot is running.
    CommandResult select_profile(const Profile& p);

    // Idle (or terminal, passing back through Idle) -> PhaseActive(0).
    // target_weight_override_g <= 0 means "use the profile's Weight thresholds".
    CommandResult start(uint32_t now_ms, const ControlGains& gains, float target_weight_override_g = 0.0f);

    SeqOutputs tick(uint32_t now_ms, const SensorFrame& in);

    // PhaseActive -> Aborted; the actuator command is 0 when this returns.
    CommandResult abort(uint32_t now_ms, AbortReason reason);

    // Terminal -> Idle. Rejected while a shot is running.
    CommandResult reset();

    SequencerState state() const { return state_; }
    uint32_t state_enter_ms() const { return state_enter_ms_; }
    bool active() const { return state_ == SEQ_PHASE_ACTIVE; }
    uint8_t phase_index() const { return phase_idx_; }
    AbortReason abort_reason() const { return abort_reason_; }
    float command() const { return last_command_; }
    uint8_t consecutive_faults() const { return consecutive_faults_; }

    const Profile& profile() const { return profile_; }
    bool has_profile() const { return profile_.phase_count > 0; }

    uint32_t shot_start_ms() const { return shot_start_ms_; }
    uint32_t phase_start_ms() const { return phase_start_ms_; }
    uint32_t end_ms() const { return end_ms_; }
    float target_weight_override() const { return weight_override_g_; }

    uint8_t transition_count() const { return transition_count_; }
    const PhaseTransition& transition(uint8_t i) const { return transitions_[i < MAX_PHASES ? i : MAX_PHASES - 1]; }

    // Valid, finite and not older than sensor_stale_ms.
    bool is_fresh(const SensorReading& r, uint32_t now_ms) const;

    void setConfig(const SequencerConfig& cfg);
    const SequencerConfig& config() const { return cfg_; }

private:
    void enter(SequencerState s, uint32_t now_ms);
    void enter_phase(uint8_t idx, uint32_t now_ms);
    void record_transition_(const BreakoutResult& br, uint32_t now_ms);

    ControllerBank& bank_;
    SequencerConfig cfg_;
    BreakoutEvaluator evaluator_;

    Profile profile_{};
    SequencerState state_ = SEQ_IDLE;
    AbortReason abort_reason_ = ABORT_NONE;
    uint32_t state_enter_ms_ = 0;

    uint8_t phase_idx_ = 0;
    uint32_t shot_start_ms_ = 0;
    uint32_t phase_start_ms_ = 0;
    uint32_t last_tick_ms_ = 0;
    uint32_t end_ms_ = 0;

    float last_command_ = 0.0f;
    uint8_t consecutive_faults_ = 0;

    // Weight baselines. Latched at the first valid reading after shot/phase entry.
    float last_weight_g_ = 0.0f;
    bool last_weight_valid_ = false;
    float shot_weight_base_g_ = 0.0f;
    bool shot_weight_latched_ = false;
    float phase_weight_base_g_ = 0.0f;
    bool phase_weight_latched_ = false;

    // Target-weight override, applied to the Weight criteria of one phase.
    float weight_override_g_ = 0.0f;
    int8_t override_phase_ = -1;
    float threshold_override_[MAX_CRITERIA]{};

    PhaseTransition transitions_[MAX_PHASES]{};
    uint8_t transition_count_ = 0;
};

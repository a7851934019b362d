#pragma once
#include "common_types.h"
#include "diagnostics.h"
#include "controllers/controller_bank.h"
#include "logic/profile.h"
#include "logic/phase_sequencer.h"
#include "core/shot_recorder.h"
#include "core/learning_engine.h"
#include "core/health_aggregator.h"
#include "utils/shot_history.h"

// Outbound telemetry. Implementations must return quickly: on_tick runs
// inside the control tick.
class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;
    virtual void on_tick(const TelemetryFrame& f) { (void)f; }
    virtual void on_shot_complete(const ShotRecord& r) { (void)r; }
    virtual void on_health(const HealthSnapshot& h) { (void)h; }
};

struct EngineConfig {
    SequencerConfig sequencer{};
    ControllerBank::Config bank{};
    ShotRecorder::Config recorder{};
    LearningEngine::Config learning{};
    HealthAggregator::Config health{};

    uint32_t health_publish_ms = HEALTH_PUBLISH_MS;
    uint8_t history_size = MAX_SHOT_HISTORY;
    const char* history_namespace = "shot_hist";
};

struct DiagnosticSnapshot {
    uint32_t ms = 0;

    SequencerState state = SEQ_IDLE;
    uint8_t phase_index = 0;
    char profile_name[PROFILE_NAME_LEN] = "";
    uint32_t shot_ms = 0;
    uint32_t phase_ms = 0;
    float command = 0.0f;
    uint8_t consecutive_faults = 0;
    AbortReason abort_reason = ABORT_NONE;

    ControllerBank::Diagnostics controller{};

    bool learning_enabled = false;
    ControlGains learned_gains{};
    LearningEngine::Adjustment last_adjustment{};

    uint8_t error_count = 0;
    bool fatal_latched = false;
    uint8_t history_count = 0;
    bool shot_pending = false;
    bool sensor_fault[SENSOR_COUNT]{};
};

// Owns the control core. tick() is the hard-deadline path; service() runs
// learning, history persistence and periodic health outside of it.
class BrewEngine {
public:
    BrewEngine() : BrewEngine(EngineConfig{}) {}
    explicit BrewEngine(const EngineConfig& cfg);

    // Restores learned gains and shot history.
    bool begin();

    void set_sink(TelemetrySink* sink) { sink_ = sink; }

    // --- Commands ---
    CommandResult select_profile(const Profile& p);
    CommandResult start_shot(uint32_t now_ms, float target_weight_override_g = 0.0f);
    CommandResult start_shot(uint32_t now_ms, const Profile& p, float target_weight_override_g = 0.0f);
    CommandResult abort_shot(uint32_t now_ms);
    CommandResult reset();
    void set_learning_enabled(bool on);
    HealthSnapshot request_health(uint32_t now_ms);
    DiagnosticSnapshot request_diagnostics(uint32_t now_ms) const;
    void acknowledge_errors();
    void set_system_status(const SystemStatus& s) { health_in_.system = s; }
    void set_network_status(const NetworkStatus& n) { health_in_.network = n; }

    // --- Periodic ---
    // Returns the actuator command for this tick, 0..1.
    float tick(uint32_t now_ms, const SensorFrame& frame);
    void service(uint32_t now_ms);

    float command() const { return seq_.command(); }
    bool shot_pending() const { return pending_; }

    const PhaseSequencer& sequencer() const { return seq_; }
    const ControllerBank& bank() const { return bank_; }
    const LearningEngine& learning() const { return learning_; }
    LearningEngine& learning() { return learning_; }
    const ShotHistoryManager& history() const { return history_; }
    ShotHistoryManager& history() { return history_; }
    const HealthAggregator& health() const { return health_; }
    const EngineConfig& config() const { return cfg_; }

private:
    void update_sensor_flags_(uint32_t now_ms, const SensorFrame& frame);
    void close_shot_();
    void flush_pending_();

    EngineConfig cfg_;
    ControllerBank bank_;
    PhaseSequencer seq_;
    ShotRecorder recorder_;
    ShotHistoryManager history_;
    LearningEngine learning_;
    HealthAggregator health_;

    TelemetrySink* sink_ = nullptr;

    HealthInputs health_in_{};
    bool sensor_seen_[SENSOR_COUNT]{};
    uint32_t last_health_ms_ = 0;
    bool health_published_ = false;

    ShotRecord pending_record_{};
    bool pending_ = false;
};

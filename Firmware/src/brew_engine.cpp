#include "brew_engine.h"
#ifndef ARDUINO
  #include "utils/native_arduino_stubs.h"
#endif
#include <stdio.h>

BrewEngine::BrewEngine(const EngineConfig& cfg)
    : cfg_(cfg)
    , bank_(cfg.bank)
    , seq_(bank_, cfg.sequencer)
    , recorder_(cfg.recorder)
    , history_(cfg.history_size, cfg.history_namespace)
    , learning_(cfg.learning)
    , health_(cfg.health)
{}

bool BrewEngine::begin() {
    const bool hist_ok = history_.begin();
    const bool learn_ok = learning_.begin();
    Diag::logf(LOG_INFO, "Engine ready: %u shots, learning %s",
               (unsigned)history_.getCount(), learning_.enabled() ? "on" : "off");
    return hist_ok && learn_ok;
}

// ===================================================================
// COMMANDS
// ===================================================================
CommandResult BrewEngine::select_profile(const Profile& p) {
    return seq_.select_profile(p);
}

CommandResult BrewEngine::start_shot(uint32_t now_ms, float target_weight_override_g) {
    // A finished shot must teach before the next one snapshots the gains.
    flush_pending_();

    const ControlGains gains = learning_.gains();
    const CommandResult r = seq_.start(now_ms, gains, target_weight_override_g);
    if (r != CMD_OK) return r;

    recorder_.begin(history_.nextShotId(), now_ms, seq_.profile().name, gains, seq_.target_weight_override());
    return CMD_OK;
}

CommandResult BrewEngine::start_shot(uint32_t now_ms, const Profile& p, float target_weight_override_g) {
    const CommandResult r = seq_.select_profile(p);
    if (r != CMD_OK) return r;
    return start_shot(now_ms, target_weight_override_g);
}

CommandResult BrewEngine::abort_shot(uint32_t now_ms) {
    const CommandResult r = seq_.abort(now_ms, ABORT_USER_STOP);
    if (r != CMD_OK) {
        Diag::log(LOG_INFO, "Abort ignored: no shot running");
        return r;
    }
    close_shot_();
    return CMD_OK;
}

CommandResult BrewEngine::reset() {
    const CommandResult r = seq_.reset();
    if (r != CMD_OK) {
        Diag::fault(LOG_WARN, FAULT_SHOT_IN_PROGRESS, "Reset rejected: shot in progress");
    }
    return r;
}

void BrewEngine::set_learning_enabled(bool on) {
    learning_.set_enabled(on);
}

void BrewEngine::acknowledge_errors() {
    Diag::acknowledge();
    Diag::log(LOG_INFO, "Errors acknowledged");
}

HealthSnapshot BrewEngine::request_health(uint32_t now_ms) {
    const HealthSnapshot h = health_.compute(health_in_, now_ms);
    last_health_ms_ = now_ms;
    health_published_ = true;
    if (sink_) sink_->on_health(h);
    return h;
}

DiagnosticSnapshot BrewEngine::request_diagnostics(uint32_t now_ms) const {
    DiagnosticSnapshot d;
    d.ms = now_ms;
    d.state = seq_.state();
    d.phase_index = seq_.phase_index();
    snprintf(d.profile_name, sizeof(d.profile_name), "%s", seq_.has_profile() ? seq_.profile().name : "");
    if (seq_.active()) {
        d.shot_ms = now_ms - seq_.shot_start_ms();
        d.phase_ms = now_ms - seq_.phase_start_ms();
    } else if (seq_.end_ms() != 0) {
        d.shot_ms = seq_.end_ms() - seq_.shot_start_ms();
    }
    d.command = seq_.command();
    d.consecutive_faults = seq_.consecutive_faults();
    d.abort_reason = seq_.abort_reason();

    d.controller = bank_.diagnostics();

    d.learning_enabled = learning_.enabled();
    d.learned_gains = learning_.gains();
    d.last_adjustment = learning_.last_adjustment();

    d.error_count = Diag::count();
    d.fatal_latched = Diag::fatal_latched();
    d.history_count = history_.getCount();
    d.shot_pending = pending_;
    for (uint8_t i = 0; i < SENSOR_COUNT; ++i) d.sensor_fault[i] = health_in_.sensor_fault[i];
    return d;
}

// ===================================================================
// PERIODIC
// ===================================================================
void BrewEngine::update_sensor_flags_(uint32_t now_ms, const SensorFrame& frame) {
    const SensorReading* readings[SENSOR_COUNT] = {
        &frame.pressure_bar, &frame.flow_ml_s, &frame.weight_g, &frame.temp_c
    };
    for (uint8_t i = 0; i < SENSOR_COUNT; ++i) {
        const SensorReading& r = *readings[i];
        const bool fresh = seq_.is_fresh(r, now_ms);
        if (fresh) sensor_seen_[i] = true;
        // A sensor that never reported is absent, not faulted.
        health_in_.sensor_fault[i] = !fresh && (sensor_seen_[i] || r.timestamp_ms != 0);
    }
}

float BrewEngine::tick(uint32_t now_ms, const SensorFrame& frame) {
    update_sensor_flags_(now_ms, frame);

    const SeqOutputs out = seq_.tick(now_ms, frame);
    if (out.ran) {
        recorder_.record(out.sample, seq_.profile().phases[out.sample.phase_index]);
        if (sink_) sink_->on_tick(out.telemetry);
    }
    if (out.shot_ended) close_shot_();
    return out.command;
}

void BrewEngine::service(uint32_t now_ms) {
    flush_pending_();
    if (!health_published_ || (now_ms - last_health_ms_) >= cfg_.health_publish_ms) {
        request_health(now_ms);
    }
}

void BrewEngine::close_shot_() {
    if (!recorder_.recording()) return;
    pending_record_ = recorder_.finish(seq_);
    pending_ = true;
}

void BrewEngine::flush_pending_() {
    if (!pending_) return;
    pending_ = false;

    const ShotSummary& s = pending_record_.summary;
    Serial.printf("[SHOT] #%lu %s %.1fs yield=%.1fg overshoot=%.2fbar settling=%.2fs\n",
                  (unsigned long)s.shot_id, s.outcome == OUTCOME_COMPLETE ? "complete" : "aborted",
                  s.duration_ms / 1000.0f, s.final_yield_g, s.overshoot_bar, s.settling_s);

    if (!history_.saveShot(std::move(pending_record_))) {
        Diag::log(LOG_WARN, "Shot kept in RAM only");
    }
    pending_record_ = ShotRecord{};

    learning_.learn(history_);

    if (sink_ && history_.getCount() > 0) {
        const ShotRecord* r = history_.record((uint8_t)(history_.getCount() - 1));
        if (r) sink_->on_shot_complete(*r);
    }
}

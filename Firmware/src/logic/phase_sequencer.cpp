#include "phase_sequencer.h"
#include "../diagnostics.h"
#ifndef ARDUINO
  #include "../utils/native_arduino_stubs.h"
#endif
#include <math.h>

PhaseSequencer::PhaseSequencer(ControllerBank& bank, const SequencerConfig& cfg)
    : bank_(bank)
    , cfg_(cfg)
    , evaluator_(cfg.breakout)
{}

void PhaseSequencer::setConfig(const SequencerConfig& cfg) {
    cfg_ = cfg;
    evaluator_.setConfig(cfg.breakout);
}

CommandResult PhaseSequencer::select_profile(const Profile& p) {
    if (state_ == SEQ_PHASE_ACTIVE) {
        Diag::fault(LOG_WARN, FAULT_SHOT_IN_PROGRESS, "Profile change rejected: shot in progress");
        return CMD_SHOT_IN_PROGRESS;
    }
    const ProfileCheck chk = validate_profile(p);
    if (!chk.ok()) {
        Diag::fault(LOG_CRITICAL, FAULT_PROFILE_INVALID, "Profile '%s' invalid: %s (phase %u)",
                    p.name, profile_issue_name(chk.issue), (unsigned)chk.phase_index);
        return CMD_PROFILE_INVALID;
    }
    profile_ = p;
    return CMD_OK;
}

CommandResult PhaseSequencer::start(uint32_t now_ms, const ControlGains& gains, float target_weight_override_g) {
    if (state_ == SEQ_PHASE_ACTIVE) {
        Diag::fault(LOG_WARN, FAULT_SHOT_IN_PROGRESS, "Start rejected: shot in progress");
        return CMD_SHOT_IN_PROGRESS;
    }
    // select_profile() only accepts valid profiles, so an empty one means none was selected.
    if (profile_.phase_count == 0) {
        Diag::fault(LOG_CRITICAL, FAULT_PROFILE_INVALID, "Start rejected: no valid profile selected");
        return CMD_PROFILE_INVALID;
    }

    if (state_ != SEQ_IDLE) {
        enter(SEQ_IDLE, now_ms);
    }

    abort_reason_ = ABORT_NONE;
    shot_start_ms_ = now_ms;
    last_tick_ms_ = now_ms;
    end_ms_ = 0;
    last_command_ = 0.0f;
    consecutive_faults_ = 0;
    transition_count_ = 0;

    shot_weight_latched_ = last_weight_valid_;
    shot_weight_base_g_ = last_weight_g_;

    weight_override_g_ = (target_weight_override_g > 0.0f && isfinite(target_weight_override_g))
                         ? target_weight_override_g : 0.0f;
    override_phase_ = -1;
    if (weight_override_g_ > 0.0f) {
        for (int8_t i = (int8_t)profile_.phase_count - 1; i >= 0 && override_phase_ < 0; --i) {
            const Phase& ph = profile_.phases[i];
            for (uint8_t c = 0; c < ph.criteria_count; ++c) {
                if (ph.criteria[c].enabled && ph.criteria[c].kind == BREAKOUT_WEIGHT) {
                    override_phase_ = i;
                    break;
                }
            }
        }
        if (override_phase_ < 0) {
            Diag::logf(LOG_WARN, "Target weight %.1fg ignored: profile has no weight breakout", weight_override_g_);
        }
    }

    bank_.begin_shot(gains);
    Serial.printf("[SHOT] Start '%s' (%u phases) Kp=%.3f Ki=%.3f Kd=%.3f\n",
                  profile_.name, (unsigned)profile_.phase_count, gains.kp, gains.ki, gains.kd);

    enter(SEQ_PHASE_ACTIVE, now_ms);
    enter_phase(0, now_ms);
    return CMD_OK;
}

CommandResult PhaseSequencer::abort(uint32_t now_ms, AbortReason reason) {
    if (state_ != SEQ_PHASE_ACTIVE) {
        last_command_ = 0.0f;
        return CMD_NOT_ACTIVE;
    }
    last_command_ = 0.0f;
    bank_.stop();
    abort_reason_ = reason;
    end_ms_ = now_ms;
    enter(SEQ_ABORTED, now_ms);

    if (reason == ABORT_SENSOR_FAULT) {
        Diag::fault(LOG_FATAL, FAULT_SENSOR_PERSISTENT, "Shot aborted: sensor fault in phase %u",
                    (unsigned)phase_idx_);
    } else {
        Diag::logf(LOG_INFO, "Shot aborted by user in phase %u", (unsigned)phase_idx_);
    }
    return CMD_OK;
}

CommandResult PhaseSequencer::reset() {
    if (state_ == SEQ_PHASE_ACTIVE) return CMD_SHOT_IN_PROGRESS;
    enter(SEQ_IDLE, end_ms_);
    last_command_ = 0.0f;
    return CMD_OK;
}

void PhaseSequencer::enter(SequencerState s, uint32_t now_ms) {
    state_ = s;
    state_enter_ms_ = now_ms;
}

void PhaseSequencer::enter_phase(uint8_t idx, uint32_t now_ms) {
    phase_idx_ = idx;
    phase_start_ms_ = now_ms;

    const Phase& ph = profile_.phases[idx];
    bank_.select(ph.controller, ph.mode);

    phase_weight_latched_ = last_weight_valid_;
    phase_weight_base_g_ = last_weight_g_;

    for (uint8_t c = 0; c < MAX_CRITERIA; ++c) threshold_override_[c] = 0.0f;
    if (override_phase_ == (int8_t)idx) {
        // Override is a total yield; the criterion measures weight gained inside this phase.
        const float in_cup = (shot_weight_latched_ && last_weight_valid_) ? (last_weight_g_ - shot_weight_base_g_) : 0.0f;
        const float remaining = max(weight_override_g_ - in_cup, 0.1f);
        for (uint8_t c = 0; c < ph.criteria_count; ++c) {
            if (ph.criteria[c].enabled && ph.criteria[c].kind == BREAKOUT_WEIGHT) {
                threshold_override_[c] = remaining;
            }
        }
    }

    Serial.printf("[PHASE] %u '%s' %s/%s target=%.2f\n",
                  (unsigned)idx, ph.name, mode_name(ph.mode), controller_name(ph.controller), ph.target_start);
}

bool PhaseSequencer::is_fresh(const SensorReading& r, uint32_t now_ms) const {
    if (!r.valid || !isfinite(r.value)) return false;
    if (now_ms > r.timestamp_ms && (now_ms - r.timestamp_ms) > cfg_.sensor_stale_ms) return false;
    return true;
}

void PhaseSequencer::record_transition_(const BreakoutResult& br, uint32_t now_ms) {
    if (transition_count_ >= MAX_PHASES) return;
    PhaseTransition& t = transitions_[transition_count_++];
    t.phase_index = phase_idx_;
    t.end_shot_ms = now_ms - shot_start_ms_;
    t.duration_ms = now_ms - phase_start_ms_;
    t.kind = br.kind;
    t.forced = br.forced;
}

SeqOutputs PhaseSequencer::tick(uint32_t now_ms, const SensorFrame& in) {
    SeqOutputs out;

    const bool p_ok = is_fresh(in.pressure_bar, now_ms);
    const bool f_ok = is_fresh(in.flow_ml_s, now_ms);
    const bool w_ok = is_fresh(in.weight_g, now_ms);

    last_weight_valid_ = w_ok;
    if (w_ok) last_weight_g_ = in.weight_g.value;

    out.telemetry.state = state_;
    out.telemetry.pressure_bar = p_ok ? in.pressure_bar.value : 0.0f;
    out.telemetry.flow_ml_s = f_ok ? in.flow_ml_s.value : 0.0f;
    out.telemetry.weight_g = w_ok ? in.weight_g.value : 0.0f;

    if (state_ != SEQ_PHASE_ACTIVE) {
        out.command = 0.0f;
        last_command_ = 0.0f;
        return out;
    }

    out.ran = true;

    if (w_ok && !shot_weight_latched_) {
        shot_weight_base_g_ = in.weight_g.value;
        shot_weight_latched_ = true;
    }
    if (w_ok && !phase_weight_latched_) {
        phase_weight_base_g_ = in.weight_g.value;
        phase_weight_latched_ = true;
    }

    const uint32_t dt_ms = now_ms - last_tick_ms_;
    last_tick_ms_ = now_ms;

    const uint8_t idx = phase_idx_;
    const Phase& ph = profile_.phases[idx];
    const uint32_t phase_ms = now_ms - phase_start_ms_;
    const float target = ph.target_at(phase_ms);

    // Controlled variable for this phase
    bool needs_sensor = true;
    bool actual_ok = false;
    float actual = 0.0f;
    switch (ph.mode) {
        case MODE_FLOW:
            actual_ok = f_ok;
            actual = in.flow_ml_s.value;
            break;
        case MODE_PRESSURE:
        case MODE_RAMP:
            actual_ok = p_ok;
            actual = in.pressure_bar.value;
            break;
        case MODE_PAUSE:
        default:
            needs_sensor = false;
            break;
    }

    float command = 0.0f;
    if (!needs_sensor) {
        consecutive_faults_ = 0;
        command = bank_.compute(0.0f, dt_ms / 1000.0f);
    } else if (actual_ok) {
        consecutive_faults_ = 0;
        command = bank_.compute(target - actual, dt_ms / 1000.0f);
    } else {
        consecutive_faults_++;
        if (consecutive_faults_ == 1) {
            Diag::fault(LOG_WARN, FAULT_SENSOR_TRANSIENT, "%s sensor fault in phase %u",
                        ph.mode == MODE_FLOW ? "Flow" : "Pressure", (unsigned)idx);
        }
        if (consecutive_faults_ >= cfg_.sensor_grace_ticks) {
            abort(now_ms, ABORT_SENSOR_FAULT);
            out.command = 0.0f;
            out.shot_ended = true;
            out.telemetry.state = state_;
            out.telemetry.phase_index = idx;
            out.telemetry.mode = ph.mode;
            out.telemetry.shot_ms = now_ms - shot_start_ms_;
            out.telemetry.phase_ms = phase_ms;
            out.telemetry.target = target;
            out.telemetry.sensor_fault = true;
            out.sample.phase_index = idx;
            out.sample.mode = ph.mode;
            out.sample.shot_ms = out.telemetry.shot_ms;
            out.sample.phase_ms = phase_ms;
            out.sample.target = target;
            return out;
        }
        // Transient: hold the last command, do not feed the controller a bogus error.
        command = last_command_;
    }
    last_command_ = command;

    // Fill the sample before any transition so it describes the phase that produced it.
    out.sample.phase_index = idx;
    out.sample.mode = ph.mode;
    out.sample.shot_ms = now_ms - shot_start_ms_;
    out.sample.phase_ms = phase_ms;
    out.sample.target = target;
    out.sample.actual = actual_ok ? actual : 0.0f;
    out.sample.actual_valid = actual_ok;
    out.sample.command = command;
    out.sample.pressure_bar = out.telemetry.pressure_bar;
    out.sample.flow_ml_s = out.telemetry.flow_ml_s;
    out.sample.weight_valid = w_ok && shot_weight_latched_;
    out.sample.weight_g = out.sample.weight_valid ? (in.weight_g.value - shot_weight_base_g_) : 0.0f;

    out.telemetry.phase_index = idx;
    out.telemetry.mode = ph.mode;
    out.telemetry.shot_ms = out.sample.shot_ms;
    out.telemetry.phase_ms = phase_ms;
    out.telemetry.target = target;
    out.telemetry.saturated = bank_.saturated();
    out.telemetry.sensor_fault = needs_sensor && !actual_ok;

    // Breakout arbitration
    BreakoutInputs bi;
    bi.phase_ms = phase_ms;
    bi.weight_valid = w_ok && phase_weight_latched_;
    bi.weight_delta_g = bi.weight_valid ? (in.weight_g.value - phase_weight_base_g_) : 0.0f;
    bi.flow_valid = f_ok;
    bi.flow_ml_s = f_ok ? in.flow_ml_s.value : 0.0f;
    const float p_ref = (ph.mode == MODE_PRESSURE || ph.mode == MODE_RAMP) ? target : ph.pressure_reference_bar;
    bi.pressure_pct_valid = p_ok && p_ref > 0.01f;
    bi.pressure_pct = bi.pressure_pct_valid ? (in.pressure_bar.value / p_ref) * 100.0f : 0.0f;
    for (uint8_t c = 0; c < MAX_CRITERIA; ++c) bi.threshold_override[c] = threshold_override_[c];

    const BreakoutResult br = evaluator_.evaluate(ph, bi);
    out.breakout = br;

    if (br.fired) {
        record_transition_(br, now_ms);
        Serial.printf("[PHASE] %u '%s' done via %s%s at %.2fs (value=%.2f)\n",
                      (unsigned)idx, ph.name, breakout_name(br.kind), br.forced ? " (hard max)" : "",
                      phase_ms / 1000.0f, br.value);
        if (br.forced) {
            Diag::logf(LOG_WARN, "Phase %u hit its hard maximum", (unsigned)idx);
        }

        if ((uint8_t)(idx + 1) < profile_.phase_count) {
            enter_phase((uint8_t)(idx + 1), now_ms);
            out.phase_changed = true;
        } else {
            end_ms_ = now_ms;
            last_command_ = 0.0f;
            command = 0.0f;
            bank_.stop();
            enter(SEQ_SHOT_COMPLETE, now_ms);
            out.shot_ended = true;
            Serial.printf("[SHOT] Complete in %.2fs\n", (now_ms - shot_start_ms_) / 1000.0f);
        }
    }

    out.command = command;
    out.telemetry.command = command;
    out.telemetry.state = state_;
    return out;
}

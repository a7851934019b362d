#include "shot_recorder.h"
#include <math.h>
#include <stdio.h>
#include <utility>

float stability_score(float sum, float sum_sq, uint32_t n) {
    if (n == 0) return 0.0f;
    const float mean = sum / n;
    if (mean <= 0.0f) return 0.0f;
    float stdev = 0.0f;
    if (n > 1) {
        const float var = (sum_sq - sum * sum / n) / (n - 1);
        stdev = var > 0.0f ? sqrtf(var) : 0.0f;
    }
    const float cv_pct = stdev / mean * 100.0f;
    return constrain(100.0f - cv_pct, 0.0f, 100.0f);
}

ShotRecorder::ShotRecorder(const Config& cfg)
    : cfg_(cfg)
{}

void ShotRecorder::begin(uint32_t shot_id, uint32_t now_ms, const char* profile_name,
                         const ControlGains& gains, float target_weight_g) {
    record_ = ShotRecord{};
    record_.trace.reserve(256);
    for (uint8_t i = 0; i < MAX_PHASES; ++i) accum_[i] = PhaseAccum{};
    pressure_ = SignalAccum{};
    flow_ = SignalAccum{};
    have_weight_ = false;
    last_weight_g_ = 0.0f;

    ShotSummary& s = record_.summary;
    s.shot_id = shot_id;
    s.start_ms = now_ms;
    s.gains = gains;
    s.target_weight_g = target_weight_g > 0.0f ? target_weight_g : 0.0f;
    snprintf(s.profile_name, sizeof(s.profile_name), "%s", profile_name ? profile_name : "");
    recording_ = true;
}

bool ShotRecorder::in_band_(float actual, float target) const {
    const float band = fabsf(target) * cfg_.tolerance_pct / 100.0f;
    return fabsf(actual - target) <= band;
}

void ShotRecorder::record(const TickSample& smp, const Phase& phase) {
    if (!recording_) return;
    const uint8_t idx = smp.phase_index;
    if (idx >= MAX_PHASES) return;

    ShotSummary& s = record_.summary;
    if (idx >= s.phase_count) {
        for (uint8_t i = s.phase_count; i <= idx; ++i) s.phases[i] = PhaseStats{};
        s.phase_count = (uint8_t)(idx + 1);
        PhaseStats& ps = s.phases[idx];
        ps.mode = phase.mode;
        ps.constant_target = phase.has_constant_target();
        ps.target = phase.target_start;
    }

    if (record_.trace.size() < cfg_.max_samples) {
        record_.trace.push_back(smp);
    } else {
        s.trace_truncated = true;
    }

    if (smp.pressure_bar > 0.0f) pressure_.add(smp.pressure_bar);
    if (smp.flow_ml_s > 0.0f) flow_.add(smp.flow_ml_s);
    if (smp.weight_valid) {
        have_weight_ = true;
        last_weight_g_ = smp.weight_g;
    }

    PhaseStats& ps = s.phases[idx];
    ps.samples++;
    if (!ps.constant_target || !smp.actual_valid) return;

    const float over = smp.actual - ps.target;
    if (over > ps.peak_overshoot) ps.peak_overshoot = over;

    // Settled at the first in-band sample after which it never leaves the band.
    PhaseAccum& a = accum_[idx];
    if (in_band_(smp.actual, ps.target)) {
        if (!a.have_candidate) {
            a.have_candidate = true;
            a.candidate_ms = smp.phase_ms;
        }
    } else {
        a.have_candidate = false;
    }
}

void ShotRecorder::aggregate_(ShotSummary& s) const {
    if (have_weight_) s.final_yield_g = last_weight_g_;
    s.peak_pressure_bar = pressure_.peak;
    s.peak_flow_ml_s = flow_.peak;
    s.avg_pressure_bar = pressure_.n ? pressure_.sum / pressure_.n : 0.0f;
    s.avg_flow_ml_s = flow_.n ? flow_.sum / flow_.n : 0.0f;
    s.pressure_stability = stability_score(pressure_.sum, pressure_.sum_sq, pressure_.n);
    s.flow_stability = stability_score(flow_.sum, flow_.sum_sq, flow_.n);

    for (uint8_t i = 0; i < s.phase_count; ++i) {
        const PhaseStats& ps = s.phases[i];
        if (ps.mode != MODE_PRESSURE || ps.samples == 0) continue;
        s.overshoot_bar = s.has_pressure_stats ? max(s.overshoot_bar, ps.peak_overshoot) : ps.peak_overshoot;
        s.settling_s = s.has_pressure_stats ? max(s.settling_s, ps.settling_ms / 1000.0f) : ps.settling_ms / 1000.0f;
        s.has_pressure_stats = true;
    }

    if (s.target_weight_g > 0.0f) {
        s.weight_deviation_g = s.final_yield_g - s.target_weight_g;
        s.target_weight_reached = s.final_yield_g >= s.target_weight_g;
    }
}

ShotRecord ShotRecorder::finish(const PhaseSequencer& seq) {
    ShotSummary& s = record_.summary;
    recording_ = false;

    const uint32_t end = seq.end_ms();
    s.duration_ms = end - s.start_ms;
    s.outcome = (seq.state() == SEQ_ABORTED) ? OUTCOME_ABORTED : OUTCOME_COMPLETE;
    s.abort_reason = seq.abort_reason();

    for (uint8_t t = 0; t < seq.transition_count(); ++t) {
        const PhaseTransition& tr = seq.transition(t);
        if (tr.phase_index >= MAX_PHASES) continue;
        PhaseStats& ps = s.phases[tr.phase_index];
        ps.duration_ms = tr.duration_ms;
        ps.breakout = tr.kind;
        ps.forced = tr.forced;
    }
    // An aborted phase has no transition entry.
    if (s.outcome == OUTCOME_ABORTED && seq.phase_index() < s.phase_count) {
        s.phases[seq.phase_index()].duration_ms = end - seq.phase_start_ms();
    }

    for (uint8_t i = 0; i < s.phase_count; ++i) {
        PhaseStats& ps = s.phases[i];
        if (!ps.constant_target) continue;
        ps.settled = accum_[i].have_candidate;
        ps.settling_ms = ps.settled ? accum_[i].candidate_ms : ps.duration_ms;
    }

    aggregate_(s);

    ShotRecord out = std::move(record_);
    record_ = ShotRecord{};
    return out;
}

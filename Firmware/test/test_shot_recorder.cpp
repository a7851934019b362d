#include <unity.h>
#include "core/shot_recorder.h"

typedef float (*SignalFn)(uint32_t now);

static SensorFrame frame_at(uint32_t now, float pressure, float weight) {
    SensorFrame f;
    f.pressure_bar.value = pressure;
    f.pressure_bar.valid = true;
    f.pressure_bar.timestamp_ms = now;
    f.flow_ml_s.value = 2.0f;
    f.flow_ml_s.valid = true;
    f.flow_ml_s.timestamp_ms = now;
    f.weight_g.value = weight;
    f.weight_g.valid = true;
    f.weight_g.timestamp_ms = now;
    return f;
}

static float zero_weight(uint32_t) { return 0.0f; }

// Runs the profile until it ends or stop_at is reached, feeding every active sample to the recorder.
static ShotRecord run_shot(const Profile& p, SignalFn pressure, SignalFn weight,
                           float target_weight_g = 0.0f, uint32_t stop_at = 0,
                           const ShotRecorder::Config& cfg = ShotRecorder::Config{}) {
    ControllerBank bank;
    PhaseSequencer seq(bank);
    ShotRecorder rec(cfg);
    TEST_ASSERT_EQUAL(CMD_OK, seq.select_profile(p));
    seq.tick(0, frame_at(0, 0.0f, weight(0)));
    TEST_ASSERT_EQUAL(CMD_OK, seq.start(0, ControlGains{}, target_weight_g));
    rec.begin(7, 0, p.name, ControlGains{}, target_weight_g);

    uint32_t now = 0;
    while (seq.active() && now < 1000000) {
        now += 50;
        if (stop_at && now >= stop_at) {
            seq.abort(now, ABORT_USER_STOP);
            break;
        }
        const SeqOutputs out = seq.tick(now, frame_at(now, pressure(now), weight(now)));
        if (out.ran) rec.record(out.sample, seq.profile().phases[out.sample.phase_index]);
    }
    TEST_ASSERT_TRUE(rec.recording());
    ShotRecord r = rec.finish(seq);
    TEST_ASSERT_FALSE(rec.recording());
    return r;
}

static Profile pressure_profile(float seconds) {
    Profile p;
    p.set_name("REC");
    Phase* ph = p.add_phase("hold", MODE_PRESSURE, 9.0f);
    ph->add_criterion(BREAKOUT_TIME, seconds);
    return p;
}

static float step_with_overshoot(uint32_t now) {
    if (now < 500) return 5.0f;
    if (now < 1500) return 9.5f;
    return 9.05f;
}

static void test_overshoot_and_settling_time() {
    const ShotRecord r = run_shot(pressure_profile(3.0f), step_with_overshoot, zero_weight);
    const ShotSummary& s = r.summary;

    TEST_ASSERT_EQUAL_UINT32(7, s.shot_id);
    TEST_ASSERT_EQUAL(OUTCOME_COMPLETE, s.outcome);
    TEST_ASSERT_EQUAL_UINT32(3000, s.duration_ms);
    TEST_ASSERT_EQUAL_UINT8(1, s.phase_count);
    TEST_ASSERT_EQUAL_UINT32(60, r.trace.size());

    const PhaseStats& ps = s.phases[0];
    TEST_ASSERT_TRUE(ps.constant_target);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.5f, ps.peak_overshoot);
    TEST_ASSERT_TRUE(ps.settled);
    TEST_ASSERT_EQUAL_UINT32(1500, ps.settling_ms);
    TEST_ASSERT_EQUAL(BREAKOUT_TIME, ps.breakout);
    TEST_ASSERT_EQUAL_UINT32(3000, ps.duration_ms);

    TEST_ASSERT_TRUE(s.has_pressure_stats);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.5f, s.overshoot_bar);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 1.5f, s.settling_s);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 9.5f, s.peak_pressure_bar);
}

static float oscillating(uint32_t now) {
    return ((now / 50) % 2) ? 8.0f : 10.0f;
}

static void test_unsettled_phase_reports_full_duration() {
    const ShotRecord r = run_shot(pressure_profile(3.0f), oscillating, zero_weight);
    const PhaseStats& ps = r.summary.phases[0];
    TEST_ASSERT_FALSE(ps.settled);
    TEST_ASSERT_EQUAL_UINT32(3000, ps.settling_ms);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 1.0f, ps.peak_overshoot);
    TEST_ASSERT_TRUE(r.summary.pressure_stability < 95.0f);
}

static float ramp_follow(uint32_t now) { return 3.0f + 6.0f * now / 6000.0f + 1.0f; }

static void test_ramp_phase_has_no_overshoot_metrics() {
    Profile p;
    Phase* ph = p.add_phase("ramp", MODE_RAMP, 3.0f);
    ph->target_end = 9.0f;
    ph->ramp_duration_s = 6.0f;
    ph->add_criterion(BREAKOUT_TIME, 6.0f);
    const ShotRecord r = run_shot(p, ramp_follow, zero_weight);
    const PhaseStats& ps = r.summary.phases[0];
    TEST_ASSERT_FALSE(ps.constant_target);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, ps.peak_overshoot);
    TEST_ASSERT_FALSE(r.summary.has_pressure_stats);
}

static void test_aborted_shot_summary() {
    const ShotRecord r = run_shot(pressure_profile(10.0f), step_with_overshoot, zero_weight, 0.0f, 1000);
    const ShotSummary& s = r.summary;
    TEST_ASSERT_EQUAL(OUTCOME_ABORTED, s.outcome);
    TEST_ASSERT_EQUAL(ABORT_USER_STOP, s.abort_reason);
    TEST_ASSERT_EQUAL_UINT32(1000, s.duration_ms);
    TEST_ASSERT_EQUAL_UINT32(1000, s.phases[0].duration_ms);
    TEST_ASSERT_EQUAL(BREAKOUT_NONE, s.phases[0].breakout);
}

static void test_stability_score() {
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, stability_score(0.0f, 0.0f, 0));
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 100.0f, stability_score(9.0f, 81.0f, 1));
    // {8, 10}: mean 9, sample stdev sqrt(2)
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 84.29f, stability_score(18.0f, 164.0f, 2));
    // {1, 100}: CV far beyond 100%
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, stability_score(101.0f, 10001.0f, 2));
}

static float linear_weight(uint32_t now) { return now / 100.0f; }

static void test_final_yield_against_target_weight() {
    Profile p;
    Phase* ph = p.add_phase("drip", MODE_PRESSURE, 6.0f);
    ph->add_criterion(BREAKOUT_TIME, 2.0f);
    const ShotRecord r = run_shot(p, step_with_overshoot, linear_weight, 18.0f);
    const ShotSummary& s = r.summary;
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 20.0f, s.final_yield_g);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 18.0f, s.target_weight_g);
    TEST_ASSERT_TRUE(s.target_weight_reached);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 2.0f, s.weight_deviation_g);
}

static float steady_9bar(uint32_t) { return 9.0f; }
static float slow_drip(uint32_t now) { return now * 0.2f / 1000.0f; }

static void test_long_shot_summary_covers_every_sample() {
    Profile p;
    p.set_name("LONG");
    for (int i = 0; i < 3; ++i) {
        Phase* ph = p.add_phase("hold", MODE_PRESSURE, 9.0f);
        ph->max_duration_s = 110.0f;
        ph->add_criterion(BREAKOUT_TIME, 100.0f);
    }
    TEST_ASSERT_TRUE(validate_profile(p).ok());

    const ShotRecord r = run_shot(p, steady_9bar, slow_drip, 55.0f);
    const ShotSummary& s = r.summary;
    TEST_ASSERT_EQUAL(OUTCOME_COMPLETE, s.outcome);
    TEST_ASSERT_EQUAL_UINT32(300000, s.duration_ms);
    TEST_ASSERT_EQUAL_UINT8(3, s.phase_count);
    TEST_ASSERT_EQUAL_UINT32(6000, r.trace.size());
    TEST_ASSERT_FALSE(s.trace_truncated);
    TEST_ASSERT_FLOAT_WITHIN(1e-2f, 60.0f, s.final_yield_g);
    TEST_ASSERT_TRUE(s.target_weight_reached);
    TEST_ASSERT_FLOAT_WITHIN(1e-2f, 5.0f, s.weight_deviation_g);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 9.0f, s.avg_pressure_bar);
}

static void test_capped_trace_is_flagged_and_summary_stays_whole() {
    ShotRecorder::Config cfg;
    cfg.max_samples = 10;
    Profile p;
    Phase* ph = p.add_phase("drip", MODE_PRESSURE, 6.0f);
    ph->add_criterion(BREAKOUT_TIME, 2.0f);

    const ShotRecord r = run_shot(p, step_with_overshoot, linear_weight, 0.0f, 0, cfg);
    const ShotSummary& s = r.summary;
    TEST_ASSERT_EQUAL_UINT32(10, r.trace.size());
    TEST_ASSERT_TRUE(s.trace_truncated);
    TEST_ASSERT_EQUAL_UINT16(40, s.phases[0].samples);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 20.0f, s.final_yield_g);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 9.5f, s.peak_pressure_bar);
}

void run_shot_recorder_tests() {
    RUN_TEST(test_overshoot_and_settling_time);
    RUN_TEST(test_unsettled_phase_reports_full_duration);
    RUN_TEST(test_ramp_phase_has_no_overshoot_metrics);
    RUN_TEST(test_aborted_shot_summary);
    RUN_TEST(test_stability_score);
    RUN_TEST(test_final_yield_against_target_weight);
    RUN_TEST(test_long_shot_summary_covers_every_sample);
    RUN_TEST(test_capped_trace_is_flagged_and_summary_stays_whole);
}

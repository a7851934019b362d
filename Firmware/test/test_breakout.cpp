#include <unity.h>
#include "logic/breakout.h"

static Phase weight_and_time_phase() {
    Phase ph;
    ph.mode = MODE_PRESSURE;
    ph.target_start = 9.0f;
    // Time declared first on purpose: declaration order must not matter across kinds.
    ph.add_criterion(BREAKOUT_TIME, 25.0f);
    ph.add_criterion(BREAKOUT_WEIGHT, 36.0f);
    return ph;
}

static BreakoutInputs inputs_at(uint32_t phase_ms, float weight) {
    BreakoutInputs in;
    in.phase_ms = phase_ms;
    in.weight_delta_g = weight;
    in.weight_valid = true;
    return in;
}

static void test_weight_beats_time_on_same_tick() {
    BreakoutEvaluator ev;
    const BreakoutResult r = ev.evaluate(weight_and_time_phase(), inputs_at(25000, 36.0f));
    TEST_ASSERT_TRUE(r.fired);
    TEST_ASSERT_EQUAL(BREAKOUT_WEIGHT, r.kind);
    TEST_ASSERT_EQUAL_INT8(1, r.criterion_index);
    TEST_ASSERT_FALSE(r.forced);
}

static void test_priority_order_is_configurable() {
    BreakoutConfig cfg;
    cfg.priority[0] = BREAKOUT_TIME;
    cfg.priority[1] = BREAKOUT_WEIGHT;
    cfg.priority[2] = BREAKOUT_FLOW;
    cfg.priority[3] = BREAKOUT_PRESSURE_PERCENT;
    BreakoutEvaluator ev(cfg);
    const BreakoutResult r = ev.evaluate(weight_and_time_phase(), inputs_at(25000, 36.0f));
    TEST_ASSERT_EQUAL(BREAKOUT_TIME, r.kind);
    TEST_ASSERT_EQUAL_UINT8(0, ev.rank(BREAKOUT_TIME));
}

static void test_invalid_input_cannot_fire() {
    BreakoutEvaluator ev;
    BreakoutInputs in = inputs_at(1000, 100.0f);
    in.weight_valid = false;
    TEST_ASSERT_FALSE(ev.evaluate(weight_and_time_phase(), in).fired);

    Phase ph;
    ph.add_criterion(BREAKOUT_FLOW, 2.0f);
    ph.add_criterion(BREAKOUT_PRESSURE_PERCENT, 90.0f);
    BreakoutInputs f;
    f.phase_ms = 1000;
    f.flow_ml_s = 5.0f;
    f.flow_valid = false;
    f.pressure_pct = 120.0f;
    f.pressure_pct_valid = false;
    TEST_ASSERT_FALSE(ev.evaluate(ph, f).fired);

    f.flow_valid = true;
    const BreakoutResult r = ev.evaluate(ph, f);
    TEST_ASSERT_EQUAL(BREAKOUT_FLOW, r.kind);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 5.0f, r.value);
}

static void test_time_fires_only_at_threshold() {
    BreakoutEvaluator ev;
    Phase ph;
    ph.add_criterion(BREAKOUT_TIME, 25.0f);
    BreakoutInputs in;
    in.phase_ms = 24999;
    TEST_ASSERT_FALSE(ev.evaluate(ph, in).fired);
    in.phase_ms = 25000;
    const BreakoutResult r = ev.evaluate(ph, in);
    TEST_ASSERT_TRUE(r.fired);
    TEST_ASSERT_EQUAL(BREAKOUT_TIME, r.kind);
    TEST_ASSERT_FALSE(r.forced);
}

static void test_min_durations_block_early_breakout() {
    BreakoutEvaluator ev;
    Phase ph;
    ph.min_duration_s = 4.0f;
    ph.add_criterion(BREAKOUT_WEIGHT, 2.0f);
    TEST_ASSERT_FALSE(ev.evaluate(ph, inputs_at(3000, 10.0f)).fired);
    TEST_ASSERT_TRUE(ev.evaluate(ph, inputs_at(4000, 10.0f)).fired);

    Phase per;
    per.add_criterion(BREAKOUT_WEIGHT, 2.0f, 3.0f);
    TEST_ASSERT_FALSE(ev.evaluate(per, inputs_at(2950, 10.0f)).fired);
    TEST_ASSERT_TRUE(ev.evaluate(per, inputs_at(3000, 10.0f)).fired);
}

static void test_hard_max_forces_synthetic_time() {
    BreakoutEvaluator ev;
    Phase ph;
    ph.max_duration_s = 10.0f;
    ph.min_duration_s = 20.0f;     // even a min that can never be met does not outlive the max
    ph.add_criterion(BREAKOUT_WEIGHT, 500.0f);

    TEST_ASSERT_FALSE(ev.evaluate(ph, inputs_at(9950, 0.0f)).fired);
    const BreakoutResult r = ev.evaluate(ph, inputs_at(10000, 0.0f));
    TEST_ASSERT_TRUE(r.fired);
    TEST_ASSERT_TRUE(r.forced);
    TEST_ASSERT_EQUAL(BREAKOUT_TIME, r.kind);
    TEST_ASSERT_EQUAL_INT8(-1, r.criterion_index);

    Phase dflt;
    dflt.add_criterion(BREAKOUT_FLOW, 9.0f);
    BreakoutInputs in;
    in.phase_ms = (uint32_t)(DEFAULT_PHASE_MAX_S * 1000);
    TEST_ASSERT_TRUE(ev.evaluate(dflt, in).forced);
}

static void test_declaration_order_breaks_ties_within_kind() {
    BreakoutEvaluator ev;
    Phase ph;
    ph.add_criterion(BREAKOUT_WEIGHT, 30.0f);
    ph.add_criterion(BREAKOUT_WEIGHT, 20.0f);
    const BreakoutResult r = ev.evaluate(ph, inputs_at(1000, 35.0f));
    TEST_ASSERT_EQUAL_INT8(0, r.criterion_index);
}

static void test_disabled_and_overridden_criteria() {
    BreakoutEvaluator ev;
    Phase ph;
    ph.add_criterion(BREAKOUT_WEIGHT, 36.0f);
    ph.add_criterion(BREAKOUT_TIME, 5.0f);
    ph.criteria[1].enabled = false;
    TEST_ASSERT_FALSE(ev.evaluate(ph, inputs_at(6000, 10.0f)).fired);

    BreakoutInputs in = inputs_at(6000, 26.0f);
    in.threshold_override[0] = 26.0f;
    const BreakoutResult r = ev.evaluate(ph, in);
    TEST_ASSERT_TRUE(r.fired);
    TEST_ASSERT_EQUAL(BREAKOUT_WEIGHT, r.kind);
}

void run_breakout_tests() {
    RUN_TEST(test_weight_beats_time_on_same_tick);
    RUN_TEST(test_priority_order_is_configurable);
    RUN_TEST(test_invalid_input_cannot_fire);
    RUN_TEST(test_time_fires_only_at_threshold);
    RUN_TEST(test_min_durations_block_early_breakout);
    RUN_TEST(test_hard_max_forces_synthetic_time);
    RUN_TEST(test_declaration_order_breaks_ties_within_kind);
    RUN_TEST(test_disabled_and_overridden_criteria);
}

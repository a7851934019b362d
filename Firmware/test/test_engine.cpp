#include <unity.h>
#include "brew_engine.h"
#include "profile_store.h"
#include "sim/puck_model.h"

namespace {
    struct CountingSink : TelemetrySink {
        uint32_t ticks = 0;
        uint32_t shots = 0;
        uint32_t health = 0;
        ShotSummary last_shot{};
        HealthSnapshot last_health{};

        void on_tick(const TelemetryFrame& f) override {
            (void)f;
            ticks++;
        }
        void on_shot_complete(const ShotRecord& r) override {
            shots++;
            last_shot = r.summary;
        }
        void on_health(const HealthSnapshot& h) override {
            health++;
            last_health = h;
        }
    };

    EngineConfig test_config(const char* ns) {
        EngineConfig cfg;
        cfg.learning.persist = false;
        cfg.history_namespace = ns;
        cfg.history_size = 5;
        return cfg;
    }

    Profile classic() {
        Profile p;
        TEST_ASSERT_TRUE(builtin_profile("classic", p));
        return p;
    }

    // Closed loop against the puck model until the shot ends or the limit passes.
    void run_shot(BrewEngine& e, PuckModel& m, uint32_t& now, uint32_t limit) {
        float cmd = e.command();
        while (e.sequencer().active() && now < limit) {
            now += CONTROL_TICK_MS;
            const SensorFrame f = m.step(cmd, CONTROL_TICK_MS / 1000.0f, now);
            cmd = e.tick(now, f);
            TEST_ASSERT_TRUE(cmd >= 0.0f && cmd <= 1.0f);
        }
    }
}

static void test_engine_runs_classic_shot_end_to_end() {
    BrewEngine e(test_config("eng_e2e"));
    CountingSink sink;
    e.set_sink(&sink);
    PuckModel m;

    uint32_t now = 0;
    e.tick(now, m.step(0.0f, 0.0f, now));
    TEST_ASSERT_EQUAL(CMD_OK, e.select_profile(classic()));
    TEST_ASSERT_EQUAL(CMD_OK, e.start_shot(now));
    const ControlGains snapshot = e.bank().diagnostics().shot_gains;

    const uint32_t bound = profile_max_ms(classic());
    run_shot(e, m, now, bound + 1000);

    TEST_ASSERT_EQUAL(SEQ_SHOT_COMPLETE, e.sequencer().state());
    TEST_ASSERT_TRUE(now <= bound);
    TEST_ASSERT_FLOAT_WITHIN(1e-9f, 0.0f, e.command());
    TEST_ASSERT_TRUE(sink.ticks > 0);

    // Persistence and learning wait for the service pass.
    TEST_ASSERT_TRUE(e.shot_pending());
    TEST_ASSERT_EQUAL_UINT32(0, sink.shots);
    TEST_ASSERT_EQUAL_UINT8(0, e.history().getCount());

    e.service(now);
    TEST_ASSERT_FALSE(e.shot_pending());
    TEST_ASSERT_EQUAL_UINT32(1, sink.shots);
    TEST_ASSERT_EQUAL_UINT8(1, e.history().getCount());
    TEST_ASSERT_EQUAL(OUTCOME_COMPLETE, sink.last_shot.outcome);
    TEST_ASSERT_EQUAL_UINT8(2, sink.last_shot.phase_count);
    TEST_ASSERT_TRUE(sink.last_shot.has_pressure_stats);
    TEST_ASSERT_TRUE(sink.last_shot.final_yield_g > 2.0f);
    TEST_ASSERT_EQUAL_STRING("CLASSIC", sink.last_shot.profile_name);
    TEST_ASSERT_EQUAL_FLOAT(snapshot.kp, sink.last_shot.gains.kp);

    TEST_ASSERT_TRUE(e.learning().last_adjustment().evaluated);
    TEST_ASSERT_EQUAL_UINT32(sink.last_shot.shot_id, e.learning().last_adjusted_shot());
    TEST_ASSERT_EQUAL_UINT32(1, sink.health);
}

static void test_engine_disabled_learning_keeps_gains() {
    BrewEngine e(test_config("eng_frozen"));
    PuckModel m;
    e.set_learning_enabled(false);
    const ControlGains before = e.learning().gains();

    uint32_t now = 0;
    for (int shot = 0; shot < 3; ++shot) {
        m.reset();
        e.tick(now, m.step(0.0f, 0.0f, now));
        TEST_ASSERT_EQUAL(CMD_OK, e.start_shot(now, classic()));
        run_shot(e, m, now, now + profile_max_ms(classic()) + 1000);
        e.service(now);
        TEST_ASSERT_EQUAL(CMD_OK, e.reset());
    }
    TEST_ASSERT_EQUAL_UINT8(3, e.history().getCount());
    TEST_ASSERT_EQUAL_FLOAT(before.kp, e.learning().gains().kp);
    TEST_ASSERT_EQUAL_FLOAT(before.ki, e.learning().gains().ki);
    TEST_ASSERT_EQUAL_FLOAT(before.kd, e.learning().gains().kd);
    TEST_ASSERT_FALSE(e.learning().last_adjustment().evaluated);
}

static void test_engine_rejects_commands_during_shot() {
    BrewEngine e(test_config("eng_busy"));
    PuckModel m;
    uint32_t now = 0;
    TEST_ASSERT_EQUAL(CMD_OK, e.start_shot(now, classic()));
    for (int i = 0; i < 10; ++i) {
        now += CONTROL_TICK_MS;
        e.tick(now, m.step(e.command(), CONTROL_TICK_MS / 1000.0f, now));
    }
    TEST_ASSERT_EQUAL(CMD_SHOT_IN_PROGRESS, e.start_shot(now));
    TEST_ASSERT_EQUAL(CMD_SHOT_IN_PROGRESS, e.select_profile(classic()));
    TEST_ASSERT_EQUAL(CMD_SHOT_IN_PROGRESS, e.reset());
    TEST_ASSERT_TRUE(e.sequencer().active());
    TEST_ASSERT_EQUAL_UINT8(0, e.sequencer().phase_index());

    Profile empty;
    TEST_ASSERT_EQUAL(CMD_OK, e.abort_shot(now));
    TEST_ASSERT_EQUAL(CMD_PROFILE_INVALID, e.start_shot(now, empty));
}

static void test_engine_abort_records_aborted_shot() {
    BrewEngine e(test_config("eng_abort"));
    CountingSink sink;
    e.set_sink(&sink);
    PuckModel m;
    uint32_t now = 0;
    TEST_ASSERT_EQUAL(CMD_OK, e.start_shot(now, classic()));
    for (int i = 0; i < 40; ++i) {
        now += CONTROL_TICK_MS;
        e.tick(now, m.step(e.command(), CONTROL_TICK_MS / 1000.0f, now));
    }
    TEST_ASSERT_TRUE(e.command() > 0.0f);

    TEST_ASSERT_EQUAL(CMD_OK, e.abort_shot(now));
    TEST_ASSERT_FLOAT_WITHIN(1e-9f, 0.0f, e.command());
    TEST_ASSERT_EQUAL(SEQ_ABORTED, e.sequencer().state());
    TEST_ASSERT_EQUAL(CMD_NOT_ACTIVE, e.abort_shot(now));

    // Ticks after the abort keep the pump off.
    now += CONTROL_TICK_MS;
    TEST_ASSERT_FLOAT_WITHIN(1e-9f, 0.0f, e.tick(now, m.step(0.0f, CONTROL_TICK_MS / 1000.0f, now)));

    e.service(now);
    ShotSummary s;
    TEST_ASSERT_TRUE(e.history().getLatestShot(s));
    TEST_ASSERT_EQUAL(OUTCOME_ABORTED, s.outcome);
    TEST_ASSERT_EQUAL(ABORT_USER_STOP, s.abort_reason);
    TEST_ASSERT_EQUAL_UINT32(2000, s.duration_ms);
    TEST_ASSERT_FALSE(e.learning().last_adjustment().evaluated);
    TEST_ASSERT_EQUAL_UINT32(1, sink.shots);
}

static void test_engine_sensor_fault_aborts_shot() {
    BrewEngine e(test_config("eng_fault"));
    PuckModel m;
    uint32_t now = 0;
    TEST_ASSERT_EQUAL(CMD_OK, e.start_shot(now, classic()));
    for (int i = 0; i < 20; ++i) {
        now += CONTROL_TICK_MS;
        e.tick(now, m.step(e.command(), CONTROL_TICK_MS / 1000.0f, now));
    }
    m.inject_fault(SENSOR_PRESSURE);
    for (int i = 0; i < 3; ++i) {
        now += CONTROL_TICK_MS;
        e.tick(now, m.step(e.command(), CONTROL_TICK_MS / 1000.0f, now));
    }
    TEST_ASSERT_EQUAL(SEQ_ABORTED, e.sequencer().state());
    TEST_ASSERT_EQUAL(ABORT_SENSOR_FAULT, e.sequencer().abort_reason());
    TEST_ASSERT_FLOAT_WITHIN(1e-9f, 0.0f, e.command());

    const DiagnosticSnapshot d = e.request_diagnostics(now);
    TEST_ASSERT_TRUE(d.sensor_fault[SENSOR_PRESSURE]);
    TEST_ASSERT_FALSE(d.sensor_fault[SENSOR_FLOW]);
    TEST_ASSERT_TRUE(d.fatal_latched);
    TEST_ASSERT_TRUE(d.shot_pending);

    HealthSnapshot h = e.request_health(now);
    TEST_ASSERT_EQUAL(HEALTH_ERROR, h.tier);
    TEST_ASSERT_EQUAL_UINT8(75, h.sensors.score);

    e.acknowledge_errors();
    TEST_ASSERT_FALSE(Diag::fatal_latched());
    h = e.request_health(now);
    TEST_ASSERT_FALSE(h.fatal_override);
}

static void test_engine_publishes_health_periodically() {
    EngineConfig cfg = test_config("eng_health");
    BrewEngine e(cfg);
    CountingSink sink;
    e.set_sink(&sink);

    e.service(0);
    TEST_ASSERT_EQUAL_UINT32(1, sink.health);
    e.service(cfg.health_publish_ms - 1);
    TEST_ASSERT_EQUAL_UINT32(1, sink.health);
    e.service(cfg.health_publish_ms);
    TEST_ASSERT_EQUAL_UINT32(2, sink.health);
    TEST_ASSERT_EQUAL_UINT32(cfg.health_publish_ms, sink.last_health.ms);
}

static void test_engine_absent_sensor_is_not_faulted() {
    BrewEngine e(test_config("eng_absent"));
    SensorFrame f;
    f.pressure_bar.value = 1.0f;
    f.pressure_bar.valid = true;
    f.pressure_bar.timestamp_ms = 100;
    e.tick(100, f);

    DiagnosticSnapshot d = e.request_diagnostics(100);
    TEST_ASSERT_FALSE(d.sensor_fault[SENSOR_PRESSURE]);
    TEST_ASSERT_FALSE(d.sensor_fault[SENSOR_TEMPERATURE]);

    f.pressure_bar.valid = false;
    f.pressure_bar.timestamp_ms = 150;
    e.tick(150, f);
    d = e.request_diagnostics(150);
    TEST_ASSERT_TRUE(d.sensor_fault[SENSOR_PRESSURE]);
    TEST_ASSERT_FALSE(d.sensor_fault[SENSOR_WEIGHT]);
    TEST_ASSERT_EQUAL(SEQ_IDLE, d.state);
}

static void test_engine_target_weight_override() {
    BrewEngine e(test_config("eng_target"));
    PuckModel m;
    uint32_t now = 0;
    e.tick(now, m.step(0.0f, 0.0f, now));
    TEST_ASSERT_EQUAL(CMD_OK, e.start_shot(now, classic(), 20.0f));
    run_shot(e, m, now, profile_max_ms(classic()) + 1000);
    e.service(now);

    ShotSummary s;
    TEST_ASSERT_TRUE(e.history().getLatestShot(s));
    TEST_ASSERT_EQUAL(OUTCOME_COMPLETE, s.outcome);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 20.0f, s.target_weight_g);
    TEST_ASSERT_EQUAL(BREAKOUT_WEIGHT, s.phases[1].breakout);
    TEST_ASSERT_TRUE(s.target_weight_reached);
    TEST_ASSERT_FLOAT_WITHIN(0.5f, 20.0f, s.final_yield_g);
}

void run_engine_tests() {
    RUN_TEST(test_engine_runs_classic_shot_end_to_end);
    RUN_TEST(test_engine_disabled_learning_keeps_gains);
    RUN_TEST(test_engine_rejects_commands_during_shot);
    RUN_TEST(test_engine_abort_records_aborted_shot);
    RUN_TEST(test_engine_sensor_fault_aborts_shot);
    RUN_TEST(test_engine_publishes_health_periodically);
    RUN_TEST(test_engine_absent_sensor_is_not_faulted);
    RUN_TEST(test_engine_target_weight_override);
}

#include <unity.h>
#include "core/health_aggregator.h"

static HealthInputs healthy() {
    HealthInputs in;
    in.system.total_heap = 1000;
    in.system.free_heap = 600;
    in.system.largest_free_block = 600;
    in.network.link_up = true;
    in.network.rssi_dbm = -50;
    return in;
}

static void test_all_healthy_is_excellent() {
    HealthAggregator h;
    const HealthSnapshot s = h.compute(healthy(), 1234);
    TEST_ASSERT_EQUAL_UINT8(100, s.score);
    TEST_ASSERT_EQUAL(HEALTH_EXCELLENT, s.tier);
    TEST_ASSERT_FALSE(s.fatal_override);
    TEST_ASSERT_EQUAL_UINT32(1234, s.ms);
}

static void test_fatal_forces_error_tier_until_acknowledged() {
    HealthAggregator h;
    Diag::fault(LOG_FATAL, FAULT_SENSOR_PERSISTENT, "pressure sensor lost");

    HealthSnapshot s = h.compute(healthy(), 0);
    TEST_ASSERT_EQUAL(HEALTH_ERROR, s.tier);
    TEST_ASSERT_TRUE(s.fatal_override);
    TEST_ASSERT_TRUE(s.score < 50);
    TEST_ASSERT_EQUAL_UINT8(0, s.errors.score);

    Diag::acknowledge();
    s = h.compute(healthy(), 0);
    TEST_ASSERT_FALSE(s.fatal_override);
    TEST_ASSERT_EQUAL_UINT8(80, s.errors.score);
    TEST_ASSERT_EQUAL_UINT8(94, s.score);
    TEST_ASSERT_EQUAL(HEALTH_EXCELLENT, s.tier);
}

static void test_fatal_latch_outlives_ring_rotation() {
    HealthAggregator h;
    Diag::fault(LOG_FATAL, FAULT_SENSOR_PERSISTENT, "pressure sensor lost");
    for (uint8_t i = 0; i < Diag::capacity(); ++i) Diag::log(LOG_INFO, "filler");
    TEST_ASSERT_EQUAL_UINT8(0, Diag::count_at_least(LOG_FATAL));
    TEST_ASSERT_EQUAL(HEALTH_ERROR, h.compute(healthy(), 0).tier);
}

static void test_tier_thresholds() {
    HealthAggregator h;
    TEST_ASSERT_EQUAL(HEALTH_EXCELLENT, h.tier_for(90));
    TEST_ASSERT_EQUAL(HEALTH_GOOD, h.tier_for(89));
    TEST_ASSERT_EQUAL(HEALTH_GOOD, h.tier_for(70));
    TEST_ASSERT_EQUAL(HEALTH_WARNING, h.tier_for(69));
    TEST_ASSERT_EQUAL(HEALTH_WARNING, h.tier_for(50));
    TEST_ASSERT_EQUAL(HEALTH_ERROR, h.tier_for(49));
    TEST_ASSERT_EQUAL_STRING("WARNING", health_tier_name(HEALTH_WARNING));
}

static void test_network_scoring() {
    HealthAggregator h;
    NetworkStatus n;
    n.link_up = true;
    n.rssi_dbm = -75;
    TEST_ASSERT_EQUAL_UINT8(60, h.score_network(n).score);
    n.rssi_dbm = -95;
    TEST_ASSERT_EQUAL_UINT8(HEALTH_RSSI_FLOOR, h.score_network(n).score);
    n.rssi_dbm = -40;
    TEST_ASSERT_EQUAL_UINT8(100, h.score_network(n).score);
    n.link_up = false;
    TEST_ASSERT_EQUAL_UINT8(0, h.score_network(n).score);
}

static void test_sensor_and_system_scoring() {
    HealthAggregator h;
    bool faults[SENSOR_COUNT] = { true, false, true, false };
    const HealthComponent sc = h.score_sensors(faults);
    TEST_ASSERT_EQUAL_UINT8(50, sc.score);
    TEST_ASSERT_EQUAL_STRING("2 faulted (pressure, ...)", sc.message);

    SystemStatus sys;
    TEST_ASSERT_EQUAL_UINT8(100, h.score_system(sys).score);
    sys.total_heap = 1000;
    sys.free_heap = 250;
    sys.largest_free_block = 125;
    TEST_ASSERT_EQUAL_UINT8(25, h.score_system(sys).score);
    sys.free_heap = 0;
    sys.largest_free_block = 0;
    TEST_ASSERT_EQUAL_UINT8(0, h.score_system(sys).score);
}

static void test_error_history_penalties() {
    HealthAggregator h;
    Diag::log(LOG_INFO, "boot");
    Diag::log(LOG_WARN, "slow sensor");
    Diag::log(LOG_WARN, "slow sensor");
    Diag::fault(LOG_CRITICAL, FAULT_HISTORY_STORAGE, "nvs write failed");
    const HealthComponent e = h.score_errors();
    TEST_ASSERT_EQUAL_UINT8(70, e.score);
    TEST_ASSERT_EQUAL_STRING("2 warning, 1 critical", e.message);

    HealthInputs in = healthy();
    in.sensor_fault[SENSOR_FLOW] = true;
    // 0.2*100 + 0.15*100 + 0.35*75 + 0.3*70 = 82.25
    const HealthSnapshot s = h.compute(in, 0);
    TEST_ASSERT_EQUAL_UINT8(82, s.score);
    TEST_ASSERT_EQUAL(HEALTH_GOOD, s.tier);
}

void run_health_tests() {
    RUN_TEST(test_all_healthy_is_excellent);
    RUN_TEST(test_fatal_forces_error_tier_until_acknowledged);
    RUN_TEST(test_fatal_latch_outlives_ring_rotation);
    RUN_TEST(test_tier_thresholds);
    RUN_TEST(test_network_scoring);
    RUN_TEST(test_sensor_and_system_scoring);
    RUN_TEST(test_error_history_penalties);
}

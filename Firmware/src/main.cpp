#include "project_config.h"
#include "common_types.h"
#include "diagnostics.h"
#include "brew_engine.h"
#include "profile_store.h"
#include "sim/puck_model.h"
#include "utils/native_arduino_stubs.h"
#include <stdlib.h>
#include <string.h>

// Host simulator: drives the control core against PuckModel at the real
// tick rate (in simulated time) and prints what the firmware would log.

class ConsoleSink : public TelemetrySink {
public:
    void on_tick(const TelemetryFrame& f) override {
        // 1 Hz is plenty on a console.
        if (f.shot_ms - last_print_ms_ < 1000 && f.shot_ms != 0) return;
        last_print_ms_ = f.shot_ms;
        Serial.printf("  t=%5.1fs ph=%u %-8s tgt=%5.2f P=%5.2fbar F=%4.2fml/s W=%5.1fg cmd=%.2f%s%s\n",
                      f.shot_ms / 1000.0f, (unsigned)f.phase_index, mode_name(f.mode), f.target,
                      f.pressure_bar, f.flow_ml_s, f.weight_g, f.command,
                      f.saturated ? " SAT" : "", f.sensor_fault ? " FAULT" : "");
    }

    void on_shot_complete(const ShotRecord& r) override {
        const ShotSummary& s = r.summary;
        last_print_ms_ = 0;
        Serial.printf("[SUMMARY] #%lu '%s' %s in %.1fs, %u samples\n",
                      (unsigned long)s.shot_id, s.profile_name,
                      s.outcome == OUTCOME_COMPLETE ? "complete" : "aborted",
                      s.duration_ms / 1000.0f, (unsigned)r.trace.size());
        for (uint8_t i = 0; i < s.phase_count; ++i) {
            const PhaseStats& ps = s.phases[i];
            Serial.printf("  phase %u %-8s %5.1fs via %s%s", (unsigned)i, mode_name(ps.mode),
                          ps.duration_ms / 1000.0f, breakout_name(ps.breakout), ps.forced ? " (max)" : "");
            if (ps.constant_target) {
                Serial.printf(" overshoot=%.2f settling=%.2fs%s", ps.peak_overshoot,
                              ps.settling_ms / 1000.0f, ps.settled ? "" : " (unsettled)");
            }
            Serial.printf("\n");
        }
        Serial.printf("  yield=%.1fg peakP=%.2f avgP=%.2f stability=%.0f\n",
                      s.final_yield_g, s.peak_pressure_bar, s.avg_pressure_bar, s.pressure_stability);
    }

    void on_health(const HealthSnapshot& h) override {
        Serial.printf("[HEALTH] %u %s (sys=%u net=%u sensors=%u errors=%u)\n",
                      (unsigned)h.score, health_tier_name(h.tier), (unsigned)h.system.score,
                      (unsigned)h.network.score, (unsigned)h.sensors.score, (unsigned)h.errors.score);
    }

private:
    uint32_t last_print_ms_ = 0;
};

static void usage(const char* argv0) {
    Serial.printf("usage: %s [shots] [classic|ramp|bloom]\n", argv0);
}

int main(int argc, char** argv) {
    int shots = 5;
    const char* profile_name = "classic";
    if (argc > 1) {
        shots = atoi(argv[1]);
        if (shots <= 0) {
            usage(argv[0]);
            return 1;
        }
    }
    if (argc > 2) profile_name = argv[2];

    Serial.println("========================================");
    Serial.println("PhaseBrew control core simulator");
    Serial.println("========================================");

    Profile profile;
    if (!builtin_profile(profile_name, profile)) {
        Serial.printf("Unknown profile '%s'\n", profile_name);
        usage(argv[0]);
        return 1;
    }

    Diag::init();
    BrewEngine engine;
    ConsoleSink sink;
    engine.set_sink(&sink);
    if (!engine.begin()) {
        Diag::log(LOG_WARN, "Persistence unavailable, running from defaults");
    }

    SystemStatus sys;
    sys.total_heap = 320 * 1024;
    sys.free_heap = 180 * 1024;
    sys.largest_free_block = 110 * 1024;
    engine.set_system_status(sys);
    NetworkStatus net;
    net.link_up = true;
    net.rssi_dbm = -58;
    engine.set_network_status(net);

    if (engine.select_profile(profile) != CMD_OK) return 1;

    PuckModel puck;
    uint32_t now = 0;
    const uint32_t bound_ms = profile_max_ms(profile) + 1000;

    for (int i = 0; i < shots; ++i) {
        puck.reset();
        const ControlGains g = engine.learning().gains();
        Serial.printf("\n--- Shot %d/%d (Kp=%.3f Ki=%.3f Kd=%.3f) ---\n", i + 1, shots, g.kp, g.ki, g.kd);

        set_host_millis(now);
        // Scale reads once before the pump starts so the tare is latched.
        (void)engine.tick(now, puck.step(0.0f, 0.0f, now));
        if (engine.start_shot(now) != CMD_OK) return 1;

        const uint32_t shot_start = now;
        float cmd = 0.0f;
        uint32_t last_service = now;
        while (engine.sequencer().active() && (now - shot_start) < bound_ms) {
            now += CONTROL_TICK_MS;
            set_host_millis(now);
            const SensorFrame f = puck.step(cmd, CONTROL_TICK_MS / 1000.0f, now);
            cmd = engine.tick(now, f);
            if (now - last_service >= SERVICE_TASK_RATE_MS) {
                engine.service(now);
                last_service = now;
            }
        }
        engine.service(now);
        if (engine.reset() != CMD_OK) return 1;

        // Rest between shots.
        now += 10000;
    }

    const ShotHistoryManager::Statistics st = engine.history().calculateStats();
    const ControlGains g = engine.learning().gains();
    Serial.printf("\n[STATS] %u shots (%u complete): avg yield=%.1fg time=%.1fs overshoot=%.2fbar settling=%.2fs\n",
                  (unsigned)st.shot_count, (unsigned)st.completed_count, st.avg_yield_g, st.avg_time_s,
                  st.avg_overshoot_bar, st.avg_settling_s);
    Serial.printf("[LEARN] Final gains Kp=%.3f Ki=%.3f Kd=%.3f\n", g.kp, g.ki, g.kd);
    return 0;
}

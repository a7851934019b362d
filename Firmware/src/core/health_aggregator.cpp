#include "health_aggregator.h"
#include <stdio.h>

static uint8_t clamp_score(float v) {
    if (!(v > 0.0f)) return 0;
    if (v >= 100.0f) return 100;
    return (uint8_t)(v + 0.5f);
}

const char* health_tier_name(HealthTier t) {
    switch (t) {
        case HEALTH_EXCELLENT: return "EXCELLENT";
        case HEALTH_GOOD:      return "GOOD";
        case HEALTH_WARNING:   return "WARNING";
        case HEALTH_ERROR:
        default:               return "ERROR";
    }
}

HealthTier HealthAggregator::tier_for(uint8_t score) const {
    if (score >= cfg_.tier_excellent) return HEALTH_EXCELLENT;
    if (score >= cfg_.tier_good) return HEALTH_GOOD;
    if (score >= cfg_.tier_warning) return HEALTH_WARNING;
    return HEALTH_ERROR;
}

HealthComponent HealthAggregator::score_system(const SystemStatus& s) const {
    HealthComponent c;
    if (s.total_heap == 0) {
        snprintf(c.message, sizeof(c.message), "Memory not reported");
        return c;
    }
    // Half the heap free counts as full headroom.
    const float free_frac = (float)s.free_heap / (float)s.total_heap;
    float score = free_frac * 200.0f;

    float frag = 0.0f;
    if (s.free_heap > 0) {
        frag = 1.0f - (float)s.largest_free_block / (float)s.free_heap;
        frag = constrain(frag, 0.0f, 1.0f);
        score -= frag * 50.0f;
    }
    c.score = clamp_score(score);
    snprintf(c.message, sizeof(c.message), "Heap %u%% free, %u%% fragmented",
             (unsigned)(free_frac * 100.0f + 0.5f), (unsigned)(frag * 100.0f + 0.5f));
    return c;
}

HealthComponent HealthAggregator::score_network(const NetworkStatus& n) const {
    HealthComponent c;
    if (!n.link_up) {
        c.score = 0;
        snprintf(c.message, sizeof(c.message), "Link down");
        return c;
    }
    float score = 100.0f;
    if (n.rssi_dbm < cfg_.rssi_good_dbm) {
        const float span = (float)(cfg_.rssi_good_dbm - cfg_.rssi_bad_dbm);
        const float t = span > 0.0f ? (float)(cfg_.rssi_good_dbm - n.rssi_dbm) / span : 1.0f;
        score = 100.0f - constrain(t, 0.0f, 1.0f) * (100.0f - cfg_.rssi_floor);
    }
    c.score = clamp_score(score);
    snprintf(c.message, sizeof(c.message), "Link up, RSSI %d dBm", (int)n.rssi_dbm);
    return c;
}

HealthComponent HealthAggregator::score_sensors(const bool faults[SENSOR_COUNT]) const {
    static const char* names[SENSOR_COUNT] = { "pressure", "flow", "weight", "temperature" };
    HealthComponent c;
    uint8_t n = 0;
    const char* first = nullptr;
    for (uint8_t i = 0; i < SENSOR_COUNT; ++i) {
        if (!faults[i]) continue;
        if (!first) first = names[i];
        n++;
    }
    c.score = clamp_score(100.0f - (float)n * cfg_.per_sensor_penalty);
    if (n == 0) {
        snprintf(c.message, sizeof(c.message), "All sensors OK");
    } else {
        snprintf(c.message, sizeof(c.message), "%u faulted (%s%s)", (unsigned)n, first, n > 1 ? ", ..." : "");
    }
    return c;
}

HealthComponent HealthAggregator::score_errors() const {
    HealthComponent c;
    uint8_t warn = 0, crit = 0, fatal = 0;
    for (uint8_t i = 0; i < Diag::count(); ++i) {
        switch (Diag::at(i).level) {
            case LOG_WARN:     warn++; break;
            case LOG_CRITICAL: crit++; break;
            case LOG_FATAL:    fatal++; break;
            default: break;
        }
    }
    const float penalty = (float)warn * cfg_.penalty_warn + (float)crit * cfg_.penalty_critical +
                          (float)fatal * cfg_.penalty_fatal;
    c.score = clamp_score(100.0f - penalty);
    if (Diag::has_fatal()) {
        c.score = 0;
        snprintf(c.message, sizeof(c.message), "Fatal error active");
    } else if (warn + crit == 0) {
        snprintf(c.message, sizeof(c.message), "No recent errors");
    } else {
        snprintf(c.message, sizeof(c.message), "%u warning, %u critical", (unsigned)warn, (unsigned)crit);
    }
    return c;
}

HealthSnapshot HealthAggregator::compute(const HealthInputs& in, uint32_t now_ms) const {
    HealthSnapshot h;
    h.ms = now_ms;
    h.system = score_system(in.system);
    h.network = score_network(in.network);
    h.sensors = score_sensors(in.sensor_fault);
    h.errors = score_errors();

    const float wsum = cfg_.w_system + cfg_.w_network + cfg_.w_sensors + cfg_.w_errors;
    float overall = 0.0f;
    if (wsum > 0.0f) {
        overall = (h.system.score * cfg_.w_system + h.network.score * cfg_.w_network +
                   h.sensors.score * cfg_.w_sensors + h.errors.score * cfg_.w_errors) / wsum;
    }
    h.score = clamp_score(overall);
    h.tier = tier_for(h.score);

    // Hard override, independent of the weighted result.
    if (Diag::has_fatal()) {
        h.fatal_override = true;
        h.tier = HEALTH_ERROR;
        if (h.score >= cfg_.tier_warning) h.score = (uint8_t)(cfg_.tier_warning ? cfg_.tier_warning - 1 : 0);
    }
    return h;
}

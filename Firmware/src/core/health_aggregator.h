#pragma once
#include "../common_types.h"
#include "../diagnostics.h"

enum HealthTier : uint8_t {
    HEALTH_EXCELLENT = 0,
    HEALTH_GOOD,
    HEALTH_WARNING,
    HEALTH_ERROR
};

struct HealthComponent {
    uint8_t score = 100;
    char message[48] = "OK";
};

struct HealthSnapshot {
    uint32_t ms = 0;
    uint8_t score = 0;
    HealthTier tier = HEALTH_ERROR;
    bool fatal_override = false;

    HealthComponent system;
    HealthComponent network;
    HealthComponent sensors;
    HealthComponent errors;
};

// Inputs gathered by the caller. Error history is read from Diag directly.
struct HealthInputs {
    SystemStatus system{};
    NetworkStatus network{};
    bool sensor_fault[SENSOR_COUNT]{};
};

// Stateless: every snapshot is derived fresh from the current inputs.
class HealthAggregator {
public:
    struct Config {
        float w_system = HEALTH_WEIGHT_SYSTEM;
        float w_network = HEALTH_WEIGHT_NETWORK;
        float w_sensors = HEALTH_WEIGHT_SENSORS;
        float w_errors = HEALTH_WEIGHT_ERRORS;

        uint8_t penalty_warn = HEALTH_PENALTY_WARN;
        uint8_t penalty_critical = HEALTH_PENALTY_CRITICAL;
        uint8_t penalty_fatal = HEALTH_PENALTY_FATAL;

        int8_t rssi_good_dbm = HEALTH_RSSI_GOOD_DBM;
        int8_t rssi_bad_dbm = HEALTH_RSSI_BAD_DBM;
        uint8_t rssi_floor = HEALTH_RSSI_FLOOR;

        uint8_t per_sensor_penalty = 25;

        uint8_t tier_excellent = 90;
        uint8_t tier_good = 70;
        uint8_t tier_warning = 50;
    };

    HealthAggregator() : HealthAggregator(Config{}) {}
    explicit HealthAggregator(const Config& cfg) : cfg_(cfg) {}

    HealthSnapshot compute(const HealthInputs& in, uint32_t now_ms) const;

    HealthTier tier_for(uint8_t score) const;

    HealthComponent score_system(const SystemStatus& s) const;
    HealthComponent score_network(const NetworkStatus& n) const;
    HealthComponent score_sensors(const bool faults[SENSOR_COUNT]) const;
    HealthComponent score_errors() const;

    void setConfig(const Config& cfg) { cfg_ = cfg; }
    const Config& config() const { return cfg_; }

private:
    Config cfg_;
};

const char* health_tier_name(HealthTier t);

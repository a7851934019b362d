#pragma once
#include "../common_types.h"
#include <random>

// Minimal hydraulic plant for host runs:
//   pump command -> group pressure (first-order lag)
//   pressure -> flow through the puck (linear conductance)
//   flow -> cup weight (integrated, 1 g per ml)
class PuckModel {
public:
    struct Config {
        float pump_max_bar = SIM_PUMP_MAX_BAR;
        float tau_s = SIM_PRESSURE_TAU_S;
        float conductance = SIM_PUCK_CONDUCTANCE;   // ml/s per bar
        float noise_bar = SIM_SENSOR_NOISE_BAR;
        float drip_delay_s = 2.0f;                  // no weight in the cup before this
        uint32_t seed = 1;
    };

    PuckModel() : PuckModel(Config{}) {}
    explicit PuckModel(const Config& cfg);

    void reset();

    // Advances the plant by dt_s under the given command and returns the sensor frame at now_ms.
    SensorFrame step(float command, float dt_s, uint32_t now_ms);

    // Next frame reports the named sensor as faulted.
    void inject_fault(SensorId id) { fault_mask_ |= (uint8_t)(1u << id); }
    void clear_faults() { fault_mask_ = 0; }

    float pressure() const { return pressure_; }
    float flow() const { return flow_; }
    float weight() const { return weight_; }

private:
    SensorReading reading_(SensorId id, float v, uint32_t now_ms) const;

    Config cfg_;
    std::mt19937 rng_;
    std::normal_distribution<float> noise_;

    float pressure_ = 0.0f;
    float flow_ = 0.0f;
    float weight_ = 0.0f;
    float wet_s_ = 0.0f;
    uint8_t fault_mask_ = 0;
};

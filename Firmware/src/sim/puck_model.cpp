#include "puck_model.h"

PuckModel::PuckModel(const Config& cfg)
    : cfg_(cfg)
    , rng_(cfg.seed)
    , noise_(0.0f, cfg.noise_bar > 0.0f ? cfg.noise_bar : 1.0f)
{}

void PuckModel::reset() {
    pressure_ = 0.0f;
    flow_ = 0.0f;
    weight_ = 0.0f;
    wet_s_ = 0.0f;
    fault_mask_ = 0;
}

SensorReading PuckModel::reading_(SensorId id, float v, uint32_t now_ms) const {
    SensorReading r;
    r.value = v;
    r.valid = (fault_mask_ & (1u << id)) == 0;
    r.timestamp_ms = now_ms;
    return r;
}

SensorFrame PuckModel::step(float command, float dt_s, uint32_t now_ms) {
    command = constrain(command, 0.0f, 1.0f);
    if (dt_s > 0.0f) {
        const float target = command * cfg_.pump_max_bar;
        const float tau = cfg_.tau_s > 0.001f ? cfg_.tau_s : 0.001f;
        const float a = constrain(dt_s / tau, 0.0f, 1.0f);
        pressure_ += (target - pressure_) * a;

        flow_ = pressure_ > 0.2f ? pressure_ * cfg_.conductance : 0.0f;
        if (flow_ > 0.0f) wet_s_ += dt_s;
        if (wet_s_ >= cfg_.drip_delay_s) weight_ += flow_ * dt_s;
    }

    const float p_noise = cfg_.noise_bar > 0.0f ? noise_(rng_) : 0.0f;
    const float measured_p = max(pressure_ + p_noise, 0.0f);

    SensorFrame f;
    f.pressure_bar = reading_(SENSOR_PRESSURE, measured_p, now_ms);
    f.flow_ml_s = reading_(SENSOR_FLOW, flow_, now_ms);
    f.weight_g = reading_(SENSOR_WEIGHT, weight_, now_ms);
    f.temp_c = reading_(SENSOR_TEMPERATURE, 93.0f, now_ms);
    return f;
}

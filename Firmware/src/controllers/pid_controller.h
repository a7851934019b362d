#pragma once
#include "../utils/compat.h"

#include <math.h>

/**
 * @brief PID Controller on a normalized actuator
 *
 * Features
 * - Error-driven interface: compute(error, dt) so the same loop serves
 *   pressure, flow and ramped targets
 * - Optional derivative low-pass filtering
 * - Integral term clamped to the actuator range, and frozen while the output
 *   is saturated in the direction the error pushes (anti-windup)
 * - Exposes last P/I/D/output terms and the saturation flag for telemetry
 *
 * Derivative filter: d_filt = a*d + (1-a)*d_prev, where a in [0..1].
 * Smaller a => more smoothing.
 */
class PIDController {
public:
    struct Config {
        float kp = 1.0f;
        float ki = 0.0f;
        float kd = 0.0f;

        // 0..1, smaller = stronger filtering. 1 = unfiltered.
        float derivative_filter = 1.0f;

        float output_min = 0.0f;
        float output_max = 1.0f;

        bool enable_anti_windup = true;
    };

    PIDController() : PIDController(Config{}) {}

    explicit PIDController(const Config& cfg)
        : cfg_(cfg) {}

    float compute(float error, float dt_s) {
        // Non-finite input: hold the last command rather than poison the state.
        if (!isfinite(error)) {
            return last_out_;
        }

        // Protect against absurd dt (first sample, clock jump)
        const bool dt_ok = (dt_s > 0.0f && dt_s < 5.0f);
        if (!dt_ok) {
            dt_s = 0.0f;
        }

        // P term
        const float p_term = cfg_.kp * error;

        // D term (derivative on error)
        float d_term = 0.0f;
        if (initialized_ && dt_ok && cfg_.kd != 0.0f) {
            const float d_err = (error - prev_error_) / dt_s;
            const float a = constrain(cfg_.derivative_filter, 0.0f, 1.0f);
            d_filt_ = a * d_err + (1.0f - a) * d_filt_;
            d_term = cfg_.kd * d_filt_;
        } else if (cfg_.kd == 0.0f) {
            d_filt_ = 0.0f;
        }
        prev_error_ = error;
        initialized_ = true;

        // I term (candidate), clamped to the actuator range
        float i_candidate = integral_;
        if (cfg_.ki != 0.0f) {
            i_candidate = integral_ + cfg_.ki * error * dt_s;
            i_candidate = constrain(i_candidate, cfg_.output_min, cfg_.output_max);
        }

        // Combine
        const float u_unclamped = p_term + i_candidate + d_term;
        const float u = clamp_(u_unclamped);

        const bool saturated_high = (u_unclamped >= cfg_.output_max);
        const bool saturated_low  = (u_unclamped <= cfg_.output_min);
        saturated_ = saturated_high || saturated_low;

        // Anti-windup: only accept the new integral if it doesn't push further into saturation
        if (cfg_.ki != 0.0f) {
            if (!cfg_.enable_anti_windup) {
                integral_ = i_candidate;
            } else {
                const bool drives_high = (error > 0.0f);
                const bool drives_low  = (error < 0.0f);

                const bool block = (saturated_high && drives_high) || (saturated_low && drives_low);
                if (!block) {
                    integral_ = i_candidate;
                }
            }
        }

        // Publish diagnostics
        last_p_ = p_term;
        last_i_ = integral_;
        last_d_ = d_term;
        last_out_ = u;

        return last_out_;
    }

    void reset() {
        integral_ = 0.0f;
        prev_error_ = 0.0f;
        d_filt_ = 0.0f;
        last_p_ = 0.0f;
        last_i_ = 0.0f;
        last_d_ = 0.0f;
        last_out_ = cfg_.output_min;
        saturated_ = false;
        initialized_ = false;
    }

    void setConfig(const Config& cfg) { cfg_ = cfg; }
    const Config& getConfig() const { return cfg_; }

    void setGains(float kp, float ki, float kd) {
        cfg_.kp = kp;
        cfg_.ki = ki;
        cfg_.kd = kd;
    }

    float getIntegral() const { return integral_; }

    // Diagnostics
    float lastOutput() const { return last_out_; }
    float lastPTerm() const { return last_p_; }
    float lastITerm() const { return last_i_; }
    float lastDTerm() const { return last_d_; }
    bool saturated() const { return saturated_; }

private:
    Config cfg_;

    float integral_ = 0.0f;

    float prev_error_ = 0.0f;
    float d_filt_ = 0.0f;

    float last_p_ = 0.0f;
    float last_i_ = 0.0f;
    float last_d_ = 0.0f;
    float last_out_ = 0.0f;

    bool saturated_ = false;
    bool initialized_ = false;

    float clamp_(float u) const {
        return constrain(u, cfg_.output_min, cfg_.output_max);
    }
};

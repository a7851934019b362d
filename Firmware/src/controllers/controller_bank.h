#pragma once
#include "../common_types.h"
#include "pid_controller.h"
#include "fuzzy_controller.h"
#include "adaptive_controller.h"

// Closed set of interchangeable single-loop controllers, dispatched by the
// active phase's ControllerType. Gains are latched once per shot.
class ControllerBank {
public:
    struct Config {
        // Fixed flow-loop gains. Pressure/Ramp phases use the learned gains.
        ControlGains flow_gains = [](){
            ControlGains g;
            g.kp = FLOW_PID_KP;
            g.ki = FLOW_PID_KI;
            g.kd = FLOW_PID_KD;
            return g;
        }();

        float derivative_filter = PRESSURE_PID_DERIVATIVE_FILTER;

        FuzzyController::Config fuzzy = [](){
            FuzzyController::Config c;
            c.error_span = FUZZY_ERROR_SPAN;
            c.rate_span = FUZZY_RATE_SPAN;
            c.output_rate = FUZZY_OUTPUT_RATE;
            return c;
        }();

        AdaptiveController::Config adaptive = [](){
            AdaptiveController::Config c;
            c.scale_min = ADAPTIVE_SCALE_MIN;
            c.scale_max = ADAPTIVE_SCALE_MAX;
            c.rate = ADAPTIVE_RATE;
            c.deadband = ADAPTIVE_DEADBAND;
            return c;
        }();
    };

    struct Diagnostics {
        ControllerType type = CTRL_PID;
        ControlMode mode = MODE_PAUSE;
        ControlGains shot_gains{};
        float last_output = 0.0f;
        float p_term = 0.0f;
        float i_term = 0.0f;
        float d_term = 0.0f;
        float adaptive_scale = 1.0f;
        float fuzzy_delta = 0.0f;
        bool saturated = false;
    };

    ControllerBank() : ControllerBank(Config{}) {}
    explicit ControllerBank(const Config& cfg);

    // Snapshot of the learned gains, frozen until the next begin_shot().
    void begin_shot(const ControlGains& gains);

    // Phase entry: pick the algorithm and loop, and start it from a clean state.
    void select(ControllerType type, ControlMode mode);

    // Normalized actuator command in [0, 1]. Pause always yields 0.
    float compute(float error, float dt_s);

    // Forces the output to zero and drops controller memory (abort / shot end).
    void stop();

    ControllerType type() const { return type_; }
    ControlMode mode() const { return mode_; }
    const ControlGains& shot_gains() const { return shot_gains_; }
    bool saturated() const;
    Diagnostics diagnostics() const;

    const Config& config() const { return cfg_; }

private:
    PIDController::Config loop_config_(ControlMode mode) const;

    Config cfg_;
    ControlGains shot_gains_{};
    ControllerType type_ = CTRL_PID;
    ControlMode mode_ = MODE_PAUSE;
    float last_output_ = 0.0f;

    PIDController pid_;
    FuzzyController fuzzy_;
    AdaptiveController adaptive_;
};

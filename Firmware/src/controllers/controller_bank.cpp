#include "controller_bank.h"

ControllerBank::ControllerBank(const Config& cfg)
    : cfg_(cfg)
    , fuzzy_(cfg.fuzzy)
    , adaptive_(cfg.adaptive)
{}

void ControllerBank::begin_shot(const ControlGains& gains) {
    shot_gains_ = gains;
    stop();
}

PIDController::Config ControllerBank::loop_config_(ControlMode mode) const {
    const ControlGains& g = (mode == MODE_FLOW) ? cfg_.flow_gains : shot_gains_;
    PIDController::Config c;
    c.kp = g.kp;
    c.ki = g.ki;
    c.kd = g.kd;
    c.derivative_filter = cfg_.derivative_filter;
    c.output_min = 0.0f;
    c.output_max = 1.0f;
    c.enable_anti_windup = true;
    return c;
}

void ControllerBank::select(ControllerType type, ControlMode mode) {
    type_ = type;
    mode_ = mode;
    last_output_ = 0.0f;

    const PIDController::Config loop = loop_config_(mode);
    switch (type_) {
        case CTRL_FUZZY:
            fuzzy_.reset();
            break;
        case CTRL_ADAPTIVE:
            adaptive_.setBase(loop);
            adaptive_.reset();
            break;
        case CTRL_PID:
        default:
            pid_.setConfig(loop);
            pid_.reset();
            break;
    }
}

float ControllerBank::compute(float error, float dt_s) {
    if (mode_ == MODE_PAUSE) {
        last_output_ = 0.0f;
        return last_output_;
    }

    float u = 0.0f;
    switch (type_) {
        case CTRL_FUZZY:    u = fuzzy_.compute(error, dt_s); break;
        case CTRL_ADAPTIVE: u = adaptive_.compute(error, dt_s); break;
        case CTRL_PID:
        default:            u = pid_.compute(error, dt_s); break;
    }
    last_output_ = constrain(u, 0.0f, 1.0f);
    return last_output_;
}

void ControllerBank::stop() {
    pid_.reset();
    fuzzy_.reset();
    adaptive_.reset();
    last_output_ = 0.0f;
}

bool ControllerBank::saturated() const {
    if (mode_ == MODE_PAUSE) return false;
    switch (type_) {
        case CTRL_FUZZY:    return fuzzy_.saturated();
        case CTRL_ADAPTIVE: return adaptive_.saturated();
        case CTRL_PID:
        default:            return pid_.saturated();
    }
}

ControllerBank::Diagnostics ControllerBank::diagnostics() const {
    Diagnostics d;
    d.type = type_;
    d.mode = mode_;
    d.shot_gains = shot_gains_;
    d.last_output = last_output_;
    d.saturated = saturated();
    d.adaptive_scale = adaptive_.scale();
    d.fuzzy_delta = fuzzy_.lastDelta();

    const PIDController* pid = nullptr;
    if (type_ == CTRL_PID) pid = &pid_;
    else if (type_ == CTRL_ADAPTIVE) pid = &adaptive_.pid();
    if (pid) {
        d.p_term = pid->lastPTerm();
        d.i_term = pid->lastITerm();
        d.d_term = pid->lastDTerm();
    }
    return d;
}

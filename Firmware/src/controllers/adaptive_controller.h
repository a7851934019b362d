#pragma once
#include "../project_config.h"
#include "pid_controller.h"

/**
 * @brief PID with in-shot gain scheduling from the error trend
 *
 * Keeps a short window of recent errors. Each tick, once the window is full:
 * - three or more sign changes in the window means the loop is ringing:
 *   shrink the scale factor;
 * - error above the deadband whose magnitude is not shrinking means the loop
 *   is sluggish: grow the scale factor.
 * The PID's Kp/Ki/Kd are the base gains multiplied by the scale, bounded to
 * [scale_min, scale_max]. The scale restarts at 1.0 every shot, so this
 * adaptation never leaks across shots.
 */
class AdaptiveController {
public:
    struct Config {
        float scale_min = 0.5f;
        float scale_max = 2.0f;
        float rate = 0.04f;
        float deadband = 0.15f;
    };

    static constexpr uint8_t WINDOW = ADAPTIVE_WINDOW;

    AdaptiveController() : AdaptiveController(Config{}) {}
    explicit AdaptiveController(const Config& cfg) : cfg_(cfg) {}

    void setBase(const PIDController::Config& base) {
        base_ = base;
        apply_scale_();
    }

    float compute(float error, float dt_s) {
        if (isfinite(error)) {
            observe_(error);
        }
        return pid_.compute(error, dt_s);
    }

    void reset() {
        scale_ = 1.0f;
        len_ = 0;
        head_ = 0;
        pid_.reset();
        apply_scale_();
    }

    float scale() const { return scale_; }
    const PIDController& pid() const { return pid_; }
    bool saturated() const { return pid_.saturated(); }

    void setConfig(const Config& cfg) { cfg_ = cfg; }
    const Config& getConfig() const { return cfg_; }

private:
    void observe_(float error) {
        win_[head_] = error;
        head_ = (uint8_t)((head_ + 1) % WINDOW);
        if (len_ < WINDOW) {
            len_++;
            return;
        }

        // Full window: oldest sample sits at head_, newest just before it.
        const float oldest = win_[head_];
        const float newest = error;

        uint8_t sign_changes = 0;
        for (uint8_t k = 1; k < WINDOW; ++k) {
            const float a = win_[(head_ + k - 1) % WINDOW];
            const float b = win_[(head_ + k) % WINDOW];
            if ((a > 0.0f && b < 0.0f) || (a < 0.0f && b > 0.0f)) sign_changes++;
        }

        float next = scale_;
        if (sign_changes >= 3) {
            next = scale_ * (1.0f - cfg_.rate);
        } else if (fabsf(newest) > cfg_.deadband && fabsf(newest) >= fabsf(oldest)) {
            next = scale_ * (1.0f + cfg_.rate);
        }
        next = constrain(next, cfg_.scale_min, cfg_.scale_max);
        if (next != scale_) {
            scale_ = next;
            apply_scale_();
        }
    }

    void apply_scale_() {
        pid_.setConfig(base_);
        pid_.setGains(base_.kp * scale_, base_.ki * scale_, base_.kd * scale_);
    }

    Config cfg_;
    PIDController::Config base_{};
    PIDController pid_;
    float scale_ = 1.0f;

    float win_[WINDOW]{};
    uint8_t head_ = 0;
    uint8_t len_ = 0;
};

#pragma once
#include "../utils/compat.h"

#include <math.h>

/**
 * @brief Incremental fuzzy controller (error, error-rate) -> command change
 *
 * Both inputs are normalized by their span and fuzzified into three
 * triangular sets (N, Z, P). A fixed 3x3 rule table maps the pair onto output
 * singletons; weighted-average defuzzification gives a value in [-1, 1] that
 * is integrated into the command at most `output_rate` per second.
 *
 *              rate N   rate Z   rate P
 *   error N     NB       NS       Z
 *   error Z     NS       Z        PS
 *   error P     Z        PS       PB
 *
 * No learned parameters; tends to be smoother than PID at the cost of speed.
 */
class FuzzyController {
public:
    struct Config {
        float error_span = 3.0f;
        float rate_span = 6.0f;
        float output_rate = 1.2f;   // command units per second at full output
        float output_min = 0.0f;
        float output_max = 1.0f;
    };

    FuzzyController() : FuzzyController(Config{}) {}
    explicit FuzzyController(const Config& cfg) : cfg_(cfg) {}

    float compute(float error, float dt_s) {
        if (!isfinite(error) || !(dt_s > 0.0f && dt_s < 5.0f)) {
            prev_error_ = isfinite(error) ? error : prev_error_;
            initialized_ = initialized_ || isfinite(error);
            return out_;
        }

        const float rate = initialized_ ? (error - prev_error_) / dt_s : 0.0f;
        prev_error_ = error;
        initialized_ = true;

        last_delta_ = infer(error, rate);
        out_ = constrain(out_ + last_delta_ * cfg_.output_rate * dt_s, cfg_.output_min, cfg_.output_max);
        return out_;
    }

    // Defuzzified rule output in [-1, 1] for a given (error, rate) pair.
    float infer(float error, float rate) const {
        float mu_e[3];
        float mu_r[3];
        fuzzify(error / cfg_.error_span, mu_e);
        fuzzify(rate / cfg_.rate_span, mu_r);

        float num = 0.0f;
        float den = 0.0f;
        for (int i = 0; i < 3; ++i) {
            for (int j = 0; j < 3; ++j) {
                const float w = min(mu_e[i], mu_r[j]);
                if (w <= 0.0f) continue;
                num += w * kRules[i][j];
                den += w;
            }
        }
        return (den > 0.0f) ? num / den : 0.0f;
    }

    void reset() {
        out_ = cfg_.output_min;
        prev_error_ = 0.0f;
        last_delta_ = 0.0f;
        initialized_ = false;
    }

    void setConfig(const Config& cfg) { cfg_ = cfg; }
    const Config& getConfig() const { return cfg_; }

    float lastOutput() const { return out_; }
    float lastDelta() const { return last_delta_; }
    bool saturated() const { return out_ <= cfg_.output_min || out_ >= cfg_.output_max; }

private:
    // Output singletons: NB=-1, NS=-0.5, Z=0, PS=0.5, PB=1
    static constexpr float kRules[3][3] = {
        { -1.0f, -0.5f, 0.0f },
        { -0.5f,  0.0f, 0.5f },
        {  0.0f,  0.5f, 1.0f },
    };

    // Triangular N/Z/P over a normalized input clamped to [-1, 1].
    static void fuzzify(float x, float mu[3]) {
        x = constrain(x, -1.0f, 1.0f);
        mu[0] = (x < 0.0f) ? -x : 0.0f;
        mu[1] = 1.0f - fabsf(x);
        mu[2] = (x > 0.0f) ? x : 0.0f;
    }

    Config cfg_;
    float out_ = 0.0f;
    float prev_error_ = 0.0f;
    float last_delta_ = 0.0f;
    bool initialized_ = false;
};

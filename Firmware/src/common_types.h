#pragma once
#include "utils/compat.h"
#include "project_config.h"

enum ControlMode : uint8_t {
    MODE_PRESSURE = 0,
    MODE_FLOW,
    MODE_PAUSE,
    MODE_RAMP       // pressure target interpolated start -> end
};

enum ControllerType : uint8_t {
    CTRL_PID = 0,
    CTRL_FUZZY,
    CTRL_ADAPTIVE
};

enum BreakoutKind : uint8_t {
    BREAKOUT_NONE = 0,
    BREAKOUT_TIME,
    BREAKOUT_WEIGHT,
    BREAKOUT_FLOW,
    BREAKOUT_PRESSURE_PERCENT
};

static constexpr uint8_t BREAKOUT_KIND_COUNT = 4;

enum SequencerState : uint8_t {
    SEQ_IDLE = 0,
    SEQ_PHASE_ACTIVE,
    SEQ_SHOT_COMPLETE,
    SEQ_ABORTED
};

// Result of a command handed to the core.
enum CommandResult : uint8_t {
    CMD_OK = 0,
    CMD_PROFILE_INVALID,
    CMD_SHOT_IN_PROGRESS,
    CMD_NOT_ACTIVE
};

enum AbortReason : uint8_t {
    ABORT_NONE = 0,
    ABORT_USER_STOP,
    ABORT_SENSOR_FAULT
};

enum FaultCode : uint8_t {
    FAULT_NONE = 0,
    FAULT_PROFILE_INVALID,
    FAULT_SHOT_IN_PROGRESS,
    FAULT_SENSOR_TRANSIENT,
    FAULT_SENSOR_PERSISTENT,
    FAULT_GAIN_OUT_OF_BOUNDS,
    FAULT_HISTORY_STORAGE
};

enum SensorId : uint8_t {
    SENSOR_PRESSURE = 0,
    SENSOR_FLOW,
    SENSOR_WEIGHT,
    SENSOR_TEMPERATURE,
    SENSOR_COUNT
};

enum ShotOutcome : uint8_t {
    OUTCOME_NONE = 0,
    OUTCOME_COMPLETE,
    OUTCOME_ABORTED
};

static inline const char* mode_name(ControlMode m) {
    switch (m) {
        case MODE_PRESSURE: return "PRESSURE";
        case MODE_FLOW:     return "FLOW";
        case MODE_PAUSE:    return "PAUSE";
        case MODE_RAMP:     return "RAMP";
        default:            return "?";
    }
}

static inline const char* controller_name(ControllerType c) {
    switch (c) {
        case CTRL_PID:      return "PID";
        case CTRL_FUZZY:    return "FUZZY";
        case CTRL_ADAPTIVE: return "ADAPTIVE";
        default:            return "?";
    }
}

static inline const char* breakout_name(BreakoutKind k) {
    switch (k) {
        case BREAKOUT_TIME:             return "TIME";
        case BREAKOUT_WEIGHT:           return "WEIGHT";
        case BREAKOUT_FLOW:             return "FLOW";
        case BREAKOUT_PRESSURE_PERCENT: return "PRESSURE_PCT";
        default:                        return "NONE";
    }
}

static inline const char* state_name(SequencerState s) {
    switch (s) {
        case SEQ_IDLE:          return "IDLE";
        case SEQ_PHASE_ACTIVE:  return "PHASE_ACTIVE";
        case SEQ_SHOT_COMPLETE: return "SHOT_COMPLETE";
        case SEQ_ABORTED:       return "ABORTED";
        default:                return "?";
    }
}

// Seconds (profile units) to integer milliseconds (tick units).
static inline uint32_t seconds_to_ms(float s) {
    if (!(s > 0.0f)) return 0;
    return (uint32_t)(s * 1000.0f + 0.5f);
}

// Controller gains. Written only by LearningEngine; the bank takes a copy at shot start.
struct ControlGains {
    float kp = PRESSURE_PID_KP;
    float ki = PRESSURE_PID_KI;
    float kd = PRESSURE_PID_KD;
};

// One reading from the external sampler. `valid == false` means the driver reported a fault.
struct SensorReading {
    float value = 0.0f;
    bool valid = false;
    uint32_t timestamp_ms = 0;
};

struct SensorFrame {
    SensorReading pressure_bar;
    SensorReading flow_ml_s;
    SensorReading weight_g;
    SensorReading temp_c;
};

// Health inputs supplied by the platform layer.
struct SystemStatus {
    uint32_t free_heap = 0;
    uint32_t total_heap = 0;
    uint32_t largest_free_block = 0;
};

struct NetworkStatus {
    bool link_up = false;
    int8_t rssi_dbm = 0;
};

// Per-tick telemetry published while a shot is running.
struct TelemetryFrame {
    SequencerState state = SEQ_IDLE;
    uint8_t phase_index = 0;
    ControlMode mode = MODE_PAUSE;
    uint32_t shot_ms = 0;
    uint32_t phase_ms = 0;
    float target = 0.0f;
    float pressure_bar = 0.0f;
    float flow_ml_s = 0.0f;
    float weight_g = 0.0f;
    float command = 0.0f;
    bool saturated = false;
    bool sensor_fault = false;
};

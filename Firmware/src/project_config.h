#pragma once

// ===================================================================
// PHASEBREW CONTROL CORE - COMPILE-TIME DEFAULTS
// Every value here can be overridden with a -D build flag. Runtime
// configuration structs (EngineConfig and friends) are seeded from these.
// ===================================================================

// --- TASK CONFIGURATION ---
#ifndef CONTROL_TICK_MS
#define CONTROL_TICK_MS         50    // 20Hz control loop
#endif
#define HEALTH_PUBLISH_MS       5000  // periodic health snapshot
#define SERVICE_TASK_RATE_MS    200   // low-priority work (learning, health)

// --- PROFILE LIMITS ---
#define MAX_PHASES              12
#define MAX_CRITERIA            4
#define PROFILE_NAME_LEN        24
#define PHASE_NAME_LEN          16

// Hard per-phase ceiling. A phase without a declared maximum gets the default.
#define DEFAULT_PHASE_MAX_S     60.0f
#define SAFETY_MAX_PHASE_S      120.0f

// Target sanity ranges used by profile validation.
#define SAFETY_MAX_PRESSURE_BAR 12.0f
#define SAFETY_MAX_FLOW_ML_S    10.0f

// --- SENSOR FAULT HANDLING ---
// Consecutive faulted samples of the controlled sensor before the shot aborts.
#define SENSOR_FAULT_GRACE_TICKS  3
// A sample older than this (relative to the tick) counts as missing.
#define SENSOR_STALE_MS           250

// ===================================================================
// PRESSURE LOOP (learned gains start here)
// Error in bar, output is a normalized pump power fraction 0..1.
// ===================================================================
#define PRESSURE_PID_KP             0.12f
#define PRESSURE_PID_KI             0.06f
#define PRESSURE_PID_KD             0.010f
#define PRESSURE_PID_DERIVATIVE_FILTER  0.3f

// Safe gain envelope enforced by the learning engine.
#define GAIN_KP_MIN     0.02f
#define GAIN_KP_MAX     0.40f
#define GAIN_KI_MIN     0.00f
#define GAIN_KI_MAX     0.30f
#define GAIN_KD_MIN     0.00f
#define GAIN_KD_MAX     0.08f

// ===================================================================
// FLOW LOOP (fixed gains). Error in ml/s.
// ===================================================================
#define FLOW_PID_KP             0.20f
#define FLOW_PID_KI             0.10f
#define FLOW_PID_KD             0.005f

// --- FUZZY CONTROLLER ---
#define FUZZY_ERROR_SPAN        3.0f    // |error| at which membership saturates
#define FUZZY_RATE_SPAN         6.0f    // |d(error)/dt| at which membership saturates
#define FUZZY_OUTPUT_RATE       1.2f    // max command change per second

// --- ADAPTIVE CONTROLLER ---
#define ADAPTIVE_SCALE_MIN      0.5f
#define ADAPTIVE_SCALE_MAX      2.0f
#define ADAPTIVE_RATE           0.04f   // relative scale step per evaluation
#define ADAPTIVE_WINDOW         8       // samples in the trend window
#define ADAPTIVE_DEADBAND       0.15f   // |error| below which no growth happens

// ===================================================================
// SHOT RECORDING / LEARNING
// ===================================================================
#define SETTLING_TOLERANCE_PCT  2.0f
#define MAX_SHOT_HISTORY        20

#define LEARNING_WINDOW_SHOTS       10
#define LEARNING_MIN_SHOTS          1
#define LEARNING_OVERSHOOT_BAR      0.30f   // mean overshoot above this -> soften
#define LEARNING_LOW_OVERSHOOT_BAR  0.10f   // "low overshoot" for the Ki rule
#define LEARNING_SETTLING_S         4.0f    // mean settling above this -> more Ki
#define LEARNING_KP_STEP            0.01f
#define LEARNING_KI_STEP            0.005f
#define LEARNING_KD_STEP            0.002f
#define LEARNING_DEFAULT_ENABLED    true

// ===================================================================
// HEALTH / DIAGNOSTICS
// ===================================================================
#ifndef ERROR_HISTORY_SIZE
#define ERROR_HISTORY_SIZE      24
#endif

#define HEALTH_WEIGHT_SYSTEM    0.20f
#define HEALTH_WEIGHT_NETWORK   0.15f
#define HEALTH_WEIGHT_SENSORS   0.35f
#define HEALTH_WEIGHT_ERRORS    0.30f

#define HEALTH_PENALTY_WARN      5
#define HEALTH_PENALTY_CRITICAL  20
#define HEALTH_PENALTY_FATAL     100

// RSSI mapping: at or above GOOD scores 100, at or below BAD scores the floor.
#define HEALTH_RSSI_GOOD_DBM    -60
#define HEALTH_RSSI_BAD_DBM     -90
#define HEALTH_RSSI_FLOOR       20

// --- SIMULATOR ---
#define SIM_PUMP_MAX_BAR        12.0f
#define SIM_PRESSURE_TAU_S      0.6f
#define SIM_PUCK_CONDUCTANCE    0.22f   // ml/s per bar
#define SIM_SENSOR_NOISE_BAR    0.03f

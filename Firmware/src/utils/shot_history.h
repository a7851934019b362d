#pragma once
#include "compat.h"
#ifndef ARDUINO
  #include "native_arduino_stubs.h"
#else
  #include <Preferences.h>
#endif
#include "../common_types.h"
#include "../core/shot_recorder.h"
#include "../diagnostics.h"
#include <deque>
#include <stdio.h>

/**
 * @brief Shot History Manager with NVS Persistence
 *
 * Keeps the most recent ShotRecords in RAM (summary + trace) and mirrors
 * each summary into NVS so learning and statistics survive power cycles.
 * Traces are RAM-only.
 *
 * Features:
 * - Circular buffer (oldest shots auto-deleted)
 * - NVS persistence of summaries
 * - Statistics calculation
 */
class ShotHistoryManager {
public:
    struct Statistics {
        float avg_yield_g = 0.0f;
        float avg_time_s = 0.0f;
        float avg_overshoot_bar = 0.0f;
        float avg_settling_s = 0.0f;
        float avg_pressure_stability = 0.0f;
        float min_yield_g = 999.0f;
        float max_yield_g = 0.0f;
        uint8_t shot_count = 0;
        uint8_t completed_count = 0;
        uint8_t pressure_stat_count = 0;
    };

    explicit ShotHistoryManager(uint8_t max_shots = MAX_SHOT_HISTORY, const char* ns = "shot_hist")
        : max_shots_(max_shots ? max_shots : 1)
        , ns_(ns)
    {}

    /**
     * @brief Initialize shot history from NVS
     */
    bool begin() {
        if (!prefs_.begin(ns_, false)) {
            Diag::fault(LOG_CRITICAL, FAULT_HISTORY_STORAGE, "Failed to open shot history namespace");
            return false;
        }
        open_ = true;
        records_.clear();

        shot_count_ = prefs_.getUChar("count", 0);
        next_index_ = prefs_.getUChar("next_idx", 0);
        next_id_ = prefs_.getUInt("next_id", 1);

        if (shot_count_ > max_shots_ || next_index_ >= max_shots_) {
            shot_count_ = 0;
            next_index_ = 0;
        }

        // Structure-size guard: a firmware update that changed ShotSummary
        // invalidates the stored blobs.
        if (shot_count_ > 0) {
            const size_t len = prefs_.getBytesLength(key_(0));
            if (len != 0 && len != sizeof(ShotSummary)) {
                Serial.println("Shot history format changed -> clearing history");
                clear();
            }
        }

        for (uint8_t i = 0; i < shot_count_; ++i) {
            ShotRecord r;
            if (prefs_.getBytes(key_(storage_index_(i)), &r.summary, sizeof(ShotSummary)) == sizeof(ShotSummary)) {
                records_.push_back(std::move(r));
                if (records_.back().summary.shot_id >= next_id_) next_id_ = records_.back().summary.shot_id + 1;
            }
        }

        Serial.printf("Loaded %u shots from history\n", (unsigned)records_.size());
        return true;
    }

    // Monotonic shot id, persisted so ids stay unique across reboots.
    uint32_t nextShotId() {
        const uint32_t id = next_id_++;
        if (open_) prefs_.putUInt("next_id", next_id_);
        return id;
    }

    /**
     * @brief Save a finished shot. RAM copy is kept even if NVS fails.
     */
    bool saveShot(ShotRecord record) {
        records_.push_back(std::move(record));
        while (records_.size() > max_shots_) records_.pop_front();

        if (!open_) return true;

        const ShotSummary& s = records_.back().summary;
        const size_t written = prefs_.putBytes(key_(next_index_), &s, sizeof(ShotSummary));
        if (written != sizeof(ShotSummary)) {
            Diag::fault(LOG_CRITICAL, FAULT_HISTORY_STORAGE, "Failed to persist shot %lu", (unsigned long)s.shot_id);
            return false;
        }

        next_index_ = (uint8_t)((next_index_ + 1) % max_shots_);
        if (shot_count_ < max_shots_) shot_count_++;

        prefs_.putUChar("count", shot_count_);
        prefs_.putUChar("next_idx", next_index_);
        return true;
    }

    /**
     * @brief Load a shot summary
     * @param index Shot index (0 = oldest, count-1 = newest)
     */
    bool loadShot(uint8_t index, ShotSummary& shot) const {
        if (index >= records_.size()) return false;
        shot = records_[index].summary;
        return true;
    }

    // Full record including the trace; null when out of range.
    const ShotRecord* record(uint8_t index) const {
        return index < records_.size() ? &records_[index] : nullptr;
    }

    bool getLatestShot(ShotSummary& shot) const {
        if (records_.empty()) return false;
        shot = records_.back().summary;
        return true;
    }

    uint8_t getCount() const { return (uint8_t)records_.size(); }
    uint8_t capacity() const { return max_shots_; }

    void clear() {
        records_.clear();
        shot_count_ = 0;
        next_index_ = 0;
        if (open_) {
            prefs_.clear();
            prefs_.putUChar("count", 0);
            prefs_.putUChar("next_idx", 0);
            prefs_.putUInt("next_id", next_id_);
        }
        Serial.println("Shot history cleared");
    }

    Statistics calculateStats() const {
        Statistics stats;
        if (records_.empty()) return stats;

        stats.shot_count = (uint8_t)records_.size();
        float sum_yield = 0.0f;
        float sum_time = 0.0f;
        float sum_overshoot = 0.0f;
        float sum_settling = 0.0f;
        float sum_stability = 0.0f;

        for (const ShotRecord& r : records_) {
            const ShotSummary& s = r.summary;
            sum_yield += s.final_yield_g;
            sum_time += s.duration_ms / 1000.0f;
            sum_stability += s.pressure_stability;
            stats.min_yield_g = min(stats.min_yield_g, s.final_yield_g);
            stats.max_yield_g = max(stats.max_yield_g, s.final_yield_g);
            if (s.outcome == OUTCOME_COMPLETE) stats.completed_count++;
            if (s.has_pressure_stats) {
                sum_overshoot += s.overshoot_bar;
                sum_settling += s.settling_s;
                stats.pressure_stat_count++;
            }
        }

        stats.avg_yield_g = sum_yield / stats.shot_count;
        stats.avg_time_s = sum_time / stats.shot_count;
        stats.avg_pressure_stability = sum_stability / stats.shot_count;
        if (stats.pressure_stat_count) {
            stats.avg_overshoot_bar = sum_overshoot / stats.pressure_stat_count;
            stats.avg_settling_s = sum_settling / stats.pressure_stat_count;
        }
        return stats;
    }

private:
    const char* key_(uint8_t storage_idx) {
        snprintf(key_buf_, sizeof(key_buf_), "shot_%u", (unsigned)storage_idx);
        return key_buf_;
    }

    // Oldest-first index -> NVS slot.
    uint8_t storage_index_(uint8_t index) const {
        if (shot_count_ < max_shots_) return index;
        return (uint8_t)((next_index_ + index) % max_shots_);
    }

    Preferences prefs_;
    uint8_t max_shots_;
    const char* ns_;
    bool open_ = false;

    uint8_t shot_count_ = 0;
    uint8_t next_index_ = 0;
    uint32_t next_id_ = 1;
    char key_buf_[16]{};

    std::deque<ShotRecord> records_;
};

// PHY calibration ("training") sequencer.
//
// Runs once after reset while the mode flag selects TRAINING:
//   IDLE -> INIT_DELAY -> WRITE_LEVEL -> READ_LEVEL -> DONE -> IDLE
//
// The IDLE -> INIT_DELAY transition emits the one-shot init_start pulse.
// Write leveling strobes wrdata_en every 4th cycle of its window with a
// toggling pattern on rank 0; read leveling strobes rddata_en every 4th
// cycle until the mock eye-center cycle is hit or the window times out.
// A timeout is recorded in the result and the sequence still completes.
//
// Every phase counts the tick it is evaluated in, so INIT_DELAY lasts
// exactly init_delay_target ticks and WRITE_LEVEL exactly its window.
// DONE publishes the per-phase flags into the latched TrainingResult and
// clears them together with the phase counters.
//
// Once DONE has returned to IDLE the sequencer stays idle until reset()
// or restart().

#pragma once

#include <cstdint>

#include "dfi_signals.hpp"
#include "timing_config.hpp"

namespace ddr_dfi {

enum class TrainingState : uint8_t {
    IDLE,
    INIT_DELAY,
    WRITE_LEVEL,
    READ_LEVEL,
    DONE,
};

const char* to_string(TrainingState state);

/// Latched outcome of the most recent calibration run.
struct TrainingResult {
    bool write_level_done = false;
    bool read_level_done = false;
    bool eye_center_detected = false;
    bool complete = false; ///< DONE was reached since the last reset/restart
};

class TrainingSequencer {
public:
    explicit TrainingSequencer(const TrainingConfig& config);

    /// Evaluate one clock cycle. A new run starts only in TRAINING mode.
    void tick(Mode mode);

    /// Force IDLE, clear counters, flags and the result.
    void reset();

    /// Re-arm so the next TRAINING-mode tick starts a new run.
    void restart() {
        restart_pending_ = true;
    }

    const DfiOutputs& outputs() const {
        return outputs_;
    }

    TrainingState current_state() const {
        return state_;
    }

    const TrainingResult& result() const {
        return result_;
    }

    uint32_t init_delay_cycles() const {
        return init_delay_cycles_;
    }
    uint32_t write_lvl_cycles() const {
        return write_lvl_cycles_;
    }
    uint32_t read_lvl_cycles() const {
        return read_lvl_cycles_;
    }

    /// Per-phase flags of the run in progress; cleared on DONE -> IDLE.
    bool write_level_done() const {
        return write_level_done_;
    }
    bool read_level_done() const {
        return read_level_done_;
    }

    /// Number of wrdata_en strobes issued during the current/last write leveling.
    uint32_t write_strobe_count() const {
        return write_strobes_;
    }

    /// Overwrite the state register (fault-injection tests only).
    void inject_state(TrainingState state) {
        state_ = state;
    }

private:
    void clear_phase();

    TrainingConfig config_;

    TrainingState state_ = TrainingState::IDLE;
    uint32_t init_delay_cycles_ = 0;
    uint32_t write_lvl_cycles_ = 0;
    uint32_t read_lvl_cycles_ = 0;
    uint32_t write_strobes_ = 0;
    bool write_level_done_ = false;
    bool read_level_done_ = false;
    bool eye_center_detected_ = false;
    bool restart_pending_ = false;

    TrainingResult result_;
    DfiOutputs outputs_;
};

} // namespace ddr_dfi
